#include "usagesync/usagesettings.h"
#include "logger/logger.h"

bool UsageSettings::operator==(const UsageSettings& other) const
{
    return refreshIntervalSecs == other.refreshIntervalSecs
        && notificationsEnabled == other.notificationsEnabled
        && smallWidgetMetric == other.smallWidgetMetric
        && mediumLeftMetric == other.mediumLeftMetric
        && mediumRightMetric == other.mediumRightMetric
        && widgetColorMode == other.widgetColorMode
        && widgetSingleColorHex == other.widgetSingleColorHex
        && extraUsageFormat == other.extraUsageFormat
        && statuslineShowDirectory == other.statuslineShowDirectory
        && statuslineShowBranch == other.statuslineShowBranch
        && statuslineShowUsage == other.statuslineShowUsage
        && statuslineShowProgressBar == other.statuslineShowProgressBar
        && statuslineShowResetTime == other.statuslineShowResetTime
        && statuslineUse24HourTime == other.statuslineUse24HourTime
        && statuslineShowUsageLabel == other.statuslineShowUsageLabel
        && statuslineShowResetLabel == other.statuslineShowResetLabel
        && statuslineColorMode == other.statuslineColorMode
        && statuslineSingleColorHex == other.statuslineSingleColorHex;
}

QString UsageSettings::metricToString(DisplayMetric metric)
{
    switch (metric) {
        case DisplayMetric::Session: return "session";
        case DisplayMetric::Weekly:  return "weekly";
        case DisplayMetric::Opus:    return "opus";
        case DisplayMetric::Sonnet:  return "sonnet";
        case DisplayMetric::Extra:   return "extra";
    }
    return "session";
}

bool UsageSettings::metricFromString(const QString& value, DisplayMetric& metric)
{
    if (value == "session") {
        metric = DisplayMetric::Session;
    } else if (value == "weekly") {
        metric = DisplayMetric::Weekly;
    } else if (value == "opus") {
        metric = DisplayMetric::Opus;
    } else if (value == "sonnet") {
        metric = DisplayMetric::Sonnet;
    } else if (value == "extra") {
        metric = DisplayMetric::Extra;
    } else {
        return false;
    }
    return true;
}

QString UsageSettings::colorModeToString(ColorMode mode)
{
    switch (mode) {
        case ColorMode::MultiColor:  return "multiColor";
        case ColorMode::Monochrome:  return "monochrome";
        case ColorMode::SingleColor: return "singleColor";
    }
    return "multiColor";
}

bool UsageSettings::colorModeFromString(const QString& value, ColorMode& mode)
{
    if (value == "multiColor") {
        mode = ColorMode::MultiColor;
    } else if (value == "monochrome") {
        mode = ColorMode::Monochrome;
    } else if (value == "singleColor") {
        mode = ColorMode::SingleColor;
    } else {
        return false;
    }
    return true;
}

// The status line stores the threshold mode as "colored"
QString UsageSettings::statuslineColorModeToString(ColorMode mode)
{
    return mode == ColorMode::MultiColor ? QString("colored") : colorModeToString(mode);
}

bool UsageSettings::statuslineColorModeFromString(const QString& value, ColorMode& mode)
{
    if (value == "colored") {
        mode = ColorMode::MultiColor;
        return true;
    }
    return colorModeFromString(value, mode);
}

QString UsageSettings::extraUsageFormatToString(ExtraUsageFormat format)
{
    switch (format) {
        case ExtraUsageFormat::Percentage: return "percentage";
        case ExtraUsageFormat::Currency:   return "currency";
        case ExtraUsageFormat::Both:       return "both";
    }
    return "percentage";
}

bool UsageSettings::extraUsageFormatFromString(const QString& value, ExtraUsageFormat& format)
{
    if (value == "percentage") {
        format = ExtraUsageFormat::Percentage;
    } else if (value == "currency") {
        format = ExtraUsageFormat::Currency;
    } else if (value == "both") {
        format = ExtraUsageFormat::Both;
    } else {
        return false;
    }
    return true;
}

static bool parseBool(const QString& value, bool& result)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        result = true;
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        result = false;
        return true;
    }
    return false;
}

bool UsageSettings::applyField(const QString& field, const QString& value)
{
    bool ok = false;

    if (field == "refreshInterval") {
        int secs = value.toInt(&ok);
        if (!ok || secs <= 0 || secs > MaxRefreshIntervalSecs) {
            LOG_WARNING(QString("Rejected refresh interval: %1").arg(value));
            return false;
        }
        refreshIntervalSecs = secs;
        return true;
    }

    if (field == "notificationsEnabled") return parseBool(value, notificationsEnabled);
    if (field == "smallWidgetMetric") return metricFromString(value, smallWidgetMetric);
    if (field == "mediumWidgetLeftMetric") return metricFromString(value, mediumLeftMetric);
    if (field == "mediumWidgetRightMetric") return metricFromString(value, mediumRightMetric);
    if (field == "widgetColorMode") return colorModeFromString(value, widgetColorMode);
    if (field == "extraUsageDisplayFormat") return extraUsageFormatFromString(value, extraUsageFormat);
    if (field == "statuslineShowDirectory") return parseBool(value, statuslineShowDirectory);
    if (field == "statuslineShowBranch") return parseBool(value, statuslineShowBranch);
    if (field == "statuslineShowUsage") return parseBool(value, statuslineShowUsage);
    if (field == "statuslineShowProgressBar") return parseBool(value, statuslineShowProgressBar);
    if (field == "statuslineShowResetTime") return parseBool(value, statuslineShowResetTime);
    if (field == "statuslineUse24HourTime") return parseBool(value, statuslineUse24HourTime);
    if (field == "statuslineShowUsageLabel") return parseBool(value, statuslineShowUsageLabel);
    if (field == "statuslineShowResetLabel") return parseBool(value, statuslineShowResetLabel);
    if (field == "statuslineColorMode") return statuslineColorModeFromString(value, statuslineColorMode);

    // Colors are stored verbatim; an unparseable value falls back when resolved
    if (field == "widgetSingleColorHex") {
        widgetSingleColorHex = value.trimmed();
        return true;
    }
    if (field == "statuslineSingleColorHex") {
        statuslineSingleColorHex = value.trimmed();
        return true;
    }

    LOG_WARNING(QString("Unknown settings field: %1").arg(field));
    return false;
}

QVariantMap UsageSettings::fieldValues() const
{
    QVariantMap fields;
    fields["refreshInterval"] = refreshIntervalSecs;
    fields["notificationsEnabled"] = notificationsEnabled;
    fields["smallWidgetMetric"] = metricToString(smallWidgetMetric);
    fields["mediumWidgetLeftMetric"] = metricToString(mediumLeftMetric);
    fields["mediumWidgetRightMetric"] = metricToString(mediumRightMetric);
    fields["widgetColorMode"] = colorModeToString(widgetColorMode);
    fields["widgetSingleColorHex"] = widgetSingleColorHex;
    fields["extraUsageDisplayFormat"] = extraUsageFormatToString(extraUsageFormat);
    fields["statuslineShowDirectory"] = statuslineShowDirectory;
    fields["statuslineShowBranch"] = statuslineShowBranch;
    fields["statuslineShowUsage"] = statuslineShowUsage;
    fields["statuslineShowProgressBar"] = statuslineShowProgressBar;
    fields["statuslineShowResetTime"] = statuslineShowResetTime;
    fields["statuslineUse24HourTime"] = statuslineUse24HourTime;
    fields["statuslineShowUsageLabel"] = statuslineShowUsageLabel;
    fields["statuslineShowResetLabel"] = statuslineShowResetLabel;
    fields["statuslineColorMode"] = statuslineColorModeToString(statuslineColorMode);
    fields["statuslineSingleColorHex"] = statuslineSingleColorHex;
    return fields;
}
