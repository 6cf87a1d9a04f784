#include "usagesync/derivedmetrics.h"
#include "logger/logger.h"
#include <QtMath>
#include <QTimeZone>

static const QString DefaultCurrency = "USD";

QString DisplayColor::name() const
{
    if (role == Primary) {
        return "primary";
    }

    quint32 rgb = rgba >> 8;
    QString text = QString("#%1").arg(rgb, 6, 16, QChar('0')).toUpper();
    if ((rgba & 0xFF) != 0xFF) {
        text += QString("%1").arg(rgba & 0xFF, 2, 16, QChar('0')).toUpper();
    }
    return text;
}

double DerivedMetrics::clampPercentage(double percentage)
{
    if (qIsNaN(percentage)) {
        return 0.0;
    }
    return qBound(0.0, percentage, 100.0);
}

StatusLevel DerivedMetrics::statusLevel(double percentage)
{
    if (percentage < ModerateThreshold) {
        return StatusLevel::Safe;
    }
    if (percentage < CriticalThreshold) {
        return StatusLevel::Moderate;
    }
    return StatusLevel::Critical;
}

QString DerivedMetrics::statusLevelToString(StatusLevel level)
{
    switch (level) {
        case StatusLevel::Safe:     return "safe";
        case StatusLevel::Moderate: return "moderate";
        case StatusLevel::Critical: return "critical";
    }
    return "safe";
}

bool DerivedMetrics::extraPercentage(double used, double limit, double& percentage)
{
    if (!(limit > 0.0)) {
        return false;
    }
    percentage = (used / limit) * 100.0;
    return true;
}

bool DerivedMetrics::metricPercentage(const UsageSnapshot& snapshot, DisplayMetric metric, double& percentage)
{
    switch (metric) {
        case DisplayMetric::Session:
            percentage = snapshot.sessionPercentage;
            return true;
        case DisplayMetric::Weekly:
            percentage = snapshot.weeklyPercentage;
            return true;
        case DisplayMetric::Opus:
            percentage = snapshot.modelPercentage(UsageSnapshot::OpusModel);
            return true;
        case DisplayMetric::Sonnet:
            percentage = snapshot.modelPercentage(UsageSnapshot::SonnetModel);
            return true;
        case DisplayMetric::Extra:
            if (!snapshot.extraUsage.isValid()) {
                return false;
            }
            return extraPercentage(snapshot.extraUsage.amountUsed, snapshot.extraUsage.amountLimit, percentage);
    }
    return false;
}

bool DerivedMetrics::parseHexColor(const QString& hex, quint32& rgba)
{
    QString digits = hex.trimmed();
    if (digits.startsWith('#')) {
        digits.remove(0, 1);
    }
    if (digits.length() != 6 && digits.length() != 8) {
        return false;
    }

    bool ok = false;
    quint32 value = digits.toUInt(&ok, 16);
    if (!ok) {
        return false;
    }

    rgba = digits.length() == 6 ? (value << 8) | 0xFF : value;
    return true;
}

DisplayColor DerivedMetrics::resolveColor(double percentage, ColorMode mode, const QString& customHex)
{
    DisplayColor color;

    switch (mode) {
        case ColorMode::Monochrome:
            color.role = DisplayColor::Primary;
            return color;

        case ColorMode::SingleColor:
            color.role = DisplayColor::Custom;
            if (!parseHexColor(customHex, color.rgba)) {
                LOG_DEBUG(QString("Unparseable custom color '%1', using default").arg(customHex));
                color.rgba = DefaultCustomRgba;
            }
            return color;

        case ColorMode::MultiColor:
            break;
    }

    switch (statusLevel(clampPercentage(percentage))) {
        case StatusLevel::Safe:
            color.role = DisplayColor::Safe;
            color.rgba = SafeRgba;
            break;
        case StatusLevel::Moderate:
            color.role = DisplayColor::Moderate;
            color.rgba = ModerateRgba;
            break;
        case StatusLevel::Critical:
            color.role = DisplayColor::Critical;
            color.rgba = CriticalRgba;
            break;
    }
    return color;
}

QString DerivedMetrics::formatResetTime(const QDateTime& resetAt, const QDateTime& now,
                                        ResetTimeStyle style, bool use24Hour)
{
    if (!resetAt.isValid()) {
        return QString();
    }

    // Nearest minute so that 6:59:45 reads 7:00 and does not flicker between refreshes
    qint64 msecs = resetAt.toMSecsSinceEpoch();
    qint64 rounded = ((msecs + 30000) / 60000) * 60000;
    QDateTime local = QDateTime::fromMSecsSinceEpoch(rounded, Qt::UTC).toTimeZone(now.timeZone());

    const QLocale c = QLocale::c();
    QString time = c.toString(local.time(), use24Hour ? QString("HH:mm") : QString("h:mmAP"));
    if (style == ResetTimeStyle::Compact) {
        return time;
    }

    qint64 days = now.date().daysTo(local.date());
    QString day;
    if (days == 0) {
        day = "Today";
    } else if (days == 1) {
        day = "Tomorrow";
    } else {
        day = c.dayName(local.date().dayOfWeek(), QLocale::LongFormat);
    }
    return day + ", " + time;
}

QString DerivedMetrics::formatPercentage(double percentage)
{
    return QString("%1%").arg(qRound(percentage));
}

QString DerivedMetrics::formatCurrency(double amount, const QString& currencyCode, const QLocale& locale)
{
    const QString code = currencyCode.isEmpty() ? DefaultCurrency : currencyCode.toUpper();

    QString symbol;
    if (locale.currencySymbol(QLocale::CurrencyIsoCode) == code) {
        symbol = locale.currencySymbol(QLocale::CurrencySymbol);
    } else {
        // The first locale that uses the currency supplies its symbol
        const QList<QLocale> locales = QLocale::matchingLocales(QLocale::AnyLanguage, QLocale::AnyScript,
                                                               QLocale::AnyCountry);
        for (const QLocale& candidate : locales) {
            if (candidate.currencySymbol(QLocale::CurrencyIsoCode) == code) {
                symbol = candidate.currencySymbol(QLocale::CurrencySymbol);
                break;
            }
        }
    }
    if (symbol.isEmpty()) {
        symbol = code + " ";
    }

    return locale.toCurrencyString(amount, symbol, 2);
}

QString DerivedMetrics::formatExtraUsage(const ExtraUsage& extra, ExtraUsageFormat format, const QLocale& locale)
{
    double percentage = 0.0;
    if (extra.isValid() && !extraPercentage(extra.amountUsed, extra.amountLimit, percentage)) {
        percentage = 0.0;
    }

    // Spend past the limit or refunds below zero still display within [0, 100]
    const QString percentText = formatPercentage(clampPercentage(percentage));
    const QString currencyText = extra.isValid()
        ? formatCurrency(extra.amountUsed / 100.0, extra.currencyCode, locale)
        : formatCurrency(0.0, DefaultCurrency, locale);

    switch (format) {
        case ExtraUsageFormat::Percentage:
            return percentText;
        case ExtraUsageFormat::Currency:
            return currencyText;
        case ExtraUsageFormat::Both:
            return percentText + QString(" %1 ").arg(QChar(0x2022)) + currencyText;
    }
    return percentText;
}

QString DerivedMetrics::timeRemaining(const QDateTime& resetAt, const QDateTime& now)
{
    qint64 secs = now.secsTo(resetAt);
    if (secs < 0) {
        return "Reset now";
    }

    qint64 hours = secs / 3600;
    qint64 minutes = (secs % 3600) / 60;
    qint64 days = hours / 24;

    if (days > 0) {
        return days == 1 ? QString("1 day") : QString("%1 days").arg(days);
    }
    if (hours > 0) {
        return minutes > 0 ? QString("%1h %2m").arg(hours).arg(minutes) : QString("%1h").arg(hours);
    }
    if (minutes > 0) {
        return QString("%1m").arg(minutes);
    }
    return "< 1m";
}

QString DerivedMetrics::timeRemainingHours(const QDateTime& resetAt, const QDateTime& now)
{
    const QString arrow(QChar(0x2192));
    qint64 msecs = now.msecsTo(resetAt);
    if (msecs < 3600 * 1000) {
        return arrow + "<1H";
    }

    qint64 hours = static_cast<qint64>(qCeil(msecs / 3600000.0));
    return arrow + QString("%1H").arg(hours);
}

double DerivedMetrics::apiUsagePercentage(const ApiUsage& usage)
{
    qint64 total = usage.currentSpendCents + usage.prepaidCreditsCents;
    if (total <= 0) {
        return 0.0;
    }
    return clampPercentage(static_cast<double>(usage.currentSpendCents) / total * 100.0);
}
