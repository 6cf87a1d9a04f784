#pragma once
#include <QString>
#include <QVariantMap>

enum class DisplayMetric {
    Session,
    Weekly,
    Opus,
    Sonnet,
    Extra
};

enum class ColorMode {
    MultiColor,   // threshold-based per status level
    Monochrome,   // neutral foreground color
    SingleColor   // user-chosen fixed color
};

enum class ExtraUsageFormat {
    Percentage,
    Currency,
    Both
};

// Display and behavior preferences shared with the tile processes
struct UsageSettings {
    static constexpr int DefaultRefreshIntervalSecs = 30;
    static constexpr int MaxRefreshIntervalSecs = 86400;
    static constexpr const char* DefaultCustomColorHex = "#00BFFF";

    int refreshIntervalSecs = DefaultRefreshIntervalSecs;
    bool notificationsEnabled = false;

    // Tiles
    DisplayMetric smallWidgetMetric = DisplayMetric::Session;
    DisplayMetric mediumLeftMetric = DisplayMetric::Session;
    DisplayMetric mediumRightMetric = DisplayMetric::Weekly;
    ColorMode widgetColorMode = ColorMode::MultiColor;
    QString widgetSingleColorHex = DefaultCustomColorHex;
    ExtraUsageFormat extraUsageFormat = ExtraUsageFormat::Percentage;

    // Companion status line
    bool statuslineShowDirectory = true;
    bool statuslineShowBranch = true;
    bool statuslineShowUsage = true;
    bool statuslineShowProgressBar = true;
    bool statuslineShowResetTime = true;
    bool statuslineUse24HourTime = false;
    bool statuslineShowUsageLabel = true;
    bool statuslineShowResetLabel = true;
    ColorMode statuslineColorMode = ColorMode::MultiColor;
    QString statuslineSingleColorHex = DefaultCustomColorHex;

    bool operator==(const UsageSettings& other) const;
    bool operator!=(const UsageSettings& other) const { return !(*this == other); }

    // Raw values as stored in the key-value tier
    static QString metricToString(DisplayMetric metric);
    static bool metricFromString(const QString& value, DisplayMetric& metric);
    static QString colorModeToString(ColorMode mode);
    static bool colorModeFromString(const QString& value, ColorMode& mode);
    static QString statuslineColorModeToString(ColorMode mode);
    static bool statuslineColorModeFromString(const QString& value, ColorMode& mode);
    static QString extraUsageFormatToString(ExtraUsageFormat format);
    static bool extraUsageFormatFromString(const QString& value, ExtraUsageFormat& format);

    // Applies "field=value" as used on the agent command line and by the legacy keys
    bool applyField(const QString& field, const QString& value);

    // Every field under its legacy key name with its raw stored value
    QVariantMap fieldValues() const;
};
