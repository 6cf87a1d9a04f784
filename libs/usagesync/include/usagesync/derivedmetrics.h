#pragma once
#include <QDateTime>
#include <QLocale>
#include <QString>
#include "usagesnapshot.h"
#include "usagesettings.h"

enum class StatusLevel {
    Safe,
    Moderate,
    Critical
};

struct DisplayColor {
    enum Role {
        Safe,
        Moderate,
        Critical,
        Primary,  // the host's neutral foreground color
        Custom
    };

    Role role = Primary;
    quint32 rgba = 0;  // 0xRRGGBBAA; meaningless for Primary

    // "#RRGGBB", "#RRGGBBAA" when not opaque, "primary" for the neutral color
    QString name() const;

    bool operator==(const DisplayColor& other) const { return role == other.role && rgba == other.rgba; }
};

enum class ResetTimeStyle {
    Full,     // "Today, 3:59PM"
    Compact   // "3:59PM"
};

/**
 * @brief Pure functions turning snapshot values into display values
 *
 * Nothing here touches storage; callers pass the current time and locale so the
 * results are reproducible.
 */
class DerivedMetrics {
public:
    static constexpr double ModerateThreshold = 50.0;
    static constexpr double CriticalThreshold = 80.0;

    static constexpr quint32 SafeRgba = 0x34C759FF;
    static constexpr quint32 ModerateRgba = 0xFF9500FF;
    static constexpr quint32 CriticalRgba = 0xFF3B30FF;
    static constexpr quint32 DefaultCustomRgba = 0x00BFFFFF;

    static double clampPercentage(double percentage);
    static StatusLevel statusLevel(double percentage);
    static QString statusLevelToString(StatusLevel level);

    // Extra usage as a percentage of its limit; false when the limit is not positive
    static bool extraPercentage(double used, double limit, double& percentage);

    // Percentage shown for a metric; false when the snapshot has no value for it
    static bool metricPercentage(const UsageSnapshot& snapshot, DisplayMetric metric, double& percentage);

    static DisplayColor resolveColor(double percentage, ColorMode mode, const QString& customHex);
    static bool parseHexColor(const QString& hex, quint32& rgba);

    static QString formatResetTime(const QDateTime& resetAt, const QDateTime& now,
                                   ResetTimeStyle style = ResetTimeStyle::Full, bool use24Hour = false);
    static QString formatExtraUsage(const ExtraUsage& extra, ExtraUsageFormat format,
                                    const QLocale& locale = QLocale());
    static QString formatPercentage(double percentage);
    static QString formatCurrency(double amount, const QString& currencyCode,
                                  const QLocale& locale = QLocale());

    static QString timeRemaining(const QDateTime& resetAt, const QDateTime& now);
    static QString timeRemainingHours(const QDateTime& resetAt, const QDateTime& now);

    static double apiUsagePercentage(const ApiUsage& usage);
};
