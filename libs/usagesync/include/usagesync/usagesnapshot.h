#pragma once
#include <QString>
#include <QDateTime>
#include <QMap>

// Pay-as-you-go spend beyond the included quota. Amounts are currency minor units (cents).
struct ExtraUsage {
    double amountUsed = 0.0;
    double amountLimit = 0.0;
    QString currencyCode;

    // The three fields only exist as a group; an empty currency means "not configured"
    bool isValid() const { return !currencyCode.isEmpty(); }

    bool operator==(const ExtraUsage& other) const {
        return amountUsed == other.amountUsed
            && amountLimit == other.amountLimit
            && currencyCode == other.currencyCode;
    }
    bool operator!=(const ExtraUsage& other) const { return !(*this == other); }
};

class UsageSnapshot {
public:
    static constexpr const char* OpusModel = "opus";
    static constexpr const char* SonnetModel = "sonnet";

    UsageSnapshot();

    double sessionPercentage = 0.0;
    QDateTime sessionResetAt;
    double weeklyPercentage = 0.0;
    QDateTime weeklyResetAt;
    QMap<QString, double> perModelPercentage;
    ExtraUsage extraUsage;
    QDateTime capturedAt;

    // Carried through from the remote payload when the producer reports them
    qint64 sessionTokensUsed = 0;
    qint64 sessionLimit = 0;
    qint64 weeklyTokensUsed = 0;
    qint64 weeklyLimit = 0;
    QString timeZoneId;

    // A snapshot without a capture time was never produced by a poll
    bool isNull() const { return !capturedAt.isValid(); }

    double modelPercentage(const QString& model) const { return perModelPercentage.value(model, 0.0); }
    void setModelPercentage(const QString& model, double percentage) { perModelPercentage[model] = percentage; }

    bool operator==(const UsageSnapshot& other) const;
    bool operator!=(const UsageSnapshot& other) const { return !(*this == other); }
};

// Console billing snapshot, read by the large tile only
struct ApiUsage {
    qint64 currentSpendCents = 0;
    qint64 prepaidCreditsCents = 0;
    QString currency;
    QDateTime resetsAt;

    bool isValid() const { return !currency.isEmpty(); }
};
