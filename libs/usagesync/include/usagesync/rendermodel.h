#pragma once
#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QLocale>
#include <QUuid>
#include "usagesnapshot.h"
#include "usagesettings.h"
#include "derivedmetrics.h"

class SnapshotStore;

// Display values of one metric, already clamped and formatted
struct MetricView {
    DisplayMetric metric = DisplayMetric::Session;
    bool available = false;
    double percentage = 0.0;
    StatusLevel level = StatusLevel::Safe;
    DisplayColor color;
    QString percentageText;
    QString resetText;         // empty for metrics without a reset time
    QString timeRemainingText;

    QJsonObject toJson() const;
};

// Immutable result of one render pass; a model without a snapshot renders as "no data"
struct RenderModel {
    bool hasSnapshot = false;
    UsageSnapshot snapshot;
    UsageSettings settings;
    QList<MetricView> metrics;
    QString extraUsageText;
    bool hasApiUsage = false;
    ApiUsage apiUsage;
    double apiUsagePercentage = 0.0;
    QDateTime generatedAt;

    const MetricView* view(DisplayMetric metric) const;
    QJsonObject toJson() const;
};

class RenderModelBuilder {
public:
    explicit RenderModelBuilder(SnapshotStore& store, const QLocale& locale = QLocale());

    RenderModel build(const QUuid& profileId, const QDateTime& now) const;

    static MetricView buildMetricView(const UsageSnapshot& snapshot, const UsageSettings& settings,
                                      DisplayMetric metric, const QDateTime& now);

private:
    SnapshotStore& m_store;
    QLocale m_locale;
};
