#include "usagesync/rendermodel.h"
#include "usagesync/snapshotcodec.h"
#include "usagesync/snapshotstore.h"
#include "logger/logger.h"
#include <QJsonArray>

static const DisplayMetric AllMetrics[] = {
    DisplayMetric::Session,
    DisplayMetric::Weekly,
    DisplayMetric::Opus,
    DisplayMetric::Sonnet,
    DisplayMetric::Extra
};

QJsonObject MetricView::toJson() const
{
    QJsonObject object;
    object["metric"] = UsageSettings::metricToString(metric);
    object["available"] = available;
    object["percentage"] = percentage;
    object["level"] = DerivedMetrics::statusLevelToString(level);
    object["color"] = color.name();
    object["text"] = percentageText;
    if (!resetText.isEmpty()) {
        object["resetText"] = resetText;
        object["timeRemaining"] = timeRemainingText;
    }
    return object;
}

const MetricView* RenderModel::view(DisplayMetric metric) const
{
    for (const MetricView& metricView : metrics) {
        if (metricView.metric == metric) {
            return &metricView;
        }
    }
    return nullptr;
}

QJsonObject RenderModel::toJson() const
{
    QJsonObject object;
    object["hasSnapshot"] = hasSnapshot;
    object["generatedAt"] = SnapshotCodec::dateToString(generatedAt);

    QJsonObject tiles;
    tiles["small"] = UsageSettings::metricToString(settings.smallWidgetMetric);
    tiles["mediumLeft"] = UsageSettings::metricToString(settings.mediumLeftMetric);
    tiles["mediumRight"] = UsageSettings::metricToString(settings.mediumRightMetric);
    tiles["colorMode"] = UsageSettings::colorModeToString(settings.widgetColorMode);
    object["tiles"] = tiles;

    if (!hasSnapshot) {
        return object;
    }

    object["capturedAt"] = SnapshotCodec::dateToString(snapshot.capturedAt);

    QJsonArray metricArray;
    for (const MetricView& metricView : metrics) {
        metricArray.append(metricView.toJson());
    }
    object["metrics"] = metricArray;
    object["extraUsage"] = extraUsageText;

    if (hasApiUsage) {
        QJsonObject api;
        api["currentSpendCents"] = static_cast<double>(apiUsage.currentSpendCents);
        api["prepaidCreditsCents"] = static_cast<double>(apiUsage.prepaidCreditsCents);
        api["currency"] = apiUsage.currency;
        api["percentage"] = apiUsagePercentage;
        object["apiUsage"] = api;
    }
    return object;
}

RenderModelBuilder::RenderModelBuilder(SnapshotStore& store, const QLocale& locale)
    : m_store(store)
    , m_locale(locale)
{
}

MetricView RenderModelBuilder::buildMetricView(const UsageSnapshot& snapshot, const UsageSettings& settings,
                                               DisplayMetric metric, const QDateTime& now)
{
    MetricView view;
    view.metric = metric;

    double raw = 0.0;
    view.available = DerivedMetrics::metricPercentage(snapshot, metric, raw);
    view.percentage = DerivedMetrics::clampPercentage(raw);
    view.level = DerivedMetrics::statusLevel(view.percentage);
    view.color = DerivedMetrics::resolveColor(view.percentage, settings.widgetColorMode, settings.widgetSingleColorHex);
    view.percentageText = DerivedMetrics::formatPercentage(view.percentage);

    QDateTime resetAt;
    if (metric == DisplayMetric::Session) {
        resetAt = snapshot.sessionResetAt;
    } else if (metric != DisplayMetric::Extra) {
        resetAt = snapshot.weeklyResetAt;
    }
    if (resetAt.isValid()) {
        view.resetText = DerivedMetrics::formatResetTime(resetAt, now, ResetTimeStyle::Full,
                                                         settings.statuslineUse24HourTime);
        view.timeRemainingText = DerivedMetrics::timeRemaining(resetAt, now);
    }
    return view;
}

RenderModel RenderModelBuilder::build(const QUuid& profileId, const QDateTime& now) const
{
    RenderModel model;
    model.generatedAt = now;
    model.settings = *m_store.loadSettings(profileId);

    if (!m_store.loadSnapshot(profileId, model.snapshot)) {
        LOG_DEBUG("No snapshot available, rendering empty model");
        model.snapshot = UsageSnapshot();
        return model;
    }
    model.hasSnapshot = true;

    for (DisplayMetric metric : AllMetrics) {
        model.metrics.append(buildMetricView(model.snapshot, model.settings, metric, now));
    }

    model.extraUsageText = DerivedMetrics::formatExtraUsage(model.snapshot.extraUsage,
                                                            model.settings.extraUsageFormat, m_locale);

    model.hasApiUsage = m_store.loadApiUsage(profileId, model.apiUsage);
    if (model.hasApiUsage) {
        model.apiUsagePercentage = DerivedMetrics::apiUsagePercentage(model.apiUsage);
    }
    return model;
}
