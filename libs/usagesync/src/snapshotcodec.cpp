#include "usagesync/snapshotcodec.h"
#include "logger/logger.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <limits>

// Seconds between 1970-01-01 and 2001-01-01, the epoch of the older producer's dates
static const qint64 ReferenceDateOffsetSecs = 978307200;

// Integers beyond 2^53 lose precision as JSON doubles
static const double MaxJsonInteger = 9007199254740992.0;

// Reference-date seconds further than this from 2001 are not plausible timestamps
static const double MaxReferenceDateSecs = 1e11;

// The read helpers leave the target untouched when the key is absent or null
// and return false when the key carries a value of the wrong type or range.

static bool readDouble(const QJsonObject& object, const QString& key, double& target)
{
    QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isDouble() || !qIsFinite(value.toDouble())) {
        return false;
    }
    target = value.toDouble();
    return true;
}

static bool readInt64(const QJsonObject& object, const QString& key, qint64& target)
{
    double number = static_cast<double>(target);
    if (!readDouble(object, key, number) || qAbs(number) > MaxJsonInteger) {
        return false;
    }
    target = qRound64(number);
    return true;
}

static bool readInt(const QJsonObject& object, const QString& key, int& target)
{
    qint64 number = target;
    if (!readInt64(object, key, number)
        || number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
        return false;
    }
    target = static_cast<int>(number);
    return true;
}

static bool readString(const QJsonObject& object, const QString& key, QString& target)
{
    QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isString()) {
        return false;
    }
    target = value.toString();
    return true;
}

static bool readBool(const QJsonObject& object, const QString& key, bool& target)
{
    QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isBool()) {
        return false;
    }
    target = value.toBool();
    return true;
}

static bool readDate(const QJsonObject& object, const QString& key, QDateTime& target)
{
    QJsonValue value = object.value(key);
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    bool ok = false;
    QDateTime parsed = SnapshotCodec::dateFromValue(value, &ok);
    if (!ok) {
        return false;
    }
    target = parsed;
    return true;
}

static bool parseObject(const QByteArray& data, QJsonObject& object, const char* what)
{
    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(data, &error);

    if (error.error != QJsonParseError::NoError) {
        LOG_DEBUG(QString("Failed to parse %1: %2 at offset %3")
                  .arg(what, error.errorString()).arg(error.offset));
        return false;
    }
    if (!doc.isObject()) {
        LOG_DEBUG(QString("Invalid %1 format (not a JSON object)").arg(what));
        return false;
    }

    object = doc.object();
    return true;
}

static QByteArray toBytes(const QJsonObject& object)
{
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

QString SnapshotCodec::dateToString(const QDateTime& dateTime)
{
    if (!dateTime.isValid()) {
        return QString();
    }
    return dateTime.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime SnapshotCodec::dateFromValue(const QJsonValue& value, bool* ok)
{
    if (ok) {
        *ok = true;
    }

    if (value.isDouble()) {
        const double secs = value.toDouble();
        if (!qIsFinite(secs) || qAbs(secs) > MaxReferenceDateSecs) {
            if (ok) {
                *ok = false;
            }
            return QDateTime();
        }
        qint64 msecs = qRound64((static_cast<double>(ReferenceDateOffsetSecs) + secs) * 1000.0);
        return QDateTime::fromMSecsSinceEpoch(msecs, Qt::UTC);
    }

    if (value.isString()) {
        const QString text = value.toString();
        if (text.isEmpty()) {
            return QDateTime();
        }
        QDateTime parsed = QDateTime::fromString(text, Qt::ISODateWithMs);
        if (parsed.isValid()) {
            return parsed;
        }
    } else if (value.isUndefined() || value.isNull()) {
        return QDateTime();
    }

    if (ok) {
        *ok = false;
    }
    return QDateTime();
}

// --- Snapshot ---

QJsonObject SnapshotCodec::snapshotToJson(const UsageSnapshot& snapshot)
{
    QJsonObject object;
    object["schemaVersion"] = SchemaVersion;
    object["sessionPercentage"] = snapshot.sessionPercentage;
    object["sessionResetAt"] = dateToString(snapshot.sessionResetAt);
    object["weeklyPercentage"] = snapshot.weeklyPercentage;
    object["weeklyResetAt"] = dateToString(snapshot.weeklyResetAt);

    QJsonObject models;
    for (auto it = snapshot.perModelPercentage.constBegin(); it != snapshot.perModelPercentage.constEnd(); ++it) {
        models[it.key()] = it.value();
    }
    object["perModelPercentage"] = models;

    // Written as a group or not at all
    if (snapshot.extraUsage.isValid()) {
        QJsonObject extra;
        extra["amountUsed"] = snapshot.extraUsage.amountUsed;
        extra["amountLimit"] = snapshot.extraUsage.amountLimit;
        extra["currencyCode"] = snapshot.extraUsage.currencyCode;
        object["extraUsage"] = extra;
    }

    object["capturedAt"] = dateToString(snapshot.capturedAt);
    object["sessionTokensUsed"] = static_cast<double>(snapshot.sessionTokensUsed);
    object["sessionLimit"] = static_cast<double>(snapshot.sessionLimit);
    object["weeklyTokensUsed"] = static_cast<double>(snapshot.weeklyTokensUsed);
    object["weeklyLimit"] = static_cast<double>(snapshot.weeklyLimit);
    if (!snapshot.timeZoneId.isEmpty()) {
        object["timeZone"] = snapshot.timeZoneId;
    }
    return object;
}

DecodeError SnapshotCodec::snapshotFromJson(const QJsonObject& object, UsageSnapshot& snapshot)
{
    if (!object.value("sessionPercentage").isDouble() || !object.value("weeklyPercentage").isDouble()) {
        LOG_DEBUG("Snapshot lacks session or weekly percentage");
        return DecodeError::Malformed;
    }

    UsageSnapshot decoded;
    bool ok = readDouble(object, "sessionPercentage", decoded.sessionPercentage)
        && readDate(object, "sessionResetAt", decoded.sessionResetAt)
        && readDouble(object, "weeklyPercentage", decoded.weeklyPercentage)
        && readDate(object, "weeklyResetAt", decoded.weeklyResetAt)
        && readDate(object, "capturedAt", decoded.capturedAt)
        && readInt64(object, "sessionTokensUsed", decoded.sessionTokensUsed)
        && readInt64(object, "sessionLimit", decoded.sessionLimit)
        && readInt64(object, "weeklyTokensUsed", decoded.weeklyTokensUsed)
        && readInt64(object, "weeklyLimit", decoded.weeklyLimit)
        && readString(object, "timeZone", decoded.timeZoneId);
    if (!ok) {
        LOG_DEBUG("Snapshot field has an unexpected type");
        return DecodeError::Malformed;
    }

    QJsonValue models = object.value("perModelPercentage");
    if (models.isObject()) {
        QJsonObject modelObject = models.toObject();
        for (auto it = modelObject.constBegin(); it != modelObject.constEnd(); ++it) {
            if (!it.value().isDouble()) {
                LOG_DEBUG(QString("Model percentage for '%1' is not a number").arg(it.key()));
                return DecodeError::Malformed;
            }
            decoded.perModelPercentage[it.key()] = it.value().toDouble();
        }
    } else if (!models.isUndefined() && !models.isNull()) {
        return DecodeError::Malformed;
    }

    QJsonValue extra = object.value("extraUsage");
    if (extra.isObject()) {
        QJsonObject extraObject = extra.toObject();
        ExtraUsage usage;
        bool complete = extraObject.value("amountUsed").isDouble()
            && extraObject.value("amountLimit").isDouble()
            && extraObject.value("currencyCode").isString();
        if (complete) {
            usage.amountUsed = extraObject.value("amountUsed").toDouble();
            usage.amountLimit = extraObject.value("amountLimit").toDouble();
            usage.currencyCode = extraObject.value("currencyCode").toString();
            decoded.extraUsage = usage;
        } else {
            LOG_DEBUG("Ignoring incomplete extra usage group");
        }
    } else if (!extra.isUndefined() && !extra.isNull()) {
        return DecodeError::Malformed;
    }

    int version = object.value("schemaVersion").toInt(SchemaVersion);
    if (version > SchemaVersion) {
        LOG_DEBUG(QString("Decoded snapshot written with newer schema %1").arg(version));
    }

    snapshot = decoded;
    return DecodeError::None;
}

QByteArray SnapshotCodec::encodeSnapshot(const UsageSnapshot& snapshot)
{
    return toBytes(snapshotToJson(snapshot));
}

DecodeError SnapshotCodec::decodeSnapshot(const QByteArray& data, UsageSnapshot& snapshot)
{
    QJsonObject object;
    if (!parseObject(data, object, "snapshot")) {
        return DecodeError::Malformed;
    }
    return snapshotFromJson(object, snapshot);
}

DecodeError SnapshotCodec::decodeCompatSnapshot(const QByteArray& data, UsageSnapshot& snapshot)
{
    QJsonObject object;
    if (!parseObject(data, object, "compat snapshot")) {
        return DecodeError::Malformed;
    }

    if (object.contains("schemaVersion")) {
        return snapshotFromJson(object, snapshot);
    }

    if (!object.value("sessionPercentage").isDouble() || !object.value("weeklyPercentage").isDouble()) {
        LOG_DEBUG("Compat snapshot lacks session or weekly percentage");
        return DecodeError::Malformed;
    }

    UsageSnapshot decoded;
    double opus = 0.0;
    double sonnet = 0.0;
    bool ok = readDouble(object, "sessionPercentage", decoded.sessionPercentage)
        && readDate(object, "sessionResetTime", decoded.sessionResetAt)
        && readDouble(object, "weeklyPercentage", decoded.weeklyPercentage)
        && readDate(object, "weeklyResetTime", decoded.weeklyResetAt)
        && readDouble(object, "opusWeeklyPercentage", opus)
        && readDouble(object, "sonnetWeeklyPercentage", sonnet)
        && readDate(object, "lastUpdated", decoded.capturedAt)
        && readInt64(object, "sessionTokensUsed", decoded.sessionTokensUsed)
        && readInt64(object, "sessionLimit", decoded.sessionLimit)
        && readInt64(object, "weeklyTokensUsed", decoded.weeklyTokensUsed)
        && readInt64(object, "weeklyLimit", decoded.weeklyLimit);
    if (!ok) {
        LOG_DEBUG("Compat snapshot field has an unexpected type");
        return DecodeError::Malformed;
    }

    decoded.setModelPercentage(UsageSnapshot::OpusModel, opus);
    decoded.setModelPercentage(UsageSnapshot::SonnetModel, sonnet);

    // Absent cost fields mean "no extra usage configured", not zero spend
    QJsonValue used = object.value("costUsed");
    QJsonValue limit = object.value("costLimit");
    QJsonValue currency = object.value("costCurrency");
    if (used.isDouble() && limit.isDouble() && currency.isString() && !currency.toString().isEmpty()) {
        decoded.extraUsage.amountUsed = used.toDouble();
        decoded.extraUsage.amountLimit = limit.toDouble();
        decoded.extraUsage.currencyCode = currency.toString();
    }

    QJsonValue zone = object.value("userTimezone");
    if (zone.isObject()) {
        decoded.timeZoneId = zone.toObject().value("identifier").toString();
    } else if (zone.isString()) {
        decoded.timeZoneId = zone.toString();
    }

    snapshot = decoded;
    return DecodeError::None;
}

// --- Settings ---

QByteArray SnapshotCodec::encodeSettings(const UsageSettings& settings)
{
    QJsonObject object;
    object["schemaVersion"] = SchemaVersion;
    object["refreshInterval"] = settings.refreshIntervalSecs;
    object["notificationsEnabled"] = settings.notificationsEnabled;
    object["smallWidgetMetric"] = UsageSettings::metricToString(settings.smallWidgetMetric);
    object["mediumWidgetLeftMetric"] = UsageSettings::metricToString(settings.mediumLeftMetric);
    object["mediumWidgetRightMetric"] = UsageSettings::metricToString(settings.mediumRightMetric);
    object["widgetColorMode"] = UsageSettings::colorModeToString(settings.widgetColorMode);
    object["widgetSingleColorHex"] = settings.widgetSingleColorHex;
    object["extraUsageDisplayFormat"] = UsageSettings::extraUsageFormatToString(settings.extraUsageFormat);
    object["statuslineShowDirectory"] = settings.statuslineShowDirectory;
    object["statuslineShowBranch"] = settings.statuslineShowBranch;
    object["statuslineShowUsage"] = settings.statuslineShowUsage;
    object["statuslineShowProgressBar"] = settings.statuslineShowProgressBar;
    object["statuslineShowResetTime"] = settings.statuslineShowResetTime;
    object["statuslineUse24HourTime"] = settings.statuslineUse24HourTime;
    object["statuslineShowUsageLabel"] = settings.statuslineShowUsageLabel;
    object["statuslineShowResetLabel"] = settings.statuslineShowResetLabel;
    object["statuslineColorMode"] = UsageSettings::statuslineColorModeToString(settings.statuslineColorMode);
    object["statuslineSingleColorHex"] = settings.statuslineSingleColorHex;
    return toBytes(object);
}

DecodeError SnapshotCodec::decodeSettings(const QByteArray& data, UsageSettings& settings)
{
    QJsonObject object;
    if (!parseObject(data, object, "settings")) {
        return DecodeError::Malformed;
    }

    // Fields decode independently: a bad value keeps that field's default
    UsageSettings decoded;
    QStringList rejected;

    if (!readInt(object, "refreshInterval", decoded.refreshIntervalSecs) || decoded.refreshIntervalSecs <= 0
        || decoded.refreshIntervalSecs > UsageSettings::MaxRefreshIntervalSecs) {
        decoded.refreshIntervalSecs = UsageSettings::DefaultRefreshIntervalSecs;
        rejected << "refreshInterval";
    }

    const struct { const char* key; bool UsageSettings::*field; } flags[] = {
        { "notificationsEnabled", &UsageSettings::notificationsEnabled },
        { "statuslineShowDirectory", &UsageSettings::statuslineShowDirectory },
        { "statuslineShowBranch", &UsageSettings::statuslineShowBranch },
        { "statuslineShowUsage", &UsageSettings::statuslineShowUsage },
        { "statuslineShowProgressBar", &UsageSettings::statuslineShowProgressBar },
        { "statuslineShowResetTime", &UsageSettings::statuslineShowResetTime },
        { "statuslineUse24HourTime", &UsageSettings::statuslineUse24HourTime },
        { "statuslineShowUsageLabel", &UsageSettings::statuslineShowUsageLabel },
        { "statuslineShowResetLabel", &UsageSettings::statuslineShowResetLabel },
    };
    for (const auto& flag : flags) {
        if (!readBool(object, flag.key, decoded.*flag.field)) {
            rejected << flag.key;
        }
    }

    const struct { const char* key; DisplayMetric UsageSettings::*field; } metrics[] = {
        { "smallWidgetMetric", &UsageSettings::smallWidgetMetric },
        { "mediumWidgetLeftMetric", &UsageSettings::mediumLeftMetric },
        { "mediumWidgetRightMetric", &UsageSettings::mediumRightMetric },
    };
    for (const auto& metric : metrics) {
        QJsonValue value = object.value(metric.key);
        if (!value.isUndefined() && !UsageSettings::metricFromString(value.toString(), decoded.*metric.field)) {
            rejected << metric.key;
        }
    }

    QJsonValue widgetMode = object.value("widgetColorMode");
    if (!widgetMode.isUndefined() && !UsageSettings::colorModeFromString(widgetMode.toString(), decoded.widgetColorMode)) {
        rejected << "widgetColorMode";
    }

    QJsonValue statuslineMode = object.value("statuslineColorMode");
    if (!statuslineMode.isUndefined()
        && !UsageSettings::statuslineColorModeFromString(statuslineMode.toString(), decoded.statuslineColorMode)) {
        rejected << "statuslineColorMode";
    }

    QJsonValue format = object.value("extraUsageDisplayFormat");
    if (!format.isUndefined() && !UsageSettings::extraUsageFormatFromString(format.toString(), decoded.extraUsageFormat)) {
        rejected << "extraUsageDisplayFormat";
    }

    if (!readString(object, "widgetSingleColorHex", decoded.widgetSingleColorHex)) {
        rejected << "widgetSingleColorHex";
    }
    if (!readString(object, "statuslineSingleColorHex", decoded.statuslineSingleColorHex)) {
        rejected << "statuslineSingleColorHex";
    }

    if (!rejected.isEmpty()) {
        LOG_WARNING(QString("Settings fields reset to defaults: %1").arg(rejected.join(", ")));
    }

    settings = decoded;
    return DecodeError::None;
}

// --- Profiles ---

static QJsonObject profileToJson(const Profile& profile)
{
    QJsonObject object;
    object["id"] = profile.id.toString(QUuid::WithoutBraces);
    object["name"] = profile.name;

    const ProfileCredentials& credentials = profile.credentials;
    if (!credentials.sessionKey.isEmpty()) object["claudeSessionKey"] = credentials.sessionKey;
    if (!credentials.organizationId.isEmpty()) object["organizationId"] = credentials.organizationId;
    if (!credentials.apiSessionKey.isEmpty()) object["apiSessionKey"] = credentials.apiSessionKey;
    if (!credentials.apiOrganizationId.isEmpty()) object["apiOrganizationId"] = credentials.apiOrganizationId;
    if (!credentials.cliCredentialsJson.isEmpty()) object["cliCredentialsJSON"] = credentials.cliCredentialsJson;

    object["hasCliAccount"] = profile.hasCliAccount;
    if (profile.cliAccountSyncedAt.isValid()) {
        object["cliAccountSyncedAt"] = SnapshotCodec::dateToString(profile.cliAccountSyncedAt);
    }
    object["refreshInterval"] = profile.refreshIntervalSecs;
    object["autoStartSessionEnabled"] = profile.autoStartSessionEnabled;
    object["checkOverageLimitEnabled"] = profile.checkOverageLimitEnabled;
    object["autoRotateEnabled"] = profile.autoRotateEnabled;
    object["isSelectedForDisplay"] = profile.isSelectedForDisplay;
    object["createdAt"] = SnapshotCodec::dateToString(profile.createdAt);
    object["lastUsedAt"] = SnapshotCodec::dateToString(profile.lastUsedAt);

    if (!profile.cachedUsage.isNull()) {
        object["claudeUsage"] = SnapshotCodec::snapshotToJson(profile.cachedUsage);
    }
    return object;
}

static bool profileFromJson(const QJsonObject& object, Profile& profile)
{
    Profile decoded;
    decoded.id = QUuid(object.value("id").toString());
    if (decoded.id.isNull()) {
        LOG_DEBUG("Profile entry has no valid id");
        return false;
    }
    if (!object.value("name").isString()) {
        LOG_DEBUG(QString("Profile %1 has no name").arg(decoded.id.toString()));
        return false;
    }
    decoded.name = object.value("name").toString();

    ProfileCredentials& credentials = decoded.credentials;
    bool ok = readString(object, "claudeSessionKey", credentials.sessionKey)
        && readString(object, "organizationId", credentials.organizationId)
        && readString(object, "apiSessionKey", credentials.apiSessionKey)
        && readString(object, "apiOrganizationId", credentials.apiOrganizationId)
        && readString(object, "cliCredentialsJSON", credentials.cliCredentialsJson)
        && readBool(object, "hasCliAccount", decoded.hasCliAccount)
        && readDate(object, "cliAccountSyncedAt", decoded.cliAccountSyncedAt)
        && readInt(object, "refreshInterval", decoded.refreshIntervalSecs)
        && readBool(object, "autoStartSessionEnabled", decoded.autoStartSessionEnabled)
        && readBool(object, "checkOverageLimitEnabled", decoded.checkOverageLimitEnabled)
        && readBool(object, "autoRotateEnabled", decoded.autoRotateEnabled)
        && readBool(object, "isSelectedForDisplay", decoded.isSelectedForDisplay)
        && readDate(object, "createdAt", decoded.createdAt)
        && readDate(object, "lastUsedAt", decoded.lastUsedAt);
    if (!ok) {
        LOG_DEBUG(QString("Profile %1 has a field of unexpected type").arg(decoded.id.toString()));
        return false;
    }
    if (decoded.refreshIntervalSecs > UsageSettings::MaxRefreshIntervalSecs) {
        LOG_WARNING(QString("Capping refresh interval of profile %1").arg(decoded.id.toString()));
        decoded.refreshIntervalSecs = UsageSettings::MaxRefreshIntervalSecs;
    }

    QJsonValue usage = object.value("claudeUsage");
    if (usage.isObject()) {
        UsageSnapshot snapshot;
        if (SnapshotCodec::snapshotFromJson(usage.toObject(), snapshot) == DecodeError::None) {
            decoded.cachedUsage = snapshot;
        } else {
            LOG_WARNING(QString("Dropping unreadable cached usage of profile %1").arg(decoded.id.toString()));
        }
    }

    profile = decoded;
    return true;
}

QByteArray SnapshotCodec::encodeProfiles(const QList<Profile>& profiles)
{
    QJsonArray array;
    for (const Profile& profile : profiles) {
        array.append(profileToJson(profile));
    }
    return QJsonDocument(array).toJson(QJsonDocument::Indented);
}

DecodeError SnapshotCodec::decodeProfiles(const QByteArray& data, QList<Profile>& profiles)
{
    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(data, &error);

    if (error.error != QJsonParseError::NoError || !doc.isArray()) {
        LOG_DEBUG(QString("Profile collection is not a JSON array: %1").arg(error.errorString()));
        return DecodeError::Malformed;
    }

    // One bad entry fails the whole collection so that a save cannot drop it silently
    QList<Profile> decoded;
    const QJsonArray array = doc.array();
    for (const QJsonValue& value : array) {
        Profile profile;
        if (!value.isObject() || !profileFromJson(value.toObject(), profile)) {
            return DecodeError::Malformed;
        }
        decoded.append(profile);
    }

    profiles = decoded;
    return DecodeError::None;
}

// --- Console billing ---

QByteArray SnapshotCodec::encodeApiUsage(const ApiUsage& usage)
{
    QJsonObject object;
    object["currentSpendCents"] = static_cast<double>(usage.currentSpendCents);
    object["prepaidCreditsCents"] = static_cast<double>(usage.prepaidCreditsCents);
    object["currency"] = usage.currency;
    object["resetsAt"] = dateToString(usage.resetsAt);
    return toBytes(object);
}

DecodeError SnapshotCodec::decodeApiUsage(const QByteArray& data, ApiUsage& usage)
{
    QJsonObject object;
    if (!parseObject(data, object, "API usage")) {
        return DecodeError::Malformed;
    }

    ApiUsage decoded;
    bool ok = object.value("currentSpendCents").isDouble()
        && object.value("currency").isString()
        && readInt64(object, "currentSpendCents", decoded.currentSpendCents)
        && readInt64(object, "prepaidCreditsCents", decoded.prepaidCreditsCents)
        && readString(object, "currency", decoded.currency)
        && readDate(object, "resetsAt", decoded.resetsAt);
    if (!ok) {
        return DecodeError::Malformed;
    }

    usage = decoded;
    return DecodeError::None;
}
