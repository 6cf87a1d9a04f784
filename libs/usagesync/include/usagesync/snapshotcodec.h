#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include "usagesnapshot.h"
#include "usagesettings.h"
#include "profile.h"

enum class DecodeError {
    None,
    Malformed
};

/**
 * @brief JSON encoding of everything shared through the tiers
 *
 * Decoders are schema tolerant: unknown fields are ignored and missing fields
 * keep their defaults, so payloads written by newer or older producers decode.
 * A payload is Malformed only when it is not JSON of the expected shape (a torn
 * write, for instance) or a known field carries the wrong type.
 */
class SnapshotCodec {
public:
    static constexpr int SchemaVersion = 2;

    static QByteArray encodeSnapshot(const UsageSnapshot& snapshot);
    static DecodeError decodeSnapshot(const QByteArray& data, UsageSnapshot& snapshot);

    /**
     * @brief Decodes the payload an older producer stores in the key-value tier
     *
     * That shape names the reset times sessionResetTime/weeklyResetTime, carries
     * the per-model and extra-usage values as flat fields and may encode dates
     * as seconds since 2001-01-01 UTC. Canonical payloads are accepted too.
     */
    static DecodeError decodeCompatSnapshot(const QByteArray& data, UsageSnapshot& snapshot);

    static QJsonObject snapshotToJson(const UsageSnapshot& snapshot);
    static DecodeError snapshotFromJson(const QJsonObject& object, UsageSnapshot& snapshot);

    static QByteArray encodeSettings(const UsageSettings& settings);
    static DecodeError decodeSettings(const QByteArray& data, UsageSettings& settings);

    static QByteArray encodeProfiles(const QList<Profile>& profiles);
    static DecodeError decodeProfiles(const QByteArray& data, QList<Profile>& profiles);

    static QByteArray encodeApiUsage(const ApiUsage& usage);
    static DecodeError decodeApiUsage(const QByteArray& data, ApiUsage& usage);

    static QString dateToString(const QDateTime& dateTime);
    static QDateTime dateFromValue(const QJsonValue& value, bool* ok = nullptr);
};
