#include "yee_config.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace yeectl {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback, int min, int max, QStringList *warnings)
{
    if (!obj.contains(key))
        return fallback;
    const QJsonValue value = obj.value(key);
    if (!value.isDouble()) {
        if (warnings)
            warnings->append(QStringLiteral("%1: expected a number").arg(key));
        return fallback;
    }
    const double raw = value.toDouble();
    const int number = value.toInt(fallback);
    if (raw != static_cast<double>(number) || number < min || number > max) {
        if (warnings)
            warnings->append(QStringLiteral("%1: %2 outside [%3, %4]").arg(key).arg(raw).arg(min).arg(max));
        return fallback;
    }
    return number;
}

bool readBool(const QJsonObject &obj, const QString &key, bool fallback, QStringList *warnings)
{
    if (!obj.contains(key))
        return fallback;
    const QJsonValue value = obj.value(key);
    if (!value.isBool()) {
        if (warnings)
            warnings->append(QStringLiteral("%1: expected true or false").arg(key));
        return fallback;
    }
    return value.toBool();
}

QString readString(const QJsonObject &obj, const QString &key, const QString &fallback, QStringList *warnings)
{
    if (!obj.contains(key))
        return fallback;
    const QJsonValue value = obj.value(key);
    if (!value.isString()) {
        if (warnings)
            warnings->append(QStringLiteral("%1: expected a string").arg(key));
        return fallback;
    }
    return value.toString().trimmed();
}

} // namespace

ControllerConfig configFromJson(const QJsonObject &json, QStringList *warnings)
{
    ControllerConfig config;

    const QString group = readString(json, QStringLiteral("multicastGroup"), QString(), warnings);
    if (!group.isEmpty()) {
        const QHostAddress address(group);
        if (address.isNull() || !address.isMulticast()) {
            if (warnings)
                warnings->append(QStringLiteral("multicastGroup: %1 is not a multicast address").arg(group));
        } else {
            config.multicastGroup = address;
        }
    }

    config.discoveryPort = static_cast<quint16>(
        readInt(json, QStringLiteral("discoveryPort"), config.discoveryPort, 1, 65535, warnings));
    config.discoveryCeilingMs =
        readInt(json, QStringLiteral("discoveryCeilingMs"), config.discoveryCeilingMs, 0, 600000, warnings);
    config.negotiationTimeoutMs =
        readInt(json, QStringLiteral("negotiationTimeoutMs"), config.negotiationTimeoutMs, 1, 60000, warnings);
    config.connectTimeoutMs =
        readInt(json, QStringLiteral("connectTimeoutMs"), config.connectTimeoutMs, 1, 60000, warnings);
    config.interfaceName = readString(json, QStringLiteral("interface"), config.interfaceName, warnings);
    config.traceCommunication =
        readBool(json, QStringLiteral("traceCommunication"), config.traceCommunication, warnings);

    return config;
}

bool loadConfigFile(const QString &path, ControllerConfig *config, QString *error, QStringList *warnings)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error)
            *error = QStringLiteral("%1: %2 at offset %3").arg(path, parseError.errorString()).arg(parseError.offset);
        return false;
    }
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("%1: top level must be an object").arg(path);
        return false;
    }

    if (config)
        *config = configFromJson(doc.object(), warnings);
    return true;
}

} // namespace yeectl
