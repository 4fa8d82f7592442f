#pragma once

#include <optional>

#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>
#include <QStringList>

namespace yeectl {

enum class ColorMode {
    Rgb = 1,
    ColorTemp = 2,
    Hsv = 3,
};

struct State {
    bool power = false;
    ColorMode colorMode = ColorMode::Rgb;
    int brightness = 1;
    int colorTemp = 1700;
    int rgb = 0;
    int hue = 0;
    int sat = 0;
    std::optional<bool> flowing;
    std::optional<QList<int>> flowParams;
    bool sideChannelActive = false;
    std::optional<int> delayOffMinutes;
};

struct Info {
    QString id;
    QString name;
    QString model;
    QStringList support;
};

struct DeviceAddress {
    QHostAddress host;
    quint16 port = 0;

    QString toString() const { return QStringLiteral("%1:%2").arg(host.toString()).arg(port); }
};

using PropertyMap = QHash<QString, QString>;

// Properties an advertisement must carry for a device to be accepted.
const QStringList &requiredAdvertisementProperties();

// Splits a CRLF advertisement into properties; the Location line becomes ip/port.
PropertyMap parseAdvertisement(const QByteArray &payload);

struct DeviceRecord {
    Info info;
    DeviceAddress address;
    State state;
};

std::optional<DeviceRecord> deviceRecordFromProperties(const PropertyMap &properties, QString *error = nullptr);

struct PushOutcome {
    QStringList applied;
    // key -> reason; value had the wrong type or was out of range
    QHash<QString, QString> rejected;
    QStringList unknown;
};

// Applies one pushed property. Returns false and leaves state untouched on rejection.
bool applyProperty(State &state, Info &info, const QString &key, const QJsonValue &value, QString *error = nullptr);

PushOutcome applyProperties(State &state, Info &info, const QJsonObject &properties);

bool isKnownProperty(const QString &key);

} // namespace yeectl
