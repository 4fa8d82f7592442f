#include "yee_model.h"

#include <cmath>
#include <limits>
#include <utility>

#include "yee_codec.h"

namespace yeectl {

namespace {

const QString kLocationPrefix = QStringLiteral("Location: yeelight://");

int parseIntOr(const QString &text, int fallback)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    return ok ? value : fallback;
}

// Devices report numbers either as JSON numbers or as decimal strings.
std::optional<int> jsonToInt(const QJsonValue &value)
{
    if (value.isDouble()) {
        const double d = value.toDouble();
        if (std::floor(d) != d)
            return std::nullopt;
        if (d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max())
            return std::nullopt;
        return static_cast<int>(d);
    }
    if (value.isString()) {
        bool ok = false;
        const int parsed = value.toString().trimmed().toInt(&ok);
        if (ok)
            return parsed;
    }
    return std::nullopt;
}

std::optional<bool> jsonFlagToBool(const QJsonValue &value)
{
    if (value.isBool())
        return value.toBool();
    const auto flag = jsonToInt(value);
    if (!flag.has_value())
        return std::nullopt;
    if (*flag == 1)
        return true;
    if (*flag == 0)
        return false;
    return std::nullopt;
}

bool reject(QString *error, const QString &message)
{
    if (error)
        *error = message;
    return false;
}

bool readRanged(const QString &key, const QJsonValue &value, int min, int max, int *out, QString *error)
{
    const auto parsed = jsonToInt(value);
    if (!parsed.has_value())
        return reject(error, QStringLiteral("%1 is not an integer").arg(key));
    if (!checkRange(key, *parsed, min, max, error))
        return false;
    *out = *parsed;
    return true;
}

} // namespace

const QStringList &requiredAdvertisementProperties()
{
    static const QStringList required = {
        QStringLiteral("ip"),
        QStringLiteral("port"),
        QStringLiteral("id"),
        QStringLiteral("power"),
        QStringLiteral("bright"),
        QStringLiteral("color_mode"),
        QStringLiteral("ct"),
        QStringLiteral("rgb"),
        QStringLiteral("hue"),
        QStringLiteral("sat"),
        QStringLiteral("name"),
        QStringLiteral("model"),
        QStringLiteral("support"),
    };
    return required;
}

PropertyMap parseAdvertisement(const QByteArray &payload)
{
    PropertyMap properties;

    QStringList lines = QString::fromUtf8(payload).split(QStringLiteral("\r\n"));
    // Status line.
    if (!lines.isEmpty())
        lines.removeFirst();

    for (const QString &line : std::as_const(lines)) {
        if (line.isEmpty())
            continue;

        if (line.startsWith(kLocationPrefix)) {
            const QString hostPort = line.mid(kLocationPrefix.size()).trimmed();
            const int sep = hostPort.lastIndexOf(QLatin1Char(':'));
            if (sep <= 0)
                continue;
            properties.insert(QStringLiteral("ip"), hostPort.left(sep));
            properties.insert(QStringLiteral("port"), hostPort.mid(sep + 1));
            continue;
        }

        const int sep = line.indexOf(QLatin1Char(':'));
        if (sep <= 0)
            continue;
        QString value = line.mid(sep + 1);
        if (value.startsWith(QLatin1Char(' ')))
            value.remove(0, 1);
        properties.insert(line.left(sep), value);
    }

    return properties;
}

std::optional<DeviceRecord> deviceRecordFromProperties(const PropertyMap &properties, QString *error)
{
    for (const QString &key : requiredAdvertisementProperties()) {
        if (!properties.contains(key)) {
            if (error)
                *error = QStringLiteral("missing property %1").arg(key);
            return std::nullopt;
        }
    }

    DeviceRecord record;

    const QString ip = properties.value(QStringLiteral("ip")).trimmed();
    if (!record.address.host.setAddress(ip)) {
        if (error)
            *error = QStringLiteral("invalid ip %1").arg(ip);
        return std::nullopt;
    }

    bool portOk = false;
    const uint port = properties.value(QStringLiteral("port")).trimmed().toUInt(&portOk);
    if (!portOk || port == 0 || port > 65535) {
        if (error)
            *error = QStringLiteral("invalid port %1").arg(properties.value(QStringLiteral("port")));
        return std::nullopt;
    }
    record.address.port = static_cast<quint16>(port);

    record.info.id = properties.value(QStringLiteral("id")).trimmed();
    if (record.info.id.isEmpty()) {
        if (error)
            *error = QStringLiteral("empty id");
        return std::nullopt;
    }
    record.info.name = properties.value(QStringLiteral("name"));
    record.info.model = properties.value(QStringLiteral("model")).trimmed();
    record.info.support = properties.value(QStringLiteral("support")).split(QLatin1Char(' '), Qt::SkipEmptyParts);

    // Factory-reset devices report empty values for properties never used.
    State &state = record.state;
    state.power = properties.value(QStringLiteral("power")).trimmed() == QLatin1String("on");
    switch (parseIntOr(properties.value(QStringLiteral("color_mode")), 1)) {
    case 2:
        state.colorMode = ColorMode::ColorTemp;
        break;
    case 3:
        state.colorMode = ColorMode::Hsv;
        break;
    default:
        state.colorMode = ColorMode::Rgb;
        break;
    }
    state.brightness = parseIntOr(properties.value(QStringLiteral("bright")), 1);
    state.colorTemp = parseIntOr(properties.value(QStringLiteral("ct")), 1700);
    state.rgb = parseIntOr(properties.value(QStringLiteral("rgb")), 0);
    state.hue = parseIntOr(properties.value(QStringLiteral("hue")), 0);
    state.sat = parseIntOr(properties.value(QStringLiteral("sat")), 0);

    if (error)
        error->clear();
    return record;
}

bool isKnownProperty(const QString &key)
{
    static const QStringList known = {
        QStringLiteral("power"),
        QStringLiteral("bright"),
        QStringLiteral("color_mode"),
        QStringLiteral("ct"),
        QStringLiteral("rgb"),
        QStringLiteral("hue"),
        QStringLiteral("sat"),
        QStringLiteral("name"),
        QStringLiteral("flowing"),
        QStringLiteral("flow_params"),
        QStringLiteral("music_on"),
        QStringLiteral("delayoff"),
    };
    return known.contains(key);
}

bool applyProperty(State &state, Info &info, const QString &key, const QJsonValue &value, QString *error)
{
    if (key == QLatin1String("power")) {
        const QString text = value.toString();
        if (!value.isString() || (text != QLatin1String("on") && text != QLatin1String("off")))
            return reject(error, QStringLiteral("power is not \"on\" or \"off\""));
        state.power = text == QLatin1String("on");
    } else if (key == QLatin1String("bright")) {
        return readRanged(key, value, kBrightnessMin, kBrightnessMax, &state.brightness, error);
    } else if (key == QLatin1String("color_mode")) {
        int mode = 0;
        if (!readRanged(key, value, 1, 3, &mode, error))
            return false;
        state.colorMode = static_cast<ColorMode>(mode);
    } else if (key == QLatin1String("ct")) {
        return readRanged(key, value, kColorTempMin, kColorTempMax, &state.colorTemp, error);
    } else if (key == QLatin1String("rgb")) {
        return readRanged(key, value, kRgbMin, kRgbMax, &state.rgb, error);
    } else if (key == QLatin1String("hue")) {
        return readRanged(key, value, kHueMin, kHueMax, &state.hue, error);
    } else if (key == QLatin1String("sat")) {
        return readRanged(key, value, kSaturationMin, kSaturationMax, &state.sat, error);
    } else if (key == QLatin1String("name")) {
        if (!value.isString())
            return reject(error, QStringLiteral("name is not a string"));
        info.name = value.toString();
    } else if (key == QLatin1String("flowing")) {
        const auto flowing = jsonFlagToBool(value);
        if (!flowing.has_value())
            return reject(error, QStringLiteral("flowing is not a 0/1 flag"));
        state.flowing = *flowing;
    } else if (key == QLatin1String("flow_params")) {
        if (!value.isString())
            return reject(error, QStringLiteral("flow_params is not a string"));
        QList<int> params;
        const QStringList parts = value.toString().split(QLatin1Char(','), Qt::SkipEmptyParts);
        for (const QString &part : parts) {
            bool ok = false;
            const int n = part.trimmed().toInt(&ok);
            if (!ok)
                return reject(error, QStringLiteral("flow_params component \"%1\" is not an integer").arg(part.trimmed()));
            params.append(n);
        }
        if (params.size() % 4 != 0)
            return reject(error, QStringLiteral("flow_params length %1 is not a multiple of 4").arg(params.size()));
        state.flowParams = params;
    } else if (key == QLatin1String("music_on")) {
        const auto active = jsonFlagToBool(value);
        if (!active.has_value())
            return reject(error, QStringLiteral("music_on is not a 0/1 flag"));
        state.sideChannelActive = *active;
    } else if (key == QLatin1String("delayoff")) {
        const auto minutes = jsonToInt(value);
        if (!minutes.has_value() || *minutes < 0)
            return reject(error, QStringLiteral("delayoff is not a non-negative integer"));
        state.delayOffMinutes = *minutes;
    } else {
        return reject(error, QStringLiteral("unknown property %1").arg(key));
    }

    if (error)
        error->clear();
    return true;
}

PushOutcome applyProperties(State &state, Info &info, const QJsonObject &properties)
{
    PushOutcome outcome;
    for (auto it = properties.constBegin(); it != properties.constEnd(); ++it) {
        if (!isKnownProperty(it.key())) {
            outcome.unknown.append(it.key());
            continue;
        }
        QString reason;
        if (applyProperty(state, info, it.key(), it.value(), &reason))
            outcome.applied.append(it.key());
        else
            outcome.rejected.insert(it.key(), reason);
    }
    return outcome;
}

} // namespace yeectl
