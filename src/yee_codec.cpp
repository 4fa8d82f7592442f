#include "yee_codec.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace yeectl {

namespace {

QString effectName(Effect effect)
{
    switch (effect) {
    case Effect::Sudden:
        return QStringLiteral("sudden");
    case Effect::Smooth:
        return QStringLiteral("smooth");
    }
    return QStringLiteral("sudden");
}

Command makeCommand(const QString &method, const QJsonArray &params = {})
{
    Command command;
    command.method = method;
    command.params = params;
    return command;
}

Command fail(QString *error, const QString &message)
{
    if (error)
        *error = message;
    return Command();
}

Command succeed(QString *error, Command command)
{
    if (error)
        error->clear();
    return command;
}

QString resultToString(const QJsonValue &value)
{
    if (value.isString())
        return value.toString();
    if (value.isDouble())
        return QString::number(value.toDouble(), 'g', 15);
    if (value.isBool())
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    if (value.isObject())
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    if (value.isArray())
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    return QString();
}

bool readId(const QJsonObject &obj, qint64 *id)
{
    const QJsonValue value = obj.value(QStringLiteral("id"));
    if (!value.isDouble())
        return false;
    *id = value.toInteger();
    return true;
}

} // namespace

bool checkRange(const QString &name, int value, int min, int max, QString *error)
{
    if (value < min) {
        if (error)
            *error = QStringLiteral("%1 of %2 below minimum inclusive of %3").arg(name).arg(value).arg(min);
        return false;
    }
    if (value > max) {
        if (error)
            *error = QStringLiteral("%1 of %2 above maximum inclusive of %3").arg(name).arg(value).arg(max);
        return false;
    }
    return true;
}

bool checkMinimum(const QString &name, int value, int min, QString *error)
{
    if (value < min) {
        if (error)
            *error = QStringLiteral("%1 of %2 below minimum inclusive of %3").arg(name).arg(value).arg(min);
        return false;
    }
    return true;
}

bool FlowProgram::addRgb(int rgb, int brightness, int durationMs, QString *error)
{
    if (!checkRange(QStringLiteral("rgb_value"), rgb, kRgbMin, kRgbMax, error)
        || !checkRange(QStringLiteral("bright_val"), brightness, kBrightnessMin, kBrightnessMax, error)
        || !checkMinimum(QStringLiteral("duration"), durationMs, kMinFlowDurationMs, error)) {
        return false;
    }
    m_states.append(FlowState{durationMs, FlowMode::Rgb, rgb, brightness});
    return true;
}

bool FlowProgram::addColorTemperature(int kelvin, int brightness, int durationMs, QString *error)
{
    if (!checkRange(QStringLiteral("color_temp"), kelvin, kColorTempMin, kColorTempMax, error)
        || !checkRange(QStringLiteral("bright_val"), brightness, kBrightnessMin, kBrightnessMax, error)
        || !checkMinimum(QStringLiteral("duration"), durationMs, kMinFlowDurationMs, error)) {
        return false;
    }
    m_states.append(FlowState{durationMs, FlowMode::ColorTemp, kelvin, brightness});
    return true;
}

bool FlowProgram::addWait(int durationMs, QString *error)
{
    if (!checkMinimum(QStringLiteral("duration"), durationMs, kMinFlowDurationMs, error))
        return false;
    m_states.append(FlowState{durationMs, FlowMode::Wait, 0, 0});
    return true;
}

QString FlowProgram::expression() const
{
    QStringList parts;
    parts.reserve(m_states.size() * 4);
    for (const FlowState &state : m_states) {
        parts << QString::number(state.durationMs)
              << QString::number(static_cast<int>(state.mode))
              << QString::number(state.value)
              << QString::number(state.brightness);
    }
    return parts.join(QStringLiteral(", "));
}

Command setColorTemperature(int kelvin, Effect effect, int durationMs, QString *error)
{
    QString reason;
    if (!checkRange(QStringLiteral("color_temp"), kelvin, kColorTempMin, kColorTempMax, &reason)
        || !checkMinimum(QStringLiteral("duration"), durationMs, kMinDurationMs, &reason)) {
        return fail(error, reason);
    }
    return succeed(error, makeCommand(QStringLiteral("set_ct_abx"), {kelvin, effectName(effect), durationMs}));
}

Command setRgb(int rgb, Effect effect, int durationMs, QString *error)
{
    QString reason;
    if (!checkRange(QStringLiteral("rgb_value"), rgb, kRgbMin, kRgbMax, &reason)
        || !checkMinimum(QStringLiteral("duration"), durationMs, kMinDurationMs, &reason)) {
        return fail(error, reason);
    }
    return succeed(error, makeCommand(QStringLiteral("set_rgb"), {rgb, effectName(effect), durationMs}));
}

Command setHsv(int hue, int saturation, Effect effect, int durationMs, QString *error)
{
    QString reason;
    if (!checkRange(QStringLiteral("hue_value"), hue, kHueMin, kHueMax, &reason)
        || !checkRange(QStringLiteral("sat_value"), saturation, kSaturationMin, kSaturationMax, &reason)
        || !checkMinimum(QStringLiteral("duration"), durationMs, kMinDurationMs, &reason)) {
        return fail(error, reason);
    }
    return succeed(error,
                   makeCommand(QStringLiteral("set_hsv"), {hue, saturation, effectName(effect), durationMs}));
}

Command setBrightness(int brightness, Effect effect, int durationMs, QString *error)
{
    QString reason;
    if (!checkRange(QStringLiteral("bright_value"), brightness, kBrightnessMin, kBrightnessMax, &reason)
        || !checkMinimum(QStringLiteral("duration"), durationMs, kMinDurationMs, &reason)) {
        return fail(error, reason);
    }
    return succeed(error, makeCommand(QStringLiteral("set_bright"), {brightness, effectName(effect), durationMs}));
}

Command setPower(bool on, Effect effect, int durationMs, QString *error)
{
    QString reason;
    if (!checkMinimum(QStringLiteral("duration"), durationMs, kMinDurationMs, &reason))
        return fail(error, reason);
    return succeed(error,
                   makeCommand(QStringLiteral("set_power"),
                               {on ? QStringLiteral("on") : QStringLiteral("off"), effectName(effect), durationMs}));
}

Command startColorFlow(FlowCount count, FlowCompletion completion, const FlowProgram &program, QString *error)
{
    if (program.stateCount() == 0)
        return fail(error, QStringLiteral("flow program has no states"));
    if (count.count < 0)
        return fail(error, QStringLiteral("flow count of %1 is negative").arg(count.count));
    if (!count.isInfinite() && count.count < program.stateCount()) {
        return fail(error,
                    QStringLiteral("flow count of %1 is fewer than the %2 states entered")
                        .arg(count.count)
                        .arg(program.stateCount()));
    }
    return succeed(error,
                   makeCommand(QStringLiteral("start_cf"),
                               {count.count, static_cast<int>(completion), program.expression()}));
}

Command stopColorFlow()
{
    return makeCommand(QStringLiteral("stop_cf"));
}

Command setSceneRgb(int rgb, int brightness, QString *error)
{
    QString reason;
    if (!checkRange(QStringLiteral("rgb_value"), rgb, kRgbMin, kRgbMax, &reason)
        || !checkRange(QStringLiteral("bright_value"), brightness, kBrightnessMin, kBrightnessMax, &reason)) {
        return fail(error, reason);
    }
    return succeed(error, makeCommand(QStringLiteral("set_scene"), {QStringLiteral("color"), rgb, brightness}));
}

Command setSceneHsv(int hue, int saturation, int brightness, QString *error)
{
    QString reason;
    if (!checkRange(QStringLiteral("hue_value"), hue, kHueMin, kHueMax, &reason)
        || !checkRange(QStringLiteral("sat_value"), saturation, kSaturationMin, kSaturationMax, &reason)
        || !checkRange(QStringLiteral("bright_value"), brightness, kBrightnessMin, kBrightnessMax, &reason)) {
        return fail(error, reason);
    }
    return succeed(error,
                   makeCommand(QStringLiteral("set_scene"), {QStringLiteral("hsv"), hue, saturation, brightness}));
}

Command setSceneColorTemperature(int kelvin, int brightness, QString *error)
{
    QString reason;
    if (!checkRange(QStringLiteral("color_temp"), kelvin, kColorTempMin, kColorTempMax, &reason)
        || !checkRange(QStringLiteral("bright_value"), brightness, kBrightnessMin, kBrightnessMax, &reason)) {
        return fail(error, reason);
    }
    return succeed(error, makeCommand(QStringLiteral("set_scene"), {QStringLiteral("ct"), kelvin, brightness}));
}

Command setMusicOn(const QString &host, int port, QString *error)
{
    if (host.trimmed().isEmpty())
        return fail(error, QStringLiteral("listener host is empty"));
    QString reason;
    if (!checkRange(QStringLiteral("listener port"), port, 1, 65535, &reason))
        return fail(error, reason);
    return succeed(error, makeCommand(QStringLiteral("set_music"), {1, host.trimmed(), port}));
}

Command setMusicOff()
{
    return makeCommand(QStringLiteral("set_music"), {0});
}

Command setName(const QString &name)
{
    return makeCommand(QStringLiteral("set_name"), {name});
}

QByteArray encodeRequest(qint64 id, const Command &command)
{
    if (!command.isValid())
        return QByteArray();

    QJsonObject request;
    request.insert(QStringLiteral("id"), id);
    request.insert(QStringLiteral("method"), command.method);
    request.insert(QStringLiteral("params"), command.params);
    return QJsonDocument(request).toJson(QJsonDocument::Compact) + QByteArrayLiteral("\r\n");
}

DecodedMessage decodeMessage(const QByteArray &line)
{
    DecodedMessage out;

    QJsonParseError err {};
    const QJsonDocument doc = QJsonDocument::fromJson(line.trimmed(), &err);
    if (err.error != QJsonParseError::NoError) {
        out.decodeError = QStringLiteral("invalid JSON: %1").arg(err.errorString());
        return out;
    }
    if (!doc.isObject()) {
        out.decodeError = QStringLiteral("not a JSON object");
        return out;
    }

    const QJsonObject obj = doc.object();
    out.hasId = readId(obj, &out.id);

    if (obj.contains(QStringLiteral("result"))) {
        const QJsonValue result = obj.value(QStringLiteral("result"));
        if (!result.isArray()) {
            out.decodeError = QStringLiteral("result is not an array");
            return out;
        }
        for (const QJsonValue &value : result.toArray())
            out.results.append(resultToString(value));
        out.kind = DecodedMessage::Kind::Result;
        return out;
    }

    if (obj.contains(QStringLiteral("error"))) {
        const QJsonObject errObj = obj.value(QStringLiteral("error")).toObject();
        const QJsonValue code = errObj.value(QStringLiteral("code"));
        const QJsonValue message = errObj.value(QStringLiteral("message"));
        if (!code.isDouble() || !message.isString()) {
            out.decodeError = QStringLiteral("error object lacks code or message");
            return out;
        }
        out.errorCode = code.toInt();
        out.errorMessage = message.toString();
        out.kind = DecodedMessage::Kind::Error;
        return out;
    }

    const QJsonValue params = obj.value(QStringLiteral("params"));
    const QString method = obj.value(QStringLiteral("method")).toString();
    if (params.isObject() && (method.isEmpty() || method == QLatin1String("props"))) {
        out.properties = params.toObject();
        out.kind = DecodedMessage::Kind::Push;
        return out;
    }

    out.decodeError = QStringLiteral("unrecognized message shape");
    return out;
}

} // namespace yeectl
