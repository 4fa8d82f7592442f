#pragma once

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

namespace yeectl {

// Protocol ranges, inclusive.
constexpr int kBrightnessMin = 1;
constexpr int kBrightnessMax = 100;
constexpr int kColorTempMin = 1700;
constexpr int kColorTempMax = 6500;
constexpr int kRgbMin = 1;
constexpr int kRgbMax = 16777215;
constexpr int kHueMin = 0;
constexpr int kHueMax = 359;
constexpr int kSaturationMin = 0;
constexpr int kSaturationMax = 100;
constexpr int kMinDurationMs = 30;
constexpr int kMinFlowDurationMs = 50;

enum class Effect {
    Sudden,
    Smooth,
};

enum class FlowCompletion {
    ReturnPrevious = 0,
    StayCurrent = 1,
    TurnOff = 2,
};

enum class FlowMode {
    Rgb = 1,
    ColorTemp = 2,
    Wait = 7,
};

// A method plus its positional params. An invalid Command never reaches the wire.
struct Command {
    QString method;
    QJsonArray params;

    bool isValid() const noexcept { return !method.isEmpty(); }
};

struct FlowState {
    int durationMs = 0;
    FlowMode mode = FlowMode::Wait;
    int value = 0;
    int brightness = 0;
};

// Accumulates validated flow states for start_cf.
class FlowProgram
{
public:
    bool addRgb(int rgb, int brightness, int durationMs, QString *error = nullptr);
    bool addColorTemperature(int kelvin, int brightness, int durationMs, QString *error = nullptr);
    bool addWait(int durationMs, QString *error = nullptr);

    int stateCount() const { return static_cast<int>(m_states.size()); }
    const QList<FlowState> &states() const { return m_states; }

    // "duration, mode, value, brightness, ..." as the device expects it.
    QString expression() const;

private:
    QList<FlowState> m_states;
};

// Repeat count for start_cf; 0 means loop until stopped.
struct FlowCount {
    int count = 0;

    static FlowCount infinite() { return {0}; }
    static FlowCount finite(int count) { return {count}; }
    bool isInfinite() const noexcept { return count == 0; }
};

bool checkRange(const QString &name, int value, int min, int max, QString *error = nullptr);
bool checkMinimum(const QString &name, int value, int min, QString *error = nullptr);

Command setColorTemperature(int kelvin, Effect effect, int durationMs = kMinDurationMs, QString *error = nullptr);
Command setRgb(int rgb, Effect effect, int durationMs = kMinDurationMs, QString *error = nullptr);
Command setHsv(int hue, int saturation, Effect effect, int durationMs = kMinDurationMs, QString *error = nullptr);
Command setBrightness(int brightness, Effect effect, int durationMs = kMinDurationMs, QString *error = nullptr);
Command setPower(bool on, Effect effect, int durationMs = kMinDurationMs, QString *error = nullptr);
Command startColorFlow(FlowCount count, FlowCompletion completion, const FlowProgram &program,
                       QString *error = nullptr);
Command stopColorFlow();
Command setSceneRgb(int rgb, int brightness, QString *error = nullptr);
Command setSceneHsv(int hue, int saturation, int brightness, QString *error = nullptr);
Command setSceneColorTemperature(int kelvin, int brightness, QString *error = nullptr);
Command setMusicOn(const QString &host, int port, QString *error = nullptr);
Command setMusicOff();
Command setName(const QString &name);

// One newline-terminated request line: {"id":..,"method":..,"params":[..]}\r\n.
// Returns an empty array for an invalid command.
QByteArray encodeRequest(qint64 id, const Command &command);

struct DecodedMessage {
    enum class Kind {
        Invalid,
        Result,
        Error,
        Push,
    };

    Kind kind = Kind::Invalid;
    qint64 id = 0;
    bool hasId = false;
    QStringList results;
    int errorCode = 0;
    QString errorMessage;
    QJsonObject properties;
    QString decodeError;
};

DecodedMessage decodeMessage(const QByteArray &line);

} // namespace yeectl
