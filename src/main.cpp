#include <cstdlib>
#include <iostream>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QEventLoop>
#include <QStringList>
#include <QTextStream>
#include <QTimer>

#include "yee_address.h"
#include "yee_channel.h"
#include "yee_codec.h"
#include "yee_config.h"
#include "yee_device.h"
#include "yee_registry.h"
#include "yee_sidechannel.h"

using namespace yeectl;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

bool readInt(const QString &text, int *value)
{
    bool ok = false;
    *value = text.toInt(&ok);
    return ok;
}

std::string toStd(const QString &text)
{
    return text.toStdString();
}

DiscoveryPolicy policyFrom(const QCommandLineParser &parser, const ControllerConfig &config, QString *error)
{
    if (parser.isSet(QStringLiteral("count"))) {
        int count = 0;
        if (!readInt(parser.value(QStringLiteral("count")), &count) || count < 0) {
            *error = QStringLiteral("--count expects a non-negative integer");
            return {};
        }
        return DiscoveryPolicy::collectExactly(count, config.discoveryCeilingMs);
    }

    double seconds = 2.0;
    if (parser.isSet(QStringLiteral("seconds"))) {
        bool ok = false;
        seconds = parser.value(QStringLiteral("seconds")).toDouble(&ok);
        if (!ok || seconds < 0) {
            *error = QStringLiteral("--seconds expects a non-negative number");
            return {};
        }
    }
    return DiscoveryPolicy::collectForDuration(static_cast<int>(seconds * 1000));
}

// Translates "<command> [args...]" into a validated request.
Command commandFrom(const QStringList &args, QString *error)
{
    const QString verb = args.value(0);
    const QStringList rest = args.mid(1);
    int a = 0;
    int b = 0;

    if (verb == QLatin1String("power") && rest.size() == 1) {
        if (rest.at(0) == QLatin1String("on") || rest.at(0) == QLatin1String("off"))
            return setPower(rest.at(0) == QLatin1String("on"), Effect::Smooth, 500, error);
    } else if (verb == QLatin1String("bright") && rest.size() == 1 && readInt(rest.at(0), &a)) {
        return setBrightness(a, Effect::Smooth, 500, error);
    } else if (verb == QLatin1String("ct") && rest.size() == 1 && readInt(rest.at(0), &a)) {
        return setColorTemperature(a, Effect::Smooth, 500, error);
    } else if (verb == QLatin1String("rgb") && rest.size() == 1 && readInt(rest.at(0), &a)) {
        return setRgb(a, Effect::Smooth, 500, error);
    } else if (verb == QLatin1String("hsv") && rest.size() == 2 && readInt(rest.at(0), &a) && readInt(rest.at(1), &b)) {
        return setHsv(a, b, Effect::Smooth, 500, error);
    } else if (verb == QLatin1String("name") && !rest.isEmpty()) {
        return setName(rest.join(QLatin1Char(' ')));
    } else if (verb == QLatin1String("flow-stop") && rest.isEmpty()) {
        return stopColorFlow();
    }

    *error = QStringLiteral("unknown command or wrong arguments: %1").arg(args.join(QLatin1Char(' ')));
    return Command();
}

void printDevices(const DeviceRegistry &registry)
{
    const QHash<QString, Device *> aliases = registry.liveAliases();
    for (const Device *device : registry.devices()) {
        QStringList names;
        for (auto it = aliases.constBegin(); it != aliases.constEnd(); ++it) {
            if (it.value() == device)
                names.append(it.key());
        }
        const State &state = device->state();
        std::cout << toStd(device->id()) << "  " << toStd(device->address().toString()) << "  "
                  << toStd(device->info().model) << "  " << (state.power ? "on" : "off") << "  bright "
                  << state.brightness;
        if (!device->info().name.isEmpty())
            std::cout << "  name \"" << toStd(device->info().name) << '"';
        if (!names.isEmpty())
            std::cout << "  alias " << toStd(names.join(QStringLiteral(", ")));
        std::cout << '\n';
    }
}

// Lets replies and pushes arrive before the process exits.
void settle(int ms)
{
    QEventLoop loop;
    QTimer::singleShot(ms, &loop, &QEventLoop::quit);
    loop.exec();
}

int runSend(DeviceRegistry &registry, const ControllerConfig &config, const QStringList &args)
{
    if (args.size() < 2) {
        std::cerr << "usage: yeectl send <id|alias> <command> [args...]\n";
        return kExitUsage;
    }

    Device *device = registry.find(args.at(0));
    if (!device) {
        std::cerr << "no device " << toStd(args.at(0)) << " found\n";
        return kExitFailure;
    }
    if (!device->primaryChannel()->waitForReady(config.connectTimeoutMs)) {
        std::cerr << "cannot connect to " << toStd(device->address().toString()) << '\n';
        return kExitFailure;
    }

    const QStringList commandArgs = args.mid(1);
    if (commandArgs.at(0) == QLatin1String("music")) {
        SideChannelNegotiator negotiator(config.negotiationTimeoutMs, config.connectTimeoutMs);
        if (commandArgs.value(1) == QLatin1String("on")) {
            const NegotiationResult result = negotiator.activate(*device);
            if (!result.ok) {
                std::cerr << toStd(errorKindName(result.errorKind)) << ": " << toStd(result.error) << '\n';
                return kExitFailure;
            }
            std::cout << "side channel open on port " << result.listenerPort << '\n';
            return kExitOk;
        }
        if (commandArgs.value(1) == QLatin1String("off")) {
            negotiator.deactivate(*device);
            device->flush();
            settle(300);
            return kExitOk;
        }
        std::cerr << "usage: yeectl send <id|alias> music on|off\n";
        return kExitUsage;
    }

    QString error;
    const Command command = commandFrom(commandArgs, &error);
    if (!command.isValid()) {
        std::cerr << toStd(error) << '\n';
        return kExitFailure;
    }

    QObject::connect(device, &Device::commandError, [](qint64 id, int code, const QString &message) {
        std::cerr << "request " << id << " failed (" << code << "): " << toStd(message) << '\n';
    });
    QObject::connect(device, &Device::commandResult, [](qint64 id, const QStringList &results) {
        std::cout << "request " << id << ": " << toStd(results.join(QStringLiteral(", "))) << '\n';
    });

    QObject::connect(device, &Device::channelError, [](ErrorKind kind, const QString &message) {
        std::cerr << toStd(errorKindName(kind)) << ": " << toStd(message) << '\n';
    });

    device->communicate(command);
    device->flush();
    settle(500);
    return kExitOk;
}

int runAlias(DeviceRegistry &registry)
{
    QTextStream in(stdin);
    registry.assignAliases([&in](bool collided) {
        if (collided)
            std::cout << "That alias is taken, choose another: " << std::flush;
        else
            std::cout << "Alias for the highlighted light (empty keeps its id): " << std::flush;
        return in.readLine();
    });
    printDevices(registry);
    settle(300);
    return kExitOk;
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("yeectl"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Discover and control LAN lights"));
    parser.addHelpOption();
    parser.addOptions({
        {QStringLiteral("config"), QStringLiteral("JSON configuration file."), QStringLiteral("path")},
        {QStringLiteral("count"), QStringLiteral("Stop after N advertisements."), QStringLiteral("n")},
        {QStringLiteral("seconds"), QStringLiteral("Collect advertisements for S seconds."), QStringLiteral("s")},
        {QStringLiteral("trace"), QStringLiteral("Log every request and reply.")},
    });
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("discover | alias | send"));
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        std::cerr << toStd(parser.helpText());
        return kExitUsage;
    }

    const char *envConfig = std::getenv("YEECTL_CONFIG");
    const QString configPath = parser.isSet(QStringLiteral("config"))
        ? parser.value(QStringLiteral("config"))
        : (envConfig ? QString::fromLocal8Bit(envConfig) : QString());

    ControllerConfig config;
    if (!configPath.isEmpty()) {
        QString error;
        QStringList warnings;
        if (!loadConfigFile(configPath, &config, &error, &warnings)) {
            std::cerr << "failed to load config: " << toStd(error) << '\n';
            return kExitFailure;
        }
        for (const QString &warning : warnings)
            std::cerr << "config: " << toStd(warning) << '\n';
    }
    if (parser.isSet(QStringLiteral("trace")))
        config.traceCommunication = true;

    QString policyError;
    const DiscoveryPolicy policy = policyFrom(parser, config, &policyError);
    if (!policyError.isEmpty()) {
        std::cerr << toStd(policyError) << '\n';
        return kExitUsage;
    }

    const QString verb = positional.at(0);
    if (verb != QLatin1String("discover") && verb != QLatin1String("alias") && verb != QLatin1String("send")) {
        std::cerr << "unknown command " << toStd(verb) << '\n';
        return kExitUsage;
    }

    InterfaceAddressResolver resolver(config.interfaceName);
    DeviceRegistry registry(resolver, config.discoveryTarget());
    registry.setReadyTimeout(config.connectTimeoutMs);
    if (config.traceCommunication)
        registry.setTraceCommunication(true);

    const RegistryPass pass = registry.discover(policy);
    if (!pass.ok) {
        std::cerr << "discovery failed: " << toStd(pass.error) << '\n';
        return kExitFailure;
    }

    if (verb == QLatin1String("discover")) {
        printDevices(registry);
        std::cerr << pass.registered << " device(s), " << pass.discarded << " discarded advertisement(s)\n";
        return kExitOk;
    }
    if (verb == QLatin1String("alias"))
        return runAlias(registry);
    return runSend(registry, config, positional.mid(1));
}
