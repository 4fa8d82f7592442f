#include "yee_registry.h"

#include <algorithm>
#include <utility>

#include "yee_address.h"
#include "yee_channel.h"
#include "yee_device.h"
#include "yee_logging.h"

namespace yeectl {

namespace {

constexpr int kDimColorTemp = 1700;
constexpr int kDimBrightness = 1;
constexpr int kMarkerColorTemp = 5000;
constexpr int kMarkerBrightness = 100;
constexpr int kDefaultOnHue = 60;
constexpr int kDefaultOnSaturation = 100;
constexpr int kDefaultOnBrightness = 100;

} // namespace

DeviceRegistry::DeviceRegistry(const AddressResolver &resolver, const DiscoveryTarget &target, QObject *parent)
    : QObject(parent)
    , m_engine(resolver, target)
{
}

DeviceRegistry::~DeviceRegistry()
{
    clearDevices();
}

void DeviceRegistry::clearDevices()
{
    if (m_devices.isEmpty())
        return;

    for (Device *device : std::as_const(m_devices))
        device->cancel();
    m_liveAliases.clear();
    qDeleteAll(m_devices);
    m_devices.clear();
    emit devicesCleared();
}

RegistryPass DeviceRegistry::discover(const DiscoveryPolicy &policy)
{
    clearDevices();

    RegistryPass pass;
    const DiscoveryResult found = m_engine.search(policy);
    if (!found.ok) {
        pass.errorKind = found.errorKind;
        pass.error = found.error;
        rebuildLiveAliases();
        return pass;
    }
    pass.dropped = found.dropped;

    for (const QByteArray &payload : found.payloads) {
        QString error;
        switch (addAdvertisement(payload, &error)) {
        case AdvertisementOutcome::Registered:
            ++pass.registered;
            break;
        case AdvertisementOutcome::Discarded:
            ++pass.discarded;
            break;
        case AdvertisementOutcome::Duplicate:
            ++pass.duplicates;
            break;
        }
    }

    rebuildLiveAliases();
    qCInfo(registryLog) << "Discovery pass registered" << pass.registered << "devices," << pass.discarded
                        << "discarded," << pass.duplicates << "duplicates";
    pass.ok = true;
    return pass;
}

DeviceRegistry::AdvertisementOutcome DeviceRegistry::addAdvertisement(const QByteArray &payload, QString *error)
{
    QString parseError;
    const std::optional<DeviceRecord> record = deviceRecordFromProperties(parseAdvertisement(payload), &parseError);
    if (!record) {
        qCWarning(registryLog).noquote() << "Discarding advertisement:" << parseError;
        if (error)
            *error = parseError;
        return AdvertisementOutcome::Discarded;
    }

    const QString id = record->info.id;
    if (m_devices.contains(id)) {
        qCDebug(registryLog) << "Device" << id << "already registered in this pass";
        return AdvertisementOutcome::Duplicate;
    }

    auto *device = new Device(*record, this);
    if (m_trace)
        device->setTraceCommunication(true);
    m_devices.insert(id, device);
    qCInfo(registryLog) << "Registered" << id << record->info.model << "at" << record->address.toString();
    emit deviceAdded(device);
    return AdvertisementOutcome::Registered;
}

void DeviceRegistry::rebuildLiveAliases()
{
    m_liveAliases.clear();
    for (auto it = m_savedAliases.constBegin(); it != m_savedAliases.constEnd(); ++it) {
        if (Device *device = m_devices.value(it.value(), nullptr))
            m_liveAliases.insert(it.key(), device);
    }
}

bool DeviceRegistry::isAliasFree(const QString &alias, const QString &id) const
{
    const auto it = m_savedAliases.constFind(alias);
    return it == m_savedAliases.constEnd() || it.value() == id;
}

bool DeviceRegistry::bindAlias(const QString &alias, const QString &id)
{
    if (alias.isEmpty() || id.isEmpty() || !isAliasFree(alias, id))
        return false;
    m_savedAliases.insert(alias, id);
    rebuildLiveAliases();
    return true;
}

void DeviceRegistry::sendOrLog(Device *device, const Command &command, const QString &what, const QString &error)
{
    if (!command.isValid()) {
        qCWarning(registryLog).noquote() << device->id() << "skipping" << what << ":" << error;
        return;
    }
    device->communicate(command);
}

void DeviceRegistry::restoreState(Device *device, const State &state)
{
    QString error;
    if (!state.power) {
        sendOrLog(device, setPower(false, Effect::Sudden, kMinDurationMs, &error), QStringLiteral("restore"), error);
        return;
    }

    Command command;
    switch (state.colorMode) {
    case ColorMode::Rgb:
        command = setSceneRgb(state.rgb, state.brightness, &error);
        break;
    case ColorMode::ColorTemp:
        command = setSceneColorTemperature(state.colorTemp, state.brightness, &error);
        break;
    case ColorMode::Hsv:
        command = setSceneHsv(state.hue, state.sat, state.brightness, &error);
        break;
    }
    sendOrLog(device, command, QStringLiteral("restore"), error);
}

void DeviceRegistry::assignAliases(const NameProvider &nameProvider)
{
    if (!nameProvider)
        return;

    const QList<Device *> ordered = devices();
    for (Device *device : ordered) {
        const State before = device->state();
        if (!device->primaryChannel()->waitForReady(m_readyTimeoutMs))
            qCWarning(registryLog) << device->id() << "is not reachable, naming it anyway";

        QString error;
        sendOrLog(device, setSceneColorTemperature(kDimColorTemp, kDimBrightness, &error), QStringLiteral("dim"),
                  error);
        sendOrLog(device, setSceneColorTemperature(kMarkerColorTemp, kMarkerBrightness, &error),
                  QStringLiteral("marker"), error);
        device->flush();

        bool collided = false;
        QString alias;
        for (;;) {
            const QString candidate = nameProvider(collided).trimmed();
            if (candidate.isEmpty()) {
                alias = device->id();
                break;
            }
            if (isAliasFree(candidate, device->id())) {
                alias = candidate;
                break;
            }
            qCInfo(registryLog) << "Alias" << candidate << "is already taken";
            collided = true;
        }

        m_savedAliases.insert(alias, device->id());
        qCInfo(registryLog) << "Bound alias" << alias << "to" << device->id();

        restoreState(device, before);
        device->flush();
    }

    rebuildLiveAliases();

    for (Device *device : ordered) {
        QString error;
        sendOrLog(device, setSceneHsv(kDefaultOnHue, kDefaultOnSaturation, kDefaultOnBrightness, &error),
                  QStringLiteral("default on"), error);
        device->flush();
    }
}

QList<Device *> DeviceRegistry::devices() const
{
    QList<Device *> list = m_devices.values();
    std::sort(list.begin(), list.end(), [](const Device *a, const Device *b) { return a->id() < b->id(); });
    return list;
}

Device *DeviceRegistry::device(const QString &id) const
{
    return m_devices.value(id, nullptr);
}

Device *DeviceRegistry::deviceByAlias(const QString &alias) const
{
    return m_liveAliases.value(alias, nullptr);
}

Device *DeviceRegistry::find(const QString &name) const
{
    if (Device *byAlias = deviceByAlias(name))
        return byAlias;
    return device(name);
}

void DeviceRegistry::setTraceCommunication(bool enabled)
{
    m_trace = enabled;
    setWireTraceEnabled(enabled);
    for (Device *device : std::as_const(m_devices))
        device->setTraceCommunication(enabled);
}

} // namespace yeectl
