#pragma once

#include <functional>

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QObject>
#include <QString>

#include "yee_codec.h"
#include "yee_discovery.h"
#include "yee_errors.h"
#include "yee_model.h"

namespace yeectl {

class AddressResolver;
class Device;

// Called with true when the previous candidate was already taken.
using NameProvider = std::function<QString(bool collided)>;

struct RegistryPass {
    bool ok = false;
    ErrorKind errorKind = ErrorKind::None;
    QString error;
    int registered = 0;
    int discarded = 0;
    int duplicates = 0;
    int dropped = 0;
};

// Owns every discovered Device and the alias bindings that outlive them.
// Not reentrant: discover() and assignAliases() must not interleave.
class DeviceRegistry : public QObject
{
    Q_OBJECT
public:
    enum class AdvertisementOutcome {
        Registered,
        Discarded,
        Duplicate,
    };

    explicit DeviceRegistry(const AddressResolver &resolver, const DiscoveryTarget &target = DiscoveryTarget(),
                            QObject *parent = nullptr);
    ~DeviceRegistry() override;

    // Replaces the whole device set with the result of one search.
    RegistryPass discover(const DiscoveryPolicy &policy);

    AdvertisementOutcome addAdvertisement(const QByteArray &payload, QString *error = nullptr);

    void assignAliases(const NameProvider &nameProvider);

    // Fails if the alias is already bound to another id.
    bool bindAlias(const QString &alias, const QString &id);

    // Sorted by id.
    QList<Device *> devices() const;
    int deviceCount() const { return m_devices.size(); }
    Device *device(const QString &id) const;
    Device *deviceByAlias(const QString &alias) const;
    // Alias first, then id.
    Device *find(const QString &name) const;

    QHash<QString, QString> savedAliases() const { return m_savedAliases; }
    QHash<QString, Device *> liveAliases() const { return m_liveAliases; }

    void setTraceCommunication(bool enabled);
    void setReadyTimeout(int timeoutMs) { m_readyTimeoutMs = timeoutMs; }

signals:
    void deviceAdded(yeectl::Device *device);
    void devicesCleared();

private:
    void clearDevices();
    void rebuildLiveAliases();
    bool isAliasFree(const QString &alias, const QString &id) const;
    void sendOrLog(Device *device, const Command &command, const QString &what, const QString &error);
    void restoreState(Device *device, const State &state);

    DiscoveryEngine m_engine;
    QHash<QString, Device *> m_devices;
    QHash<QString, QString> m_savedAliases;
    QHash<QString, Device *> m_liveAliases;
    bool m_trace = false;
    int m_readyTimeoutMs = 2000;
};

} // namespace yeectl
