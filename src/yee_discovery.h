#pragma once

#include <QByteArray>
#include <QHostAddress>
#include <QList>
#include <QString>

#include "yee_errors.h"

namespace yeectl {

class AddressResolver;

constexpr int kDefaultDiscoveryCeilingMs = 5000;
constexpr quint16 kDiscoveryPort = 1982;

struct DiscoveryTarget {
    QHostAddress group = QHostAddress(QStringLiteral("239.255.255.250"));
    quint16 port = kDiscoveryPort;
};

struct DiscoveryPolicy {
    enum class Mode {
        CollectExactly,
        CollectForDuration,
    };

    Mode mode = Mode::CollectForDuration;
    int count = 0;
    // Ceiling for CollectExactly, window length for CollectForDuration.
    int timeoutMs = 2000;

    static DiscoveryPolicy collectExactly(int count, int ceilingMs = kDefaultDiscoveryCeilingMs)
    {
        return {Mode::CollectExactly, count, ceilingMs};
    }

    static DiscoveryPolicy collectForDuration(int durationMs)
    {
        return {Mode::CollectForDuration, 0, durationMs};
    }
};

struct DiscoveryResult {
    bool ok = false;
    ErrorKind errorKind = ErrorKind::None;
    QString error;
    // Arrival order.
    QList<QByteArray> payloads;
    bool quotaReached = false;
    int dropped = 0;
};

class DiscoveryEngine
{
public:
    explicit DiscoveryEngine(const AddressResolver &resolver, const DiscoveryTarget &target = DiscoveryTarget());

    // Blocks in a local event loop until the policy is satisfied. Zero
    // replies is a successful, empty result.
    DiscoveryResult search(const DiscoveryPolicy &policy) const;

    static const QByteArray &searchMessage();

private:
    const AddressResolver &m_resolver;
    DiscoveryTarget m_target;
};

} // namespace yeectl
