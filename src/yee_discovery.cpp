#include "yee_discovery.h"

#include <QEventLoop>
#include <QNetworkDatagram>
#include <QTimer>
#include <QUdpSocket>

#include "yee_address.h"
#include "yee_logging.h"

namespace yeectl {

DiscoveryEngine::DiscoveryEngine(const AddressResolver &resolver, const DiscoveryTarget &target)
    : m_resolver(resolver)
    , m_target(target)
{
}

const QByteArray &DiscoveryEngine::searchMessage()
{
    static const QByteArray message = QByteArrayLiteral(
        "M-SEARCH * HTTP/1.1\r\n"
        "HOST: 239.255.255.250:1982\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "ST: wifi_bulb");
    return message;
}

DiscoveryResult DiscoveryEngine::search(const DiscoveryPolicy &policy) const
{
    DiscoveryResult result;

    const auto local = m_resolver.localAddress();
    if (!local.has_value() || local->isNull()) {
        result.errorKind = ErrorKind::SetupFailure;
        result.error = QStringLiteral("Local network address not found");
        qCWarning(discoveryLog) << "Discovery setup failed:" << result.error;
        return result;
    }

    const bool collectExactly = policy.mode == DiscoveryPolicy::Mode::CollectExactly;
    const int quota = collectExactly ? qMax(0, policy.count) : 0;
    const int waitMs = qMax(0, policy.timeoutMs);

    // Replies are addressed to the search's source endpoint, so the search
    // goes out through the listening socket itself.
    QUdpSocket listener;
    if (!listener.bind(*local, 0)) {
        result.errorKind = ErrorKind::SetupFailure;
        result.error = QStringLiteral("Cannot bind discovery listener on %1: %2")
                           .arg(local->toString(), listener.errorString());
        qCWarning(discoveryLog) << "Discovery setup failed:" << result.error;
        return result;
    }
    listener.setSocketOption(QAbstractSocket::MulticastTtlOption, 1);

    qCDebug(discoveryLog) << "Discovery listener ready on" << listener.localAddress().toString()
                          << listener.localPort();

    if (collectExactly && quota == 0) {
        listener.close();
        result.ok = true;
        result.quotaReached = true;
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);

    auto drain = [&]() {
        while (listener.hasPendingDatagrams()) {
            const QNetworkDatagram datagram = listener.receiveDatagram();
            if (!datagram.isValid())
                continue;
            if (collectExactly && result.payloads.size() >= quota) {
                ++result.dropped;
                qCDebug(discoveryLog) << "Dropping reply from" << datagram.senderAddress().toString()
                                      << "after quota of" << quota;
                continue;
            }
            result.payloads.append(datagram.data());
            qCDebug(discoveryLog) << "Reply" << result.payloads.size() << "from"
                                  << datagram.senderAddress().toString();
            if (collectExactly && result.payloads.size() >= quota) {
                result.quotaReached = true;
                loop.quit();
            }
        }
    };

    QObject::connect(&listener, &QUdpSocket::readyRead, &loop, drain);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    const qint64 written = listener.writeDatagram(searchMessage(), m_target.group, m_target.port);
    if (written < 0) {
        listener.close();
        result.errorKind = ErrorKind::SetupFailure;
        result.error = QStringLiteral("UDP search send error: %1").arg(listener.errorString());
        qCWarning(discoveryLog) << "Discovery setup failed:" << result.error;
        return result;
    }
    qCDebug(discoveryLog) << "search message sent to" << m_target.group.toString() << m_target.port;

    timer.start(waitMs);
    loop.exec();

    if (!result.quotaReached)
        drain();

    QObject::disconnect(&listener, nullptr, &loop, nullptr);
    listener.close();

    if (collectExactly && !result.quotaReached) {
        qCInfo(discoveryLog) << "listener cancelled after" << waitMs << "ms. Found" << result.payloads.size()
                             << "of" << quota << "lights.";
    } else {
        qCInfo(discoveryLog) << "listener successfully found" << result.payloads.size() << "lights.";
    }

    result.ok = true;
    return result;
}

} // namespace yeectl
