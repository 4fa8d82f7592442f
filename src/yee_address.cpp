#include "yee_address.h"

#include <QNetworkInterface>

#include "yee_logging.h"

namespace yeectl {

InterfaceAddressResolver::InterfaceAddressResolver(const QString &interfaceName)
    : m_interfaceName(interfaceName.trimmed())
{
}

std::optional<QHostAddress> InterfaceAddressResolver::localAddress() const
{
    const QList<QNetworkInterface> interfaces = QNetworkInterface::allInterfaces();
    for (const QNetworkInterface &iface : interfaces) {
        if (!m_interfaceName.isEmpty() && iface.name() != m_interfaceName)
            continue;

        const QNetworkInterface::InterfaceFlags flags = iface.flags();
        if (!flags.testFlag(QNetworkInterface::IsUp) || !flags.testFlag(QNetworkInterface::IsRunning))
            continue;
        if (flags.testFlag(QNetworkInterface::IsLoopBack))
            continue;

        for (const QNetworkAddressEntry &entry : iface.addressEntries()) {
            const QHostAddress ip = entry.ip();
            if (ip.protocol() == QAbstractSocket::IPv4Protocol && !ip.isLoopback())
                return ip;
        }
    }

    if (m_interfaceName.isEmpty())
        qCWarning(discoveryLog) << "No IPv4 address found on any network interface";
    else
        qCWarning(discoveryLog) << "No IPv4 address found on interface" << m_interfaceName;
    return std::nullopt;
}

} // namespace yeectl
