#pragma once

#include <optional>
#include <utility>

#include <QHostAddress>
#include <QString>

namespace yeectl {

class AddressResolver
{
public:
    virtual ~AddressResolver() = default;

    // Local outbound IPv4 address, if the host has one.
    virtual std::optional<QHostAddress> localAddress() const = 0;
};

// Picks the first up, running, non-loopback IPv4 address, optionally
// restricted to a named interface.
class InterfaceAddressResolver final : public AddressResolver
{
public:
    explicit InterfaceAddressResolver(const QString &interfaceName = QString());

    std::optional<QHostAddress> localAddress() const override;

private:
    QString m_interfaceName;
};

class FixedAddressResolver final : public AddressResolver
{
public:
    explicit FixedAddressResolver(std::optional<QHostAddress> address)
        : m_address(std::move(address))
    {
    }

    std::optional<QHostAddress> localAddress() const override { return m_address; }

private:
    std::optional<QHostAddress> m_address;
};

} // namespace yeectl
