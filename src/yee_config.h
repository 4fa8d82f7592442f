#pragma once

#include <QHostAddress>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "yee_discovery.h"
#include "yee_sidechannel.h"

namespace yeectl {

struct ControllerConfig {
    QHostAddress multicastGroup = QHostAddress(QStringLiteral("239.255.255.250"));
    quint16 discoveryPort = kDiscoveryPort;
    int discoveryCeilingMs = kDefaultDiscoveryCeilingMs;
    int negotiationTimeoutMs = kDefaultNegotiationTimeoutMs;
    int connectTimeoutMs = kDefaultPrimaryReadyTimeoutMs;
    // Empty picks the first usable interface.
    QString interfaceName;
    bool traceCommunication = false;

    DiscoveryTarget discoveryTarget() const { return {multicastGroup, discoveryPort}; }
};

// Reads known keys over the defaults. Wrong-typed or out-of-range values
// keep their default and are listed in *warnings.
ControllerConfig configFromJson(const QJsonObject &json, QStringList *warnings = nullptr);

bool loadConfigFile(const QString &path, ControllerConfig *config, QString *error, QStringList *warnings = nullptr);

} // namespace yeectl
