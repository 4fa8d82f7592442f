#include "yee_logging.h"

Q_LOGGING_CATEGORY(discoveryLog, "yeectl.discovery");
Q_LOGGING_CATEGORY(channelLog, "yeectl.channel");
Q_LOGGING_CATEGORY(codecLog, "yeectl.codec");
Q_LOGGING_CATEGORY(deviceLog, "yeectl.device");
Q_LOGGING_CATEGORY(sideChannelLog, "yeectl.sidechannel");
Q_LOGGING_CATEGORY(registryLog, "yeectl.registry");
Q_LOGGING_CATEGORY(wireLog, "yeectl.wire", QtInfoMsg);

namespace yeectl {

void setWireTraceEnabled(bool enabled)
{
    QLoggingCategory::setFilterRules(enabled ? QStringLiteral("yeectl.wire.debug=true")
                                             : QStringLiteral("yeectl.wire.debug=false"));
}

} // namespace yeectl
