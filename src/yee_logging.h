#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(discoveryLog)
Q_DECLARE_LOGGING_CATEGORY(channelLog)
Q_DECLARE_LOGGING_CATEGORY(codecLog)
Q_DECLARE_LOGGING_CATEGORY(deviceLog)
Q_DECLARE_LOGGING_CATEGORY(sideChannelLog)
Q_DECLARE_LOGGING_CATEGORY(registryLog)
// Raw request/response traffic; debug level is disabled unless tracing is on.
Q_DECLARE_LOGGING_CATEGORY(wireLog)

namespace yeectl {

void setWireTraceEnabled(bool enabled);

} // namespace yeectl
