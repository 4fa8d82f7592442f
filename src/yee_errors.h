#pragma once

#include <QString>

namespace yeectl {

enum class ErrorKind {
    None,
    SetupFailure,
    ValidationFailure,
    ProtocolDecodeFailure,
    TransportFailure,
    NegotiationTimeout,
    AlreadyActive,
    NotReady,
};

inline QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return QStringLiteral("none");
    case ErrorKind::SetupFailure:
        return QStringLiteral("setup failure");
    case ErrorKind::ValidationFailure:
        return QStringLiteral("validation failure");
    case ErrorKind::ProtocolDecodeFailure:
        return QStringLiteral("protocol decode failure");
    case ErrorKind::TransportFailure:
        return QStringLiteral("transport failure");
    case ErrorKind::NegotiationTimeout:
        return QStringLiteral("negotiation timeout");
    case ErrorKind::AlreadyActive:
        return QStringLiteral("already active");
    case ErrorKind::NotReady:
        return QStringLiteral("not ready");
    }
    return QString();
}

} // namespace yeectl
