#include "yee_device.h"

#include <QRandomGenerator>
#include <QThread>

#include "yee_channel.h"
#include "yee_logging.h"

namespace yeectl {

Device::Device(const DeviceRecord &record, QObject *parent)
    : QObject(parent)
    , m_info(record.info)
    , m_state(record.state)
    , m_address(record.address)
    , m_sessionTag(static_cast<int>(QRandomGenerator::global()->bounded(1000, 10000)))
{
    m_primary = new ControlChannel(m_address, true, this);

    connect(m_primary, &ControlChannel::propertiesPushed, this, [this](const QJsonObject &properties) {
        applyPush(properties);
    });
    connect(m_primary, &ControlChannel::resultReceived, this, [this](qint64 requestId, const QStringList &results) {
        if (m_trace)
            qCInfo(wireLog).noquote() << "id" << requestId << ":" << results.join(QStringLiteral(", "));
        emit commandResult(requestId, results);
    });
    connect(m_primary, &ControlChannel::errorReceived, this, &Device::commandError);
    connect(m_primary, &ControlChannel::decodeFailed, this, [this](const QString &error, const QByteArray &) {
        emit channelError(ErrorKind::ProtocolDecodeFailure, error);
    });
    connect(m_primary, &ControlChannel::failed, this, [this](const QString &error) {
        qCWarning(deviceLog).noquote() << m_info.id << "primary channel failed:" << error;
        emit channelError(ErrorKind::TransportFailure, error);
    });
}

Device::~Device()
{
    qCDebug(deviceLog) << "Device destroyed for" << m_info.id;
}

qint64 Device::nextRequestId()
{
    ++m_requestCounter;
    const QString joined = QString::number(m_sessionTag) + QString::number(m_requestCounter);
    return joined.toLongLong();
}

ControlChannel *Device::channelFor(const Command &command) const
{
    // The deactivation request always travels on the primary channel.
    if (command.method == QLatin1String("set_music"))
        return m_primary;
    if (m_side && !m_side->isTerminal())
        return m_side;
    return m_primary;
}

qint64 Device::communicate(const Command &command)
{
    if (QThread::currentThread() != thread()) {
        qCWarning(deviceLog) << m_info.id << "communicate called outside the owner thread, request dropped";
        return 0;
    }
    if (!command.isValid()) {
        qCWarning(deviceLog) << m_info.id << "refusing to send an invalid command";
        return 0;
    }

    const qint64 requestId = nextRequestId();
    const QByteArray payload = encodeRequest(requestId, command);
    ControlChannel *channel = channelFor(command);

    if (channel == m_side) {
        // No replies come back on the side channel.
        channel->send(payload);
    } else {
        channel->send(payload, requestId);
    }

    if (m_trace) {
        qCInfo(wireLog).noquote() << (channel == m_side ? "side channel used," : "primary channel used,")
                                  << "sent to" << m_address.toString() << QString::fromUtf8(payload).trimmed();
    }
    return requestId;
}

void Device::installSideChannel(ControlChannel *channel)
{
    if (!channel)
        return;
    if (m_side && m_side != channel)
        discardSideChannel();

    channel->setParent(this);
    m_side = channel;

    connect(m_side, &ControlChannel::failed, this, [this](const QString &error) {
        qCWarning(deviceLog).noquote() << m_info.id << "side channel failed:" << error;
        discardSideChannel();
        emit channelError(ErrorKind::TransportFailure, error);
    });

    qCInfo(deviceLog) << m_info.id << "side channel installed from" << m_side->remoteAddress().toString();
    emit sideChannelChanged(true);
}

void Device::discardSideChannel()
{
    if (!m_side)
        return;

    ControlChannel *side = m_side;
    m_side = nullptr;
    side->disconnect(this);
    side->close();
    side->deleteLater();

    qCInfo(deviceLog) << m_info.id << "side channel discarded";
    emit sideChannelChanged(false);
}

void Device::cancel()
{
    discardSideChannel();
    m_primary->close();
}

void Device::flush()
{
    m_primary->flush();
    if (m_side)
        m_side->flush();
}

void Device::setTraceCommunication(bool enabled)
{
    m_trace = enabled;
    setWireTraceEnabled(enabled);
}

PushOutcome Device::applyPush(const QJsonObject &properties)
{
    const PushOutcome outcome = applyProperties(m_state, m_info, properties);

    for (const QString &key : outcome.applied) {
        if (m_trace)
            qCInfo(wireLog).noquote() << m_info.id << "updating" << key << "to"
                                      << properties.value(key).toVariant().toString();
        else
            qCDebug(deviceLog).noquote() << m_info.id << "updating" << key;
    }
    for (auto it = outcome.rejected.constBegin(); it != outcome.rejected.constEnd(); ++it) {
        qCWarning(deviceLog).noquote() << m_info.id << "rejected pushed property" << it.key() << ":" << it.value();
        emit propertyRejected(it.key(), it.value());
    }
    for (const QString &key : outcome.unknown) {
        qCInfo(deviceLog).noquote() << "Property key (" << key << ") not handled. Value is"
                                    << properties.value(key).toVariant().toString();
    }

    if (outcome.applied.contains(QStringLiteral("music_on")) && !m_state.sideChannelActive)
        discardSideChannel();

    if (!outcome.applied.isEmpty())
        emit stateChanged(outcome.applied);

    return outcome;
}

} // namespace yeectl
