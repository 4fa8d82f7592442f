#include "fake_bulb.h"

#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkDatagram>
#include <QTcpSocket>
#include <QTimer>

#include <utility>

namespace yeectl::fakes {

namespace {

QList<QJsonObject> takeLines(QByteArray &buffer)
{
    QList<QJsonObject> objects;
    int newline = buffer.indexOf('\n');
    while (newline >= 0) {
        const QByteArray line = buffer.left(newline).trimmed();
        buffer.remove(0, newline + 1);
        if (!line.isEmpty()) {
            const QJsonDocument doc = QJsonDocument::fromJson(line);
            if (doc.isObject())
                objects.append(doc.object());
        }
        newline = buffer.indexOf('\n');
    }
    return objects;
}

} // namespace

void spinFor(int ms)
{
    QEventLoop loop;
    QTimer::singleShot(ms, &loop, &QEventLoop::quit);
    loop.exec();
}

QByteArray advertisement(const QString &id, const QHostAddress &host, quint16 port, const QStringList &omit)
{
    const QList<QPair<QString, QString>> fields = {
        {QStringLiteral("id"), id},
        {QStringLiteral("model"), QStringLiteral("color")},
        {QStringLiteral("fw_ver"), QStringLiteral("18")},
        {QStringLiteral("support"), QStringLiteral("get_prop set_default set_power toggle set_bright start_cf "
                                                   "stop_cf set_scene set_ct_abx set_rgb set_hsv set_music set_name")},
        {QStringLiteral("power"), QStringLiteral("on")},
        {QStringLiteral("bright"), QStringLiteral("80")},
        {QStringLiteral("color_mode"), QStringLiteral("2")},
        {QStringLiteral("ct"), QStringLiteral("4000")},
        {QStringLiteral("rgb"), QStringLiteral("16711680")},
        {QStringLiteral("hue"), QStringLiteral("100")},
        {QStringLiteral("sat"), QStringLiteral("35")},
        {QStringLiteral("name"), QString()},
    };

    QString text = QStringLiteral("HTTP/1.1 200 OK\r\n"
                                  "Cache-Control: max-age=3600\r\n"
                                  "Date: \r\n"
                                  "Ext: \r\n");
    if (!omit.contains(QStringLiteral("ip")))
        text += QStringLiteral("Location: yeelight://%1:%2\r\n").arg(host.toString()).arg(port);
    text += QStringLiteral("Server: POSIX UPnP/1.0 YGLC/1\r\n");
    for (const auto &field : fields) {
        if (!omit.contains(field.first))
            text += QStringLiteral("%1: %2\r\n").arg(field.first, field.second);
    }
    return text.toUtf8();
}

FakeBulb::FakeBulb()
{
    QObject::connect(&m_server, &QTcpServer::newConnection, &m_server, [this]() { onNewConnection(); });
    m_server.listen(QHostAddress::LocalHost, 0);
}

FakeBulb::~FakeBulb()
{
    delete m_stray;
    delete m_side;
    for (QTcpSocket *client : std::as_const(m_clients))
        client->disconnect();
}

QStringList FakeBulb::methods() const
{
    QStringList names;
    for (const QJsonObject &request : m_requests)
        names.append(request.value(QStringLiteral("method")).toString());
    return names;
}

void FakeBulb::onNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QTcpSocket *client = m_server.nextPendingConnection();
        m_clients.append(client);
        QObject::connect(client, &QTcpSocket::readyRead, &m_server, [this, client]() { onClientData(client); });
    }
}

void FakeBulb::onClientData(QTcpSocket *client)
{
    QByteArray &buffer = m_buffers[client];
    buffer.append(client->readAll());
    for (const QJsonObject &request : takeLines(buffer)) {
        m_requests.append(request);
        handleRequest(client, request);
    }
}

void FakeBulb::handleRequest(QTcpSocket *client, const QJsonObject &request)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const QJsonArray params = request.value(QStringLiteral("params")).toArray();

    if (method == QLatin1String("set_music") && params.at(0).toInt() == 1 && m_callbackEnabled) {
        if (m_straySource.isNull())
            dialBack(params.at(1).toString(), params.at(2).toInt());
        else
            dialStray(params.at(1).toString(), params.at(2).toInt());
    }

    if (!m_autoReply || !request.contains(QStringLiteral("id")))
        return;

    QJsonObject reply;
    reply.insert(QStringLiteral("id"), request.value(QStringLiteral("id")));
    reply.insert(QStringLiteral("result"), QJsonArray{QStringLiteral("ok")});
    client->write(QJsonDocument(reply).toJson(QJsonDocument::Compact) + "\r\n");
}

void FakeBulb::dialBack(const QString &host, int port)
{
    delete m_side;
    m_sideBuffer.clear();
    m_side = new QTcpSocket;
    QObject::connect(m_side, &QTcpSocket::readyRead, &m_server, [this]() {
        m_sideBuffer.append(m_side->readAll());
        m_sideRequests.append(takeLines(m_sideBuffer));
    });
    m_side->bind(m_callbackSource, 0);
    m_side->connectToHost(QHostAddress(host), static_cast<quint16>(port));
}

void FakeBulb::dialStray(const QString &host, int port)
{
    delete m_stray;
    m_stray = new QTcpSocket;
    bool connected = false;
    QObject::connect(m_stray, &QAbstractSocket::stateChanged, &m_server,
                     [this, host, port, connected](QAbstractSocket::SocketState state) mutable {
                         if (state == QAbstractSocket::ConnectedState) {
                             connected = true;
                         } else if (state == QAbstractSocket::UnconnectedState && connected) {
                             connected = false;
                             dialBack(host, port);
                         }
                     });
    m_stray->bind(m_straySource, 0);
    m_stray->connectToHost(QHostAddress(host), static_cast<quint16>(port));
}

void FakeBulb::sendToClients(const QByteArray &bytes)
{
    for (QTcpSocket *client : std::as_const(m_clients))
        client->write(bytes);
}

void FakeBulb::push(const QJsonObject &properties)
{
    QJsonObject message;
    message.insert(QStringLiteral("method"), QStringLiteral("props"));
    message.insert(QStringLiteral("params"), properties);
    sendToClients(QJsonDocument(message).toJson(QJsonDocument::Compact) + "\r\n");
}

void FakeBulb::dropClients()
{
    for (QTcpSocket *client : std::as_const(m_clients))
        client->abort();
}

void FakeBulb::dropSideConnection()
{
    if (m_side)
        m_side->abort();
}

bool FakeBulb::sideConnected() const
{
    return m_side && m_side->state() == QAbstractSocket::ConnectedState;
}

FakeAdvertiser::FakeAdvertiser()
{
    QObject::connect(&m_socket, &QUdpSocket::readyRead, &m_socket, [this]() { onReadyRead(); });
    m_socket.bind(QHostAddress::LocalHost, 0);
}

void FakeAdvertiser::addReply(const QByteArray &payload, int delayMs)
{
    m_replies.append(qMakePair(payload, delayMs));
}

void FakeAdvertiser::onReadyRead()
{
    while (m_socket.hasPendingDatagrams()) {
        const QNetworkDatagram search = m_socket.receiveDatagram();
        if (!search.isValid())
            continue;
        m_searches.append(search.data());

        const QHostAddress sender = search.senderAddress();
        const quint16 senderPort = static_cast<quint16>(search.senderPort());
        for (const auto &reply : std::as_const(m_replies)) {
            const QByteArray payload = reply.first;
            if (reply.second <= 0) {
                m_socket.writeDatagram(payload, sender, senderPort);
                continue;
            }
            QTimer::singleShot(reply.second, &m_socket, [this, payload, sender, senderPort]() {
                m_socket.writeDatagram(payload, sender, senderPort);
            });
        }
    }
}

} // namespace yeectl::fakes
