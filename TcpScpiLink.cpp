#include "TcpScpiLink.h"
#include "InstrumentError.h"
#include <QDebug>

static constexpr int CONNECT_TIMEOUT_MS = 10000;
static constexpr int WRITE_TIMEOUT_MS = 5000;
static constexpr int DRAIN_TIMEOUT_MS = 100;
// Gap after which a partially received reply is considered complete.
static constexpr int QUIET_GAP_MS = 200;

TcpScpiLink::TcpScpiLink(const QString &host, quint16 port)
    : ScpiLink(QString("tcp://%1:%2").arg(host).arg(port)) {}

TcpScpiLink::~TcpScpiLink() {
    closeDevice();
}

std::unique_ptr<ScpiLink> TcpScpiLink::connectTo(const QString &host, quint16 port) {
    std::unique_ptr<TcpScpiLink> link(new TcpScpiLink(host, port));
    link->socket.connectToHost(host, port);
    if (!link->socket.waitForConnected(CONNECT_TIMEOUT_MS)) {
        throw ConnectionError(QString("Cannot connect to %1:%2 (%3). Is the SCPI server running?")
                                  .arg(host).arg(port).arg(link->socket.errorString()));
    }
    qDebug() << "[TcpScpiLink] Connected to" << host << port;
    return link;
}

void TcpScpiLink::writeBytes(const QByteArray &data) {
    if (socket.state() != QAbstractSocket::ConnectedState)
        fail("socket is no longer connected");
    if (socket.write(data) != data.size() || !socket.waitForBytesWritten(WRITE_TIMEOUT_MS))
        fail(QString("write failed: %1").arg(socket.errorString()));
}

QByteArray TcpScpiLink::readResponse(int timeoutMs, int expectedBytes) {
    QByteArray data = socket.readAll();
    if (data.isEmpty()) {
        if (!socket.waitForReadyRead(timeoutMs)) {
            if (socket.state() != QAbstractSocket::ConnectedState)
                fail(QString("connection lost: %1").arg(socket.errorString()));
            return QByteArray();
        }
        data = socket.readAll();
    }

    for (;;) {
        const bool complete = expectedBytes > 0 ? data.size() >= expectedBytes : data.endsWith('\n');
        if (complete)
            break;
        if (!socket.waitForReadyRead(QUIET_GAP_MS)) {
            if (socket.state() != QAbstractSocket::ConnectedState)
                fail(QString("connection lost: %1").arg(socket.errorString()));
            break;
        }
        data += socket.readAll();
    }
    return data;
}

void TcpScpiLink::discardInput() {
    QByteArray stale = socket.readAll();
    while (socket.waitForReadyRead(DRAIN_TIMEOUT_MS))
        stale += socket.readAll();
    if (socket.state() != QAbstractSocket::ConnectedState)
        fail(QString("connection lost: %1").arg(socket.errorString()));
    if (!stale.isEmpty())
        qDebug() << "[TcpScpiLink] Discarded" << stale.size() << "stale bytes";
}

void TcpScpiLink::closeDevice() {
    if (socket.state() != QAbstractSocket::UnconnectedState) {
        socket.disconnectFromHost();
        if (socket.state() != QAbstractSocket::UnconnectedState)
            socket.waitForDisconnected(1000);
    }
}
