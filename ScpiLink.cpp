#include "ScpiLink.h"
#include "InstrumentError.h"
#include "SerialScpiLink.h"
#include "TcpScpiLink.h"
#include <QDebug>
#include <QThread>
#include <QUrl>
#include <QUrlQuery>

ScpiLink::ScpiLink(const QString &address) : addr(address) {}

ScpiLink::~ScpiLink() = default;

std::unique_ptr<ScpiLink> ScpiLink::open(const QString &address) {
    const QUrl url(address);
    if (!url.isValid())
        throw ConnectionError(QString("Invalid instrument address: %1").arg(address));

    const QString scheme = url.scheme().toLower();
    if (scheme == "tcp") {
        if (url.host().isEmpty() || url.port() <= 0)
            throw ConnectionError(QString("TCP address needs host and port: %1").arg(address));
        qDebug() << "[ScpiLink] Opening TCP link to" << url.host() << url.port();
        return TcpScpiLink::connectTo(url.host(), static_cast<quint16>(url.port()));
    }
    if (scheme == "serial") {
        const QString portName = url.path();
        if (portName.isEmpty())
            throw ConnectionError(QString("Serial address needs a port: %1").arg(address));
        int baud = 115200;
        const QUrlQuery q(url);
        if (q.hasQueryItem("baud")) {
            bool ok = false;
            baud = q.queryItemValue("baud").toInt(&ok);
            if (!ok || baud <= 0)
                throw ConnectionError(QString("Invalid baud rate in %1").arg(address));
        }
        qDebug() << "[ScpiLink] Opening serial link on" << portName << "baud" << baud;
        return SerialScpiLink::openPort(portName, baud);
    }
    throw ConnectionError(QString("Unsupported instrument address scheme '%1'").arg(scheme));
}

void ScpiLink::send(const QString &command) {
    const QString cmd = command.trimmed();
    ensureConnected(cmd);
    writeBytes(cmd.toUtf8() + '\n');
    qDebug() << "[ScpiLink] >" << cmd;
    if (commandDelayMs > 0)
        QThread::msleep(commandDelayMs);
}

std::optional<QString> ScpiLink::query(const QString &command) {
    const QString cmd = command.trimmed();
    ensureConnected(cmd);
    discardInput();
    writeBytes(cmd.toUtf8() + '\n');
    const QByteArray reply = readResponse(responseTimeoutMs, 0);
    if (reply.isEmpty()) {
        qWarning() << "[ScpiLink] Timeout waiting for reply to" << cmd;
        return std::nullopt;
    }
    const QString text = QString::fromUtf8(reply).trimmed();
    qDebug() << "[ScpiLink] <" << cmd << "->" << text;
    return text;
}

std::optional<QByteArray> ScpiLink::queryBinary(const QString &command, int expectedBytes) {
    const QString cmd = command.trimmed();
    ensureConnected(cmd);
    discardInput();
    writeBytes(cmd.toUtf8() + '\n');
    const QByteArray reply = readResponse(responseTimeoutMs, expectedBytes);
    if (reply.isEmpty()) {
        qWarning() << "[ScpiLink] Timeout waiting for binary reply to" << cmd;
        return std::nullopt;
    }
    qDebug() << "[ScpiLink] <" << cmd << "->" << reply.size() << "bytes";
    return reply;
}

void ScpiLink::close() {
    if (!connected)
        return;
    connected = false;
    closeDevice();
    qDebug() << "[ScpiLink] Closed" << addr;
}

void ScpiLink::fail(const QString &msg) {
    qWarning() << "[ScpiLink]" << addr << msg;
    connected = false;
    closeDevice();
    throw TransportError(QString("%1: %2").arg(addr, msg));
}

void ScpiLink::ensureConnected(const QString &command) const {
    if (!connected)
        throw TransportError(QString("%1 is not connected (command '%2')").arg(addr, command));
}
