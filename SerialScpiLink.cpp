#include "SerialScpiLink.h"
#include "InstrumentError.h"
#include <QDebug>

static constexpr int WRITE_TIMEOUT_MS = 1000;
static constexpr int QUIET_GAP_MS = 100;

SerialScpiLink::SerialScpiLink(const QString &portName)
    : ScpiLink(QString("serial://%1").arg(portName)) {}

SerialScpiLink::~SerialScpiLink() {
    closeDevice();
}

std::unique_ptr<ScpiLink> SerialScpiLink::openPort(const QString &portName, int baudRate) {
    std::unique_ptr<SerialScpiLink> link(new SerialScpiLink(portName));
    QSerialPort &serial = link->serial;
    serial.setPortName(portName);
    serial.setBaudRate(baudRate);
    serial.setDataBits(QSerialPort::Data8);
    serial.setParity(QSerialPort::NoParity);
    serial.setStopBits(QSerialPort::OneStop);
    serial.setFlowControl(QSerialPort::NoFlowControl);
    if (!serial.open(QIODevice::ReadWrite)) {
        qDebug() << "[SerialScpiLink] Failed to open serial port:" << portName << serial.errorString();
        throw ConnectionError(QString("Failed to open serial port %1: %2").arg(portName, serial.errorString()));
    }
    qDebug() << "[SerialScpiLink] Serial port opened successfully:" << portName;
    return link;
}

void SerialScpiLink::writeBytes(const QByteArray &data) {
    if (!serial.isOpen())
        fail("serial port is closed");
    if (serial.write(data) != data.size() || !serial.waitForBytesWritten(WRITE_TIMEOUT_MS))
        fail(QString("write failed: %1").arg(serial.errorString()));
}

QByteArray SerialScpiLink::readResponse(int timeoutMs, int expectedBytes) {
    serial.clearError();
    QByteArray data = serial.readAll();
    if (data.isEmpty()) {
        if (!serial.waitForReadyRead(timeoutMs)) {
            if (serial.error() != QSerialPort::NoError && serial.error() != QSerialPort::TimeoutError)
                fail(QString("read failed: %1").arg(serial.errorString()));
            return QByteArray();
        }
        data = serial.readAll();
    }

    for (;;) {
        const bool complete = expectedBytes > 0 ? data.size() >= expectedBytes : data.endsWith('\n');
        if (complete)
            break;
        if (!serial.waitForReadyRead(QUIET_GAP_MS)) {
            if (serial.error() != QSerialPort::NoError && serial.error() != QSerialPort::TimeoutError)
                fail(QString("read failed: %1").arg(serial.errorString()));
            break;
        }
        data += serial.readAll();
    }
    return data;
}

void SerialScpiLink::discardInput() {
    if (!serial.isOpen())
        fail("serial port is closed");
    serial.clear(QSerialPort::Input);
    serial.readAll();
}

void SerialScpiLink::closeDevice() {
    if (serial.isOpen())
        serial.close();
}
