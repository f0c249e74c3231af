#pragma once
#include "ScpiLink.h"
#include <QSerialPort>

// SCPI over a (virtual) serial port, e.g. a generator enumerated as USB CDC.
class SerialScpiLink : public ScpiLink {
public:
    static std::unique_ptr<ScpiLink> openPort(const QString &portName, int baudRate);
    ~SerialScpiLink() override;

protected:
    void writeBytes(const QByteArray &data) override;
    QByteArray readResponse(int timeoutMs, int expectedBytes) override;
    void discardInput() override;
    void closeDevice() override;

private:
    explicit SerialScpiLink(const QString &portName);

    QSerialPort serial;
};
