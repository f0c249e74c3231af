#pragma once
#include "ScpiLink.h"
#include <QTcpSocket>

// SCPI over a raw TCP socket, as served by the Owon VDS PC software.
class TcpScpiLink : public ScpiLink {
public:
    static std::unique_ptr<ScpiLink> connectTo(const QString &host, quint16 port);
    ~TcpScpiLink() override;

protected:
    void writeBytes(const QByteArray &data) override;
    QByteArray readResponse(int timeoutMs, int expectedBytes) override;
    void discardInput() override;
    void closeDevice() override;

private:
    TcpScpiLink(const QString &host, quint16 port);

    QTcpSocket socket;
};
