#pragma once
#include <QByteArray>
#include <QString>
#include <memory>
#include <optional>

// Connected handle to one SCPI instrument. Instances only come from open(),
// so holding one means the connection was established. Once the transport
// fails or close() is called, every operation throws TransportError.
class ScpiLink {
public:
    virtual ~ScpiLink();

    // "tcp://host:port" or "serial:///dev/ttyUSB0?baud=115200".
    // Throws ConnectionError.
    static std::unique_ptr<ScpiLink> open(const QString &address);

    void send(const QString &command);
    std::optional<QString> query(const QString &command);
    std::optional<QByteArray> queryBinary(const QString &command, int expectedBytes);

    void close();
    bool isConnected() const { return connected; }
    QString address() const { return addr; }

    void setCommandDelay(int ms) { commandDelayMs = ms; }
    void setResponseTimeout(int ms) { responseTimeoutMs = ms; }

protected:
    explicit ScpiLink(const QString &address);

    // Transport primitives. Implementations throw TransportError on I/O
    // failure; readResponse() returns an empty array on timeout.
    virtual void writeBytes(const QByteArray &data) = 0;
    virtual QByteArray readResponse(int timeoutMs, int expectedBytes) = 0;
    virtual void discardInput() = 0;
    virtual void closeDevice() = 0;

    [[noreturn]] void fail(const QString &msg);

private:
    void ensureConnected(const QString &command) const;

    QString addr;
    bool connected = true;
    int commandDelayMs = 100;
    int responseTimeoutMs = 10000;
};
