#include "InstrumentError.h"
#include "TcpScpiLink.h"
#include <QTcpServer>
#include <QTcpSocket>
#include <gtest/gtest.h>

class TcpScpiLinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(server.listen(QHostAddress::LocalHost, 0));
    }

    std::unique_ptr<ScpiLink> connectLink() {
        std::unique_ptr<ScpiLink> link = TcpScpiLink::connectTo("127.0.0.1", server.serverPort());
        link->setCommandDelay(0);
        link->setResponseTimeout(500);
        if (server.waitForNewConnection(2000))
            peer = server.nextPendingConnection();
        return link;
    }

    QTcpServer server;
    QTcpSocket *peer = nullptr;
};

TEST_F(TcpScpiLinkTest, ClosedPortRaisesConnectionError) {
    const quint16 port = server.serverPort();
    server.close();
    EXPECT_THROW(TcpScpiLink::connectTo("127.0.0.1", port), ConnectionError);
}

TEST_F(TcpScpiLinkTest, SendWritesNewlineTerminatedCommand) {
    std::unique_ptr<ScpiLink> link = connectLink();
    ASSERT_NE(peer, nullptr);
    EXPECT_TRUE(link->isConnected());
    EXPECT_EQ(link->address(), QString("tcp://127.0.0.1:%1").arg(server.serverPort()));

    link->send("  *RST ");
    QByteArray received;
    while (!received.endsWith('\n') && peer->waitForReadyRead(2000))
        received += peer->readAll();
    EXPECT_EQ(received, QByteArray("*RST\n"));
}

TEST_F(TcpScpiLinkTest, ClosedLinkRefusesCommands) {
    std::unique_ptr<ScpiLink> link = connectLink();
    link->close();
    EXPECT_FALSE(link->isConnected());
    EXPECT_THROW(link->send("*RUN"), TransportError);
    EXPECT_THROW(link->query("*IDN?"), TransportError);
}

TEST_F(TcpScpiLinkTest, PeerDisconnectBecomesTransportError) {
    std::unique_ptr<ScpiLink> link = connectLink();
    ASSERT_NE(peer, nullptr);
    peer->abort();
    server.close();

    EXPECT_THROW(link->query("*IDN?"), TransportError);
    EXPECT_FALSE(link->isConnected());
    EXPECT_THROW(link->send("*RUN"), TransportError);
}

TEST(ScpiLinkOpenTest, TcpAddressRequiresPort) {
    EXPECT_THROW(ScpiLink::open("tcp://localhost"), ConnectionError);
    EXPECT_THROW(ScpiLink::open("ftp://localhost:21"), ConnectionError);
}
