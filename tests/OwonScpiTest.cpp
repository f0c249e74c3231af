#include "InstrumentError.h"
#include "OwonGenerator.h"
#include "OwonScope.h"
#include <QQueue>
#include <QStringList>
#include <gtest/gtest.h>

namespace {

// Captures written commands and serves canned replies.
class RecordingLink : public ScpiLink {
public:
    RecordingLink() : ScpiLink("test://recording") { setCommandDelay(0); }

    QStringList written;
    QQueue<QByteArray> replies;
    int discards = 0;
    bool deviceClosed = false;

protected:
    void writeBytes(const QByteArray &data) override {
        written << QString::fromUtf8(data);
    }
    QByteArray readResponse(int, int) override {
        return replies.isEmpty() ? QByteArray() : replies.dequeue();
    }
    void discardInput() override { ++discards; }
    void closeDevice() override { deviceClosed = true; }
};

}

class OwonScopeTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto owned = std::make_unique<RecordingLink>();
        link = owned.get();
        scope = std::make_unique<OwonScope>(std::move(owned));
    }

    RecordingLink *link = nullptr;
    std::unique_ptr<OwonScope> scope;
};

TEST_F(OwonScopeTest, ChannelCommands) {
    scope->setChannelDisplay(2, true);
    scope->setCoupling(1, Coupling::AC);
    scope->setProbeAttenuation(1, 10);
    scope->setVerticalScale(2, 0.5);
    scope->setVerticalOffset(1, 0);

    EXPECT_EQ(link->written, QStringList({":CHANnel2:DISPlay ON\n", ":CHANnel1:COUPling AC\n",
                                          ":CHANnel1:PROBe X10\n", ":CHANnel2:SCALE 0.5\n",
                                          ":CHANnel1:OFFSet 0\n"}));
}

TEST_F(OwonScopeTest, AcquisitionAndTriggerCommands) {
    scope->run();
    scope->stop();
    scope->setTimebase("200us");
    scope->setAcquisitionType(AcquisitionType::Sample);
    scope->setTriggerMode(TriggerMode::Auto);
    scope->setTriggerEdgeSource(1);

    EXPECT_EQ(link->written, QStringList({"*RUN\n", "*STOP\n", ":TIMebase:SCALE 200us\n",
                                          ":ACQuire:TYPE SAMPle\n", ":TRIGger:MODE AUTO\n",
                                          ":TRIGger:SINGle:EDGE:SOURce CH1\n"}));
}

TEST_F(OwonScopeTest, MeasurementQueryIsTrimmed) {
    link->replies.enqueue("2.00V\r\n");
    const std::optional<QString> reply = scope->queryMeasurement(2, MeasurementItem::PeakToPeak);
    ASSERT_TRUE(reply);
    EXPECT_EQ(*reply, "2.00V");
    EXPECT_EQ(link->written.last(), ":MEASure2:PKPK?\n");
    EXPECT_EQ(link->discards, 1);
}

TEST_F(OwonScopeTest, QueryTimeoutGivesNoValue) {
    EXPECT_FALSE(scope->verticalScale(1));
    EXPECT_EQ(link->written.last(), ":CHANnel1:SCALE?\n");
}

TEST_F(OwonScopeTest, AdcBufferIsTruncatedToOneScreen) {
    link->replies.enqueue(QByteArray(OwonScope::ADC_SAMPLE_COUNT + 12, char(100)));
    const std::optional<QByteArray> codes = scope->fetchAdcSamples(1);
    ASSERT_TRUE(codes);
    EXPECT_EQ(codes->size(), OwonScope::ADC_SAMPLE_COUNT);
    EXPECT_EQ(link->written.last(), "*ADC? CH1\n");
}

TEST_F(OwonScopeTest, ShortAdcBufferIsRejected) {
    link->replies.enqueue(QByteArray(OwonScope::ADC_SAMPLE_COUNT - 1, char(100)));
    EXPECT_FALSE(scope->fetchAdcSamples(1));
    EXPECT_FALSE(scope->fetchAdcSamples(1));
}

TEST_F(OwonScopeTest, ClosedLinkThrowsTransportError) {
    scope->disconnect();
    EXPECT_TRUE(link->deviceClosed);
    EXPECT_FALSE(scope->isConnected());
    EXPECT_THROW(scope->run(), TransportError);
    EXPECT_THROW(scope->identity(), TransportError);
}

TEST(OwonGeneratorTest, SetupCommands) {
    auto owned = std::make_unique<RecordingLink>();
    RecordingLink *link = owned.get();
    OwonGenerator generator(std::move(owned));

    generator.setWaveform(Waveform::Sine);
    generator.setAmplitudeVpp(2.5);
    generator.setOutputImpedance(OutputImpedance::HighZ);
    generator.setOffsetVolts(0);
    generator.setFrequency(1234.5);
    generator.setOutputEnabled(true);

    EXPECT_EQ(link->written, QStringList({"SOURce1:FUNCtion:SHAPE SINusoid\n",
                                          "SOURce1:VOLTage:AMPLitude 2.5Vpp\n",
                                          "OUTPut1:IMPedance INFinity\n",
                                          "SOURce1:VOLTage:OFFSet 0V\n",
                                          "SOURce1:FREQuency:FIXed 1234.5Hz\n",
                                          "OUTPut1:STATE ON\n"}));
}

TEST(OwonGeneratorTest, LargeFrequencyKeepsFullPrecision) {
    auto owned = std::make_unique<RecordingLink>();
    RecordingLink *link = owned.get();
    OwonGenerator generator(std::move(owned));

    generator.setFrequency(12345678.0);
    EXPECT_EQ(link->written.last(), "SOURce1:FREQuency:FIXed 12345678Hz\n");
}

TEST(ScpiLinkAddressTest, RejectsUnsupportedSchemes) {
    EXPECT_THROW(ScpiLink::open("usb://device"), ConnectionError);
    EXPECT_THROW(ScpiLink::open("tcp://127.0.0.1"), ConnectionError);
    EXPECT_THROW(ScpiLink::open("serial:///dev/ttyUSB0?baud=fast"), ConnectionError);
}
