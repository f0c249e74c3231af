#pragma once
#include "Instruments.h"
#include "ScpiLink.h"
#include <memory>

// Owon VDS series scope driven through the SCPI server of the VDS PC software.
class OwonScope : public Oscilloscope {
public:
    static constexpr int ADC_SAMPLE_COUNT = 500;

    explicit OwonScope(std::unique_ptr<ScpiLink> link);
    ~OwonScope() override;

    void disconnect();
    ScpiLink &link() { return *scpi; }

    bool isConnected() const override;
    std::optional<QString> identity() override;
    void reset() override;
    void run() override;
    void stop() override;

    void setChannelDisplay(int channel, bool on) override;
    std::optional<QString> channelDisplay(int channel) override;
    void setCoupling(int channel, Coupling coupling) override;
    std::optional<QString> coupling(int channel) override;
    void setProbeAttenuation(int channel, int factor) override;
    std::optional<QString> probeAttenuation(int channel) override;
    void setVerticalScale(int channel, double voltsPerDiv) override;
    std::optional<QString> verticalScale(int channel) override;
    void setVerticalOffset(int channel, int divisions) override;
    std::optional<QString> verticalOffset(int channel) override;

    void setTimebase(const QString &scpiScale) override;
    std::optional<QString> timebase() override;
    void setAcquisitionType(AcquisitionType type) override;
    std::optional<QString> acquisitionType() override;
    void setTriggerMode(TriggerMode mode) override;
    std::optional<QString> triggerMode() override;
    void setTriggerEdgeSource(int channel) override;
    std::optional<QString> triggerEdgeSource() override;

    void clearMeasurements() override;
    void setMeasurementSource(int channel) override;
    void addMeasurement(MeasurementItem item) override;
    std::optional<QString> queryMeasurement(int channel, MeasurementItem item) override;

    std::optional<QByteArray> fetchAdcSamples(int channel) override;
    int adcSampleCount() const override { return ADC_SAMPLE_COUNT; }

private:
    static QString channelPrefix(int channel);
    static QString measurementName(MeasurementItem item);

    std::unique_ptr<ScpiLink> scpi;
};
