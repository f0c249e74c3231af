#pragma once
#include "Instruments.h"
#include "ScpiLink.h"
#include <memory>

// Owon DGE series arbitrary waveform generator, output/source channel 1.
class OwonGenerator : public SignalGenerator {
public:
    explicit OwonGenerator(std::unique_ptr<ScpiLink> link);
    ~OwonGenerator() override;

    void disconnect();

    bool isConnected() const override;
    std::optional<QString> identity() override;
    void reset() override;

    void setWaveform(Waveform shape) override;
    void setAmplitudeVpp(double vpp) override;
    void setOffsetVolts(double volts) override;
    void setOutputImpedance(OutputImpedance impedance) override;
    void setOutputEnabled(bool enabled) override;
    void setFrequency(double hz) override;

private:
    std::unique_ptr<ScpiLink> scpi;
};
