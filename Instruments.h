#pragma once
#include <QByteArray>
#include <QString>
#include <optional>

enum class Waveform { Sine, Square, Ramp };
enum class OutputImpedance { HighZ, FiftyOhm };
enum class Coupling { DC, AC };
enum class AcquisitionType { Sample, Average, PeakDetect };
enum class TriggerMode { Auto, Normal, Single };
enum class MeasurementItem { PeakToPeak, FallingDelay, RisingDelay, Frequency };

// Function generator capabilities used by the sequencers. Setters are
// fire-and-forget; callers pace them. All methods throw TransportError once
// the connection is gone.
class SignalGenerator {
public:
    virtual ~SignalGenerator() = default;

    virtual bool isConnected() const = 0;
    virtual std::optional<QString> identity() = 0;
    virtual void reset() = 0;

    virtual void setWaveform(Waveform shape) = 0;
    virtual void setAmplitudeVpp(double vpp) = 0;
    virtual void setOffsetVolts(double volts) = 0;
    virtual void setOutputImpedance(OutputImpedance impedance) = 0;
    virtual void setOutputEnabled(bool enabled) = 0;
    virtual void setFrequency(double hz) = 0;
};

// Oscilloscope capabilities used by the sequencers. Getters return the raw
// instrument reply (std::nullopt on timeout); parsing is the caller's job.
class Oscilloscope {
public:
    virtual ~Oscilloscope() = default;

    virtual bool isConnected() const = 0;
    virtual std::optional<QString> identity() = 0;
    virtual void reset() = 0;
    virtual void run() = 0;
    virtual void stop() = 0;

    virtual void setChannelDisplay(int channel, bool on) = 0;
    virtual std::optional<QString> channelDisplay(int channel) = 0;
    virtual void setCoupling(int channel, Coupling coupling) = 0;
    virtual std::optional<QString> coupling(int channel) = 0;
    virtual void setProbeAttenuation(int channel, int factor) = 0;
    virtual std::optional<QString> probeAttenuation(int channel) = 0;
    virtual void setVerticalScale(int channel, double voltsPerDiv) = 0;
    virtual std::optional<QString> verticalScale(int channel) = 0;
    virtual void setVerticalOffset(int channel, int divisions) = 0;
    virtual std::optional<QString> verticalOffset(int channel) = 0;

    virtual void setTimebase(const QString &scpiScale) = 0;
    virtual std::optional<QString> timebase() = 0;
    virtual void setAcquisitionType(AcquisitionType type) = 0;
    virtual std::optional<QString> acquisitionType() = 0;
    virtual void setTriggerMode(TriggerMode mode) = 0;
    virtual std::optional<QString> triggerMode() = 0;
    virtual void setTriggerEdgeSource(int channel) = 0;
    virtual std::optional<QString> triggerEdgeSource() = 0;

    virtual void clearMeasurements() = 0;
    virtual void setMeasurementSource(int channel) = 0;
    virtual void addMeasurement(MeasurementItem item) = 0;
    virtual std::optional<QString> queryMeasurement(int channel, MeasurementItem item) = 0;

    // Raw 8-bit digitizer codes of one screen. std::nullopt if the buffer
    // is absent or shorter than adcSampleCount().
    virtual std::optional<QByteArray> fetchAdcSamples(int channel) = 0;
    virtual int adcSampleCount() const = 0;
};
