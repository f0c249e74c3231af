#pragma once
#include "SweepConfig.h"
#include <QObject>
#include <QVector>

class Oscilloscope;
class SignalGenerator;
class Pacer;

// Measured points of one sweep, in sweep order. Failed points are absent.
struct BodeSweepResult {
    QVector<double> frequencies;
    QVector<double> magnitudesDb;
    QVector<double> phasesDeg;
    SweepConfiguration config;
    bool interrupted = false;

    int size() const { return frequencies.size(); }
    bool isEmpty() const { return frequencies.isEmpty(); }
};

// 20*log10(secondary/primary) with the primary floor-clamped to MIN_DETECTABLE_VPP.
double bodeMagnitudeDb(double primaryVpp, double secondaryVpp);
// Maps any angle into (-180, 180].
double wrapPhaseDegrees(double rawDegrees);
// Phase of CH2 relative to CH1 from the falling-edge delay.
double phaseFromDelay(double delaySeconds, double frequencyHz);

// Drives generator and scope through a frequency sweep and records gain and
// phase of the device under test (CH1 = input, CH2 = output).
class BodeSweeper : public QObject {
    Q_OBJECT
public:
    // Fixed vertical scale used on both channels for the whole sweep.
    static constexpr double FIXED_VOLTS_PER_DIV = 1.0;
    static constexpr int CH1_PROBE_FACTOR = 1;

    BodeSweeper(SignalGenerator &generator, Oscilloscope &scope, Pacer &pacer, QObject *parent = nullptr);

    // Throws ConfigurationError for an invalid configuration (before any
    // instrument command) and TransportError when a link drops. An operator
    // interrupt ends the sweep early with the points measured so far.
    // The generator output is switched off on every exit path.
    BodeSweepResult run(const SweepConfiguration &config);

    static double signalSettleTime(double frequencyHz);

signals:
    void statusMessage(const QString &msg);
    void pointMeasured(int index, double frequencyHz, double magnitudeDb, double phaseDeg);
    void pointSkipped(int index, double frequencyHz, const QString &reason);

private:
    void configureInstruments(const SweepConfiguration &config);
    void prepareAcquisition();
    void measurePoint(int index, int total, double frequencyHz, int averages, BodeSweepResult &result);
    void cleanup();

    SignalGenerator &generator;
    Oscilloscope &scope;
    Pacer &pacer;
};
