#include "BodeSweeper.h"
#include "AveragingSampler.h"
#include "InstrumentError.h"
#include "Instruments.h"
#include "Interrupt.h"
#include "Pacer.h"
#include "Timebase.h"
#include <QDebug>
#include <algorithm>
#include <cmath>

static constexpr double COMMAND_PAUSE_S = 0.3;
static constexpr double STOP_WAIT_S = 1.5;
static constexpr double RUN_STABILIZE_S = 3.0;
static constexpr double SCALE_WAIT_S = 2.0;
static constexpr double MAX_SIGNAL_WAIT_S = 5.0;

double bodeMagnitudeDb(double primaryVpp, double secondaryVpp) {
    const double primary = std::max(primaryVpp, MIN_DETECTABLE_VPP);
    return 20.0 * std::log10(secondaryVpp / primary);
}

double wrapPhaseDegrees(double rawDegrees) {
    double phase = std::fmod(rawDegrees, 360.0);
    if (phase < 0)
        phase += 360.0;
    if (phase >= 360.0)
        phase = 0.0;
    if (phase > 180.0)
        phase -= 360.0;
    return phase;
}

double phaseFromDelay(double delaySeconds, double frequencyHz) {
    return wrapPhaseDegrees(-delaySeconds * frequencyHz * 360.0);
}

BodeSweeper::BodeSweeper(SignalGenerator &generator, Oscilloscope &scope, Pacer &pacer, QObject *parent)
    : QObject(parent), generator(generator), scope(scope), pacer(pacer) {}

double BodeSweeper::signalSettleTime(double frequencyHz) {
    return std::min(std::max(3.0 / frequencyHz, 0.5), MAX_SIGNAL_WAIT_S);
}

void BodeSweeper::configureInstruments(const SweepConfiguration &config) {
    emit statusMessage(tr("--- 1. Instrument configuration ---"));

    generator.setWaveform(Waveform::Sine);
    pacer.sleep(COMMAND_PAUSE_S);
    generator.setAmplitudeVpp(config.generatorAmplitudeVpp);
    pacer.sleep(COMMAND_PAUSE_S);
    generator.setOutputImpedance(OutputImpedance::HighZ);
    pacer.sleep(COMMAND_PAUSE_S);
    generator.setOffsetVolts(0.0);
    pacer.sleep(COMMAND_PAUSE_S);
    emit statusMessage(tr("  Generator: sine %1 Vpp, high Z, 0 V offset.").arg(config.generatorAmplitudeVpp));

    for (int ch = 1; ch <= 2; ++ch) {
        scope.setChannelDisplay(ch, true);
        pacer.sleep(COMMAND_PAUSE_S);
    }
    for (int ch = 1; ch <= 2; ++ch) {
        scope.setCoupling(ch, Coupling::DC);
        pacer.sleep(COMMAND_PAUSE_S);
    }
    scope.setProbeAttenuation(1, CH1_PROBE_FACTOR);
    pacer.sleep(COMMAND_PAUSE_S);
    scope.setAcquisitionType(AcquisitionType::Sample);
    pacer.sleep(COMMAND_PAUSE_S);
    for (int ch = 1; ch <= 2; ++ch) {
        scope.setVerticalOffset(ch, 0);
        pacer.sleep(COMMAND_PAUSE_S);
    }
    emit statusMessage(tr("  Scope: CH1/CH2 on, DC coupling, CH1 probe X%1, SAMPLE acquisition.").arg(CH1_PROBE_FACTOR));

    generator.setOutputEnabled(true);
    pacer.sleep(COMMAND_PAUSE_S);
    emit statusMessage(tr("  Generator: output ON."));
}

void BodeSweeper::prepareAcquisition() {
    emit statusMessage(tr("--- 2. Sweep ---"));

    emit statusMessage(tr("  CH1 scale fixed at %1 V/div (waiting %2 s)...").arg(FIXED_VOLTS_PER_DIV).arg(SCALE_WAIT_S));
    scope.setVerticalScale(1, FIXED_VOLTS_PER_DIV);
    pacer.sleep(SCALE_WAIT_S);

    scope.setTriggerEdgeSource(1);
    pacer.sleep(COMMAND_PAUSE_S);

    // CH2 has no range of its own; it borrows the CH1 estimate.
    emit statusMessage(tr("  CH2 scale estimate %1 V/div (waiting %2 s)...").arg(FIXED_VOLTS_PER_DIV).arg(SCALE_WAIT_S));
    scope.setVerticalScale(2, FIXED_VOLTS_PER_DIV);
    pacer.sleep(SCALE_WAIT_S);

    for (int ch = 1; ch <= 2; ++ch) {
        scope.setVerticalOffset(ch, 0);
        pacer.sleep(COMMAND_PAUSE_S);
    }

    emit statusMessage(tr("  RUN in AUTO trigger mode, stabilizing %1 s...").arg(RUN_STABILIZE_S));
    scope.setTriggerMode(TriggerMode::Auto);
    pacer.sleep(COMMAND_PAUSE_S);
    scope.run();
    pacer.sleep(RUN_STABILIZE_S);
}

void BodeSweeper::measurePoint(int index, int total, double frequencyHz, int averages, BodeSweepResult &result) {
    if (frequencyHz <= 0) {
        emit statusMessage(tr("Skipping invalid frequency: %1 Hz").arg(frequencyHz));
        emit pointSkipped(index, frequencyHz, tr("non-positive frequency"));
        return;
    }

    emit statusMessage(tr("Point %1/%2 - Frequency: %3 Hz").arg(index + 1).arg(total).arg(frequencyHz, 0, 'f', 2));
    generator.setFrequency(frequencyHz);

    const double settle = signalSettleTime(frequencyHz);
    emit statusMessage(tr("  Waiting %1 s for the signal to settle...").arg(settle, 0, 'f', 2));
    pacer.sleep(settle);

    emit statusMessage(tr("  STOP for reconfiguration (waiting %1 s)...").arg(STOP_WAIT_S));
    scope.stop();
    pacer.sleep(STOP_WAIT_S);

    const Timebase &tb = optimalTimebaseForFrequency(frequencyHz);
    emit statusMessage(tr("  Timebase %1 (waiting %2 s)...").arg(tb.scpi).arg(SCALE_WAIT_S));
    scope.setTimebase(tb.scpi);
    pacer.sleep(SCALE_WAIT_S);

    // Measurements only refresh while acquiring.
    emit statusMessage(tr("  RUN, stabilizing %1 s...").arg(RUN_STABILIZE_S));
    scope.run();
    pacer.sleep(RUN_STABILIZE_S);

    AveragingSampler sampler(scope, pacer);
    connect(&sampler, &AveragingSampler::statusMessage, this, &BodeSweeper::statusMessage);
    const std::optional<AveragedReading> reading = sampler.sample(averages, tb.seconds);

    if (!reading) {
        if (!scope.isConnected())
            throw TransportError(QStringLiteral("Oscilloscope connection lost at %1 Hz").arg(frequencyHz));
        emit statusMessage(tr("  Measurement failed for this point. Skipped."));
        emit pointSkipped(index, frequencyHz, tr("no usable measurement"));
        qDebug() << "[BodeSweeper] Point" << index << "at" << frequencyHz << "Hz skipped";
        return;
    }

    const double magnitude = bodeMagnitudeDb(reading->primaryVpp, reading->secondaryVpp);
    const double phase = phaseFromDelay(reading->delaySeconds, frequencyHz);

    result.frequencies.append(frequencyHz);
    result.magnitudesDb.append(magnitude);
    result.phasesDeg.append(phase);

    emit statusMessage(tr("  -> Magnitude: %1 dB | Phase: %2 deg").arg(magnitude, 0, 'f', 2).arg(phase, 0, 'f', 2));
    emit pointMeasured(index, frequencyHz, magnitude, phase);
}

void BodeSweeper::cleanup() {
    try {
        if (generator.isConnected()) {
            generator.setOutputEnabled(false);
            emit statusMessage(tr("--- Sweep finished. Generator output OFF ---"));
        }
    } catch (const InstrumentError &e) {
        qWarning() << "[BodeSweeper] Could not switch the generator output off:" << e.what();
    }

    try {
        if (scope.isConnected()) {
            scope.setAcquisitionType(AcquisitionType::Sample);
            scope.setTriggerMode(TriggerMode::Auto);
        }
    } catch (const InstrumentError &e) {
        qWarning() << "[BodeSweeper] Could not restore the scope state:" << e.what();
    }
}

BodeSweepResult BodeSweeper::run(const SweepConfiguration &config) {
    QString error;
    if (!config.isValid(&error))
        throw ConfigurationError(error);

    BodeSweepResult result;
    result.config = config;
    const QVector<double> frequencies = bodeFrequencyList(config);
    qDebug() << "[BodeSweeper] Sweeping" << frequencies.size() << "points," << scaleName(config.scale)
             << "scale," << config.numAverages << "averages";

    try {
        configureInstruments(config);
        prepareAcquisition();
        for (int i = 0; i < frequencies.size(); ++i) {
            Interrupt::checkpoint();
            measurePoint(i, frequencies.size(), frequencies[i], config.numAverages, result);
        }
    } catch (const Interrupted &) {
        result.interrupted = true;
        emit statusMessage(tr("--- Interrupted by operator ---"));
        qDebug() << "[BodeSweeper] Interrupted after" << result.size() << "points";
    } catch (const std::exception &e) {
        qWarning() << "[BodeSweeper] Sweep aborted:" << e.what();
        cleanup();
        throw;
    }

    cleanup();
    return result;
}
