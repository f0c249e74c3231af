#include "SpectrumAnalyzer.h"
#include "InstrumentError.h"
#include "Instruments.h"
#include "Interrupt.h"
#include "Pacer.h"
#include <QDebug>
#include <QRegularExpression>

static constexpr double COMMAND_PAUSE_S = 0.3;
static constexpr double RECONFIGURE_WAIT_S = 1.0;
static constexpr double BUFFER_READY_WAIT_S = 2.0;
static constexpr int SPECTRUM_PROBE_FACTOR = 1;

SpectrumPlan planSpectrum(double resolutionHz, int sampleCount) {
    const Timebase &tb = timebaseForResolution(resolutionHz);
    SpectrumPlan plan{tb, 0.0, 0.0, 0.0, 0.0};
    plan.captureSeconds = tb.seconds * SCOPE_HORIZONTAL_DIVISIONS;
    plan.sampleRateHz = sampleCount / plan.captureSeconds;
    plan.resolutionHz = 1.0 / plan.captureSeconds;
    plan.nyquistHz = plan.sampleRateHz / 2.0;
    return plan;
}

SpectrumAnalyzer::SpectrumAnalyzer(Oscilloscope &scope, Pacer &pacer, QObject *parent)
    : QObject(parent), scope(scope), pacer(pacer) {}

double SpectrumAnalyzer::acquisitionWait(double timebaseSeconds) {
    return timebaseSeconds * 5.0 + 1.0;
}

std::optional<double> SpectrumAnalyzer::parseVoltsPerDiv(const QString &reply) {
    static const QRegularExpression re(QStringLiteral("^([-+]?[0-9]*\\.?[0-9]+(?:[eE][-+]?[0-9]+)?)\\s*([mu]?)V?$"),
                                       QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch m = re.match(reply.trimmed());
    if (!m.hasMatch())
        return std::nullopt;
    double value = m.captured(1).toDouble();
    const QString prefix = m.captured(2).toLower();
    if (prefix == "m")
        value *= 1e-3;
    else if (prefix == "u")
        value *= 1e-6;
    if (value <= 0)
        return std::nullopt;
    return value;
}

std::optional<int> SpectrumAnalyzer::parseProbeFactor(const QString &reply) {
    bool ok = false;
    const int factor = reply.trimmed().toUpper().remove('X').toInt(&ok);
    if (!ok || factor <= 0)
        return std::nullopt;
    return factor;
}

void SpectrumAnalyzer::configureChannel(const SpectrumConfiguration &config) {
    emit statusMessage(tr("--- 1. Scope configuration ---"));
    const int ch = config.channel;

    scope.setChannelDisplay(ch, true);
    pacer.sleep(COMMAND_PAUSE_S);
    scope.setCoupling(ch, config.coupling);
    pacer.sleep(COMMAND_PAUSE_S);
    emit statusMessage(tr("  CH%1 coupling %2.").arg(ch).arg(couplingName(config.coupling)));
    scope.setProbeAttenuation(ch, SPECTRUM_PROBE_FACTOR);
    pacer.sleep(COMMAND_PAUSE_S);
    emit statusMessage(tr("  CH%1 probe set to X%2 (make sure this matches the probe in use).").arg(ch).arg(SPECTRUM_PROBE_FACTOR));
    scope.setAcquisitionType(AcquisitionType::Sample);
    pacer.sleep(COMMAND_PAUSE_S);
    scope.setTriggerMode(TriggerMode::Auto);
    pacer.sleep(COMMAND_PAUSE_S);
    scope.run();
    emit statusMessage(tr("  Scope in RUN, AUTO trigger, SAMPLE acquisition."));
}

void SpectrumAnalyzer::leaveRunning() {
    try {
        if (scope.isConnected())
            scope.run();
    } catch (const InstrumentError &e) {
        qWarning() << "[SpectrumAnalyzer] Could not restart the scope:" << e.what();
    }
}

std::optional<SpectrumResult> SpectrumAnalyzer::acquire(const SpectrumConfiguration &config, const SpectrumPlan &plan,
                                                        const Confirmation &confirmAdjusted) {
    const int ch = config.channel;
    const int n = scope.adcSampleCount();

    emit statusMessage(tr("  IMPORTANT: adjust the CH%1 V/div on the scope so the signal is fully visible and NOT clipped.").arg(ch));
    if (!confirmAdjusted()) {
        emit statusMessage(tr("Analysis cancelled."));
        return std::nullopt;
    }
    Interrupt::checkpoint();

    emit statusMessage(tr("  Setting the timebase and reading back V/div..."));
    scope.stop();
    pacer.sleep(RECONFIGURE_WAIT_S);
    scope.setTimebase(plan.timebase.scpi);
    pacer.sleep(RECONFIGURE_WAIT_S);

    const std::optional<QString> scaleReply = scope.verticalScale(ch);
    const std::optional<QString> probeReply = scope.probeAttenuation(ch);
    const std::optional<double> voltsPerDiv = scaleReply ? parseVoltsPerDiv(*scaleReply) : std::nullopt;
    const std::optional<int> probe = probeReply ? parseProbeFactor(*probeReply) : std::nullopt;
    if (!voltsPerDiv || !probe) {
        qWarning() << "[SpectrumAnalyzer] Unreadable channel settings: scale" << scaleReply.value_or("<none>")
                   << "probe" << probeReply.value_or("<none>");
        emit statusMessage(tr("ERROR: cannot read V/div or probe attenuation of CH%1.").arg(ch));
        return std::nullopt;
    }
    emit statusMessage(tr("  Read V/div: %1 V (probe X%2)").arg(*voltsPerDiv).arg(*probe));

    const double step = SpectrumMath::voltsPerStep(*voltsPerDiv, *probe);
    const QVector<double> window = SpectrumMath::windowFunction(config.window, n);
    const double wait = acquisitionWait(plan.timebase.seconds);

    SpectrumResult result;
    QVector<ComplexSpectrum> spectra;
    try {
        for (int i = 0; i < config.numAverages; ++i) {
            Interrupt::checkpoint();
            emit statusMessage(tr("  Acquisition %1/%2, waiting %3 s...").arg(i + 1).arg(config.numAverages).arg(wait, 0, 'f', 2));
            scope.run();
            pacer.sleep(wait);
            scope.stop();
            pacer.sleep(BUFFER_READY_WAIT_S);

            const std::optional<QByteArray> raw = scope.fetchAdcSamples(ch);
            if (!raw || raw->size() != n) {
                emit statusMessage(tr("  Invalid ADC data (received %1 bytes). Skipped.")
                                       .arg(raw ? QString::number(raw->size()) : QStringLiteral("no")));
                continue;
            }

            QVector<double> volts = SpectrumMath::voltsFromCodes(*raw, step);
            for (int k = 0; k < n; ++k)
                volts[k] *= window[k];
            spectra.append(SpectrumMath::dft(volts));
        }
    } catch (const Interrupted &) {
        result.interrupted = true;
        emit statusMessage(tr("--- Interrupted by operator, averaging %1 acquisitions ---").arg(spectra.size()));
    }

    if (spectra.isEmpty()) {
        emit statusMessage(tr("ERROR: no successful acquisition."));
        return std::nullopt;
    }

    emit statusMessage(tr("  Averaging %1 acquisitions...").arg(spectra.size()));
    const ReducedSpectrum reduced = SpectrumMath::reduceSpectra(spectra, window, plan.sampleRateHz);
    result.frequencies = reduced.frequencies;
    result.rmsVolts = reduced.rmsVolts;
    result.db = reduced.db;
    result.config = config;
    result.timebase = plan.timebase;
    result.sampleRateHz = plan.sampleRateHz;
    result.resolutionHz = plan.resolutionHz;
    result.nyquistHz = plan.nyquistHz;
    result.acquisitionsUsed = spectra.size();
    return result;
}

std::optional<SpectrumResult> SpectrumAnalyzer::analyze(const SpectrumConfiguration &config,
                                                        const Confirmation &confirmAdjusted) {
    QString error;
    if (!config.isValid(&error))
        throw ConfigurationError(error);

    const SpectrumPlan plan = planSpectrum(config.resolutionHz, scope.adcSampleCount());
    emit statusMessage(tr("--- 2. Acquisition ---"));
    emit statusMessage(tr("  Target resolution: %1 Hz").arg(config.resolutionHz, 0, 'f', 2));
    emit statusMessage(tr("  Timebase:          %1 / div").arg(plan.timebase.scpi));
    emit statusMessage(tr("  Actual resolution: %1 Hz").arg(plan.resolutionHz, 0, 'f', 2));
    emit statusMessage(tr("  Max frequency (Nyquist): %1 Hz").arg(plan.nyquistHz, 0, 'f', 2));
    if (config.stopHz > plan.nyquistHz) {
        emit statusMessage(tr("  WARNING: stop frequency (%1 Hz) exceeds the maximum frequency.").arg(config.stopHz));
        qWarning() << "[SpectrumAnalyzer] Stop frequency" << config.stopHz << "above Nyquist" << plan.nyquistHz;
    }

    std::optional<SpectrumResult> result;
    try {
        configureChannel(config);
        result = acquire(config, plan, confirmAdjusted);
    } catch (const Interrupted &) {
        emit statusMessage(tr("Analysis interrupted."));
        result.reset();
    } catch (const std::exception &e) {
        qWarning() << "[SpectrumAnalyzer] Analysis aborted:" << e.what();
        leaveRunning();
        throw;
    }

    leaveRunning();
    return result;
}
