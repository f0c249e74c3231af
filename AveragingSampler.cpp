#include "AveragingSampler.h"
#include "Instruments.h"
#include "Interrupt.h"
#include "MeasurementPoller.h"
#include "Pacer.h"
#include <QDebug>
#include <algorithm>
#include <cmath>
#include <exception>

static constexpr double MEASURE_PAUSE_S = 0.2;
static constexpr double MAX_READING_WAIT_S = 5.0;
static constexpr double READ_TIMEOUT_S = 10.0;

AveragingSampler::AveragingSampler(Oscilloscope &scope, Pacer &pacer, QObject *parent)
    : QObject(parent), scope(scope), pacer(pacer) {}

double AveragingSampler::waitPerReading(double timebaseSeconds) {
    return std::min(std::max(timebaseSeconds * 2.0, 0.5), MAX_READING_WAIT_S);
}

void AveragingSampler::registerMeasurements() {
    scope.clearMeasurements();
    pacer.sleep(MEASURE_PAUSE_S);
    scope.setMeasurementSource(1);
    pacer.sleep(MEASURE_PAUSE_S);
    scope.addMeasurement(MeasurementItem::PeakToPeak);
    pacer.sleep(MEASURE_PAUSE_S);
    scope.addMeasurement(MeasurementItem::FallingDelay);
    pacer.sleep(MEASURE_PAUSE_S);
    scope.setMeasurementSource(2);
    pacer.sleep(MEASURE_PAUSE_S);
    scope.addMeasurement(MeasurementItem::PeakToPeak);
    pacer.sleep(MEASURE_PAUSE_S);
}

std::optional<AveragedReading> AveragingSampler::sample(int repetitions, double timebaseSeconds) {
    const double wait = waitPerReading(timebaseSeconds);
    const MeasurementPoller poller(pacer, READ_TIMEOUT_S);
    double sumVpp1 = 0.0, sumVpp2 = 0.0, sumDelay = 0.0;
    int accepted = 0;

    emit statusMessage(tr("  Acquiring %1 software averages...").arg(repetitions));

    try {
        registerMeasurements();

        for (int i = 0; i < repetitions; ++i) {
            Interrupt::checkpoint();
            emit statusMessage(tr("  Average %1/%2: waiting %3 s for a fresh measurement...")
                                   .arg(i + 1).arg(repetitions).arg(wait, 0, 'f', 2));
            pacer.sleep(wait);

            const PollResult vpp1 = poller.read("CH1 PKPK", [this] {
                return scope.queryMeasurement(1, MeasurementItem::PeakToPeak);
            });
            const PollResult vpp2 = poller.read("CH2 PKPK", [this] {
                return scope.queryMeasurement(2, MeasurementItem::PeakToPeak);
            });
            const PollResult delay = poller.read("CH1 FDELay", [this] {
                return scope.queryMeasurement(1, MeasurementItem::FallingDelay);
            });

            if (vpp1.status == PollResult::Status::TransportFailure
                || vpp2.status == PollResult::Status::TransportFailure
                || delay.status == PollResult::Status::TransportFailure) {
                emit statusMessage(tr("  Average %1: connection lost, aborting point.").arg(i + 1));
                return std::nullopt;
            }

            if (!vpp1.ok() || !vpp2.ok() || !delay.ok()
                || std::fabs(vpp1.value) >= OVERLOAD_SENTINEL
                || std::fabs(vpp2.value) >= OVERLOAD_SENTINEL
                || std::fabs(delay.value) >= OVERLOAD_SENTINEL) {
                emit statusMessage(tr("  Average %1: error (overload or timeout). Skipped.").arg(i + 1));
                continue;
            }

            if (vpp1.value < MIN_DETECTABLE_VPP) {
                emit statusMessage(tr("  Average %1: error (Vpp1 too low: %2). Skipped.").arg(i + 1).arg(vpp1.value));
                continue;
            }

            sumVpp1 += vpp1.value;
            sumVpp2 += vpp2.value;
            sumDelay += delay.value;
            ++accepted;
        }
    } catch (const std::exception &e) {
        qWarning() << "[AveragingSampler] Measurement aborted:" << e.what();
        emit statusMessage(tr("  Fatal error during measurement: %1. Skipped.").arg(e.what()));
        return std::nullopt;
    }

    if (accepted == 0) {
        qDebug() << "[AveragingSampler] No usable repetition out of" << repetitions;
        return std::nullopt;
    }

    AveragedReading reading;
    reading.primaryVpp = sumVpp1 / accepted;
    reading.secondaryVpp = sumVpp2 / accepted;
    reading.delaySeconds = sumDelay / accepted;
    reading.acceptedRepetitions = accepted;
    qDebug() << "[AveragingSampler] Averaged" << accepted << "/" << repetitions
             << "repetitions: vpp1=" << reading.primaryVpp << "vpp2=" << reading.secondaryVpp
             << "delay=" << reading.delaySeconds;
    return reading;
}
