#include "OwonGenerator.h"
#include <QDebug>

OwonGenerator::OwonGenerator(std::unique_ptr<ScpiLink> link) : scpi(std::move(link)) {}

OwonGenerator::~OwonGenerator() {
    disconnect();
}

void OwonGenerator::disconnect() {
    if (scpi)
        scpi->close();
}

bool OwonGenerator::isConnected() const {
    return scpi && scpi->isConnected();
}

std::optional<QString> OwonGenerator::identity() {
    return scpi->query("*IDN?");
}

void OwonGenerator::reset() {
    scpi->send("*RST");
}

void OwonGenerator::setWaveform(Waveform shape) {
    switch (shape) {
    case Waveform::Sine:   scpi->send("SOURce1:FUNCtion:SHAPE SINusoid"); break;
    case Waveform::Square: scpi->send("SOURce1:FUNCtion:SHAPE SQUare"); break;
    case Waveform::Ramp:   scpi->send("SOURce1:FUNCtion:SHAPE RAMP"); break;
    }
}

void OwonGenerator::setAmplitudeVpp(double vpp) {
    scpi->send(QString("SOURce1:VOLTage:AMPLitude %1Vpp").arg(vpp));
}

void OwonGenerator::setOffsetVolts(double volts) {
    scpi->send(QString("SOURce1:VOLTage:OFFSet %1V").arg(volts));
}

void OwonGenerator::setOutputImpedance(OutputImpedance impedance) {
    scpi->send(impedance == OutputImpedance::HighZ ? "OUTPut1:IMPedance INFinity" : "OUTPut1:IMPedance 50");
}

void OwonGenerator::setOutputEnabled(bool enabled) {
    scpi->send(enabled ? "OUTPut1:STATE ON" : "OUTPut1:STATE OFF");
    qDebug() << "[OwonGenerator] Output" << (enabled ? "ON" : "OFF");
}

void OwonGenerator::setFrequency(double hz) {
    scpi->send(QString("SOURce1:FREQuency:FIXed %1Hz").arg(hz, 0, 'g', 10));
}
