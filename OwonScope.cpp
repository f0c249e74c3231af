#include "OwonScope.h"
#include <QDebug>

OwonScope::OwonScope(std::unique_ptr<ScpiLink> link) : scpi(std::move(link)) {}

OwonScope::~OwonScope() {
    disconnect();
}

void OwonScope::disconnect() {
    if (scpi)
        scpi->close();
}

bool OwonScope::isConnected() const {
    return scpi && scpi->isConnected();
}

std::optional<QString> OwonScope::identity() {
    return scpi->query("*IDN?");
}

void OwonScope::reset() {
    scpi->send("*RST");
}

void OwonScope::run() {
    scpi->send("*RUN");
}

void OwonScope::stop() {
    scpi->send("*STOP");
}

QString OwonScope::channelPrefix(int channel) {
    return QString(":CHANnel%1").arg(channel);
}

void OwonScope::setChannelDisplay(int channel, bool on) {
    scpi->send(channelPrefix(channel) + (on ? ":DISPlay ON" : ":DISPlay OFF"));
}

std::optional<QString> OwonScope::channelDisplay(int channel) {
    return scpi->query(channelPrefix(channel) + ":DISPlay?");
}

void OwonScope::setCoupling(int channel, Coupling coupling) {
    scpi->send(channelPrefix(channel) + (coupling == Coupling::AC ? ":COUPling AC" : ":COUPling DC"));
}

std::optional<QString> OwonScope::coupling(int channel) {
    return scpi->query(channelPrefix(channel) + ":COUPling?");
}

void OwonScope::setProbeAttenuation(int channel, int factor) {
    scpi->send(QString("%1:PROBe X%2").arg(channelPrefix(channel)).arg(factor));
}

std::optional<QString> OwonScope::probeAttenuation(int channel) {
    return scpi->query(channelPrefix(channel) + ":PROBe?");
}

void OwonScope::setVerticalScale(int channel, double voltsPerDiv) {
    scpi->send(QString("%1:SCALE %2").arg(channelPrefix(channel)).arg(voltsPerDiv));
}

std::optional<QString> OwonScope::verticalScale(int channel) {
    return scpi->query(channelPrefix(channel) + ":SCALE?");
}

void OwonScope::setVerticalOffset(int channel, int divisions) {
    scpi->send(QString("%1:OFFSet %2").arg(channelPrefix(channel)).arg(divisions));
}

std::optional<QString> OwonScope::verticalOffset(int channel) {
    return scpi->query(channelPrefix(channel) + ":OFFSet?");
}

void OwonScope::setTimebase(const QString &scpiScale) {
    scpi->send(":TIMebase:SCALE " + scpiScale);
}

std::optional<QString> OwonScope::timebase() {
    return scpi->query(":TIMebase:SCALE?");
}

void OwonScope::setAcquisitionType(AcquisitionType type) {
    switch (type) {
    case AcquisitionType::Sample:     scpi->send(":ACQuire:TYPE SAMPle"); break;
    case AcquisitionType::Average:    scpi->send(":ACQuire:TYPE AVERage"); break;
    case AcquisitionType::PeakDetect: scpi->send(":ACQuire:TYPE PEAK"); break;
    }
}

std::optional<QString> OwonScope::acquisitionType() {
    return scpi->query(":ACQuire:TYPE?");
}

void OwonScope::setTriggerMode(TriggerMode mode) {
    switch (mode) {
    case TriggerMode::Auto:   scpi->send(":TRIGger:MODE AUTO"); break;
    case TriggerMode::Normal: scpi->send(":TRIGger:MODE NORMal"); break;
    case TriggerMode::Single: scpi->send(":TRIGger:MODE SINGle"); break;
    }
}

std::optional<QString> OwonScope::triggerMode() {
    return scpi->query(":TRIGger:MODE?");
}

void OwonScope::setTriggerEdgeSource(int channel) {
    scpi->send(QString(":TRIGger:SINGle:EDGE:SOURce CH%1").arg(channel));
}

std::optional<QString> OwonScope::triggerEdgeSource() {
    return scpi->query(":TRIGger:SINGle:EDGE:SOURce?");
}

// --- Measurements ---

QString OwonScope::measurementName(MeasurementItem item) {
    switch (item) {
    case MeasurementItem::PeakToPeak:   return "PKPK";
    case MeasurementItem::FallingDelay: return "FDELay";
    case MeasurementItem::RisingDelay:  return "RDELay";
    case MeasurementItem::Frequency:    return "FREQuency";
    }
    return QString();
}

void OwonScope::clearMeasurements() {
    scpi->send(":MEASure:DELete ALL");
}

void OwonScope::setMeasurementSource(int channel) {
    scpi->send(QString(":MEASure:SOURce CHAN%1").arg(channel));
}

void OwonScope::addMeasurement(MeasurementItem item) {
    scpi->send(":MEASure:ADD " + measurementName(item));
}

std::optional<QString> OwonScope::queryMeasurement(int channel, MeasurementItem item) {
    return scpi->query(QString(":MEASure%1:%2?").arg(channel).arg(measurementName(item)));
}

std::optional<QByteArray> OwonScope::fetchAdcSamples(int channel) {
    const auto raw = scpi->queryBinary(QString("*ADC? CH%1").arg(channel), ADC_SAMPLE_COUNT);
    if (!raw) {
        qWarning() << "[OwonScope] No ADC data received for CH" << channel;
        return std::nullopt;
    }
    if (raw->size() < ADC_SAMPLE_COUNT) {
        qWarning() << "[OwonScope] Incomplete ADC data: received" << raw->size() << "bytes, expected" << ADC_SAMPLE_COUNT;
        return std::nullopt;
    }
    return raw->left(ADC_SAMPLE_COUNT);
}
