#include "SweepConfig.h"
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <cmath>

QString scaleName(FrequencyScale scale) {
    return scale == FrequencyScale::Logarithmic ? "log" : "lin";
}

bool SweepConfiguration::isValid(QString *error) const {
    QString msg;
    if (scale == FrequencyScale::Logarithmic && startHz <= 0)
        msg = "Start frequency must be greater than zero for a logarithmic sweep.";
    else if (stopHz <= startHz)
        msg = "Stop frequency must be greater than the start frequency.";
    else if (numPoints < 1)
        msg = "At least one sweep point is required.";
    else if (numAverages < 1)
        msg = "At least one average per point is required.";
    else if (generatorAmplitudeVpp <= 0)
        msg = "Generator amplitude must be positive.";
    if (error)
        *error = msg;
    return msg.isEmpty();
}

QJsonObject SweepConfiguration::toJson() const {
    QJsonObject obj;
    obj["f_start"] = startHz;
    obj["f_stop"] = stopHz;
    obj["num_points"] = numPoints;
    obj["num_points_lin"] = numPointsLinear;
    obj["scale"] = scaleName(scale);
    obj["num_averages"] = numAverages;
    obj["gen_amplitude_vpp"] = generatorAmplitudeVpp;
    obj["y_mag_min"] = magnitudeMinDb;
    obj["y_mag_max"] = magnitudeMaxDb;
    obj["y_mag_min_lin"] = magnitudeMinLinearDb;
    return obj;
}

SweepConfiguration SweepConfiguration::fromJson(const QJsonObject &obj) {
    SweepConfiguration c;
    c.startHz = obj.value("f_start").toDouble(c.startHz);
    c.stopHz = obj.value("f_stop").toDouble(c.stopHz);
    c.numPoints = obj.value("num_points").toInt(c.numPoints);
    c.numPointsLinear = obj.value("num_points_lin").toInt(c.numPointsLinear);
    c.scale = obj.value("scale").toString(scaleName(c.scale)).toLower() == "lin"
                  ? FrequencyScale::Linear : FrequencyScale::Logarithmic;
    c.numAverages = obj.value("num_averages").toInt(c.numAverages);
    c.generatorAmplitudeVpp = obj.value("gen_amplitude_vpp").toDouble(c.generatorAmplitudeVpp);
    c.magnitudeMinDb = obj.value("y_mag_min").toDouble(c.magnitudeMinDb);
    c.magnitudeMaxDb = obj.value("y_mag_max").toDouble(c.magnitudeMaxDb);
    c.magnitudeMinLinearDb = obj.value("y_mag_min_lin").toDouble(c.magnitudeMinLinearDb);
    return c;
}

SweepConfiguration SweepConfiguration::load(const QString &path) {
    QFile file(path);
    if (!file.exists())
        return SweepConfiguration();
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "[SweepConfig] Cannot read" << path << "- using factory defaults";
        return SweepConfiguration();
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[SweepConfig] Configuration file" << path << "is corrupt ("
                   << parseError.errorString() << ") - using factory defaults";
        return SweepConfiguration();
    }
    return fromJson(doc.object());
}

bool SweepConfiguration::save(const QString &path) const {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        qWarning() << "[SweepConfig] Cannot save configuration to" << path << file.errorString();
        return false;
    }
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    qDebug() << "[SweepConfig] Saved configuration to" << path;
    return true;
}

QVector<double> bodeFrequencyList(const SweepConfiguration &config) {
    QVector<double> freqs;
    const int n = config.numPoints;
    if (n <= 0)
        return freqs;
    freqs.reserve(n);
    if (n == 1) {
        freqs.append(config.startHz);
        return freqs;
    }

    if (config.scale == FrequencyScale::Logarithmic) {
        const double logStart = std::log10(config.startHz);
        const double logStop = std::log10(config.stopHz);
        const double step = (logStop - logStart) / (n - 1);
        for (int i = 0; i < n; ++i)
            freqs.append(std::pow(10.0, logStart + i * step));
    } else {
        const double step = (config.stopHz - config.startHz) / (n - 1);
        for (int i = 0; i < n; ++i)
            freqs.append(config.startHz + i * step);
    }
    // Endpoints exactly as configured.
    freqs.first() = config.startHz;
    freqs.last() = config.stopHz;
    return freqs;
}
