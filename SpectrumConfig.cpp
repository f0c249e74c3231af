#include "SpectrumConfig.h"
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

QString windowName(WindowKind window) {
    return window == WindowKind::Hann ? "HANNING" : "RECTANGLE";
}

bool parseWindowName(const QString &text, WindowKind *window) {
    const QString t = text.trimmed().toUpper();
    if (t.startsWith("HANN")) {
        *window = WindowKind::Hann;
        return true;
    }
    if (t.startsWith("RECT")) {
        *window = WindowKind::Rectangular;
        return true;
    }
    return false;
}

QString couplingName(Coupling coupling) {
    return coupling == Coupling::AC ? "AC" : "DC";
}

bool SpectrumConfiguration::isValid(QString *error) const {
    QString msg;
    if (resolutionHz <= 0)
        msg = "Frequency resolution must be greater than zero.";
    else if (numAverages < 1)
        msg = "At least one acquisition is required.";
    else if (channel != 1 && channel != 2)
        msg = "Channel must be 1 or 2.";
    else if (stopHz <= startHz)
        msg = "Stop frequency must be greater than the start frequency.";
    if (error)
        *error = msg;
    return msg.isEmpty();
}

QJsonObject SpectrumConfiguration::toJson() const {
    QJsonObject obj;
    obj["f_start"] = startHz;
    obj["f_stop"] = stopHz;
    obj["resolution_hz"] = resolutionHz;
    obj["num_averages"] = numAverages;
    obj["channel"] = channel;
    obj["coupling"] = couplingName(coupling);
    obj["window"] = windowName(window);
    return obj;
}

SpectrumConfiguration SpectrumConfiguration::fromJson(const QJsonObject &obj) {
    SpectrumConfiguration c;
    c.startHz = obj.value("f_start").toDouble(c.startHz);
    c.stopHz = obj.value("f_stop").toDouble(c.stopHz);
    c.resolutionHz = obj.value("resolution_hz").toDouble(c.resolutionHz);
    c.numAverages = obj.value("num_averages").toInt(c.numAverages);
    c.channel = obj.value("channel").toInt(c.channel);
    c.coupling = obj.value("coupling").toString("DC").toUpper().contains("AC") ? Coupling::AC : Coupling::DC;
    WindowKind w;
    if (parseWindowName(obj.value("window").toString(), &w))
        c.window = w;
    return c;
}

SpectrumConfiguration SpectrumConfiguration::load(const QString &path) {
    QFile file(path);
    if (!file.exists())
        return SpectrumConfiguration();
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "[SpectrumConfig] Cannot read" << path << "- using factory defaults";
        return SpectrumConfiguration();
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[SpectrumConfig] Configuration file" << path << "is corrupt - using factory defaults";
        return SpectrumConfiguration();
    }
    return fromJson(doc.object());
}

bool SpectrumConfiguration::save(const QString &path) const {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        qWarning() << "[SpectrumConfig] Cannot save configuration to" << path << file.errorString();
        return false;
    }
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    qDebug() << "[SpectrumConfig] Saved configuration to" << path;
    return true;
}
