#pragma once
#include "Instruments.h"
#include <QJsonObject>
#include <QString>

enum class WindowKind { Hann, Rectangular };

// Parameters of one spectrum analysis.
struct SpectrumConfiguration {
    double startHz = 0.0;         // display range only
    double stopHz = 100000.0;
    double resolutionHz = 100.0;  // drives the timebase choice
    int numAverages = 3;
    int channel = 1;
    Coupling coupling = Coupling::DC;
    WindowKind window = WindowKind::Hann;

    bool isValid(QString *error = nullptr) const;

    QJsonObject toJson() const;
    static SpectrumConfiguration fromJson(const QJsonObject &obj);

    static SpectrumConfiguration load(const QString &path);
    bool save(const QString &path) const;
};

QString windowName(WindowKind window);
// Accepts the instrument-style spellings ("HANNing", "RECTangle", ...).
bool parseWindowName(const QString &text, WindowKind *window);
QString couplingName(Coupling coupling);
