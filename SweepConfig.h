#pragma once
#include <QJsonObject>
#include <QString>
#include <QVector>

enum class FrequencyScale { Linear, Logarithmic };

// Parameters of one Bode sweep. Loaded from persisted defaults, optionally
// edited by the operator, then read-only for the duration of the sweep.
struct SweepConfiguration {
    double startHz = 1.0;
    double stopHz = 100000.0;
    int numPoints = 20;
    int numPointsLinear = 50;      // remembered default for the linear scale
    FrequencyScale scale = FrequencyScale::Logarithmic;
    int numAverages = 3;
    double generatorAmplitudeVpp = 1.0;
    double magnitudeMinDb = -100.0;
    double magnitudeMaxDb = 10.0;
    double magnitudeMinLinearDb = -40.0;   // remembered default for the linear scale

    bool isValid(QString *error = nullptr) const;

    QJsonObject toJson() const;
    // Keys missing from the object keep their factory default.
    static SweepConfiguration fromJson(const QJsonObject &obj);

    // Missing file: factory defaults. Corrupt file: warning + factory defaults.
    static SweepConfiguration load(const QString &path);
    bool save(const QString &path) const;
};

QString scaleName(FrequencyScale scale);

// Target frequencies of the sweep, inclusive of both ends.
QVector<double> bodeFrequencyList(const SweepConfiguration &config);
