#pragma once
#include "SpectrumConfig.h"
#include "SpectrumMath.h"
#include "Timebase.h"
#include <QObject>
#include <functional>
#include <optional>

class Oscilloscope;
class Pacer;

struct SpectrumResult {
    QVector<double> frequencies;   // 0 .. Nyquist, n/2 bins
    QVector<double> rmsVolts;
    QVector<double> db;
    SpectrumConfiguration config;

    Timebase timebase = {0.0, ""};
    double sampleRateHz = 0.0;
    double resolutionHz = 0.0;
    double nyquistHz = 0.0;
    int acquisitionsUsed = 0;
    bool interrupted = false;
};

// Acquisition plan derived from the requested resolution.
struct SpectrumPlan {
    Timebase timebase;
    double captureSeconds;
    double sampleRateHz;
    double resolutionHz;
    double nyquistHz;
};

SpectrumPlan planSpectrum(double resolutionHz, int sampleCount);

// Captures raw ADC screens from one scope channel and turns them into an
// averaged amplitude spectrum.
class SpectrumAnalyzer : public QObject {
    Q_OBJECT
public:
    // Blocks until the operator has set the vertical scale by hand. Returns
    // false to abandon the analysis.
    using Confirmation = std::function<bool()>;

    SpectrumAnalyzer(Oscilloscope &scope, Pacer &pacer, QObject *parent = nullptr);

    // std::nullopt when the operator declined, the channel settings could
    // not be read back or no acquisition was usable. Throws ConfigurationError
    // before touching the scope and TransportError when the link drops.
    // The scope is left running on every exit path.
    std::optional<SpectrumResult> analyze(const SpectrumConfiguration &config, const Confirmation &confirmAdjusted);

    static double acquisitionWait(double timebaseSeconds);
    static std::optional<double> parseVoltsPerDiv(const QString &reply);
    static std::optional<int> parseProbeFactor(const QString &reply);

signals:
    void statusMessage(const QString &msg);

private:
    void configureChannel(const SpectrumConfiguration &config);
    std::optional<SpectrumResult> acquire(const SpectrumConfiguration &config, const SpectrumPlan &plan,
                                          const Confirmation &confirmAdjusted);
    void leaveRunning();

    Oscilloscope &scope;
    Pacer &pacer;
};
