#pragma once
#include <QObject>
#include <optional>

class Oscilloscope;
class Pacer;

// Smallest channel-1 amplitude that still gives a usable ratio.
inline constexpr double MIN_DETECTABLE_VPP = 1e-9;

struct AveragedReading {
    double primaryVpp = 0.0;     // CH1 peak-to-peak
    double secondaryVpp = 0.0;   // CH2 peak-to-peak
    double delaySeconds = 0.0;   // CH1 -> CH2 falling edge delay
    int acceptedRepetitions = 0;
};

// Reads CH1/CH2 peak-to-peak and the falling-edge delay N times and averages
// the repetitions where all three values are usable.
class AveragingSampler : public QObject {
    Q_OBJECT
public:
    AveragingSampler(Oscilloscope &scope, Pacer &pacer, QObject *parent = nullptr);

    // std::nullopt when no repetition was usable or the procedure failed.
    std::optional<AveragedReading> sample(int repetitions, double timebaseSeconds);

    static double waitPerReading(double timebaseSeconds);

signals:
    void statusMessage(const QString &msg);

private:
    void registerMeasurements();

    Oscilloscope &scope;
    Pacer &pacer;
};
