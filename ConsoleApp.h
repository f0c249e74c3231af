#pragma once
#include "SpectrumConfig.h"
#include "SweepConfig.h"
#include <QObject>
#include <QString>

class ConsolePrompt;
class Oscilloscope;
class OwonGenerator;
class OwonScope;
struct BodeSweepResult;
struct SpectrumResult;

struct ConsoleOptions {
    QString scopeAddress = "tcp://127.0.0.1:3000";
    QString generatorAddress = "serial:///dev/ttyUSB0";
    QString dataDir = "DATA";
    QString bodeConfigPath = "bode_config.json";
    QString spectrumConfigPath = "spectrum_config.json";
    bool showPlots = true;
};

// Interactive operator sessions. Each run* method owns the instrument
// connections for its duration and returns a process exit code.
class ConsoleApp : public QObject {
    Q_OBJECT
public:
    ConsoleApp(const ConsoleOptions &options, ConsolePrompt &prompt, QObject *parent = nullptr);

    int runBode();
    int runSpectrum();
    int runScpiConsole();
    int listPorts();

    SweepConfiguration editBodeConfig(const SweepConfiguration &defaults);
    SpectrumConfiguration editSpectrumConfig(const SpectrumConfiguration &defaults);

public slots:
    void showStatus(const QString &msg);

private:
    void printBodeConfig(const SweepConfiguration &config);
    void printSpectrumConfig(const SpectrumConfiguration &config);
    void resetScope(Oscilloscope &scope);
    void presentBode(const BodeSweepResult &result);
    void presentSpectrum(const SpectrumResult &result);
    void shutdown(OwonGenerator *generator, OwonScope *scope);
    QString plotsDir() const;

    ConsoleOptions options;
    ConsolePrompt &prompt;
};
