#include "ConsoleApp.h"
#include "BodeSweeper.h"
#include "ConsolePrompt.h"
#include "InstrumentError.h"
#include "Interrupt.h"
#include "OwonGenerator.h"
#include "OwonScope.h"
#include "Pacer.h"
#include "PlotManager.h"
#include "ResultExporter.h"
#include "ScpiLink.h"
#include "SpectrumAnalyzer.h"
#include <QDebug>
#include <QDir>
#include <QSerialPortInfo>
#include <memory>

static constexpr double RESET_WAIT_S = 2.0;

ConsoleApp::ConsoleApp(const ConsoleOptions &options, ConsolePrompt &prompt, QObject *parent)
    : QObject(parent), options(options), prompt(prompt) {}

void ConsoleApp::showStatus(const QString &msg) {
    prompt.print(msg);
}

QString ConsoleApp::plotsDir() const {
    return QDir(options.dataDir).filePath("PLOTS");
}

void ConsoleApp::resetScope(Oscilloscope &scope) {
    prompt.print("  Sending reset (*RST) to the oscilloscope...");
    scope.reset();
    ThreadPacer().sleep(RESET_WAIT_S);
    prompt.print("  Reset complete.");
}

void ConsoleApp::shutdown(OwonGenerator *generator, OwonScope *scope) {
    try {
        if (generator && generator->isConnected()) {
            generator->setOutputEnabled(false);
            generator->disconnect();
            prompt.print("Generator output OFF, disconnected.");
        }
    } catch (const InstrumentError &e) {
        qWarning() << "[ConsoleApp] Generator shutdown failed:" << e.what();
        prompt.print(QString("Error while disconnecting the generator: %1").arg(e.what()));
    }
    try {
        if (scope && scope->isConnected()) {
            scope->setTriggerMode(TriggerMode::Auto);
            scope->disconnect();
            prompt.print("Oscilloscope disconnected.");
        }
    } catch (const InstrumentError &e) {
        qWarning() << "[ConsoleApp] Scope shutdown failed:" << e.what();
        prompt.print(QString("Error while disconnecting the oscilloscope: %1").arg(e.what()));
    }
}

// --- Bode ---

void ConsoleApp::printBodeConfig(const SweepConfiguration &config) {
    prompt.print();
    prompt.print("--- Configuration summary ---");
    prompt.print("  Instruments:");
    prompt.print(QString("    Generator:     %1").arg(options.generatorAddress));
    prompt.print(QString("    Oscilloscope:  %1").arg(options.scopeAddress));
    prompt.print("  Sweep:");
    prompt.print(QString("    Frequency:     %1 Hz to %2 Hz").arg(config.startHz).arg(config.stopHz));
    prompt.print(QString("    Points:        %1 (%2 scale)").arg(config.numPoints).arg(scaleName(config.scale)));
    prompt.print(QString("    Generator:     %1 Vpp").arg(config.generatorAmplitudeVpp));
    prompt.print("  Measurement:");
    prompt.print(QString("    Averages:      %1").arg(config.numAverages));
    prompt.print("  Plot:");
    prompt.print(QString("    Magnitude:     %1 dB to %2 dB").arg(config.magnitudeMinDb).arg(config.magnitudeMaxDb));
    prompt.print("-----------------------------");
}

SweepConfiguration ConsoleApp::editBodeConfig(const SweepConfiguration &defaults) {
    prompt.print();
    prompt.print("--- Edit sweep configuration ---");
    SweepConfiguration config = defaults;

    for (;;) {
        const QString scale = prompt.ask("Frequency scale, linear (lin) or logarithmic (log)?", scaleName(config.scale)).toLower();
        if (scale == "lin" || scale == "log") {
            config.scale = scale == "lin" ? FrequencyScale::Linear : FrequencyScale::Logarithmic;
            break;
        }
        prompt.print("Error: enter 'lin' or 'log'.");
    }
    const bool linear = config.scale == FrequencyScale::Linear;

    for (;;) {
        const double start = prompt.askDouble("Start frequency (Hz)", config.startHz);
        if (!linear && start <= 0) {
            prompt.print("ERROR: the start frequency of a logarithmic sweep must be greater than zero.");
            continue;
        }
        config.startHz = start;
        break;
    }
    for (;;) {
        const double stop = prompt.askDouble("Stop frequency (Hz)", config.stopHz);
        if (stop <= config.startHz) {
            prompt.print("ERROR: the stop frequency must be greater than the start frequency.");
            continue;
        }
        config.stopHz = stop;
        break;
    }

    config.numPoints = prompt.askInt("Number of points", linear ? config.numPointsLinear : config.numPoints);
    if (linear)
        config.numPointsLinear = config.numPoints;
    config.numAverages = prompt.askInt("Number of averages per point", config.numAverages);
    config.generatorAmplitudeVpp = prompt.askDouble("Generator amplitude (Vpp)", config.generatorAmplitudeVpp);

    config.magnitudeMinDb = prompt.askDouble("Plot magnitude minimum (dB)",
                                             linear ? config.magnitudeMinLinearDb : config.magnitudeMinDb);
    if (linear)
        config.magnitudeMinLinearDb = config.magnitudeMinDb;
    config.magnitudeMaxDb = prompt.askDouble("Plot magnitude maximum (dB)", config.magnitudeMaxDb);
    return config;
}

void ConsoleApp::presentBode(const BodeSweepResult &result) {
    prompt.print();
    prompt.print(result.interrupted ? "--- Sweep interrupted, partial results ---" : "--- Sweep complete ---");

    PlotManager plots;
    connect(&plots, &PlotManager::statusMessage, this, &ConsoleApp::showStatus);
    plots.plotBode(result);
    if (options.showPlots)
        plots.showBlocking("Bode plot");

    prompt.print();
    prompt.print("--- Saving results ---");
    if (prompt.askYesNo("Save the plot image?", true))
        plots.savePng(ResultExporter::nextFilename(plotsDir(), "BODE_plot", ".png"));

    ResultExporter exporter;
    connect(&exporter, &ResultExporter::statusMessage, this, &ConsoleApp::showStatus);
    if (prompt.askYesNo("Save the raw data (CSV)?", true))
        exporter.writeBodeCsv(result, ResultExporter::nextFilename(options.dataDir, "BODE_data", ".csv"));
}

int ConsoleApp::runBode() {
    prompt.print("--- Frequency response analysis (Bode plot) ---");
    Interrupt::ScopedHandler sigint;
    std::unique_ptr<OwonGenerator> generator;
    std::unique_ptr<OwonScope> scope;
    int rc = 0;

    try {
        prompt.print(QString("Connecting to the generator (%1)...").arg(options.generatorAddress));
        generator = std::make_unique<OwonGenerator>(ScpiLink::open(options.generatorAddress));
        prompt.print(QString("  -> Generator IDN: %1").arg(generator->identity().value_or("<no reply>")));

        prompt.print(QString("Connecting to the oscilloscope (%1)...").arg(options.scopeAddress));
        scope = std::make_unique<OwonScope>(ScpiLink::open(options.scopeAddress));
        prompt.print(QString("  -> Oscilloscope IDN: %1").arg(scope->identity().value_or("<no reply>")));
        resetScope(*scope);

        ThreadPacer pacer;
        do {
            SweepConfiguration config = SweepConfiguration::load(options.bodeConfigPath);
            prompt.print();
            prompt.print("--- Current default configuration ---");
            printBodeConfig(config);

            if (prompt.askYesNo("Modify this configuration?", false)) {
                config = editBodeConfig(config);
                if (prompt.askYesNo("Save this configuration as the new default?", false)
                    && config.save(options.bodeConfigPath))
                    prompt.print(QString("Configuration saved to '%1'.").arg(options.bodeConfigPath));
            }

            prompt.print();
            prompt.print("--- Configuration ready ---");
            printBodeConfig(config);

            if (!prompt.askYesNo("Confirm and start the sweep?", true)) {
                prompt.print("Sweep cancelled.");
                continue;
            }

            BodeSweeper sweeper(*generator, *scope, pacer);
            connect(&sweeper, &BodeSweeper::statusMessage, this, &ConsoleApp::showStatus);
            try {
                const BodeSweepResult result = sweeper.run(config);
                Interrupt::clear();
                if (result.isEmpty())
                    prompt.print("No data collected, nothing to plot.");
                else
                    presentBode(result);
            } catch (const ConfigurationError &e) {
                prompt.print(QString("ERROR: invalid configuration: %1").arg(e.what()));
            }
        } while (prompt.askYesNo("Start a new sweep?", false));
    } catch (const ConnectionError &e) {
        prompt.print(QString("FATAL CONNECTION ERROR: %1").arg(e.what()));
        prompt.print("Check the addresses, the cabling and that the VDS software is running.");
        rc = 1;
    } catch (const TransportError &e) {
        prompt.print(QString("FATAL ERROR: connection lost: %1").arg(e.what()));
        rc = 1;
    } catch (const Interrupted &) {
        prompt.print("--- Exiting ---");
    } catch (const std::exception &e) {
        qCritical() << "[ConsoleApp] Unexpected error:" << e.what();
        prompt.print(QString("FATAL UNEXPECTED ERROR: %1").arg(e.what()));
        rc = 1;
    }

    shutdown(generator.get(), scope.get());
    prompt.print("--- Program finished ---");
    return rc;
}

// --- Spectrum ---

void ConsoleApp::printSpectrumConfig(const SpectrumConfiguration &config) {
    prompt.print();
    prompt.print("--- Configuration summary ---");
    prompt.print("  Instruments:");
    prompt.print(QString("    Oscilloscope:  %1").arg(options.scopeAddress));
    prompt.print("  Analysis:");
    prompt.print(QString("    Channel:       CH%1 (%2)").arg(config.channel).arg(couplingName(config.coupling)));
    prompt.print(QString("    Resolution:    ~%1 Hz (target)").arg(config.resolutionHz));
    prompt.print(QString("    Averages:      %1").arg(config.numAverages));
    prompt.print(QString("    FFT window:    %1").arg(windowName(config.window)));
    prompt.print("  Plot:");
    prompt.print(QString("    Range:         %1 Hz to %2 Hz").arg(config.startHz).arg(config.stopHz));
    prompt.print("-----------------------------");
}

SpectrumConfiguration ConsoleApp::editSpectrumConfig(const SpectrumConfiguration &defaults) {
    prompt.print();
    prompt.print("--- Edit analysis configuration ---");
    SpectrumConfiguration config = defaults;

    config.startHz = prompt.askDouble("Plot start frequency (Hz)", config.startHz);
    config.stopHz = prompt.askDouble("Plot stop frequency (Hz)", config.stopHz);
    config.resolutionHz = prompt.askDouble("Desired resolution (Hz)", config.resolutionHz);
    config.numAverages = prompt.askInt("Number of averages", config.numAverages);
    config.channel = prompt.askInt("Channel (1 or 2)", config.channel);

    const QString coupling = prompt.ask("Coupling (AC or DC)", couplingName(config.coupling)).toUpper();
    config.coupling = coupling.contains("AC") ? Coupling::AC : Coupling::DC;

    for (;;) {
        WindowKind window;
        if (parseWindowName(prompt.ask("FFT window (HANNing, RECTangle)", windowName(config.window)), &window)) {
            config.window = window;
            break;
        }
        prompt.print("Error: only the HANNing and RECTangle windows are supported.");
    }
    return config;
}

void ConsoleApp::presentSpectrum(const SpectrumResult &result) {
    prompt.print();
    prompt.print(QString("--- Analysis complete (%1 acquisitions) ---").arg(result.acquisitionsUsed));

    PlotManager plots;
    connect(&plots, &PlotManager::statusMessage, this, &ConsoleApp::showStatus);
    plots.plotSpectrum(result);
    if (options.showPlots)
        plots.showBlocking("Spectrum");

    prompt.print();
    prompt.print("--- Saving results ---");
    if (prompt.askYesNo("Save the plot image?", true))
        plots.savePng(ResultExporter::nextFilename(plotsDir(), "SPECTRUM_plot", ".png"));

    ResultExporter exporter;
    connect(&exporter, &ResultExporter::statusMessage, this, &ConsoleApp::showStatus);
    if (prompt.askYesNo("Save the raw data (CSV)?", true))
        exporter.writeSpectrumCsv(result, ResultExporter::nextFilename(options.dataDir, "SPECTRUM_data", ".csv"));
}

int ConsoleApp::runSpectrum() {
    prompt.print("--- Spectrum analysis ---");
    Interrupt::ScopedHandler sigint;
    std::unique_ptr<OwonScope> scope;
    int rc = 0;

    try {
        prompt.print(QString("Connecting to the oscilloscope (%1)...").arg(options.scopeAddress));
        scope = std::make_unique<OwonScope>(ScpiLink::open(options.scopeAddress));
        prompt.print(QString("  -> Oscilloscope IDN: %1").arg(scope->identity().value_or("<no reply>")));
        resetScope(*scope);

        ThreadPacer pacer;
        do {
            SpectrumConfiguration config = SpectrumConfiguration::load(options.spectrumConfigPath);
            prompt.print();
            prompt.print("--- Current default configuration ---");
            printSpectrumConfig(config);

            if (prompt.askYesNo("Modify this configuration?", false)) {
                config = editSpectrumConfig(config);
                if (prompt.askYesNo("Save this configuration as the new default?", false)
                    && config.save(options.spectrumConfigPath))
                    prompt.print(QString("Configuration saved to '%1'.").arg(options.spectrumConfigPath));
            }

            prompt.print();
            prompt.print("--- Configuration ready ---");
            printSpectrumConfig(config);

            if (!prompt.askYesNo("Confirm and start the analysis?", true)) {
                prompt.print("Analysis cancelled.");
                continue;
            }

            SpectrumAnalyzer analyzer(*scope, pacer);
            connect(&analyzer, &SpectrumAnalyzer::statusMessage, this, &ConsoleApp::showStatus);
            try {
                const std::optional<SpectrumResult> result = analyzer.analyze(config, [this] {
                    prompt.waitForEnter("  Press ENTER to continue...");
                    return true;
                });
                Interrupt::clear();
                if (result)
                    presentSpectrum(*result);
                else
                    prompt.print("No data collected, nothing to plot.");
            } catch (const ConfigurationError &e) {
                prompt.print(QString("ERROR: invalid configuration: %1").arg(e.what()));
            }
        } while (prompt.askYesNo("Start a new analysis?", false));
    } catch (const ConnectionError &e) {
        prompt.print(QString("FATAL CONNECTION ERROR: %1").arg(e.what()));
        prompt.print("Check that the VDS software is running.");
        rc = 1;
    } catch (const TransportError &e) {
        prompt.print(QString("FATAL ERROR: connection lost: %1").arg(e.what()));
        rc = 1;
    } catch (const Interrupted &) {
        prompt.print("--- Exiting ---");
    } catch (const std::exception &e) {
        qCritical() << "[ConsoleApp] Unexpected error:" << e.what();
        prompt.print(QString("FATAL UNEXPECTED ERROR: %1").arg(e.what()));
        rc = 1;
    }

    shutdown(nullptr, scope.get());
    prompt.print("--- Program finished ---");
    return rc;
}

// --- SCPI console ---

int ConsoleApp::runScpiConsole() {
    prompt.print("--- SCPI console ---");
    Interrupt::ScopedHandler sigint;
    std::unique_ptr<OwonScope> scope;
    int rc = 0;

    try {
        prompt.print(QString("Connecting to %1...").arg(options.scopeAddress));
        scope = std::make_unique<OwonScope>(ScpiLink::open(options.scopeAddress));
        const std::optional<QString> idn = scope->identity();
        if (idn)
            prompt.print(QString("Connected! IDN: %1").arg(*idn));
        else
            prompt.print("Connected, but no IDN reply. Is the scope powered on?");

        prompt.print();
        prompt.print("Type 'exit' or 'quit' to leave.");
        prompt.print("Queries (e.g. *IDN?) print the reply.");
        prompt.print("Other commands (e.g. :CHANnel1:SCALe 0.5) print 'Sent.'");
        prompt.print();

        ScpiLink &link = scope->link();
        for (;;) {
            const QString command = prompt.readLine("SCPI > ");
            if (command.compare("exit", Qt::CaseInsensitive) == 0 || command.compare("quit", Qt::CaseInsensitive) == 0) {
                prompt.print("Disconnecting...");
                break;
            }
            if (command.isEmpty())
                continue;

            try {
                if (command.endsWith('?')) {
                    prompt.print(QString("  -> QUERY: %1").arg(command));
                    const std::optional<QString> reply = link.query(command);
                    prompt.print(QString("  <- RESPONSE: %1").arg(reply.value_or("<no reply>")));
                } else {
                    prompt.print(QString("  -> SET: %1").arg(command));
                    link.send(command);
                    prompt.print("  <- Sent.");
                }
                prompt.print();
            } catch (const TransportError &e) {
                prompt.print(QString("ERROR while sending the command: %1").arg(e.what()));
                prompt.print("The connection may have dropped.");
                rc = 1;
                break;
            }
        }
    } catch (const ConnectionError &e) {
        prompt.print(QString("FATAL CONNECTION ERROR: %1").arg(e.what()));
        prompt.print("Check that the Owon VDS software is running.");
        rc = 1;
    } catch (const Interrupted &) {
        prompt.print("--- Forced exit (Ctrl+C) ---");
    } catch (const std::exception &e) {
        qCritical() << "[ConsoleApp] Unexpected error:" << e.what();
        prompt.print(QString("FATAL UNEXPECTED ERROR: %1").arg(e.what()));
        rc = 1;
    }

    shutdown(nullptr, scope.get());
    prompt.print("--- Console closed ---");
    return rc;
}

// --- Port listing ---

int ConsoleApp::listPorts() {
    prompt.print("Looking for connected instruments...");
    const auto ports = QSerialPortInfo::availablePorts();
    if (ports.isEmpty()) {
        prompt.print();
        prompt.print("No serial ports found.");
        prompt.print("Check that:");
        prompt.print("  1. The instrument is powered on and connected via USB.");
        prompt.print("  2. You have permission to open serial devices (e.g. the 'dialout' group).");
        return 1;
    }

    prompt.print();
    prompt.print("--- Ports found ---");
    for (const QSerialPortInfo &port : ports) {
        QString info = QString("%1 (VID: %2, PID: %3)")
            .arg(port.systemLocation())
            .arg(port.vendorIdentifier(), 4, 16, QChar('0'))
            .arg(port.productIdentifier(), 4, 16, QChar('0'));
        if (!port.manufacturer().isEmpty() || !port.description().isEmpty())
            info += " " + QString("%1 %2").arg(port.manufacturer(), port.description()).trimmed();
        prompt.print(info);
    }
    prompt.print("-------------------");
    prompt.print();
    prompt.print(QString("Pass the generator as --generator serial://%1").arg(ports.first().systemLocation()));
    return 0;
}
