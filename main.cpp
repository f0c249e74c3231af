#include "ConsoleApp.h"
#include "ConsolePrompt.h"
#include <QApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QTextStream>

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QApplication::setApplicationName("scopesweep");
    QApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Bode plots and spectrum analysis with an Owon VDS scope and DGE generator.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "bode | spectrum | console | list-ports");

    const ConsoleOptions defaults;
    QCommandLineOption scopeOption("scope", "Oscilloscope address (tcp://host:port).", "url", defaults.scopeAddress);
    QCommandLineOption generatorOption("generator", "Generator address (serial:///dev/ttyUSB0?baud=115200 or tcp://host:port).",
                                       "url", defaults.generatorAddress);
    QCommandLineOption dataDirOption("data-dir", "Directory for CSV and PNG results.", "dir", defaults.dataDir);
    QCommandLineOption noPlotOption("no-plot", "Do not open the plot window.");
    QCommandLineOption verboseOption({"v", "verbose"}, "Print debug messages.");
    parser.addOptions({scopeOption, generatorOption, dataDirOption, noPlotOption, verboseOption});
    parser.process(app);

    if (!parser.isSet(verboseOption))
        QLoggingCategory::setFilterRules("*.debug=false");

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        QTextStream(stderr) << parser.helpText();
        return 2;
    }

    ConsoleOptions options;
    options.scopeAddress = parser.value(scopeOption);
    options.generatorAddress = parser.value(generatorOption);
    options.dataDir = parser.value(dataDirOption);
    options.showPlots = !parser.isSet(noPlotOption);

    ConsolePrompt prompt;
    ConsoleApp console(options, prompt);

    const QString command = args.first();
    if (command == "bode")
        return console.runBode();
    if (command == "spectrum")
        return console.runSpectrum();
    if (command == "console")
        return console.runScpiConsole();
    if (command == "list-ports")
        return console.listPorts();

    QTextStream(stderr) << "Unknown command: " << command << "\n\n" << parser.helpText();
    return 2;
}
