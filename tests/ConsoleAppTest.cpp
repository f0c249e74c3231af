#include "ConsoleApp.h"
#include "ConsolePrompt.h"
#include "Interrupt.h"
#include <QTextStream>
#include <gtest/gtest.h>
#include <chrono>
#include <cstring>
#include <csignal>
#include <thread>
#include <unistd.h>

// Drives a prompt from a canned answer script and collects its output.
class ScriptedConsole {
public:
    explicit ScriptedConsole(const QString &answers)
        : input(answers), inStream(&input, QIODevice::ReadOnly), outStream(&output, QIODevice::WriteOnly),
          prompt(inStream, outStream) {}

    QString transcript() {
        outStream.flush();
        return output;
    }

    QString input;
    QString output;
    QTextStream inStream;
    QTextStream outStream;
    ConsolePrompt prompt;
};

TEST(ConsolePromptTest, EmptyAnswerSelectsDefault) {
    ScriptedConsole console("\n  spaced  \n");
    EXPECT_EQ(console.prompt.ask("Name", "owon"), "owon");
    EXPECT_EQ(console.prompt.ask("Name", "owon"), "spaced");
    EXPECT_TRUE(console.transcript().startsWith("Name [owon]: "));
}

TEST(ConsolePromptTest, YesNoRepeatsUntilUnderstood) {
    ScriptedConsole console("maybe\nYES\n\nno\n");
    EXPECT_TRUE(console.prompt.askYesNo("Continue?", false));
    EXPECT_FALSE(console.prompt.askYesNo("Continue?", false));
    EXPECT_FALSE(console.prompt.askYesNo("Continue?", true));
    EXPECT_TRUE(console.transcript().contains("Please answer 'y' or 'n'."));
    EXPECT_TRUE(console.transcript().contains("Continue? (y/n) [n]: "));
}

TEST(ConsolePromptTest, NumbersAreValidated) {
    ScriptedConsole console("abc\n2.5\n1.5\n\n");
    EXPECT_DOUBLE_EQ(console.prompt.askDouble("Amplitude", 1.0), 2.5);
    EXPECT_EQ(console.prompt.askInt("Points", 20), 20);
    EXPECT_TRUE(console.transcript().contains("Error: please enter a number."));
    EXPECT_TRUE(console.transcript().contains("Error: please enter a whole number."));
}

TEST(ConsolePromptTest, EndOfInputInterrupts) {
    ScriptedConsole console("y\n");
    EXPECT_TRUE(console.prompt.askYesNo("First?", false));
    EXPECT_THROW(console.prompt.askYesNo("Second?", false), Interrupted);
}

TEST(ConsolePromptTest, PendingInterruptStopsDialogue) {
    ScriptedConsole console("y\n");
    Interrupt::request();
    EXPECT_THROW(console.prompt.ask("Anything"), Interrupted);
    Interrupt::clear();
}

// Prompt reading from the read end of a pipe; the write end stays open
// unless the test closes it.
class DescriptorPromptTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(::pipe(fds), 0);
        out.setString(&output, QIODevice::WriteOnly);
    }
    void TearDown() override {
        Interrupt::clear();
        ::close(fds[0]);
        if (fds[1] >= 0)
            ::close(fds[1]);
    }
    void feed(const char *text) {
        ASSERT_EQ(::write(fds[1], text, std::strlen(text)), static_cast<ssize_t>(std::strlen(text)));
    }
    void closeWriter() {
        ::close(fds[1]);
        fds[1] = -1;
    }

    int fds[2] = {-1, -1};
    QString output;
    QTextStream out;
};

TEST_F(DescriptorPromptTest, ReadsLinesUntilEndOfInput) {
    ConsolePrompt prompt(fds[0], out);
    feed("lin\r\n\n42");
    closeWriter();

    EXPECT_EQ(prompt.readLine("> "), "lin");
    EXPECT_EQ(prompt.ask("Points", "20"), "20");
    EXPECT_EQ(prompt.askInt("Points", 20), 42);
    EXPECT_THROW(prompt.readLine("> "), Interrupted);
}

TEST_F(DescriptorPromptTest, CtrlCEndsBlockedWait) {
    ConsolePrompt prompt(fds[0], out);
    Interrupt::ScopedHandler sigint;
    std::thread sender([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        ::kill(::getpid(), SIGINT);
    });

    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(prompt.waitForEnter("Press ENTER to continue..."), Interrupted);
    sender.join();
    EXPECT_TRUE(Interrupt::requested());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

class ConsoleEditTest : public ::testing::Test {
protected:
    SweepConfiguration editBode(const QString &answers, const SweepConfiguration &defaults = SweepConfiguration()) {
        console = std::make_unique<ScriptedConsole>(answers);
        ConsoleApp app(ConsoleOptions(), console->prompt);
        return app.editBodeConfig(defaults);
    }

    SpectrumConfiguration editSpectrum(const QString &answers) {
        console = std::make_unique<ScriptedConsole>(answers);
        ConsoleApp app(ConsoleOptions(), console->prompt);
        return app.editSpectrumConfig(SpectrumConfiguration());
    }

    std::unique_ptr<ScriptedConsole> console;
};

TEST_F(ConsoleEditTest, LinearScaleOffersLinearDefaults) {
    const SweepConfiguration config = editBode("lin\n\n\n\n\n\n\n\n");
    EXPECT_EQ(config.scale, FrequencyScale::Linear);
    EXPECT_EQ(config.numPoints, 50);
    EXPECT_EQ(config.numPointsLinear, 50);
    EXPECT_DOUBLE_EQ(config.magnitudeMinDb, -40.0);
    EXPECT_DOUBLE_EQ(config.startHz, 1.0);
    EXPECT_DOUBLE_EQ(config.stopHz, 100000.0);
}

TEST_F(ConsoleEditTest, LinearAnswersAreRemembered) {
    const SweepConfiguration config = editBode("lin\n0\n500\n11\n4\n2\n-30\n5\n");
    EXPECT_DOUBLE_EQ(config.startHz, 0.0);
    EXPECT_DOUBLE_EQ(config.stopHz, 500.0);
    EXPECT_EQ(config.numPoints, 11);
    EXPECT_EQ(config.numPointsLinear, 11);
    EXPECT_EQ(config.numAverages, 4);
    EXPECT_DOUBLE_EQ(config.generatorAmplitudeVpp, 2.0);
    EXPECT_DOUBLE_EQ(config.magnitudeMinDb, -30.0);
    EXPECT_DOUBLE_EQ(config.magnitudeMinLinearDb, -30.0);
    EXPECT_DOUBLE_EQ(config.magnitudeMaxDb, 5.0);
}

TEST_F(ConsoleEditTest, LogarithmicSweepRejectsBadRange) {
    const SweepConfiguration config = editBode("sqrt\nlog\n0\n-5\n10\n5\n20\n\n\n\n\n\n");
    EXPECT_EQ(config.scale, FrequencyScale::Logarithmic);
    EXPECT_DOUBLE_EQ(config.startHz, 10.0);
    EXPECT_DOUBLE_EQ(config.stopHz, 20.0);
    EXPECT_EQ(config.numPoints, 20);
    EXPECT_EQ(config.numPointsLinear, 50);
    EXPECT_DOUBLE_EQ(config.magnitudeMinDb, -100.0);

    const QString out = console->transcript();
    EXPECT_TRUE(out.contains("Error: enter 'lin' or 'log'."));
    EXPECT_EQ(out.count("ERROR: the start frequency of a logarithmic sweep must be greater than zero."), 2);
    EXPECT_EQ(out.count("ERROR: the stop frequency must be greater than the start frequency."), 1);
}

TEST_F(ConsoleEditTest, SpectrumWindowIsReaskedUntilSupported) {
    const SpectrumConfiguration config = editSpectrum("\n2000\n\n5\n2\nac\nblackman\nrect\n");
    EXPECT_DOUBLE_EQ(config.startHz, 0.0);
    EXPECT_DOUBLE_EQ(config.stopHz, 2000.0);
    EXPECT_DOUBLE_EQ(config.resolutionHz, 100.0);
    EXPECT_EQ(config.numAverages, 5);
    EXPECT_EQ(config.channel, 2);
    EXPECT_EQ(config.coupling, Coupling::AC);
    EXPECT_EQ(config.window, WindowKind::Rectangular);
    EXPECT_TRUE(console->transcript().contains("Error: only the HANNing and RECTangle windows are supported."));
}

TEST_F(ConsoleEditTest, EndOfInputDuringEditInterrupts) {
    EXPECT_THROW(editBode("lin\n100\n"), Interrupted);
}
