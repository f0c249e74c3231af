#include "ConsolePrompt.h"
#include "Interrupt.h"
#include <QDebug>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <poll.h>
#include <unistd.h>

static constexpr int INPUT_POLL_MS = 200;
static constexpr int INPUT_CHUNK = 4096;

ConsolePrompt::ConsolePrompt()
    : stdoutStream(stdout), inputFd(STDIN_FILENO), out(stdoutStream) {}

ConsolePrompt::ConsolePrompt(int inputFd, QTextStream &out)
    : inputFd(inputFd), out(out) {}

ConsolePrompt::ConsolePrompt(QTextStream &in, QTextStream &out)
    : in(&in), out(out) {}

void ConsolePrompt::print(const QString &line) {
    out << line << Qt::endl;
}

QString ConsolePrompt::readLine(const QString &promptText) {
    out << promptText;
    out.flush();
    const std::optional<QString> line = readInputLine();
    if (!line || Interrupt::requested()) {
        out << Qt::endl;
        Interrupt::checkpoint();
        throw Interrupted();
    }
    return line->trimmed();
}

std::optional<QString> ConsolePrompt::readInputLine() {
    if (!in)
        return readDescriptorLine();
    const QString line = in->readLine();
    if (line.isNull())
        return std::nullopt;
    return line;
}

// Waits in short polls so a pending Ctrl+C ends the wait even when the
// blocked read would be restarted. std::nullopt on end of input.
std::optional<QString> ConsolePrompt::readDescriptorLine() {
    for (;;) {
        const int newline = pendingInput.indexOf('\n');
        if (newline >= 0) {
            const QString line = QString::fromLocal8Bit(pendingInput.left(newline));
            pendingInput.remove(0, newline + 1);
            return line;
        }
        if (Interrupt::requested())
            return std::nullopt;

        pollfd pfd = {inputFd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, INPUT_POLL_MS);
        if (ready < 0 && errno != EINTR) {
            qWarning() << "[ConsolePrompt] poll on input failed:" << std::strerror(errno);
            break;
        }
        if (ready <= 0)
            continue;

        char chunk[INPUT_CHUNK];
        const ssize_t n = ::read(inputFd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            qWarning() << "[ConsolePrompt] read on input failed:" << std::strerror(errno);
            break;
        }
        if (n == 0)
            break;
        pendingInput.append(chunk, static_cast<int>(n));
    }

    if (pendingInput.isEmpty())
        return std::nullopt;
    const QString last = QString::fromLocal8Bit(pendingInput);
    pendingInput.clear();
    return last;
}

QString ConsolePrompt::ask(const QString &question, const QString &defaultValue) {
    const QString answer = readLine(QString("%1 [%2]: ").arg(question, defaultValue));
    return answer.isEmpty() ? defaultValue : answer;
}

bool ConsolePrompt::askYesNo(const QString &question, bool defaultYes) {
    for (;;) {
        const QString answer = ask(question + " (y/n)", defaultYes ? "y" : "n").toLower();
        if (answer == "y" || answer == "yes")
            return true;
        if (answer == "n" || answer == "no")
            return false;
        print("Please answer 'y' or 'n'.");
    }
}

double ConsolePrompt::askDouble(const QString &question, double defaultValue) {
    for (;;) {
        const QString answer = ask(question, QString::number(defaultValue, 'g', 10));
        bool ok = false;
        const double value = answer.toDouble(&ok);
        if (ok)
            return value;
        print("Error: please enter a number.");
    }
}

int ConsolePrompt::askInt(const QString &question, int defaultValue) {
    for (;;) {
        const QString answer = ask(question, QString::number(defaultValue));
        bool ok = false;
        const int value = answer.toInt(&ok);
        if (ok)
            return value;
        print("Error: please enter a whole number.");
    }
}

void ConsolePrompt::waitForEnter(const QString &message) {
    readLine(message);
}
