#pragma once
#include <QByteArray>
#include <QString>
#include <QTextStream>
#include <optional>

// Line-oriented operator dialogue on stdin/stdout. An empty answer selects
// the default shown in brackets. End of input or a pending Ctrl+C throws
// Interrupted.
class ConsolePrompt {
public:
    ConsolePrompt();
    // Reads answers straight from a file descriptor, polling for Ctrl+C
    // while waiting.
    ConsolePrompt(int inputFd, QTextStream &out);
    ConsolePrompt(QTextStream &in, QTextStream &out);

    void print(const QString &line = QString());

    QString ask(const QString &question, const QString &defaultValue = QString());
    bool askYesNo(const QString &question, bool defaultYes);
    double askDouble(const QString &question, double defaultValue);
    int askInt(const QString &question, int defaultValue);
    // Blocks until the operator presses Enter.
    void waitForEnter(const QString &message);

    // Trimmed answer, without default handling.
    QString readLine(const QString &promptText);

private:
    std::optional<QString> readInputLine();
    std::optional<QString> readDescriptorLine();

    QTextStream stdoutStream;
    QTextStream *in = nullptr;
    int inputFd = -1;
    QByteArray pendingInput;
    QTextStream &out;
};
