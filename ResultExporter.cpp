#include "ResultExporter.h"
#include "BodeSweeper.h"
#include "SpectrumAnalyzer.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

// Enough digits for a double to survive a text round trip.
static constexpr int CSV_PRECISION = 17;

ResultExporter::ResultExporter(QObject *parent) : QObject(parent) {}

QString ResultExporter::nextFilename(const QString &directory, const QString &prefix, const QString &extension) {
    QDir dir(directory);
    if (!dir.exists() && !QDir().mkpath(directory))
        qWarning() << "[ResultExporter] Cannot create directory" << directory;

    for (int i = 1;; ++i) {
        const QString name = QString("%1_%2%3").arg(prefix).arg(i, 3, 10, QChar('0')).arg(extension);
        const QString path = dir.filePath(name);
        if (!QFileInfo::exists(path))
            return path;
    }
}

bool ResultExporter::writeColumns(const QString &path, const QString &header, const QVector<double> &a,
                                  const QVector<double> &b, const QVector<double> &c) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        qWarning() << "[ResultExporter] Failed to open file for writing:" << path << file.errorString();
        emit statusMessage(tr("ERROR: cannot save the CSV file: %1").arg(file.errorString()));
        return false;
    }

    QTextStream out(&file);
    out << header << "\n";
    const int rows = qMin(a.size(), qMin(b.size(), c.size()));
    for (int i = 0; i < rows; ++i) {
        out << QString::number(a[i], 'g', CSV_PRECISION) << ","
            << QString::number(b[i], 'g', CSV_PRECISION) << ","
            << QString::number(c[i], 'g', CSV_PRECISION) << "\n";
    }
    out.flush();
    if (out.status() != QTextStream::Ok) {
        qWarning() << "[ResultExporter] Write error on" << path;
        return false;
    }

    file.close();
    qDebug() << "[ResultExporter] Exported" << rows << "rows to:" << path;
    emit statusMessage(tr("Data saved to: %1").arg(path));
    return true;
}

bool ResultExporter::writeBodeCsv(const BodeSweepResult &result, const QString &path) {
    return writeColumns(path, "Frequency (Hz),Magnitude (dB),Phase (deg)",
                        result.frequencies, result.magnitudesDb, result.phasesDeg);
}

bool ResultExporter::writeSpectrumCsv(const SpectrumResult &result, const QString &path) {
    return writeColumns(path, "Frequency (Hz),Amplitude (Vrms),Amplitude (dB)",
                        result.frequencies, result.rmsVolts, result.db);
}

std::optional<CsvColumns> ResultExporter::readCsv(const QString &path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "[ResultExporter] Failed to open file for reading:" << path;
        return std::nullopt;
    }

    QTextStream in(&file);
    CsvColumns columns;
    if (in.atEnd())
        return std::nullopt;
    columns.header = in.readLine().split(',');

    int lineNo = 1;
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        ++lineNo;
        if (line.isEmpty())
            continue;
        const QStringList fields = line.split(',');
        bool ok0 = false, ok1 = false, ok2 = false;
        if (fields.size() == 3) {
            columns.first.append(fields[0].toDouble(&ok0));
            columns.second.append(fields[1].toDouble(&ok1));
            columns.third.append(fields[2].toDouble(&ok2));
        }
        if (!ok0 || !ok1 || !ok2) {
            qWarning() << "[ResultExporter] Malformed row" << lineNo << "in" << path;
            return std::nullopt;
        }
    }
    return columns;
}
