#include "BodeSweeper.h"
#include "ResultExporter.h"
#include "SpectrumAnalyzer.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <gtest/gtest.h>

namespace {

QString firstLine(const QString &path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        return QString();
    return QString::fromUtf8(file.readLine()).trimmed();
}

}

TEST(ResultExporterTest, NextFilenameCountsFromOneAndCreatesDirectory) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString plots = QDir(tmp.path()).filePath("DATA/PLOTS");

    const QString first = ResultExporter::nextFilename(plots, "BODE_plot", ".png");
    EXPECT_TRUE(QDir(plots).exists());
    EXPECT_EQ(QFileInfo(first).fileName(), "BODE_plot_001.png");

    QFile file(first);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.close();
    EXPECT_EQ(QFileInfo(ResultExporter::nextFilename(plots, "BODE_plot", ".png")).fileName(), "BODE_plot_002.png");
    EXPECT_EQ(QFileInfo(ResultExporter::nextFilename(plots, "BODE_data", ".csv")).fileName(), "BODE_data_001.csv");
}

TEST(ResultExporterTest, BodeCsvRoundTripsExactly) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString path = tmp.filePath("bode.csv");

    BodeSweepResult result;
    result.frequencies = {1000.0, 3162.2776601683795, 10000.0};
    result.magnitudesDb = {-6.0205999132796242, 1.0 / 3.0, -123.456789e-7};
    result.phasesDeg = {-3.6, -11.384199576606166, 180.0};

    ResultExporter exporter;
    ASSERT_TRUE(exporter.writeBodeCsv(result, path));
    EXPECT_EQ(firstLine(path), "Frequency (Hz),Magnitude (dB),Phase (deg)");

    const std::optional<CsvColumns> back = ResultExporter::readCsv(path);
    ASSERT_TRUE(back);
    EXPECT_EQ(back->rows(), 3);
    EXPECT_EQ(back->first, result.frequencies);
    EXPECT_EQ(back->second, result.magnitudesDb);
    EXPECT_EQ(back->third, result.phasesDeg);
}

TEST(ResultExporterTest, SpectrumCsvHasItsOwnHeader) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString path = tmp.filePath("spectrum.csv");

    SpectrumResult result;
    result.frequencies = {0.0, 100.0};
    result.rmsVolts = {0.0, 0.7071067811865476};
    result.db = {-240.0, -3.0102999566398116};

    ResultExporter exporter;
    ASSERT_TRUE(exporter.writeSpectrumCsv(result, path));
    EXPECT_EQ(firstLine(path), "Frequency (Hz),Amplitude (Vrms),Amplitude (dB)");

    const std::optional<CsvColumns> back = ResultExporter::readCsv(path);
    ASSERT_TRUE(back);
    EXPECT_EQ(back->second, result.rmsVolts);
    EXPECT_EQ(back->third, result.db);
}

TEST(ResultExporterTest, UnwritablePathReportsFailure) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    ResultExporter exporter;
    QStringList messages;
    QObject::connect(&exporter, &ResultExporter::statusMessage, [&messages](const QString &m) { messages << m; });

    EXPECT_FALSE(exporter.writeBodeCsv(BodeSweepResult(), tmp.filePath("missing/dir/out.csv")));
    EXPECT_EQ(messages.size(), 1);
}

TEST(ResultExporterTest, MalformedCsvIsRejected) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());
    const QString path = tmp.filePath("bad.csv");
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Text));
    file.write("Frequency (Hz),Magnitude (dB),Phase (deg)\n1000,-6.02\n");
    file.close();

    EXPECT_FALSE(ResultExporter::readCsv(path));
    EXPECT_FALSE(ResultExporter::readCsv(tmp.filePath("absent.csv")));
}
