#pragma once
#include <QObject>
#include <QStringList>
#include <QVector>
#include <optional>

struct BodeSweepResult;
struct SpectrumResult;

// Three numeric columns read back from an exported CSV file.
struct CsvColumns {
    QStringList header;
    QVector<double> first;
    QVector<double> second;
    QVector<double> third;

    int rows() const { return first.size(); }
};

class ResultExporter : public QObject {
    Q_OBJECT
public:
    explicit ResultExporter(QObject *parent = nullptr);

    // First "<prefix>_NNN<extension>" in directory that does not exist yet,
    // counting from 001. Creates the directory when needed.
    static QString nextFilename(const QString &directory, const QString &prefix, const QString &extension);

    bool writeBodeCsv(const BodeSweepResult &result, const QString &path);
    bool writeSpectrumCsv(const SpectrumResult &result, const QString &path);

    static std::optional<CsvColumns> readCsv(const QString &path);

signals:
    void statusMessage(const QString &msg);

private:
    bool writeColumns(const QString &path, const QString &header, const QVector<double> &a,
                      const QVector<double> &b, const QVector<double> &c);
};
