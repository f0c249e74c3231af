#pragma once
#include <QObject>
#include <QString>

class QCustomPlot;
class QCPTextElement;
class QWidget;
struct BodeSweepResult;
struct SpectrumResult;

// Renders sweep and spectrum results into a single QCustomPlot.
class PlotManager : public QObject {
    Q_OBJECT
public:
    static constexpr int EXPORT_WIDTH = 1200;
    static constexpr int EXPORT_HEIGHT = 800;

    explicit PlotManager(QObject *parent = nullptr);
    ~PlotManager();
    QWidget *plotWidget() const;

    // Magnitude (left axis) and phase (right axis) against frequency.
    void plotBode(const BodeSweepResult &result);
    // dB (left axis) and Vrms (right axis) against frequency.
    void plotSpectrum(const SpectrumResult &result);

    void setTitle(const QString &title);

    // Shows the plot in a window and returns once the window is closed.
    void showBlocking(const QString &windowTitle);

    bool savePng(const QString &path, int width = EXPORT_WIDTH, int height = EXPORT_HEIGHT);

signals:
    void statusMessage(const QString &msg);

private:
    void resetAxes();
    void styleValueAxis(bool secondary, const QString &label, const QColor &color);

    QCustomPlot *plot;
    QCPTextElement *title;
};
