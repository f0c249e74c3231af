#include "PlotManager.h"
#include "BodeSweeper.h"
#include "SpectrumAnalyzer.h"
#include "qcustomplot.h"
#include <QDebug>
#include <QDialog>
#include <QDir>
#include <QFileInfo>
#include <QVBoxLayout>
#include <algorithm>

PlotManager::PlotManager(QObject *parent)
    : QObject(parent), plot(new QCustomPlot), title(nullptr)
{
    plot->plotLayout()->insertRow(0);
    title = new QCPTextElement(plot, QString(), QFont("Arial", 12, QFont::Bold));
    plot->plotLayout()->addElement(0, 0, title);

    plot->axisRect()->setupFullAxesBox(true);
    plot->legend->setVisible(true);
    plot->legend->setBrush(QBrush(Qt::white));
    plot->legend->setBorderPen(QPen(Qt::black));
    plot->setMinimumSize(800, 500);
}

PlotManager::~PlotManager() {
    delete plot;
}

QWidget *PlotManager::plotWidget() const {
    return plot;
}

void PlotManager::setTitle(const QString &text) {
    title->setText(text);
}

void PlotManager::resetAxes() {
    plot->clearGraphs();
    plot->clearItems();

    plot->xAxis->setLabel("Frequency (Hz)");
    plot->xAxis->grid()->setSubGridVisible(true);
    plot->xAxis->grid()->setSubGridPen(QPen(Qt::lightGray, 0, Qt::DashLine));
    plot->yAxis->grid()->setSubGridVisible(true);
    plot->yAxis2->setVisible(true);
    plot->yAxis2->setTickLabels(true);
}

void PlotManager::styleValueAxis(bool secondary, const QString &label, const QColor &color) {
    QCPAxis *axis = secondary ? plot->yAxis2 : plot->yAxis;
    axis->setLabel(label);
    axis->setLabelColor(color);
    axis->setTickLabelColor(color);
    axis->setBasePen(QPen(color));
    axis->setTickPen(QPen(color));
    axis->setSubTickPen(QPen(color));
}

void PlotManager::plotBode(const BodeSweepResult &result) {
    resetAxes();
    setTitle("Bode plot - Frequency response");

    const bool logScale = result.config.scale == FrequencyScale::Logarithmic;
    if (logScale) {
        plot->xAxis->setScaleType(QCPAxis::stLogarithmic);
        QSharedPointer<QCPAxisTickerLog> logTicker(new QCPAxisTickerLog);
        logTicker->setLogBase(10);
        plot->xAxis->setTicker(logTicker);
        plot->xAxis->setNumberFormat("eb");
        plot->xAxis->setNumberPrecision(0);
    } else {
        plot->xAxis->setScaleType(QCPAxis::stLinear);
        plot->xAxis->setTicker(QSharedPointer<QCPAxisTicker>(new QCPAxisTicker));
        plot->xAxis->setNumberFormat("g");
        plot->xAxis->setNumberPrecision(6);
    }

    plot->addGraph(plot->xAxis, plot->yAxis);
    plot->graph(0)->setData(result.frequencies, result.magnitudesDb, true);
    plot->graph(0)->setPen(QPen(Qt::blue, 2));
    plot->graph(0)->setScatterStyle(QCPScatterStyle(QCPScatterStyle::ssCircle, 5));
    plot->graph(0)->setName("Magnitude (dB)");
    styleValueAxis(false, "Magnitude (dB)", Qt::blue);
    plot->yAxis->setRange(result.config.magnitudeMinDb, result.config.magnitudeMaxDb);

    plot->addGraph(plot->xAxis, plot->yAxis2);
    plot->graph(1)->setData(result.frequencies, result.phasesDeg, true);
    plot->graph(1)->setPen(QPen(Qt::red, 2));
    plot->graph(1)->setScatterStyle(QCPScatterStyle(QCPScatterStyle::ssSquare, 5));
    plot->graph(1)->setName("Phase (deg)");
    styleValueAxis(true, "Phase (degrees)", Qt::red);
    plot->yAxis2->setRange(-180.0, 180.0);
    plot->yAxis2->setNumberFormat("f");
    plot->yAxis2->setNumberPrecision(0);

    plot->xAxis->setRange(result.config.startHz, result.config.stopHz);
    plot->replot();
}

void PlotManager::plotSpectrum(const SpectrumResult &result) {
    resetAxes();
    setTitle("Spectrum analysis");

    plot->xAxis->setScaleType(QCPAxis::stLinear);
    plot->xAxis->setTicker(QSharedPointer<QCPAxisTicker>(new QCPAxisTicker));
    plot->xAxis->setNumberFormat("g");
    plot->xAxis->setNumberPrecision(6);

    plot->addGraph(plot->xAxis, plot->yAxis);
    plot->graph(0)->setData(result.frequencies, result.db, true);
    plot->graph(0)->setPen(QPen(Qt::blue, 1.5));
    plot->graph(0)->setName("Amplitude (dB)");
    styleValueAxis(false, "Amplitude (dB)", Qt::blue);
    plot->graph(0)->rescaleValueAxis(false, true);

    plot->addGraph(plot->xAxis, plot->yAxis2);
    plot->graph(1)->setData(result.frequencies, result.rmsVolts, true);
    plot->graph(1)->setPen(QPen(Qt::red, 1));
    plot->graph(1)->setName("Amplitude (Vrms)");
    styleValueAxis(true, "Amplitude (Vrms)", Qt::red);
    plot->yAxis2->setNumberFormat("g");
    plot->yAxis2->setNumberPrecision(3);
    plot->graph(1)->rescaleValueAxis(false, true);

    plot->xAxis->setRange(result.config.startHz, result.config.stopHz);
    plot->replot();
}

void PlotManager::showBlocking(const QString &windowTitle) {
    QDialog window;
    window.setWindowTitle(windowTitle);
    QVBoxLayout *layout = new QVBoxLayout(&window);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->addWidget(plot);
    plot->show();
    window.resize(EXPORT_WIDTH, EXPORT_HEIGHT);

    emit statusMessage(tr("Showing the plot. Close the window to continue..."));
    window.exec();

    // The plot outlives the window.
    layout->removeWidget(plot);
    plot->setParent(nullptr);
}

bool PlotManager::savePng(const QString &path, int width, int height) {
    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        qWarning() << "[PlotManager] Cannot create directory" << dir;
        return false;
    }
    if (!plot->savePng(path, width, height)) {
        qWarning() << "[PlotManager] Failed to save plot to" << path;
        emit statusMessage(tr("ERROR: cannot save the plot to %1").arg(path));
        return false;
    }
    qDebug() << "[PlotManager] Plot saved to" << path;
    emit statusMessage(tr("Plot saved to: %1").arg(path));
    return true;
}
