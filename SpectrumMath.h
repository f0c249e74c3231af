#pragma once
#include "SpectrumConfig.h"
#include <QByteArray>
#include <QVector>
#include <complex>

using ComplexSpectrum = QVector<std::complex<double>>;

// Full-scale span of the 8-bit digitizer: 8 vertical divisions over 255 steps.
inline constexpr double ADC_VERTICAL_DIVISIONS = 8.0;
inline constexpr double ADC_CODE_RANGE = 255.0;
inline constexpr double ADC_CODE_MIDPOINT = 127.5;
// Added before taking the logarithm so empty bins stay finite.
inline constexpr double SPECTRUM_DB_EPSILON = 1e-12;

struct ReducedSpectrum {
    QVector<double> frequencies;
    QVector<double> rmsVolts;
    QVector<double> db;
};

namespace SpectrumMath {

// Hann: 0.5 - 0.5*cos(2*pi*k/(n-1)); rectangular: all ones.
QVector<double> windowFunction(WindowKind kind, int n);

double voltsPerStep(double voltsPerDiv, int probeFactor);
double voltsFromCode(double code, double voltsPerStep);
QVector<double> voltsFromCodes(const QByteArray &codes, double voltsPerStep);

// Complex DFT of a real sequence, all n bins.
ComplexSpectrum dft(const QVector<double> &samples);

// Averages the complex spectra bin by bin, keeps the first n/2 bins and
// scales them to RMS volts using the window's coherent gain. Bin 0 is the DC
// level and is not doubled nor divided by sqrt(2).
ReducedSpectrum reduceSpectra(const QVector<ComplexSpectrum> &spectra, const QVector<double> &window,
                              double sampleRateHz);

}
