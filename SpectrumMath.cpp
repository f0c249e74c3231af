#include "SpectrumMath.h"
#include <cmath>

static const double PI = std::acos(-1.0);

namespace SpectrumMath {

QVector<double> windowFunction(WindowKind kind, int n) {
    QVector<double> w(n, 1.0);
    if (kind == WindowKind::Rectangular || n < 2)
        return w;
    for (int k = 0; k < n; ++k)
        w[k] = 0.5 - 0.5 * std::cos(2.0 * PI * k / (n - 1));
    return w;
}

double voltsPerStep(double voltsPerDiv, int probeFactor) {
    return (ADC_VERTICAL_DIVISIONS * voltsPerDiv * probeFactor) / ADC_CODE_RANGE;
}

double voltsFromCode(double code, double voltsPerStep) {
    return (code - ADC_CODE_MIDPOINT) * voltsPerStep;
}

QVector<double> voltsFromCodes(const QByteArray &codes, double voltsPerStep) {
    QVector<double> volts(codes.size());
    for (int i = 0; i < codes.size(); ++i)
        volts[i] = voltsFromCode(static_cast<unsigned char>(codes[i]), voltsPerStep);
    return volts;
}

ComplexSpectrum dft(const QVector<double> &samples) {
    const int n = samples.size();
    ComplexSpectrum out(n);
    for (int k = 0; k < n; ++k) {
        std::complex<double> sum(0.0, 0.0);
        for (int t = 0; t < n; ++t) {
            // Reduce the index product first to keep the angle small.
            const double angle = 2.0 * PI * ((static_cast<long long>(k) * t) % n) / n;
            sum += samples[t] * std::complex<double>(std::cos(angle), -std::sin(angle));
        }
        out[k] = sum;
    }
    return out;
}

ReducedSpectrum reduceSpectra(const QVector<ComplexSpectrum> &spectra, const QVector<double> &window,
                              double sampleRateHz) {
    ReducedSpectrum result;
    if (spectra.isEmpty())
        return result;

    const int n = spectra.first().size();
    ComplexSpectrum avg(n, std::complex<double>(0.0, 0.0));
    for (const ComplexSpectrum &s : spectra) {
        for (int k = 0; k < n; ++k)
            avg[k] += s[k];
    }
    for (int k = 0; k < n; ++k)
        avg[k] /= static_cast<double>(spectra.size());

    double windowSum = 0.0;
    for (double w : window)
        windowSum += w;

    const int half = n / 2;
    result.frequencies.resize(half);
    result.rmsVolts.resize(half);
    result.db.resize(half);
    for (int k = 0; k < half; ++k) {
        result.frequencies[k] = k * sampleRateHz / n;
        const double peak = std::abs(avg[k]) * 2.0 / windowSum;
        result.rmsVolts[k] = k == 0 ? std::abs(avg[0]) / windowSum : peak / std::sqrt(2.0);
        result.db[k] = 20.0 * std::log10(result.rmsVolts[k] + SPECTRUM_DB_EPSILON);
    }
    return result;
}

}
