#pragma once
#include <QString>
#include <QVector>

// One horizontal (time/div) setting of the scope.
struct Timebase {
    double seconds;
    const char *scpi;
};

inline constexpr int SCOPE_HORIZONTAL_DIVISIONS = 10;

const QVector<Timebase> &timebaseTable();

// Smallest setting that shows about two periods across the screen.
// Clamped to the largest setting; a non-positive frequency selects 1 s.
const Timebase &optimalTimebaseForFrequency(double frequencyHz);

// Smallest setting whose capture window gives at least the requested
// frequency resolution; clamped to the largest setting.
const Timebase &timebaseForResolution(double resolutionHz);
