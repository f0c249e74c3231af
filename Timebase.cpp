#include "Timebase.h"

namespace {
const Timebase *smallestAtLeast(double timePerDiv) {
    for (const Timebase &tb : timebaseTable()) {
        if (tb.seconds >= timePerDiv)
            return &tb;
    }
    return &timebaseTable().last();
}
}

const QVector<Timebase> &timebaseTable() {
    static const QVector<Timebase> table = {
        {5e-9, "5ns"},     {10e-9, "10ns"},   {20e-9, "20ns"},   {50e-9, "50ns"},
        {100e-9, "100ns"}, {200e-9, "200ns"}, {500e-9, "500ns"},
        {1e-6, "1us"},     {2e-6, "2us"},     {5e-6, "5us"},
        {10e-6, "10us"},   {20e-6, "20us"},   {50e-6, "50us"},
        {100e-6, "100us"}, {200e-6, "200us"}, {500e-6, "500us"},
        {1e-3, "1ms"},     {2e-3, "2ms"},     {5e-3, "5ms"},
        {10e-3, "10ms"},   {20e-3, "20ms"},   {50e-3, "50ms"},
        {100e-3, "100ms"}, {200e-3, "200ms"}, {500e-3, "500ms"},
        {1.0, "1s"},       {2.0, "2s"},       {5.0, "5s"},
        {10.0, "10s"},     {20.0, "20s"},     {50.0, "50s"},     {100.0, "100s"}
    };
    return table;
}

const Timebase &optimalTimebaseForFrequency(double frequencyHz) {
    if (frequencyHz <= 0) {
        for (const Timebase &tb : timebaseTable()) {
            if (tb.seconds == 1.0)
                return tb;
        }
    }
    const double period = 1.0 / frequencyHz;
    const double idealPerDiv = (period * 2.0) / SCOPE_HORIZONTAL_DIVISIONS;
    return *smallestAtLeast(idealPerDiv);
}

const Timebase &timebaseForResolution(double resolutionHz) {
    const double idealPerDiv = 1.0 / (resolutionHz * SCOPE_HORIZONTAL_DIVISIONS);
    return *smallestAtLeast(idealPerDiv);
}
