#include "Pacer.h"
#include <QThread>
#include <cmath>

ThreadPacer::ThreadPacer() {
    clock.start();
}

void ThreadPacer::sleep(double seconds) {
    if (seconds > 0)
        QThread::msleep(static_cast<unsigned long>(std::lround(seconds * 1000.0)));
}

double ThreadPacer::elapsed() const {
    return clock.nsecsElapsed() / 1e9;
}
