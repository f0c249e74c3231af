#include "Interrupt.h"
#include <QDebug>
#include <atomic>

namespace {
std::atomic<bool> pending{false};

void onSigint(int) {
    pending.store(true);
}
}

namespace Interrupt {

// No SA_RESTART: a read blocked on the console returns with EINTR.
ScopedHandler::ScopedHandler() {
    struct sigaction action = {};
    action.sa_handler = onSigint;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    installed = sigaction(SIGINT, &action, &previous) == 0;
    if (!installed)
        qWarning() << "[Interrupt] Could not install the Ctrl+C handler";
}

ScopedHandler::~ScopedHandler() {
    if (installed)
        sigaction(SIGINT, &previous, nullptr);
}

void request() {
    pending.store(true);
}

bool requested() {
    return pending.load();
}

void clear() {
    pending.store(false);
}

void checkpoint() {
    if (pending.load()) {
        qDebug() << "[Interrupt] Operator interrupt at checkpoint";
        throw Interrupted();
    }
}

}
