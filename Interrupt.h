#pragma once
#include <signal.h>

// Operator interrupt (Ctrl+C). The signal handler only raises a flag; the
// sequencers poll it at point and repetition boundaries.
class Interrupted {
public:
    Interrupted() = default;
};

namespace Interrupt {

// Installs the SIGINT handler for its lifetime and restores the previous one.
class ScopedHandler {
public:
    ScopedHandler();
    ~ScopedHandler();
    ScopedHandler(const ScopedHandler &) = delete;
    ScopedHandler &operator=(const ScopedHandler &) = delete;

private:
    struct sigaction previous = {};
    bool installed = false;
};

void request();
bool requested();
void clear();

// Throws Interrupted when an interrupt is pending. The flag stays raised so
// outer loops also unwind.
void checkpoint();

}
