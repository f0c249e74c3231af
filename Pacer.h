#pragma once
#include <QElapsedTimer>

// Source of blocking delays and elapsed time for the sequencers.
class Pacer {
public:
    virtual ~Pacer() = default;
    virtual void sleep(double seconds) = 0;
    // Monotonic seconds since an arbitrary origin.
    virtual double elapsed() const = 0;
};

class ThreadPacer : public Pacer {
public:
    ThreadPacer();
    void sleep(double seconds) override;
    double elapsed() const override;

private:
    QElapsedTimer clock;
};
