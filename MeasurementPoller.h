#pragma once
#include <QString>
#include <functional>
#include <optional>

class Pacer;

// Readings with a magnitude at or above this mean "out of range".
inline constexpr double OVERLOAD_SENTINEL = 1e30;

struct PollResult {
    enum class Status { Ok, Timeout, TransportFailure };

    Status status = Status::Timeout;
    double value = 0.0;
    QString lastRaw;    // last reply seen, for diagnostics

    bool ok() const { return status == Status::Ok; }
};

// Re-issues a measurement query until it yields a finite number. Overload
// sentinels are numbers and are returned as-is; only unparseable replies
// (measurement not ready yet) are retried. A transport failure ends polling
// at once.
class MeasurementPoller {
public:
    using Fetch = std::function<std::optional<QString>()>;

    explicit MeasurementPoller(Pacer &pacer, double timeoutSeconds = 10.0, double intervalSeconds = 0.25);

    PollResult read(const QString &label, const Fetch &fetch) const;

    double timeout() const { return timeoutSeconds; }

private:
    Pacer &pacer;
    double timeoutSeconds;
    double intervalSeconds;
};
