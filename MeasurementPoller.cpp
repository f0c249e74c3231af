#include "MeasurementPoller.h"
#include "InstrumentError.h"
#include "Pacer.h"
#include <QDebug>
#include <cmath>

MeasurementPoller::MeasurementPoller(Pacer &pacer, double timeoutSeconds, double intervalSeconds)
    : pacer(pacer), timeoutSeconds(timeoutSeconds), intervalSeconds(intervalSeconds) {}

PollResult MeasurementPoller::read(const QString &label, const Fetch &fetch) const {
    PollResult result;
    result.lastRaw = "N/A";
    const double start = pacer.elapsed();
    int attempts = 0;

    while (pacer.elapsed() - start < timeoutSeconds) {
        ++attempts;
        std::optional<QString> reply;
        try {
            reply = fetch();
        } catch (const TransportError &e) {
            qWarning() << "[MeasurementPoller] Transport failure reading" << label << ":" << e.what();
            result.status = PollResult::Status::TransportFailure;
            return result;
        }

        if (reply) {
            result.lastRaw = *reply;
            bool ok = false;
            const double v = reply->trimmed().toDouble(&ok);
            if (ok && std::isfinite(v)) {
                if (attempts > 1)
                    qDebug() << "[MeasurementPoller]" << label << "ready after" << attempts << "attempts";
                result.status = PollResult::Status::Ok;
                result.value = v;
                return result;
            }
        }
        pacer.sleep(intervalSeconds);
    }

    qWarning() << "[MeasurementPoller] Timeout reading" << label << "- last value:" << result.lastRaw;
    result.status = PollResult::Status::Timeout;
    return result;
}
