#include "network/sync_scheduler.hpp"

#include <QDebug>
#include <QLoggingCategory>
#include <algorithm>

Q_LOGGING_CATEGORY(spoolSchedulerLog, "spool.scheduler")

namespace spool::network {

std::chrono::milliseconds next_backoff(std::chrono::milliseconds interval,
                                       int consecutive_failures,
                                       std::chrono::milliseconds max) {
    if (interval.count() <= 0) {
        interval = std::chrono::milliseconds(1);
    }
    auto delay = interval;
    for (int i = 0; i < consecutive_failures && delay < max; ++i) {
        delay *= 2;
    }
    return std::min(delay, std::max(max, interval));
}

SyncScheduler::SyncScheduler(SyncEngine& engine,
                             std::chrono::milliseconds interval,
                             std::chrono::milliseconds max_backoff,
                             QObject* parent)
    : QObject(parent)
    , engine_(engine)
    , interval_(interval)
    , max_backoff_(max_backoff)
    , current_delay_(interval)
{
    timer_.setSingleShot(true);
    connect(&timer_, &QTimer::timeout, this, &SyncScheduler::runCycle);
}

void SyncScheduler::start() {
    if (halted_) {
        qCDebug(spoolSchedulerLog) << "start ignored, sync is halted";
        return;
    }
    stopped_ = false;
    scheduleNext(std::chrono::milliseconds(0));
}

void SyncScheduler::stop() {
    stopped_ = true;
    timer_.stop();
    engine_.cancel();
}

void SyncScheduler::resume() {
    halted_ = false;
    failures_ = 0;
    start();
}

void SyncScheduler::syncNow() {
    if (halted_) {
        return;
    }
    timer_.stop();
    runCycle();
}

void SyncScheduler::scheduleNext(std::chrono::milliseconds delay) {
    if (stopped_ || halted_) {
        return;
    }
    current_delay_ = delay;
    timer_.start(delay);
}

void SyncScheduler::runCycle() {
    auto result = engine_.run_cycle();

    if (result.is_ok()) {
        failures_ = 0;
        const auto& report = result.unwrap();
        emit cycleFinished(report.pushed, report.pulled,
                           static_cast<int>(report.failures.size()));
        scheduleNext(interval_);
        return;
    }

    const auto& error = result.unwrap_err();
    const auto message = QString::fromStdString(error.describe());

    switch (error.code) {
        case ErrorCode::Busy:
        case ErrorCode::Cancelled:
            qCDebug(spoolSchedulerLog) << "cycle skipped:" << message;
            scheduleNext(interval_);
            return;
        case ErrorCode::SyncCursorInvalid:
        case ErrorCode::Unauthorized:
            halted_ = true;
            timer_.stop();
            qWarning().noquote() << "SYNC: halted:" << message;
            emit syncHalted(message);
            return;
        default:
            break;
    }

    ++failures_;
    const auto delay = next_backoff(interval_, failures_, max_backoff_);
    qCDebug(spoolSchedulerLog) << "cycle failed" << failures_ << "time(s), retrying in"
                               << delay.count() << "ms";
    emit cycleFailed(message, failures_);
    scheduleNext(delay);
}

} // namespace spool::network
