#pragma once

#include "network/sync_engine.hpp"

#include <QObject>
#include <QString>
#include <QTimer>
#include <chrono>

namespace spool::network {

/**
 * Delay before the next attempt after `consecutive_failures` failed
 * cycles: the interval doubled per failure, capped at `max`.
 */
[[nodiscard]] std::chrono::milliseconds next_backoff(std::chrono::milliseconds interval,
                                                     int consecutive_failures,
                                                     std::chrono::milliseconds max);

/**
 * SyncScheduler - Runs sync cycles on a timer.
 *
 * Transport and protocol failures back off exponentially and retry.
 * SyncCursorInvalid and Unauthorized stop the schedule until resume()
 * because retrying cannot fix them.
 */
class SyncScheduler : public QObject {
    Q_OBJECT

public:
    SyncScheduler(SyncEngine& engine,
                  std::chrono::milliseconds interval,
                  std::chrono::milliseconds max_backoff,
                  QObject* parent = nullptr);

    /**
     * Run a cycle right away, then keep going every interval.
     */
    void start();
    void stop();

    /**
     * Clear a halt (after the user re-authenticated or requested a full
     * resync) and start again.
     */
    void resume();

    /**
     * Run one cycle now, outside the timer.
     */
    void syncNow();

    [[nodiscard]] bool isActive() const { return timer_.isActive(); }
    [[nodiscard]] bool isHalted() const { return halted_; }
    [[nodiscard]] int consecutiveFailures() const { return failures_; }
    [[nodiscard]] std::chrono::milliseconds currentDelay() const { return current_delay_; }

signals:
    void cycleFinished(qint64 pushed, qint64 pulled, int recordFailures);
    void cycleFailed(const QString& message, int consecutiveFailures);
    void syncHalted(const QString& message);

private:
    void runCycle();
    void scheduleNext(std::chrono::milliseconds delay);

    SyncEngine& engine_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds max_backoff_;
    std::chrono::milliseconds current_delay_;
    QTimer timer_;
    int failures_ = 0;
    bool halted_ = false;
    bool stopped_ = true;
};

} // namespace spool::network
