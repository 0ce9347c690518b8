#ifndef _DRIVESYNC_SCHEDULER_HPP_
#define _DRIVESYNC_SCHEDULER_HPP_
/**
 * @file scheduler.hpp
 * @brief Periodic sync requests
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/engine.hpp>

#include <QMutex>
#include <QWaitCondition>

#include <functional>
#include <memory>

namespace drivesync { namespace engine {

/**
 * Requests sync for the same pair once per interval, the first request
 * is made right after start. A tick is skipped if the previous run for
 * the pair is still active. Events of the started runs should be
 * consumed by on_started callback to let the engine dispose them.
 * start() and stop() are called by the owner thread.
 */
class Scheduler
{
public:
    typedef std::function<void (RunHandle)> on_started_type;

    Scheduler(Engine &, SyncPolicy const &, SyncSettings const &
              , int intervalMs, on_started_type on_started = on_started_type());
    ~Scheduler();

    Scheduler(Scheduler const &) = delete;
    Scheduler & operator = (Scheduler const &) = delete;

    /// Returns false if already running
    bool start();
    /// Waits for the scheduler thread, runs started by it are not touched
    void stop();
    bool isRunning() const;

    int started() const;
    int skipped() const;
    int failed() const;
    RunHandle lastRun() const;

private:
    class Thread;

    void loop();
    void tick();

    Engine &engine_;
    SyncPolicy policy_;
    SyncSettings settings_;
    int interval_ms_;
    on_started_type on_started_;

    mutable QMutex mutex_;
    QWaitCondition cond_;
    bool is_stopped_;
    int started_;
    int skipped_;
    int failed_;
    RunHandle last_run_;
    std::unique_ptr<Thread> thread_;
};

}}

#endif // _DRIVESYNC_SCHEDULER_HPP_
