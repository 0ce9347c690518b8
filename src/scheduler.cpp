/**
 * @file scheduler.cpp
 * @brief Periodic sync requests
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/scheduler.hpp>
#include <drivesync/error.hpp>
#include <drivesync/debug.hpp>

#include <cor/util.hpp>

#include <QThread>
#include <QMutexLocker>
#include <QElapsedTimer>

namespace drivesync { namespace engine {

using debug::Level;

namespace {

template <typename ... Args>
void trace(Level l, Args &&...args)
{
    debug::print_ge(l, "Sync.scheduler:", std::forward<Args>(args)...);
}

}

class Scheduler::Thread : public QThread
{
public:
    Thread(Scheduler &scheduler) : scheduler_(scheduler) {}
protected:
    virtual void run()
    {
        scheduler_.loop();
    }
private:
    Scheduler &scheduler_;
};

Scheduler::Scheduler(Engine &engine, SyncPolicy const &policy
                     , SyncSettings const &settings, int intervalMs
                     , on_started_type on_started)
    : engine_(engine)
    , policy_(policy)
    , settings_(settings)
    , interval_ms_(intervalMs)
    , on_started_(on_started)
    , is_stopped_(true)
    , started_(0)
    , skipped_(0)
    , failed_(0)
{
    if (interval_ms_ <= 0)
        error::raise({{"reason", "InvalidSettings"}
                , {"msg", "Sync interval should be positive"}
                , {"interval", interval_ms_}});
}

Scheduler::~Scheduler()
{
    stop();
}

bool Scheduler::start()
{
    {
        QMutexLocker l(&mutex_);
        if (!is_stopped_) {
            trace(Level::Warning, "Already running");
            return false;
        }
    }
    if (thread_)
        thread_->wait();

    QMutexLocker l(&mutex_);
    trace(Level::Info, "Start, interval", interval_ms_, "ms"
          , settings_.remoteName, "->", settings_.localRoot);
    is_stopped_ = false;
    thread_ = cor::make_unique<Thread>(*this);
    thread_->start();
    return true;
}

void Scheduler::stop()
{
    {
        QMutexLocker l(&mutex_);
        if (is_stopped_)
            return;
        trace(Level::Info, "Stop");
        is_stopped_ = true;
        cond_.wakeAll();
    }
    if (thread_ && thread_.get() != QThread::currentThread())
        thread_->wait();
}

bool Scheduler::isRunning() const
{
    QMutexLocker l(&mutex_);
    return !is_stopped_;
}

int Scheduler::started() const
{
    QMutexLocker l(&mutex_);
    return started_;
}

int Scheduler::skipped() const
{
    QMutexLocker l(&mutex_);
    return skipped_;
}

int Scheduler::failed() const
{
    QMutexLocker l(&mutex_);
    return failed_;
}

RunHandle Scheduler::lastRun() const
{
    QMutexLocker l(&mutex_);
    return last_run_;
}

void Scheduler::tick()
{
    RunHandle h;
    try {
        h = engine_.requestSync(policy_, settings_);
    } catch (error::Error const &e) {
        QMutexLocker l(&mutex_);
        if (error::reason(e) == "SyncAlreadyInProgress") {
            trace(Level::Info, "Previous sync is still running, skipping");
            ++skipped_;
        } else {
            trace(Level::Error, "Can't request sync", e.m);
            ++failed_;
        }
        return;
    }
    {
        QMutexLocker l(&mutex_);
        ++started_;
        last_run_ = h;
    }
    trace(Level::Debug, "Started", h);
    if (on_started_)
        on_started_(h);
}

void Scheduler::loop()
{
    QMutexLocker l(&mutex_);
    while (!is_stopped_) {
        l.unlock();
        tick();
        l.relock();

        QElapsedTimer timer;
        timer.start();
        // wait() can wake up before the timeout
        while (!is_stopped_ && timer.elapsed() < interval_ms_)
            cond_.wait(&mutex_, static_cast<unsigned long>
                       (interval_ms_ - timer.elapsed()));
    }
}

}}
