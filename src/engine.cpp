/**
 * @file engine.cpp
 * @brief Sync orchestration: run state machine and run registry
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/engine.hpp>
#include <drivesync/filter.hpp>
#include <drivesync/subprocess.hpp>
#include <drivesync/error.hpp>
#include <drivesync/debug.hpp>
#include <drivesync/util.hpp>

#include <cor/util.hpp>

#include <QThread>
#include <QMutexLocker>
#include <QWaitCondition>
#include <QDir>

#include <array>
#include <functional>

namespace drivesync { namespace engine {

using debug::Level;

template <typename ... Args>
void trace(Level l, Args &&...args)
{
    debug::print_ge(l, "Sync.engine:", std::forward<Args>(args)...);
}

namespace {

const std::array<char const *, RunStatesEnd> state_names = {{
        "Idle", "Estimating", "AwaitingConfirmation", "DryRunning"
        , "Transferring", "Paused", "Completed", "Failed", "Cancelled"
    }};

QString pairKey(QString const &remoteName, QString const &localRoot)
{
    return QStringList({remoteName, QDir::cleanPath(localRoot)}).join("\n");
}

QString policyKey(SyncSettings const &settings, SyncPolicy const &policy)
{
    return QStringList({pairKey(settings.remoteName, settings.localRoot)
                , policy.key()}).join("\n");
}

void validate(SyncSettings const &settings)
{
    auto invalid = [&settings](char const *msg) {
        error::raise({{"reason", "InvalidSettings"}, {"msg", msg}
                , {"remote", settings.remoteName}
                , {"local", settings.localRoot}});
    };
    if (settings.remoteName.trimmed().isEmpty())
        invalid("Remote name is empty");
    if (settings.localRoot.isEmpty() || !QDir::isAbsolutePath(settings.localRoot))
        invalid("Local folder should be an absolute path");
    if (settings.largeSyncThresholdBytes <= 0)
        invalid("Large sync threshold should be positive");
    if (settings.bandwidthLimitKbps < 0)
        invalid("Bandwidth limit can't be negative");
}

QString failureReason(subprocess::ExitStatus const &status, QString const &errors)
{
    auto res = status.signalled
        ? QString("terminated by signal")
        : QString("exit code %1").arg(status.code);
    return errors.isEmpty() ? res : res + ": " + errors;
}

}

QString stateName(RunState s)
{
    return state_names.at(static_cast<size_t>(s));
}

bool isTerminal(RunState s)
{
    return s == Completed || s == Failed || s == Cancelled;
}

QDebug operator << (QDebug d, RunState s)
{
    d << stateName(s);
    return d;
}

QDebug operator << (QDebug d, RunHandle const &h)
{
    QDebugStateSaver saver(d);
    d.nospace() << "Run#" << h.id;
    return d;
}

/**
 * State machine of one sync run. execute() is running in the run
 * thread, all other methods are called by the engine from any thread.
 */
class Run
{
public:
    typedef std::function<void (Run const &)> on_finished_type;

    Run(SyncRun const &, filter::FilterArgs const &
        , inventory::Inventory const &, on_finished_type);
    ~Run();

    void start();
    void join();

    void pause();
    void resume();
    void cancel();
    void confirm(bool);

    RunState state() const;
    QList<RunState> history() const;
    SyncRun snapshot() const;
    bool isFinished() const;
    bool isConsumed() const;

    bool next(int &pos, ProgressEvent &);

private:
    enum class Decision { None, Proceed, Reject };

    class Thread : public QThread
    {
    public:
        Thread(Run &run) : run_(run) {}
    protected:
        virtual void run()
        {
            run_.execute();
        }
    private:
        Run &run_;
    };

    void execute();
    void estimate();
    bool askConfirmation();
    subprocess::ExitStatus transfer(bool is_dry_run);
    void onLine(progress::Parser &, QString const &, bool is_dry_run);

    void setState(RunState);
    void publish(ProgressEvent const &);
    bool changeState(RunState);
    void append(ProgressEvent const &);
    bool setActive(subprocess::HandlePtr const &);
    bool isCancelled() const;
    void finish(RunState, ProgressEvent);

    mutable QMutex mutex_;
    QWaitCondition cond_;
    SyncRun data_;
    QList<RunState> history_;
    QList<ProgressEvent> events_;
    filter::FilterArgs filters_;
    inventory::Inventory inventory_;
    on_finished_type on_finished_;
    subprocess::HandlePtr active_;
    Decision decision_;
    bool is_cancelled_;
    bool is_finished_;
    bool is_consumed_;
    std::unique_ptr<Thread> thread_;
};

Run::Run(SyncRun const &data, filter::FilterArgs const &filters
         , inventory::Inventory const &inventory, on_finished_type on_finished)
    : data_(data)
    , history_({data.state})
    , filters_(filters)
    , inventory_(inventory)
    , on_finished_(on_finished)
    , decision_(Decision::None)
    , is_cancelled_(false)
    , is_finished_(false)
    , is_consumed_(false)
{}

Run::~Run()
{
    join();
}

void Run::start()
{
    thread_ = cor::make_unique<Thread>(*this);
    thread_->start();
}

void Run::join()
{
    if (thread_ && thread_.get() != QThread::currentThread())
        thread_->wait();
}

RunState Run::state() const
{
    QMutexLocker l(&mutex_);
    return data_.state;
}

QList<RunState> Run::history() const
{
    QMutexLocker l(&mutex_);
    return history_;
}

SyncRun Run::snapshot() const
{
    QMutexLocker l(&mutex_);
    return data_;
}

bool Run::isFinished() const
{
    QMutexLocker l(&mutex_);
    return is_finished_;
}

bool Run::isConsumed() const
{
    QMutexLocker l(&mutex_);
    return is_consumed_;
}

bool Run::isCancelled() const
{
    QMutexLocker l(&mutex_);
    return is_cancelled_;
}

void Run::setState(RunState state)
{
    QMutexLocker l(&mutex_);
    changeState(state);
}

void Run::publish(ProgressEvent const &event)
{
    QMutexLocker l(&mutex_);
    append(event);
}

// expects mutex_ to be locked
bool Run::changeState(RunState state)
{
    if (data_.state == state)
        return true;
    if (isTerminal(data_.state)) {
        trace(Level::Debug, data_.id, "is", data_.state, ", ignoring", state);
        return false;
    }
    trace(Level::Info, data_.id, data_.state, "->", state);
    data_.state = state;
    history_.push_back(state);
    return true;
}

// expects mutex_ to be locked
void Run::append(ProgressEvent const &event)
{
    if (!events_.isEmpty() && events_.back().isTerminal()) {
        trace(Level::Debug, data_.id, "Dropping event after the end", event);
        return;
    }
    if (event.type == ProgressEvent::Progress && !event.simulated) {
        data_.bytesTransferred = event.bytesDone;
        data_.filesTransferred = event.filesDone;
    } else if (event.type == ProgressEvent::Warning) {
        data_.errors.push_back(FileError{event.path, event.message});
    }
    trace(Level::Debug, data_.id, event);
    events_.push_back(event);
    cond_.wakeAll();
}

bool Run::setActive(subprocess::HandlePtr const &handle)
{
    QMutexLocker l(&mutex_);
    active_ = handle;
    if (handle && is_cancelled_) {
        // cancel() missed this process, it will not be started
        handle->cancel();
        return false;
    }
    return true;
}

bool Run::next(int &pos, ProgressEvent &event)
{
    QMutexLocker l(&mutex_);
    while (pos >= events_.size() && !is_finished_)
        cond_.wait(&mutex_);
    if (pos >= events_.size())
        return false;
    event = events_.at(pos++);
    if (event.isTerminal())
        is_consumed_ = true;
    return true;
}

void Run::pause()
{
    subprocess::HandlePtr handle;
    {
        QMutexLocker l(&mutex_);
        if (data_.state == Paused)
            return;
        if (data_.state != Transferring || !active_ || is_cancelled_)
            error::raise({{"reason", "InvalidState"}
                    , {"msg", "Only transferring run can be paused"}
                    , {"state", stateName(data_.state)}});
        handle = active_;
    }
    handle->pause();

    QMutexLocker l(&mutex_);
    // run can be cancelled or finished while the process is stopped
    if (data_.state != Transferring || is_cancelled_ || is_finished_)
        return;
    changeState(Paused);
    append(ProgressEvent(ProgressEvent::Paused));
}

void Run::resume()
{
    subprocess::HandlePtr handle;
    {
        QMutexLocker l(&mutex_);
        if (data_.state == Transferring)
            return;
        if (data_.state != Paused)
            error::raise({{"reason", "InvalidState"}
                    , {"msg", "Only paused run can be resumed"}
                    , {"state", stateName(data_.state)}});
        handle = active_;
    }
    if (handle)
        handle->resume();

    QMutexLocker l(&mutex_);
    if (data_.state != Paused || is_cancelled_ || is_finished_)
        return;
    changeState(Transferring);
    append(ProgressEvent(ProgressEvent::Resumed));
}

void Run::cancel()
{
    subprocess::HandlePtr handle;
    {
        QMutexLocker l(&mutex_);
        if (is_cancelled_ || is_finished_ || isTerminal(data_.state))
            return;
        trace(Level::Info, "Cancel", data_.id);
        is_cancelled_ = true;
        handle = active_;
        cond_.wakeAll();
    }
    // blocks until the run thread reaps the process
    if (handle)
        handle->cancel();
}

void Run::confirm(bool proceed)
{
    QMutexLocker l(&mutex_);
    if (data_.state != AwaitingConfirmation || decision_ != Decision::None)
        error::raise({{"reason", "InvalidState"}
                , {"msg", "Run is not waiting for confirmation"}
                , {"state", stateName(data_.state)}});
    trace(Level::Info, data_.id, "Confirmed:", proceed);
    decision_ = proceed ? Decision::Proceed : Decision::Reject;
    cond_.wakeAll();
}

void Run::finish(RunState state, ProgressEvent event)
{
    {
        QMutexLocker l(&mutex_);
        data_.endedAt = QDateTime::currentDateTimeUtc();
        active_.reset();
        event.bytesDone = data_.bytesTransferred;
        event.filesDone = data_.filesTransferred;
        event.bytesTotal = data_.estimate.totalBytes;
        event.filesTotal = data_.estimate.totalFiles;
        if (state == Completed)
            data_.summary = event.message;
    }
    setState(state);
    // the registry is updated before the terminal event is visible
    if (on_finished_)
        on_finished_(*this);
    publish(event);

    QMutexLocker l(&mutex_);
    is_finished_ = true;
    cond_.wakeAll();
}

void Run::estimate()
{
    setState(Estimating);
    subprocess::Process ps(inventory_.settings().cancelGraceMs
                           , inventory_.settings().suspend);
    if (!setActive(ps.handle()))
        return;

    try {
        auto res = inventory_.estimateSize(data_.settings.remoteName, filters_, ps);
        {
            QMutexLocker l(&mutex_);
            data_.estimate = res;
        }
        publish(ProgressEvent::estimated
                (ProgressEvent::Estimated, res.totalBytes, res.totalFiles));
    } catch (error::Error const &e) {
        if (isCancelled())
            return;
        trace(Level::Warning, data_.id, "Estimation failed", e.m);
        publish(ProgressEvent::warning
                (QString(), QString("Size estimation failed: %1")
                 .arg(error::message(e))));
    }
    setActive(subprocess::HandlePtr());
}

bool Run::askConfirmation()
{
    SizeEstimate estimate;
    qint64 threshold;
    {
        QMutexLocker l(&mutex_);
        estimate = data_.estimate;
        threshold = data_.settings.largeSyncThresholdBytes;
    }
    if (estimate.totalBytes <= threshold)
        return true;

    setState(AwaitingConfirmation);
    publish(ProgressEvent::estimated
            (ProgressEvent::ConfirmationRequired
             , estimate.totalBytes, estimate.totalFiles));

    QMutexLocker l(&mutex_);
    while (decision_ == Decision::None && !is_cancelled_)
        cond_.wait(&mutex_);
    return !is_cancelled_ && decision_ == Decision::Proceed;
}

void Run::onLine(progress::Parser &parser, QString const &line, bool is_dry_run)
{
    ProgressEvent event;
    if (!parser.parse(line, event))
        return;

    switch (event.type) {
    case ProgressEvent::Completed: {
        QMutexLocker l(&mutex_);
        data_.summary = event.message;
        break;
    }
    case ProgressEvent::Progress: {
        event.simulated = is_dry_run;
        QMutexLocker l(&mutex_);
        if (!event.bytesTotal)
            event.bytesTotal = data_.estimate.totalBytes;
        if (!event.filesTotal)
            event.filesTotal = data_.estimate.totalFiles;
        l.unlock();
        publish(event);
        break;
    }
    default:
        publish(event);
        break;
    }
}

subprocess::ExitStatus Run::transfer(bool is_dry_run)
{
    auto const &tool_settings = inventory_.settings();
    SyncSettings settings;
    {
        QMutexLocker l(&mutex_);
        settings = data_.settings;
        data_.summary.clear();
    }
    auto args = tool::transfer(settings, filters_, is_dry_run
                               , tool_settings.statsIntervalSec);

    subprocess::Process ps(tool_settings.cancelGraceMs, tool_settings.suspend);
    if (!setActive(ps.handle()))
        return subprocess::ExitStatus();

    ps.start(tool_settings.program, args, tool_settings.env);
    progress::Parser parser;
    subprocess::Process::Line line;
    while (ps.readLine(line))
        onLine(parser, line.text, is_dry_run);

    auto status = ps.handle()->status();
    setActive(subprocess::HandlePtr());
    if (!status.ok() && !isCancelled())
        trace(Level::Warning, data_.id, is_dry_run ? "Dry run" : "Transfer"
              , "failed", status.code, ps.program(), ps.arguments()
              , ps.stderrTail());

    if (!status.ok()) {
        QMutexLocker l(&mutex_);
        data_.summary = failureReason(status, ps.stderrTail());
    }
    return status;
}

void Run::execute()
{
    auto cancelled = [this]() {
        finish(Cancelled, ProgressEvent(ProgressEvent::Cancelled));
    };
    try {
        publish(ProgressEvent(ProgressEvent::Started));
        estimate();
        if (isCancelled())
            return cancelled();

        if (!askConfirmation())
            return cancelled();

        bool is_dry_run;
        {
            QMutexLocker l(&mutex_);
            is_dry_run = data_.isDryRun;
        }
        if (is_dry_run) {
            setState(DryRunning);
            auto status = transfer(true);
            if (isCancelled())
                return cancelled();
            if (!status.ok())
                return finish(Failed, ProgressEvent::failed
                              ("Dry run failed, " + snapshot().summary));
        }

        setState(Transferring);
        auto status = transfer(false);
        if (isCancelled())
            return cancelled();
        auto summary = snapshot().summary;
        if (!status.ok())
            return finish(Failed, ProgressEvent::failed(summary));

        if (summary.isEmpty()) {
            auto data = snapshot();
            summary = QString("%1 files, %2 bytes transferred")
                .arg(data.filesTransferred).arg(data.bytesTransferred);
        }
        finish(Completed, ProgressEvent::completed(summary));
    } catch (error::Error const &e) {
        trace(Level::Error, data_.id, "Run failed", e.m);
        if (isCancelled())
            return cancelled();
        auto reason = error::message(e);
        finish(Failed, ProgressEvent::failed
               (reason.isEmpty() ? QString("Sync failed") : reason));
    } catch (std::exception const &e) {
        trace(Level::Error, data_.id, "Run failed", e.what());
        finish(Failed, ProgressEvent::failed(e.what()));
    }
}

bool EventStream::next(ProgressEvent &event)
{
    if (!run_)
        return false;
    return run_->next(pos_, event);
}

Engine::Engine(tool::Settings const &settings)
    : settings_(settings)
    , inventory_(settings)
    , last_id_(0)
{}

Engine::~Engine()
{
    QList<std::shared_ptr<Run> > runs;
    {
        QMutexLocker l(&mutex_);
        runs = runs_.values();
    }
    for (auto const &run : runs)
        run->cancel();
    for (auto const &run : runs)
        run->join();
}

RunHandle Engine::requestSync(SyncPolicy const &policy, SyncSettings const &settings)
{
    validate(settings);
    auto filters = filter::build(policy);

    purge();
    std::shared_ptr<Run> run;
    {
        QMutexLocker l(&mutex_);
        auto pair = pairKey(settings.remoteName, settings.localRoot);
        if (active_.contains(pair))
            error::raise({{"reason", "SyncAlreadyInProgress"}
                    , {"msg", "Sync for this folder pair is already running"}
                    , {"remote", settings.remoteName}
                    , {"local", settings.localRoot}
                    , {"run", active_[pair]}});

        SyncRun data;
        data.id = RunHandle(++last_id_);
        data.policy = policy;
        data.settings = settings;
        data.isDryRun = settings.dryRunBeforeFirstSync
            && !transferred_.contains(policyKey(settings, policy));
        data.startedAt = QDateTime::currentDateTimeUtc();

        trace(Level::Info, "Request", data.id, policy, settings
              , "dry run:", data.isDryRun);
        run = std::make_shared<Run>
            (data, filters, inventory_
             , [this](Run const &r) { finished(r); });
        runs_.insert(data.id.id, run);
        active_.insert(pair, data.id.id);
    }
    run->start();
    return run->snapshot().id;
}

void Engine::finished(Run const &run)
{
    auto data = run.snapshot();
    QMutexLocker l(&mutex_);
    auto pair = pairKey(data.settings.remoteName, data.settings.localRoot);
    if (active_.value(pair) == data.id.id)
        active_.remove(pair);
    if (data.state == Completed) {
        transferred_.insert(policyKey(data.settings, data.policy));
        last_sync_[pair] = data.endedAt;
    }
}

void Engine::purge()
{
    QList<std::shared_ptr<Run> > disposed;
    {
        QMutexLocker l(&mutex_);
        for (auto it = runs_.begin(); it != runs_.end();) {
            auto const &run = it.value();
            if (run->isFinished() && run->isConsumed()) {
                disposed.push_back(run);
                it = runs_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto const &run : disposed)
        run->join();
}

std::shared_ptr<Run> Engine::find(RunHandle h, bool must_exist) const
{
    QMutexLocker l(&mutex_);
    auto res = runs_.value(h.id);
    if (!res && must_exist)
        error::raise({{"reason", "UnknownRun"}, {"msg", "Unknown run"}
                , {"run", h.id}});
    return res;
}

EventStream Engine::subscribe(RunHandle h)
{
    return EventStream(find(h, true));
}

void Engine::pause(RunHandle h)
{
    find(h, true)->pause();
}

void Engine::resume(RunHandle h)
{
    find(h, true)->resume();
}

void Engine::cancel(RunHandle h)
{
    auto run = find(h, false);
    if (run)
        run->cancel();
}

void Engine::confirm(RunHandle h, bool proceed)
{
    find(h, true)->confirm(proceed);
}

RunState Engine::state(RunHandle h) const
{
    return find(h, true)->state();
}

QList<RunState> Engine::history(RunHandle h) const
{
    return find(h, true)->history();
}

SyncRun Engine::snapshot(RunHandle h) const
{
    return find(h, true)->snapshot();
}

bool Engine::isActive(QString const &remoteName, QString const &localRoot) const
{
    QMutexLocker l(&mutex_);
    return active_.contains(pairKey(remoteName, localRoot));
}

QDateTime Engine::lastSyncTime(QString const &remoteName, QString const &localRoot) const
{
    QMutexLocker l(&mutex_);
    return last_sync_.value(pairKey(remoteName, localRoot));
}

}}
