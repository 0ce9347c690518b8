#ifndef _DRIVESYNC_ENGINE_HPP_
#define _DRIVESYNC_ENGINE_HPP_
/**
 * @file engine.hpp
 * @brief Sync orchestration: run state machine and run registry
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/policy.hpp>
#include <drivesync/progress.hpp>
#include <drivesync/inventory.hpp>

#include <QMap>
#include <QSet>
#include <QList>
#include <QMutex>
#include <QDateTime>

#include <memory>

namespace drivesync { namespace engine {

/// Run id, 0 is invalid
struct RunHandle
{
    RunHandle() : id(0) {}
    explicit RunHandle(quint64 v) : id(v) {}

    inline bool isValid() const { return id != 0; }

    bool operator == (RunHandle const &that) const { return id == that.id; }
    bool operator != (RunHandle const &that) const { return id != that.id; }
    bool operator < (RunHandle const &that) const { return id < that.id; }

    quint64 id;
};

enum RunState {
    Idle
    , Estimating
    , AwaitingConfirmation
    , DryRunning
    , Transferring
    , Paused
    , Completed
    , Failed
    , Cancelled
    , RunStatesEnd
};

QString stateName(RunState);
bool isTerminal(RunState);

struct FileError
{
    QString path;
    QString message;
};

/// Run record, snapshot() returns a copy of it
struct SyncRun
{
    SyncRun()
        : state(Idle)
        , bytesTransferred(0)
        , filesTransferred(0)
        , isDryRun(false)
    {}

    RunHandle id;
    SyncPolicy policy;
    SyncSettings settings;
    RunState state;
    qint64 bytesTransferred;
    qint64 filesTransferred;
    QList<FileError> errors;
    SizeEstimate estimate;
    /// Dry run is going to be or was executed before the transfer
    bool isDryRun;
    QString summary;
    QDateTime startedAt;
    QDateTime endedAt;
};

class Run;

/**
 * Ordered events of one run starting from the first one. next() blocks
 * until the next event is available and returns false after the
 * terminal event is consumed.
 */
class EventStream
{
public:
    EventStream() : pos_(0) {}
    explicit EventStream(std::shared_ptr<Run> const &run)
        : run_(run), pos_(0)
    {}

    bool next(ProgressEvent &);

private:
    std::shared_ptr<Run> run_;
    int pos_;
};

/**
 * Accepts sync requests and executes each of them in a separate
 * thread. Only one run for the same (remote, local folder) pair can be
 * active. All methods can be called from any thread.
 */
class Engine
{
public:
    Engine(tool::Settings const &settings = tool::Settings());
    ~Engine();

    Engine(Engine const &) = delete;
    Engine & operator = (Engine const &) = delete;

    /**
     * Start sync. Raises InvalidSettings, InvalidPolicy or
     * SyncAlreadyInProgress, all other errors are reported as events.
     */
    RunHandle requestSync(SyncPolicy const &, SyncSettings const &);

    /// Raises UnknownRun if the run is unknown or already disposed
    EventStream subscribe(RunHandle);

    /// Allowed only while transferring, raises PauseUnsupported or InvalidState
    void pause(RunHandle);
    void resume(RunHandle);
    /// Does nothing for unknown and finished runs
    void cancel(RunHandle);
    /// Answer to ConfirmationRequired, raises InvalidState in other states
    void confirm(RunHandle, bool proceed);

    RunState state(RunHandle) const;
    QList<RunState> history(RunHandle) const;
    SyncRun snapshot(RunHandle) const;
    bool isActive(QString const &remoteName, QString const &localRoot) const;
    /// End time of the last completed run for the pair, invalid if none
    QDateTime lastSyncTime(QString const &remoteName, QString const &localRoot) const;

    inventory::Inventory const &inventory() const { return inventory_; }

private:
    std::shared_ptr<Run> find(RunHandle, bool must_exist) const;
    void finished(Run const &);
    void purge();

    tool::Settings settings_;
    inventory::Inventory inventory_;
    mutable QMutex mutex_;
    quint64 last_id_;
    QMap<quint64, std::shared_ptr<Run> > runs_;
    QMap<QString, quint64> active_;
    QSet<QString> transferred_;
    QMap<QString, QDateTime> last_sync_;
};

QDebug operator << (QDebug, RunState);
QDebug operator << (QDebug, RunHandle const &);

}}

#endif // _DRIVESYNC_ENGINE_HPP_
