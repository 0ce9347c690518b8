#ifndef _DRIVESYNC_SUBPROCESS_HPP_
#define _DRIVESYNC_SUBPROCESS_HPP_
/**
 * @file subprocess.hpp
 * @brief Supervised subprocess with streamed output
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <memory>

#include <QProcess>
#include <QVariant>
#include <QStringList>
#include <QMutex>
#include <QWaitCondition>
#include <QElapsedTimer>

class QThread;

namespace drivesync { namespace subprocess {

struct ExitStatus
{
    ExitStatus() : code(-1), signalled(false) {}
    ExitStatus(int c, bool s) : code(c), signalled(s) {}

    inline bool ok() const { return !signalled && code == 0; }

    int code;
    bool signalled;
};

class Process;

/**
 * Thread-safe control side of a running subprocess. Signals are
 * delivered to the whole process group of the child. The handle stays
 * valid after the process is gone, control requests become no-ops.
 */
class Handle
{
public:
    Handle(int graceMs, bool suspend);

    /// Suspend the process group, raises PauseUnsupported if not possible
    void pause();
    void resume();

    /**
     * Terminate the process group, wait for the grace period and kill
     * it. Blocks until the reader side observes the exit, so it must be
     * called from another thread than the one reading the output.
     * Calling it on an exited or never started process does nothing.
     */
    void cancel();

    /// Blocks until the process exits, call it from a non-reader thread
    ExitStatus wait();

    ExitStatus status() const;
    bool isRunning() const;
    bool isSuspended() const;
    bool isCancelled() const;
    qint64 pid() const;

private:
    friend class Process;

    void started(qint64 pid, QThread *owner);
    void finished(ExitStatus const &);
    bool signal(int sig);
    bool isOwnerThread() const;

    mutable QMutex mutex_;
    QWaitCondition exited_cond_;
    int grace_ms_;
    bool suspend_;
    qint64 pid_;
    QThread *owner_;
    bool is_exited_;
    bool is_suspended_;
    bool is_cancelled_;
    ExitStatus status_;
};

typedef std::shared_ptr<Handle> HandlePtr;

/**
 * One external process: start it, read its stdout and stderr line by
 * line. Reading must be done from the thread which started the
 * process. Control operations can be requested from any thread through
 * handle().
 */
class Process
{
public:
    enum class Channel { Out, Err };
    struct Line {
        Channel channel;
        QString text;
    };

    Process(int graceMs = 5000, bool suspend = true);
    ~Process();

    Process(Process const &) = delete;
    Process & operator = (Process const &) = delete;

    /// Overall limit for the process run time, -1 = no limit
    void setTimeout(int ms)
    {
        timeout_ms_ = ms;
    }

    /// Raises SpawnFailed if the program can't be started
    HandlePtr start(QString const &program, QStringList const &args
                    , QVariantMap const &env = QVariantMap());

    /**
     * Blocks until the next output line is available. Returns false
     * when the process has exited and all output is consumed. Raises
     * Timeout (after cancelling the process) if the time limit is hit.
     */
    bool readLine(Line &);

    /// Drain all remaining output and wait for exit
    ExitStatus wait();

    /// Cancel from the reading thread
    void cancel();

    inline HandlePtr handle() const { return handle_; }

    QStringList stdoutLines() const { return stdout_; }
    QStringList stderrLines() const { return stderr_; }
    QString stderrTail(int count = 5) const;

    QString program() const { return program_; }
    QStringList arguments() const { return args_; }

private:
    bool takeLine(QProcess::ProcessChannel, Channel, Line &, bool);
    void collect(Line const &);
    void checkTimeout();
    void finished();

    std::unique_ptr<QProcess> ps_;
    HandlePtr handle_;
    QString program_;
    QStringList args_;
    QStringList stdout_;
    QStringList stderr_;
    QElapsedTimer timer_;
    int timeout_ms_;
};

/**
 * Run the command to the end and return its stdout. Raises Process
 * error with stderr on non-zero exit and SpawnFailed or Timeout on the
 * corresponding failures.
 */
QByteArray check_output(QString const &cmd, QStringList const &args
                        , QVariantMap const &env = QVariantMap()
                        , int timeout = -1);

}}

#endif // _DRIVESYNC_SUBPROCESS_HPP_
