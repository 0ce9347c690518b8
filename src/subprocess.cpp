/**
 * @file subprocess.cpp
 * @brief Supervised subprocess with streamed output
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/subprocess.hpp>
#include <drivesync/error.hpp>
#include <drivesync/debug.hpp>
#include <drivesync/util.hpp>

#include <cor/util.hpp>

#include <QProcessEnvironment>
#include <QThread>
#include <QMutexLocker>

#ifdef Q_OS_UNIX
#include <signal.h>
#include <unistd.h>
#include <sys/types.h>
#endif

namespace drivesync { namespace subprocess {

using debug::Level;

template <typename ... Args>
void trace(Level l, Args &&...args)
{
    debug::print_ge(l, "Sync.process:", std::forward<Args>(args)...);
}

namespace {

const int poll_interval_ms = 100;
const int stderr_keep_lines = 50;

/// Child is moved to its own process group to be able to control
/// the whole tree spawned by the tool. Signals blocked by the parent
/// (e.g. to be handled by sigwait) are unblocked for the tool.
class ChildProcess : public QProcess
{
protected:
    virtual void setupChildProcess()
    {
#ifdef Q_OS_UNIX
        ::setpgid(0, 0);
        sigset_t empty;
        ::sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);
#endif
    }
};

QString chopLineEnd(QByteArray const &data)
{
    auto res = QString::fromUtf8(data);
    while (res.endsWith('\n') || res.endsWith('\r'))
        res.chop(1);
    return res;
}

}

Handle::Handle(int graceMs, bool suspend)
    : grace_ms_(graceMs)
    , suspend_(suspend)
    , pid_(0)
    , owner_(nullptr)
    , is_exited_(false)
    , is_suspended_(false)
    , is_cancelled_(false)
{}

void Handle::started(qint64 pid, QThread *owner)
{
    QMutexLocker l(&mutex_);
    pid_ = pid;
    owner_ = owner;
}

void Handle::finished(ExitStatus const &status)
{
    QMutexLocker l(&mutex_);
    if (is_exited_)
        return;
    status_ = status;
    is_exited_ = true;
    is_suspended_ = false;
    exited_cond_.wakeAll();
}

bool Handle::isOwnerThread() const
{
    return owner_ && owner_ == QThread::currentThread();
}

bool Handle::signal(int sig)
{
#ifdef Q_OS_UNIX
    if (!pid_ || is_exited_)
        return false;
    if (::kill(-static_cast<pid_t>(pid_), sig) == 0)
        return true;
    // setpgid in the child can fail, fall back to the child itself
    return ::kill(static_cast<pid_t>(pid_), sig) == 0;
#else
    Q_UNUSED(sig);
    return false;
#endif
}

void Handle::pause()
{
    QMutexLocker l(&mutex_);
#ifdef Q_OS_UNIX
    if (!suspend_)
        error::raise({{"reason", "PauseUnsupported"}
                , {"msg", "Process suspension is disabled"}});
    if (!pid_ || is_exited_ || is_cancelled_)
        error::raise({{"reason", "InvalidState"}
                , {"msg", "Process is not running"}});
    if (is_suspended_)
        return;
    trace(Level::Info, "Suspend", pid_);
    if (!signal(SIGSTOP))
        error::raise({{"reason", "PauseUnsupported"}
                , {"msg", "Can't suspend process"}, {"pid", pid_}});
    is_suspended_ = true;
#else
    error::raise({{"reason", "PauseUnsupported"}
            , {"msg", "Process suspension is not supported"}});
#endif
}

void Handle::resume()
{
    QMutexLocker l(&mutex_);
#ifdef Q_OS_UNIX
    if (!is_suspended_)
        return;
    trace(Level::Info, "Resume", pid_);
    signal(SIGCONT);
    is_suspended_ = false;
#endif
}

void Handle::cancel()
{
    QMutexLocker l(&mutex_);
    is_cancelled_ = true;
    if (!pid_ || is_exited_)
        return;

    trace(Level::Info, "Terminate", pid_);
#ifdef Q_OS_UNIX
    signal(SIGTERM);
    if (is_suspended_) {
        signal(SIGCONT);
        is_suspended_ = false;
    }
#endif
    if (isOwnerThread())
        return;

    QElapsedTimer timer;
    timer.start();
    while (!is_exited_) {
        auto left = grace_ms_ - timer.elapsed();
        if (left <= 0)
            break;
        exited_cond_.wait(&mutex_, static_cast<unsigned long>(left));
    }
    if (is_exited_)
        return;

    trace(Level::Warning, "Process is not finished in", grace_ms_
          , "ms, killing", pid_);
#ifdef Q_OS_UNIX
    signal(SIGKILL);
#endif
    while (!is_exited_)
        exited_cond_.wait(&mutex_);
}

ExitStatus Handle::wait()
{
    QMutexLocker l(&mutex_);
    if (isOwnerThread())
        error::raise({{"reason", "Logic"}
                , {"msg", "Handle::wait() is called from the reader thread"}});
    while (!is_exited_)
        exited_cond_.wait(&mutex_);
    return status_;
}

ExitStatus Handle::status() const
{
    QMutexLocker l(&mutex_);
    return status_;
}

bool Handle::isRunning() const
{
    QMutexLocker l(&mutex_);
    return pid_ && !is_exited_;
}

bool Handle::isSuspended() const
{
    QMutexLocker l(&mutex_);
    return is_suspended_;
}

bool Handle::isCancelled() const
{
    QMutexLocker l(&mutex_);
    return is_cancelled_;
}

qint64 Handle::pid() const
{
    QMutexLocker l(&mutex_);
    return pid_;
}

Process::Process(int graceMs, bool suspend)
    : handle_(std::make_shared<Handle>(graceMs, suspend))
    , timeout_ms_(-1)
{}

Process::~Process()
{
    if (ps_ && ps_->state() != QProcess::NotRunning) {
        trace(Level::Warning, "Process is still running, killing", program_);
#ifdef Q_OS_UNIX
        {
            QMutexLocker l(&handle_->mutex_);
            handle_->signal(SIGKILL);
        }
#else
        ps_->kill();
#endif
        ps_->waitForFinished(-1);
        finished();
    }
}

HandlePtr Process::start(QString const &program, QStringList const &args
                         , QVariantMap const &env)
{
    if (ps_)
        error::raise({{"reason", "Logic"}
                , {"msg", "Can't start process, it is already started"}
                , {"cmd", program}, {"args", QVariant(args)}});
    if (handle_->isCancelled())
        error::raise({{"reason", "Cancelled"}
                , {"msg", "Process is cancelled before start"}
                , {"cmd", program}});

    program_ = program;
    args_ = args;
    ps_ = cor::make_unique<ChildProcess>();
    ps_->setProcessChannelMode(QProcess::SeparateChannels);
    if (!env.isEmpty()) {
        auto environment = QProcessEnvironment::systemEnvironment();
        for (auto it = env.begin(); it != env.end(); ++it)
            environment.insert(it.key(), str(it.value()));
        ps_->setProcessEnvironment(environment);
    }

    trace(Level::Info, "Start", program, args);
    ps_->start(program, args);
    if (!ps_->waitForStarted(-1)) {
        auto cause = ps_->errorString();
        trace(Level::Error, "Can't start", program, cause);
        handle_->finished(ExitStatus(-1, false));
        error::raise({{"reason", "SpawnFailed"}
                , {"msg", "Can't start process"}, {"cause", cause}
                , {"cmd", program}, {"args", QVariant(args)}});
    }
    // the tool should never wait for interactive input
    ps_->closeWriteChannel();
    timer_.start();
    handle_->started(ps_->processId(), QThread::currentThread());
    if (handle_->isCancelled()) {
        trace(Level::Info, "Cancelled while starting", program);
#ifdef Q_OS_UNIX
        QMutexLocker l(&handle_->mutex_);
        handle_->signal(SIGKILL);
#else
        ps_->kill();
#endif
    }
    return handle_;
}

bool Process::takeLine(QProcess::ProcessChannel ch, Channel channel
                       , Line &line, bool is_rest)
{
    ps_->setReadChannel(ch);
    if (ps_->canReadLine()) {
        line.channel = channel;
        line.text = chopLineEnd(ps_->readLine());
        collect(line);
        return true;
    }
    if (is_rest && ps_->bytesAvailable()) {
        line.channel = channel;
        line.text = chopLineEnd(ps_->readAll());
        collect(line);
        return true;
    }
    return false;
}

void Process::collect(Line const &line)
{
    if (line.channel == Channel::Out) {
        stdout_.push_back(line.text);
    } else {
        stderr_.push_back(line.text);
        if (stderr_.size() > stderr_keep_lines)
            stderr_.removeFirst();
    }
}

void Process::checkTimeout()
{
    if (timeout_ms_ < 0 || timer_.elapsed() < timeout_ms_)
        return;
    trace(Level::Warning, "Timeout", program_, args_);
    cancel();
    error::raise({{"reason", "Timeout"}
            , {"msg", "Process is not finished in time"}
            , {"cmd", program_}, {"timeout", timeout_ms_}});
}

bool Process::readLine(Line &line)
{
    if (!ps_)
        return false;

    for (;;) {
        if (takeLine(QProcess::StandardOutput, Channel::Out, line, false)
            || takeLine(QProcess::StandardError, Channel::Err, line, false))
            return true;

        if (ps_->state() == QProcess::NotRunning) {
            if (takeLine(QProcess::StandardOutput, Channel::Out, line, true)
                || takeLine(QProcess::StandardError, Channel::Err, line, true))
                return true;
            finished();
            return false;
        }
        checkTimeout();
#ifndef Q_OS_UNIX
        if (handle_->isCancelled())
            ps_->kill();
#endif
        ps_->setReadChannel(QProcess::StandardOutput);
        ps_->waitForReadyRead(poll_interval_ms);
    }
}

ExitStatus Process::wait()
{
    if (!ps_)
        return handle_->status();
    Line line;
    while (readLine(line)) {}
    return handle_->status();
}

void Process::cancel()
{
    if (!ps_)
        return;
    handle_->cancel();
    if (!ps_->waitForFinished(handle_->grace_ms_)) {
        trace(Level::Warning, "Process is not finished in time, killing"
              , program_);
#ifdef Q_OS_UNIX
        {
            QMutexLocker l(&handle_->mutex_);
            handle_->signal(SIGKILL);
        }
#else
        ps_->kill();
#endif
        ps_->waitForFinished(-1);
    }
    finished();
}

void Process::finished()
{
    if (ps_->state() != QProcess::NotRunning)
        return;
    auto crashed = (ps_->exitStatus() == QProcess::CrashExit);
    ExitStatus status(crashed ? -1 : ps_->exitCode(), crashed);
    trace(Level::Info, "Process is finished", program_
          , "rc=", status.code, "signalled=", status.signalled);
    handle_->finished(status);
}

QString Process::stderrTail(int count) const
{
    return util::tail(filterEmpty(stderr_), count);
}

QByteArray check_output(QString const &cmd, QStringList const &args
                        , QVariantMap const &env, int timeout)
{
    Process p;
    p.setTimeout(timeout);
    p.start(cmd, args, env);
    auto status = p.wait();
    if (!status.ok())
        error::raise({{"reason", "Process"}, {"msg", "Process error"}
                , {"cmd", cmd}, {"args", QVariant(args)}
                , {"rc", status.code}, {"signalled", status.signalled}
                , {"stderr", p.stderrLines().join("\n")}});
    return p.stdoutLines().join("\n").toUtf8();
}

}}
