#include <drivesync/subprocess.hpp>
#include <drivesync/error.hpp>

#include "tests_common.hpp"
#include <tut/tut.hpp>

#include <QThread>
#include <QElapsedTimer>

#include <functional>

#include <signal.h>
#include <pthread.h>

namespace error = drivesync::error;
namespace subprocess = drivesync::subprocess;
using subprocess::Process;

namespace tut
{

struct subprocess_test
{
    virtual ~subprocess_test()
    {
    }
};

typedef test_group<subprocess_test> tf;
typedef tf::object object;
tf drivesync_subprocess_test("subprocess");

enum test_ids {
    tid_lines =  1,
    tid_exit_code,
    tid_spawn_failed,
    tid_cancel,
    tid_cancel_idle,
    tid_pause_resume,
    tid_pause_unsupported,
    tid_timeout,
    tid_check_output,
    tid_wait_other_thread,
    tid_signal_mask
};

namespace {

/// Runs the function in a separate thread
class Async : public QThread
{
public:
    Async(std::function<void ()> fn) : fn_(fn) {}
protected:
    virtual void run()
    {
        fn_();
    }
private:
    std::function<void ()> fn_;
};

QString reasonOf(std::function<void ()> fn)
{
    try {
        fn();
    } catch (error::Error const &e) {
        return error::reason(e);
    }
    return QString();
}

}

template<> template<>
void object::test<tid_lines>()
{
    Process ps;
    ps.start("/bin/sh", {"-c", "echo out1; echo err1 >&2; echo out2"});
    QStringList out, err;
    Process::Line line;
    while (ps.readLine(line))
        (line.channel == Process::Channel::Out ? out : err).push_back(line.text);
    ensure_equals("Stdout", out, QStringList({"out1", "out2"}));
    ensure_equals("Stderr", err, QStringList({"err1"}));
    ensure("Exited ok", ps.handle()->status().ok());
    ensure("Not running", !ps.handle()->isRunning());
    ensure("Nothing more", !ps.readLine(line));
}

template<> template<>
void object::test<tid_exit_code>()
{
    Process ps;
    ps.start("/bin/sh", {"-c", "echo oops >&2; exit 3"});
    auto status = ps.wait();
    ensure_equals("Exit code", status.code, 3);
    ensure("Not signalled", !status.signalled);
    ensure("Not ok", !status.ok());
    ensure_equals("Stderr tail", ps.stderrTail(), QString("oops"));
}

template<> template<>
void object::test<tid_spawn_failed>()
{
    Process ps;
    ensure_equals("Missing program", reasonOf([&ps]() {
                ps.start("/nonexistent/drivesync-tool", {});
            }), QString("SpawnFailed"));
    Process::Line line;
    ensure("No output", !ps.readLine(line));
}

template<> template<>
void object::test<tid_cancel>()
{
    Process ps(1000);
    auto handle = ps.start("/bin/sh", {"-c", "echo started; sleep 30"});
    Process::Line line;
    ensure("First line", ps.readLine(line));

    QElapsedTimer timer;
    timer.start();
    Async canceller([handle]() { handle->cancel(); });
    canceller.start();
    while (ps.readLine(line)) {}
    canceller.wait();

    ensure("Cancelled", handle->isCancelled());
    ensure("Not running", !handle->isRunning());
    ensure("Not ok", !handle->status().ok());
    ensure("Finished before sleep ends", timer.elapsed() < 20000);

    // second cancel on an exited process does nothing
    handle->cancel();
}

template<> template<>
void object::test<tid_cancel_idle>()
{
    Process ps;
    auto handle = ps.handle();
    handle->cancel();
    ensure("Marked cancelled", handle->isCancelled());
    ensure_equals("Can't start cancelled", reasonOf([&ps]() {
                ps.start("/bin/sh", {"-c", "exit 0"});
            }), QString("Cancelled"));
}

template<> template<>
void object::test<tid_pause_resume>()
{
    Process ps;
    auto handle = ps.start("/bin/sh", {"-c", "echo a; sleep 0.5; echo b"});
    Process::Line line;
    ensure("First line", ps.readLine(line));
    handle->pause();
    ensure("Suspended", handle->isSuspended());
    QThread::msleep(700);
    ensure("Still running while suspended", handle->isRunning());
    handle->resume();
    ensure("Resumed", !handle->isSuspended());
    ensure("Second line", ps.readLine(line));
    ensure_equals("Second line text", line.text, QString("b"));
    ensure("Exit ok", ps.wait().ok());
}

template<> template<>
void object::test<tid_pause_unsupported>()
{
    Process ps(5000, false);
    auto handle = ps.start("/bin/sh", {"-c", "sleep 5"});
    ensure_equals("Suspension disabled", reasonOf([handle]() {
                handle->pause();
            }), QString("PauseUnsupported"));
    ensure("Not suspended", !handle->isSuspended());
    ps.cancel();
    ensure("Not running", !handle->isRunning());
}

template<> template<>
void object::test<tid_timeout>()
{
    Process ps(1000);
    ps.setTimeout(300);
    ps.start("/bin/sh", {"-c", "sleep 10"});
    ensure_equals("Timeout", reasonOf([&ps]() { ps.wait(); }), QString("Timeout"));
    ensure("Not running", !ps.handle()->isRunning());
}

template<> template<>
void object::test<tid_check_output>()
{
    auto out = subprocess::check_output("/bin/sh", {"-c", "echo hello"});
    ensure_equals("Output", str(out), QString("hello"));

    try {
        subprocess::check_output("/bin/sh", {"-c", "echo bad >&2; exit 2"});
        fail("check_output should raise");
    } catch (error::Error const &e) {
        ensure_equals("Reason", error::reason(e), QString("Process"));
        ensure_equals("Exit code", e.m["rc"].toInt(), 2);
        ensure_equals("Stderr", e.m["stderr"].toString(), QString("bad"));
    }
}

template<> template<>
void object::test<tid_wait_other_thread>()
{
    Process ps;
    auto handle = ps.start("/bin/sh", {"-c", "echo a; sleep 0.3; echo b; exit 4"});
    subprocess::ExitStatus waited;
    Async waiter([handle, &waited]() { waited = handle->wait(); });
    waiter.start();

    QStringList lines;
    Process::Line line;
    while (ps.readLine(line))
        lines.push_back(line.text);
    ensure("Waiter is released", waiter.wait(10000));
    ensure_equals("All lines are read", lines, QStringList({"a", "b"}));
    ensure_equals("Exit code from the other thread", waited.code, 4);
    ensure_equals("Same status", handle->status().code, 4);
    ensure_equals("Owner thread can't wait", reasonOf([handle]() {
                handle->wait();
            }), QString("Logic"));
}

template<> template<>
void object::test<tid_signal_mask>()
{
    QString blocked;
    Async spawner([&blocked]() {
            sigset_t signals;
            sigemptyset(&signals);
            sigaddset(&signals, SIGTERM);
            sigaddset(&signals, SIGINT);
            pthread_sigmask(SIG_BLOCK, &signals, nullptr);
            try {
                auto out = subprocess::check_output
                    ("/bin/sh", {"-c", "grep SigBlk /proc/self/status"});
                blocked = str(out).section(':', 1).trimmed();
            } catch (error::Error const &e) {
                blocked = error::message(e);
            }
        });
    spawner.start();
    spawner.wait();
    ensure_equals("Tool gets no blocked signals", blocked
                  , QString("0000000000000000"));
}

}
