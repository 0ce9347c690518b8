/**
 * @file drivesync-cli.cpp
 * @brief Sync command line tool
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <QThread>
#include <QMutex>
#include <QMutexLocker>
#include <QSemaphore>
#include <QDebug>

#include <drivesync/engine.hpp>
#include <drivesync/scheduler.hpp>
#include <drivesync/config.hpp>
#include <drivesync/filter.hpp>
#include <drivesync/inventory.hpp>
#include <drivesync/error.hpp>
#include <drivesync/debug.hpp>
#include <drivesync/util.hpp>

#include <atomic>
#include <cstdio>
#include <functional>

#include <signal.h>
#include <pthread.h>
#include <time.h>
#include <unistd.h>

namespace debug = drivesync::debug;
namespace error = drivesync::error;
namespace config = drivesync::config;
namespace engine = drivesync::engine;
namespace inventory = drivesync::inventory;
namespace filter = drivesync::filter;
using drivesync::ProgressEvent;

namespace {

sigset_t interruptSignals()
{
    sigset_t res;
    sigemptyset(&res);
    sigaddset(&res, SIGINT);
    sigaddset(&res, SIGTERM);
    return res;
}

/**
 * SIGINT and SIGTERM are blocked in all threads and picked up here.
 * The handler is replaced while a sync is running to cancel it, so its
 * tool (living in its own process group) is not left behind.
 */
class SignalWatcher : public QThread
{
public:
    typedef std::function<void (int)> on_signal_type;

    SignalWatcher()
    {
        auto mask = interruptSignals();
        auto rc = pthread_sigmask(SIG_BLOCK, &mask, nullptr);
        if (rc)
            error::raise({{"msg", "Can't block signals"}, {"rc", rc}});
        start();
    }

    ~SignalWatcher()
    {
        requestInterruption();
        wait();
    }

    /// Empty handler means exit
    void setHandler(on_signal_type handler)
    {
        QMutexLocker l(&mutex_);
        handler_ = handler;
    }

protected:
    virtual void run()
    {
        auto mask = interruptSignals();
        struct timespec timeout = {0, 200 * 1000 * 1000};
        while (!isInterruptionRequested()) {
            auto sig = sigtimedwait(&mask, nullptr, &timeout);
            if (sig <= 0)
                continue;
            debug::info("Got signal", sig);
            // handler is not replaced while it is running
            QMutexLocker l(&mutex_);
            if (!handler_)
                ::_exit(128 + sig);
            handler_(sig);
        }
    }

private:
    QMutex mutex_;
    on_signal_type handler_;
};

/// Resets the signal handler on scope exit
class SignalHandler
{
public:
    SignalHandler(SignalWatcher &watcher, SignalWatcher::on_signal_type handler)
        : watcher_(watcher)
    {
        watcher_.setHandler(handler);
    }

    ~SignalHandler()
    {
        watcher_.setHandler(SignalWatcher::on_signal_type());
    }

private:
    SignalWatcher &watcher_;
};

QTextStream &out()
{
    static QTextStream s(stdout);
    return s;
}

bool ask(QString const &question)
{
    static QTextStream in(stdin);
    out() << question << " [y/N] " << flush;
    auto answer = in.readLine().trimmed().toLower();
    return answer == "y" || answer == "yes";
}

QString humanBytes(qint64 v)
{
    static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double res = v;
    size_t i = 0;
    for (; res >= 1024 && i < sizeof(units) / sizeof(units[0]) - 1; ++i)
        res /= 1024;
    return QString("%1 %2").arg(res, 0, 'f', i ? 1 : 0).arg(units[i]);
}

config::Profile profile(QCommandLineParser const &parser)
{
    auto res = config::Profile::load(parser.value("config"));
    QVariantMap options;
    if (parser.isSet("remote"))
        options["rclone_remote"] = parser.value("remote");
    if (parser.isSet("local"))
        options["local_folder"] = parser.value("local");
    auto folders = config::folderOptions(parser.values("include")
                                         , parser.values("exclude"));
    for (auto it = folders.begin(); it != folders.end(); ++it)
        options[it.key()] = it.value();
    if (parser.isSet("bwlimit"))
        options["bandwidth_limit_kbps"] = parser.value("bwlimit").toLongLong();
    if (parser.isSet("no-dry-run"))
        options["dry_run_first_sync"] = false;
    res.update(options);
    if (parser.isSet("save"))
        res.save(parser.value("config"));
    return res;
}

void render(ProgressEvent const &event)
{
    switch (event.type) {
    case ProgressEvent::Started:
        out() << "Started" << endl;
        break;
    case ProgressEvent::Estimated:
        out() << "To transfer: " << event.filesTotal << " files, "
              << humanBytes(event.bytesTotal) << endl;
        break;
    case ProgressEvent::Progress:
        out() << (event.simulated ? "[dry run] " : "")
              << humanBytes(event.bytesDone) << " / "
              << humanBytes(event.bytesTotal) << ", "
              << event.filesDone << " / " << event.filesTotal << " files"
              << (event.currentFile.isEmpty() ? QString() : ", " + event.currentFile)
              << endl;
        break;
    case ProgressEvent::Warning:
        out() << "Warning: " << (event.path.isEmpty() ? QString() : event.path + ": ")
              << event.message << endl;
        break;
    case ProgressEvent::Paused:
        out() << "Paused" << endl;
        break;
    case ProgressEvent::Resumed:
        out() << "Resumed" << endl;
        break;
    case ProgressEvent::Completed:
        out() << "Completed: " << event.message << endl;
        break;
    case ProgressEvent::Failed:
        out() << "Failed: " << event.message << endl;
        break;
    case ProgressEvent::Cancelled:
        out() << "Cancelled" << endl;
        break;
    default:
        break;
    }
}

void checkConfigured(config::Profile const &cfg)
{
    if (!cfg.isConfigured())
        error::raise({{"reason", "Config"}
                , {"msg", "Remote and local folder should be set"}});
}

/// Renders run events until the end, returns true if completed
bool follow(engine::Engine &sync_engine, engine::RunHandle run, bool is_confirmed)
{
    auto events = sync_engine.subscribe(run);
    ProgressEvent event;
    bool is_completed = false;
    while (events.next(event)) {
        render(event);
        if (event.type == ProgressEvent::ConfirmationRequired) {
            auto proceed = is_confirmed || ask
                (QString("Sync is going to download %1 in %2 files, continue?")
                 .arg(humanBytes(event.bytesTotal)).arg(event.filesTotal));
            try {
                sync_engine.confirm(run, proceed);
            } catch (error::Error const &) {
                // cancelled by signal while asking
                if (sync_engine.state(run) != engine::Cancelled)
                    throw;
            }
        } else if (event.type == ProgressEvent::Completed) {
            is_completed = true;
        }
    }
    return is_completed;
}

int runSync(SignalWatcher &watcher, config::Profile const &cfg, bool is_confirmed)
{
    checkConfigured(cfg);
    engine::Engine sync_engine(cfg.toolSettings());
    auto run = sync_engine.requestSync(cfg.policy(), cfg.settings());
    SignalHandler on_signal(watcher, [&sync_engine, run](int) {
            sync_engine.cancel(run);
        });
    return follow(sync_engine, run, is_confirmed) ? 0 : 1;
}

int runAutoSync(SignalWatcher &watcher, config::Profile const &cfg, bool is_confirmed)
{
    checkConfigured(cfg);
    auto interval = cfg.syncIntervalMinutes();
    engine::Engine sync_engine(cfg.toolSettings());
    std::atomic<bool> is_interrupted(false);
    engine::Scheduler scheduler
        (sync_engine, cfg.policy(), cfg.settings(), interval * 60 * 1000
         , [&](engine::RunHandle run) {
            if (is_interrupted)
                sync_engine.cancel(run);
            follow(sync_engine, run, is_confirmed);
            auto last = sync_engine.lastSyncTime(cfg.remote(), cfg.localFolder());
            if (last.isValid())
                out() << "Last sync: " << last.toLocalTime().toString(Qt::ISODate) << endl;
        });

    QSemaphore interrupted;
    SignalHandler on_signal(watcher, [&](int) {
            // run started after this point is cancelled by the callback
            is_interrupted = true;
            auto run = scheduler.lastRun();
            if (run.isValid())
                sync_engine.cancel(run);
            interrupted.release();
        });
    out() << "Sync every " << interval << " minutes, interrupt to stop" << endl;
    scheduler.start();
    interrupted.acquire();
    scheduler.stop();
    return 0;
}

int execute(SignalWatcher &watcher, QCommandLineParser const &parser)
{
    auto action = parser.value("action");
    auto cfg = profile(parser);
    inventory::Inventory remote(cfg.toolSettings());

    if (action == "sync") {
        return runSync(watcher, cfg, parser.isSet("yes"));
    } else if (action == "auto") {
        return runAutoSync(watcher, cfg, parser.isSet("yes"));
    } else if (action == "estimate") {
        auto res = remote.estimateSize(cfg.remote(), filter::build(cfg.policy()));
        out() << res.totalFiles << " files, " << humanBytes(res.totalBytes) << endl;
    } else if (action == "folders") {
        auto folders = remote.listFolders(cfg.remote(), parser.value("depth").toInt());
        QString path;
        while (folders.next(path))
            out() << path << endl;
    } else if (action == "remotes") {
        for (auto const &name : remote.listRemotes())
            out() << name << endl;
    } else if (action == "type") {
        auto type = remote.remoteType(cfg.remote());
        if (type.isEmpty())
            error::raise({{"reason", "RemoteUnreachable"}
                    , {"msg", "Unknown remote"}, {"remote", cfg.remote()}});
        out() << type << endl;
    } else if (action == "version") {
        auto version = remote.version();
        if (version.isEmpty())
            error::raise({{"reason", "SpawnFailed"}
                    , {"msg", "Can't get sync tool version"}
                    , {"cmd", cfg.toolSettings().program}});
        out() << version << endl;
    } else {
        error::raise({{"msg", "Unknown action"}, {"action", action}});
    }
    return 0;
}

}

int main_(int argc, char **argv)
{
    // before any other thread is started to get signals blocked there too
    SignalWatcher watcher;
    QCoreApplication app(argc, argv);
    QCommandLineParser parser;
    parser.setApplicationDescription("Remote to local folder sync");
    parser.addHelpOption();

    parser.addOption(QCommandLineOption(QStringList() << "a" << "action", "sync|auto|estimate|folders|remotes|type|version", "action", "sync"));
    parser.addOption(QCommandLineOption(QStringList() << "c" << "config", "config", "path", config::defaultPath()));
    parser.addOption(QCommandLineOption(QStringList() << "r" << "remote", "remote", "remote"));
    parser.addOption(QCommandLineOption(QStringList() << "l" << "local", "local folder", "path"));
    parser.addOption(QCommandLineOption(QStringList() << "i" << "include", "sync only this folder", "folder"));
    parser.addOption(QCommandLineOption(QStringList() << "x" << "exclude", "skip this folder", "folder"));
    parser.addOption(QCommandLineOption(QStringList() << "b" << "bwlimit", "bandwidth limit", "kbps"));
    parser.addOption(QCommandLineOption(QStringList() << "y" << "yes", "do not ask for confirmation"));
    parser.addOption(QCommandLineOption(QStringList() << "n" << "no-dry-run", "skip dry run before the first sync"));
    parser.addOption(QCommandLineOption(QStringList() << "s" << "save", "save options to config"));
    parser.addOption(QCommandLineOption(QStringList() << "depth", "folder listing depth", "depth", "1"));

    parser.process(app);

    return execute(watcher, parser);
}

int main(int argc, char **argv)
{
    try {
        return main_(argc, argv);
    } catch (error::Error const &e) {
        debug::critical("Error:", e.m);
    } catch (std::exception const &e) {
        debug::critical("Error:", e.what());
    }
    return 1;
}
