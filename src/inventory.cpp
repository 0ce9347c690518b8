/**
 * @file inventory.cpp
 * @brief Read-only queries of the remote storage through the tool
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/inventory.hpp>
#include <drivesync/error.hpp>
#include <drivesync/debug.hpp>
#include <drivesync/util.hpp>

#include <cor/util.hpp>

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QRegExp>

namespace drivesync { namespace inventory {

using debug::Level;

template <typename ... Args>
void trace(Level l, Args &&...args)
{
    debug::print_ge(l, "Sync.inventory:", std::forward<Args>(args)...);
}

namespace {

const int list_stderr_lines = 10;

void raiseRemoteError(QString const &remote, QString const &errors
                      , QVariantMap const &info)
{
    auto reason = remoteErrorReason(errors);
    trace(Level::Warning, reason, remote, errors);
    error::raise(map({{"reason", reason}, {"msg", "Can't access remote"}
                , {"remote", remote}, {"cause", errors}}), info);
}

}

QString remoteErrorReason(QString const &errors)
{
    static const QStringList auth_markers = {
        "auth", "unauthorized", "401", "token", "login", "credentials"
        , "password"
    };
    auto text = errors.toLower();
    for (auto const &marker : auth_markers)
        if (text.contains(marker))
            return "RemoteUnauthenticated";
    return "RemoteUnreachable";
}

SizeEstimate parseSize(QByteArray const &data)
{
    QJsonParseError err;
    auto doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        error::raise({{"reason", "EstimationFailed"}
                , {"msg", "Can't parse size output"}
                , {"cause", err.errorString()}, {"data", str(data)}});

    auto obj = doc.object();
    if (!obj.contains("bytes") || !obj.contains("count"))
        error::raise({{"reason", "EstimationFailed"}
                , {"msg", "Unexpected size output"}, {"data", str(data)}});

    auto bytes = obj.value("bytes").toDouble(-1);
    auto count = obj.value("count").toDouble(-1);
    auto const limit = static_cast<double>(std::numeric_limits<qint64>::max());
    if (!(bytes >= 0 && bytes < limit && count >= 0 && count < limit))
        error::raise({{"reason", "EstimationFailed"}
                , {"msg", "Wrong size values"}, {"data", str(data)}});
    return SizeEstimate(static_cast<qint64>(bytes), static_cast<qint64>(count));
}

FolderList::FolderList(tool::Settings const &settings, QStringList const &args)
    : settings_(settings)
    , args_(args)
    , is_done_(false)
{}

void FolderList::start()
{
    ps_ = cor::make_unique<subprocess::Process>
        (settings_.cancelGraceMs, settings_.suspend);
    ps_->setTimeout(settings_.listTimeoutMs);
    try {
        ps_->start(settings_.program, args_, settings_.env);
    } catch (error::Error const &e) {
        is_done_ = true;
        error::raise({{"reason", "RemoteUnreachable"}
                , {"msg", "Can't start listing"}
                , {"cause", error::message(e)}});
    }
}

void FolderList::check()
{
    auto status = ps_->handle()->status();
    if (!status.ok())
        raiseRemoteError(args_.value(1), ps_->stderrTail(list_stderr_lines)
                         , {{"rc", status.code}});
}

bool FolderList::next(QString &res)
{
    if (is_done_)
        return false;
    if (!ps_)
        start();

    subprocess::Process::Line line;
    try {
        while (ps_->readLine(line)) {
            if (line.channel != subprocess::Process::Channel::Out)
                continue;
            auto path = line.text.trimmed();
            while (path.endsWith('/'))
                path.chop(1);
            if (path.isEmpty())
                continue;
            res = path;
            return true;
        }
    } catch (error::Error const &e) {
        is_done_ = true;
        error::raise({{"reason", "RemoteUnreachable"}
                , {"msg", "Listing failed"}, {"cause", error::message(e)}});
    }
    is_done_ = true;
    check();
    return false;
}

QStringList FolderList::all()
{
    QStringList res;
    QString path;
    while (next(path))
        res.push_back(path);
    return res;
}

FolderList Inventory::listFolders(QString const &remoteName, int maxDepth) const
{
    trace(Level::Debug, "List folders", remoteName, maxDepth);
    return FolderList(settings_, tool::listDirs(remoteName, maxDepth));
}

SizeEstimate Inventory::estimateSize(QString const &remoteName
                                     , filter::FilterArgs const &filters
                                     , subprocess::Process &ps) const
{
    auto args = tool::size(remoteName, filters);
    trace(Level::Debug, "Estimate", args);
    ps.setTimeout(settings_.inventoryTimeoutMs);
    subprocess::ExitStatus status;
    try {
        ps.start(settings_.program, args, settings_.env);
        status = ps.wait();
    } catch (error::Error const &e) {
        error::raise({{"reason", "EstimationFailed"}
                , {"msg", "Can't estimate size"}
                , {"cause", error::message(e)}, {"remote", remoteName}});
    }
    if (!status.ok())
        error::raise({{"reason", "EstimationFailed"}
                , {"msg", "Size query failed"}
                , {"cause", ps.stderrTail()}, {"rc", status.code}
                , {"remote", remoteName}, {"cmd", ps.program()}
                , {"args", ps.arguments()}});

    auto res = parseSize(ps.stdoutLines().join("\n").toUtf8());
    trace(Level::Info, "Estimated", remoteName, res);
    return res;
}

SizeEstimate Inventory::estimateSize(QString const &remoteName
                                     , filter::FilterArgs const &filters) const
{
    subprocess::Process ps(settings_.cancelGraceMs, settings_.suspend);
    return estimateSize(remoteName, filters, ps);
}

QByteArray Inventory::execute(ToolCmd const &cmd) const
{
    return subprocess::check_output(cmd.get<Cmd::Exec>(), cmd.get<Cmd::Args>()
                                    , cmd.get<Cmd::Env>()
                                    , cmd.get<Cmd::Timeout>());
}

QStringList Inventory::listRemotes() const
{
    auto out = execute(tool::command(settings_, tool::listRemotes()
                                     , settings_.listTimeoutMs));
    QStringList res;
    for (auto const &line : str(out).split('\n')) {
        auto name = line.trimmed();
        while (name.endsWith(':'))
            name.chop(1);
        if (!name.isEmpty())
            res.push_back(name);
    }
    return res;
}

void Inventory::checkRemote(QString const &remoteName) const
{
    try {
        execute(tool::command(settings_, tool::checkRemote(remoteName)
                              , settings_.listTimeoutMs));
    } catch (error::Error const &e) {
        auto errors = e.m.value("stderr").toString();
        if (errors.isEmpty())
            errors = error::message(e);
        raiseRemoteError(remoteName, errors, {{"rc", e.m.value("rc")}});
    }
}

QString Inventory::remoteType(QString const &remoteName) const
{
    QByteArray out;
    try {
        out = execute(tool::command(settings_, tool::remoteConfig(remoteName)
                                    , settings_.listTimeoutMs));
    } catch (error::Error const &e) {
        trace(Level::Warning, "Can't get remote config", remoteName, e.m);
        return QString();
    }
    QRegExp type_re("^type\\s*=\\s*(\\S+)$");
    for (auto const &line : str(out).split('\n')) {
        if (type_re.exactMatch(line.trimmed()))
            return type_re.cap(1);
    }
    return QString();
}

QString Inventory::findRemote(QString const &typeName) const
{
    for (auto const &name : listRemotes()) {
        if (remoteType(name).contains(typeName, Qt::CaseInsensitive))
            return name;
    }
    return QString();
}

QString Inventory::version() const
{
    QByteArray out;
    try {
        out = execute(tool::command(settings_, tool::version()
                                    , settings_.listTimeoutMs));
    } catch (error::Error const &e) {
        trace(Level::Warning, "Can't get tool version", e.m);
        return QString();
    }
    QRegExp version_re("v(\\d+(\\.\\d+)*)");
    return (version_re.indexIn(str(out)) >= 0) ? version_re.cap(1) : QString();
}

}}
