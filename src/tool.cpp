/**
 * @file tool.cpp
 * @brief External sync tool invocation: settings and command lines
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/tool.hpp>

#include <QSet>
#include <QMap>

#include <algorithm>

namespace drivesync { namespace tool {

Settings::Settings()
    : program("rclone")
    , cancelGraceMs(5000)
    , inventoryTimeoutMs(60000)
    , listTimeoutMs(30000)
    , statsIntervalSec(1)
#ifdef Q_OS_UNIX
    , suspend(true)
#else
    , suspend(false)
#endif
{}

QString remotePath(QString const &remoteName)
{
    return remoteName.contains(':') ? remoteName : remoteName + ":";
}

QStringList command_line_options(QVariantMap const &options
                                 , QMap<QString, QString> const &short_options
                                 , QMap<QString, QString> const &long_options
                                 , QSet<QString> const &options_has_param)
{
    QStringList cmd_options;

    for (auto it = options.begin(); it != options.end(); ++it) {
        auto n = it.key();
        auto v = it.value();
        auto opt = short_options.value(n);
        if (!opt.isEmpty()) {
            if (options_has_param.contains(n)) {
                cmd_options.append(QStringList({QString("-") + opt, v.toString()}));
            } else {
                if (v.toBool())
                    cmd_options.push_back(QString("-") + opt);
            }
            continue;
        }
        opt = long_options.value(n);
        if (!opt.isEmpty()) {
            if (options_has_param.contains(n)) {
                cmd_options.push_back(QStringList({"--", opt, "=", v.toString()}).join(""));
            } else {
                if (v.toBool())
                    cmd_options.push_back(QString("--") + opt);
            }
        }
    }
    return cmd_options;
}

QStringList listDirs(QString const &remoteName, int maxDepth)
{
    QStringList res = {"lsf", remotePath(remoteName), "--dirs-only", "-R"};
    if (maxDepth > 0)
        res << "--max-depth" << QString::number(maxDepth);
    return res;
}

QStringList size(QString const &remoteName, filter::FilterArgs const &filters)
{
    return QStringList({"size", remotePath(remoteName), "--json"})
        + filters.args();
}

QStringList transfer(SyncSettings const &settings
                     , filter::FilterArgs const &filters
                     , bool dryRun, int statsIntervalSec)
{
    static const QMap<QString, QString> short_options = {
        {"verbose", "v"}
    };
    static const QMap<QString, QString> long_options = {
        {"stats", "stats"}, {"dry_run", "dry-run"}, {"bwlimit", "bwlimit"}
    };
    static const QSet<QString> options_has_param = {"stats", "bwlimit"};

    QVariantMap options = {
        {"verbose", true}
        , {"stats", QString("%1s").arg(std::max(1, statsIntervalSec))}
        , {"dry_run", dryRun}
    };
    if (settings.bandwidthLimitKbps > 0)
        options["bwlimit"] = QString("%1k").arg(settings.bandwidthLimitKbps);

    QStringList res = {"sync", remotePath(settings.remoteName)
                       , settings.localRoot};
    res += command_line_options(options, short_options, long_options
                                , options_has_param);
    res += filters.args();
    return res;
}

QStringList listRemotes()
{
    return {"listremotes"};
}

QStringList checkRemote(QString const &remoteName)
{
    return {"lsd", remotePath(remoteName), "--max-depth", "1"};
}

QStringList remoteConfig(QString const &remoteName)
{
    return {"config", "show", remoteName.section(':', 0, 0)};
}

QStringList version()
{
    return {"version"};
}

ToolCmd command(Settings const &settings, QStringList const &args, int timeout)
{
    return ToolCmd(settings.program, args, settings.env, timeout);
}

}}
