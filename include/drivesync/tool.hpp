#ifndef _DRIVESYNC_TOOL_HPP_
#define _DRIVESYNC_TOOL_HPP_
/**
 * @file tool.hpp
 * @brief External sync tool invocation: settings and command lines
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/policy.hpp>
#include <drivesync/filter.hpp>

#include <cor/util.hpp>

#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QMap>
#include <QSet>

enum class Cmd { Exec, Args, Env, Timeout, Last_ = Timeout };
typedef Record<Cmd, QString, QStringList, QVariantMap, int> ToolCmd;

template <> struct RecordTraits<ToolCmd>
{
    RECORD_FIELD_NAMES(ToolCmd, "Exec", "Args", "Env", "Timeout");
};

namespace drivesync { namespace tool {

/**
 * How to run the external tool. The program is looked up in PATH
 * unless it is an absolute path. env entries are added to the process
 * environment.
 */
struct Settings
{
    Settings();

    QString program;
    QVariantMap env;
    int cancelGraceMs;
    int inventoryTimeoutMs;
    int listTimeoutMs;
    int statsIntervalSec;
    bool suspend;
};

/// "remote" -> "remote:", names already containing ':' are kept
QString remotePath(QString const &remoteName);

QStringList listDirs(QString const &remoteName, int maxDepth);
QStringList size(QString const &remoteName, filter::FilterArgs const &);
QStringList transfer(SyncSettings const &, filter::FilterArgs const &
                     , bool dryRun, int statsIntervalSec);
QStringList listRemotes();
QStringList checkRemote(QString const &remoteName);
QStringList remoteConfig(QString const &remoteName);
QStringList version();

ToolCmd command(Settings const &, QStringList const &args, int timeout = -1);

/**
 * Generate command line options from the map using short and long
 * option names. Options from options_has_param get their value,
 * others are treated as boolean switches.
 */
QStringList command_line_options
(QVariantMap const &options
 , QMap<QString, QString> const &short_options
 , QMap<QString, QString> const &long_options
 , QSet<QString> const &options_has_param);

}}

#endif // _DRIVESYNC_TOOL_HPP_
