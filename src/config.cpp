/**
 * @file config.cpp
 * @brief User sync profile stored as JSON
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/config.hpp>
#include <drivesync/error.hpp>
#include <drivesync/debug.hpp>
#include <drivesync/util.hpp>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <limits>

namespace drivesync { namespace config {

namespace {

const char *fileName = "config.json";
const qint64 megabyte = 1024 * 1024;
const int maxIntervalMinutes = 7 * 24 * 60;

QVariantMap defaults()
{
    return {
        {"rclone_remote", ""}
        , {"local_folder", ""}
        , {"sync_mode", "full"}
        , {"included_folders", QStringList()}
        , {"excluded_folders", QStringList()}
        , {"confirm_large_sync", true}
        , {"large_sync_threshold_mb", 1000}
        , {"bandwidth_limit_kbps", 0}
        , {"dry_run_first_sync", true}
        , {"rclone_path", "rclone"}
        , {"auto_sync_enabled", false}
        , {"sync_interval_minutes", 30}
    };
}

QVariantMap read(const QString &fname)
{
    QFile f(fname);
    if (!f.open(QIODevice::ReadOnly))
        error::raise({{"reason", "Config"}, {"msg", "Can't read config"}
                , {"path", fname}, {"cause", f.errorString()}});

    QJsonParseError err;
    auto doc = QJsonDocument::fromJson(f.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        error::raise({{"reason", "Config"}, {"msg", "Invalid config"}
                , {"path", fname}, {"cause", err.errorString()}});
    return doc.object().toVariantMap();
}

void write(const QVariantMap &src, const QString &fname)
{
    auto dir = QFileInfo(fname).absolutePath();
    if (!QDir().mkpath(dir))
        error::raise({{"reason", "Config"}, {"msg", "Can't create config dir"}
                , {"path", dir}});

    QFile f(fname);
    QJsonDocument doc(QJsonObject::fromVariantMap(src));
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)
        || f.write(doc.toJson()) < 0)
        error::raise({{"reason", "Config"}, {"msg", "Can't write config"}
                , {"path", fname}, {"cause", f.errorString()}});
}

QString expandHome(const QString &path)
{
    if (path == "~")
        return QDir::homePath();
    if (path.startsWith("~/"))
        return QDir::homePath() + path.mid(1);
    return path;
}

}

QString defaultDir()
{
    static const char *envName = "DRIVESYNC_CONFIG_DIR";
    return qEnvironmentVariableIsSet(envName)
        ? QString::fromLocal8Bit(qgetenv(envName))
        : QDir::homePath() + "/.config/drivesync";
}

QString defaultPath()
{
    return QDir(defaultDir()).filePath(fileName);
}

QVariantMap folderOptions(QStringList const &included, QStringList const &excluded)
{
    if (!included.isEmpty() && !excluded.isEmpty())
        error::raise({{"reason", "Config"}
                , {"msg", "Folders can be either included or excluded, not both"}
                , {"included", included}, {"excluded", excluded}});
    if (!included.isEmpty())
        return {{"sync_mode", "selective_include"}, {"included_folders", included}};
    if (!excluded.isEmpty())
        return {{"sync_mode", "selective_exclude"}, {"excluded_folders", excluded}};
    return QVariantMap();
}

Profile::Profile()
    : m_data(defaults())
{
}

Profile::Profile(const QVariantMap &data)
    : m_data(defaults())
{
    update(data);
}

Profile Profile::load(const QString &fname)
{
    auto path = fname.isEmpty() ? defaultPath() : fname;
    if (!QFileInfo(path).exists()) {
        debug::info("No config", path, "using defaults");
        return Profile();
    }
    debug::debug("Load config", path);
    return Profile(read(path));
}

void Profile::save(const QString &fname) const
{
    auto path = fname.isEmpty() ? defaultPath() : fname;
    debug::debug("Save config", path);
    write(m_data, path);
}

bool Profile::update(const QVariantMap &src)
{
    bool updated = false;
    for (auto i = src.begin(); i != src.end(); ++i) {
        if (!m_data.contains(i.key()) || i.value() != m_data.value(i.key())) {
            m_data[i.key()] = i.value();
            updated = true;
        }
    }
    return updated;
}

bool Profile::isConfigured() const
{
    return !remote().isEmpty() && !localFolder().isEmpty();
}

QString Profile::remote() const
{
    return str(m_data.value("rclone_remote")).trimmed();
}

QString Profile::localFolder() const
{
    return expandHome(str(m_data.value("local_folder")).trimmed());
}

SyncPolicy Profile::policy() const
{
    switch (policyMode(str(m_data.value("sync_mode")))) {
    case SyncPolicy::IncludeOnly:
        return SyncPolicy::includeOnly(m_data.value("included_folders").toStringList());
    case SyncPolicy::ExcludeOnly:
        return SyncPolicy::excludeOnly(m_data.value("excluded_folders").toStringList());
    default:
        return SyncPolicy::full();
    }
}

SyncSettings Profile::settings() const
{
    SyncSettings res;
    res.remoteName = remote();
    res.localRoot = localFolder();
    res.bandwidthLimitKbps = m_data.value("bandwidth_limit_kbps").toLongLong();
    res.dryRunBeforeFirstSync = m_data.value("dry_run_first_sync").toBool();
    auto const max = std::numeric_limits<qint64>::max();
    auto threshold_mb = m_data.value("large_sync_threshold_mb").toLongLong();
    if (!m_data.value("confirm_large_sync").toBool() || threshold_mb > max / megabyte)
        res.largeSyncThresholdBytes = max;
    else
        res.largeSyncThresholdBytes = threshold_mb * megabyte;
    return res;
}

bool Profile::autoSyncEnabled() const
{
    return m_data.value("auto_sync_enabled").toBool();
}

int Profile::syncIntervalMinutes() const
{
    bool ok = false;
    auto res = m_data.value("sync_interval_minutes").toInt(&ok);
    if (!ok || res <= 0 || res > maxIntervalMinutes)
        error::raise({{"reason", "Config"}, {"msg", "Sync interval is out of range"}
                , {"value", m_data.value("sync_interval_minutes")}});
    return res;
}

tool::Settings Profile::toolSettings() const
{
    tool::Settings res;
    auto program = str(m_data.value("rclone_path")).trimmed();
    if (!program.isEmpty())
        res.program = expandHome(program);
    return res;
}

}}
