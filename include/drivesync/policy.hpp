#ifndef _DRIVESYNC_POLICY_HPP_
#define _DRIVESYNC_POLICY_HPP_
/**
 * @file policy.hpp
 * @brief Sync request description: folder policy and settings
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QDebug>

namespace drivesync {

/**
 * Which remote folders participate in the sync. Folder paths are
 * remote-relative and use forward slashes. includedPaths is used only
 * in IncludeOnly mode, excludedPaths only in ExcludeOnly mode.
 */
struct SyncPolicy
{
    enum Mode { Full, IncludeOnly, ExcludeOnly };

    SyncPolicy() : mode(Full) {}

    static SyncPolicy full();
    static SyncPolicy includeOnly(QStringList const &);
    static SyncPolicy excludeOnly(QStringList const &);

    /// Paths relevant for the mode, empty for Full
    QStringList paths() const;
    /// Stable textual identity of the effective policy
    QString key() const;

    Mode mode;
    QStringList includedPaths;
    QStringList excludedPaths;
};

struct SyncSettings
{
    SyncSettings()
        : bandwidthLimitKbps(0)
        , largeSyncThresholdBytes(defaultThreshold)
        , dryRunBeforeFirstSync(true)
    {}

    static const qint64 defaultThreshold = 1000ll * 1024 * 1024;

    QString remoteName;
    QString localRoot;
    qint64 bandwidthLimitKbps;
    qint64 largeSyncThresholdBytes;
    bool dryRunBeforeFirstSync;
};

struct SizeEstimate
{
    SizeEstimate() : totalBytes(0), totalFiles(0) {}
    SizeEstimate(qint64 bytes, qint64 files)
        : totalBytes(bytes)
        , totalFiles(files)
        , estimatedAt(QDateTime::currentDateTimeUtc())
    {}

    qint64 totalBytes;
    qint64 totalFiles;
    QDateTime estimatedAt;
};

QString modeName(SyncPolicy::Mode);
SyncPolicy::Mode policyMode(QString const &);

QDebug operator << (QDebug, SyncPolicy const &);
QDebug operator << (QDebug, SyncSettings const &);
QDebug operator << (QDebug, SizeEstimate const &);

}

#endif // _DRIVESYNC_POLICY_HPP_
