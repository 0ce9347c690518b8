/**
 * @file policy.cpp
 * @brief Sync request description: folder policy and settings
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/policy.hpp>
#include <drivesync/error.hpp>

#include <array>

namespace drivesync {

namespace {

const std::array<char const *, 3> mode_names = {{"full", "include", "exclude"}};

}

const qint64 SyncSettings::defaultThreshold;

SyncPolicy SyncPolicy::full()
{
    return SyncPolicy();
}

SyncPolicy SyncPolicy::includeOnly(QStringList const &paths)
{
    SyncPolicy res;
    res.mode = IncludeOnly;
    res.includedPaths = paths;
    return res;
}

SyncPolicy SyncPolicy::excludeOnly(QStringList const &paths)
{
    SyncPolicy res;
    res.mode = ExcludeOnly;
    res.excludedPaths = paths;
    return res;
}

QStringList SyncPolicy::paths() const
{
    switch (mode) {
    case IncludeOnly:
        return includedPaths;
    case ExcludeOnly:
        return excludedPaths;
    default:
        return QStringList();
    }
}

QString SyncPolicy::key() const
{
    return QStringList({modeName(mode), paths().join("\n")}).join(":");
}

QString modeName(SyncPolicy::Mode mode)
{
    return mode_names.at(static_cast<size_t>(mode));
}

SyncPolicy::Mode policyMode(QString const &name)
{
    auto n = name.trimmed().toLower();
    if (n == "full")
        return SyncPolicy::Full;
    if (n == "include" || n == "selective_include")
        return SyncPolicy::IncludeOnly;
    if (n == "exclude" || n == "selective_exclude")
        return SyncPolicy::ExcludeOnly;
    error::raise({{"reason", "InvalidPolicy"}
            , {"msg", "Unknown sync mode"}, {"mode", name}});
    return SyncPolicy::Full;
}

QDebug operator << (QDebug d, SyncPolicy const &v)
{
    QDebugStateSaver saver(d);
    d.nospace() << "Policy(" << modeName(v.mode) << ", " << v.paths() << ")";
    return d;
}

QDebug operator << (QDebug d, SyncSettings const &v)
{
    QDebugStateSaver saver(d);
    d.nospace() << "Settings(" << v.remoteName << " -> " << v.localRoot
                << ", bwlimit=" << v.bandwidthLimitKbps
                << ", threshold=" << v.largeSyncThresholdBytes
                << ", dry_run_first=" << v.dryRunBeforeFirstSync << ")";
    return d;
}

QDebug operator << (QDebug d, SizeEstimate const &v)
{
    QDebugStateSaver saver(d);
    d.nospace() << "Estimate(" << v.totalBytes << " bytes, "
                << v.totalFiles << " files)";
    return d;
}

}
