#ifndef _DRIVESYNC_INVENTORY_HPP_
#define _DRIVESYNC_INVENTORY_HPP_
/**
 * @file inventory.hpp
 * @brief Read-only queries of the remote storage through the tool
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/tool.hpp>
#include <drivesync/subprocess.hpp>

#include <memory>

namespace drivesync { namespace inventory {

/**
 * Remote folders produced while the listing is running. Single pass:
 * the sequence can't be restarted. Raises RemoteUnreachable or
 * RemoteUnauthenticated from next() if the listing fails.
 */
class FolderList
{
public:
    FolderList(tool::Settings const &, QStringList const &args);
    FolderList(FolderList &&) = default;

    bool next(QString &);

    /// Consume the rest of the sequence
    QStringList all();

private:
    void start();
    void check();

    tool::Settings settings_;
    QStringList args_;
    std::unique_ptr<subprocess::Process> ps_;
    bool is_done_;
};

class Inventory
{
public:
    Inventory(tool::Settings const &settings = tool::Settings())
        : settings_(settings)
    {}

    FolderList listFolders(QString const &remoteName, int maxDepth) const;

    /**
     * Total size of files matching filters. Raises EstimationFailed.
     * Uses the passed process to allow its cancellation while
     * estimating.
     */
    SizeEstimate estimateSize(QString const &remoteName
                              , filter::FilterArgs const &
                              , subprocess::Process &) const;
    SizeEstimate estimateSize(QString const &remoteName
                              , filter::FilterArgs const &) const;

    /// Remote names configured for the tool, without trailing ':'
    QStringList listRemotes() const;
    /// Raises RemoteUnreachable/RemoteUnauthenticated if not accessible
    void checkRemote(QString const &remoteName) const;
    /// Backend type of the remote ("drive", "protondrive"...), empty if unknown
    QString remoteType(QString const &remoteName) const;
    /// First remote with the type containing the name, empty if none
    QString findRemote(QString const &typeName) const;
    /// Tool version, empty if the tool can't be executed
    QString version() const;

    tool::Settings const &settings() const { return settings_; }

private:
    QByteArray execute(ToolCmd const &) const;

    tool::Settings settings_;
};

/// Classify failed remote access by the tool stderr
QString remoteErrorReason(QString const &errors);

/// Parse "size --json" output
SizeEstimate parseSize(QByteArray const &);

}}

#endif // _DRIVESYNC_INVENTORY_HPP_
