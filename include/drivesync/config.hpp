#ifndef _DRIVESYNC_CONFIG_HPP_
#define _DRIVESYNC_CONFIG_HPP_
/**
 * @file config.hpp
 * @brief User sync profile stored as JSON
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/policy.hpp>
#include <drivesync/tool.hpp>

#include <QString>
#include <QVariantMap>

namespace drivesync { namespace config {

/// $DRIVESYNC_CONFIG_DIR or ~/.config/drivesync
QString defaultDir();
QString defaultPath();

/// Profile keys selecting folders, raises Config if both lists are set
QVariantMap folderOptions(QStringList const &included, QStringList const &excluded);

/**
 * Sync profile: which remote goes to which local folder and how.
 * Missing keys have default values.
 */
class Profile
{
public:
    Profile();
    explicit Profile(const QVariantMap &data);

    /// Missing file gives defaults, broken one raises Config error
    static Profile load(const QString &fname = QString());
    void save(const QString &fname = QString()) const;

    bool update(const QVariantMap &src);

    bool isConfigured() const;

    QString remote() const;
    QString localFolder() const;

    SyncPolicy policy() const;
    SyncSettings settings() const;
    tool::Settings toolSettings() const;

    bool autoSyncEnabled() const;
    /// Raises Config error if the interval is not in (0, one week]
    int syncIntervalMinutes() const;

    inline QVariantMap data() const { return m_data; }

private:
    QVariantMap m_data;
};

}}

#endif // _DRIVESYNC_CONFIG_HPP_
