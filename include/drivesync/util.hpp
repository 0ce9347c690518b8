#ifndef _DRIVESYNC_UTIL_HPP_
#define _DRIVESYNC_UTIL_HPP_
/**
 * @file util.hpp
 * @brief Misc. helpful utilities
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/error.hpp>

#include <QVariant>
#include <QDebug>
#include <QMap>
#include <QStringList>
#include <QRegExp>

namespace {

inline QString str(QVariant const &v)
{
    return v.toString();
}

inline QString str(QByteArray const &v)
{
    return QString::fromUtf8(v);
}

inline QVariantMap map(std::initializer_list<std::pair<QString, QVariant> > data)
{
    return QVariantMap(data);
}

inline QStringList filterEmpty(QStringList const &src)
{
    return src.filter(QRegExp("^.+$"));
}

}

namespace drivesync { namespace util {

/**
 * Parse human readable amount of bytes ("1.5 MiB", "12k", "300")
 * converting it to the provided unit. Raises on malformed input.
 */
double parseBytes(QString const &s, QString const &unit = "b"
                  , long multiplier = 1024);

/// Last @a count items of @a src joined with @a sep
QString tail(QStringList const &src, int count, QString const &sep = "\n");

}}

#endif // _DRIVESYNC_UTIL_HPP_
