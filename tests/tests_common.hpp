#ifndef _DRIVESYNC_TESTS_COMMON_HPP_
#define _DRIVESYNC_TESTS_COMMON_HPP_

#include <drivesync/util.hpp>

#include <QStringList>
#include <QVariantMap>

#include <ostream>

template <class CharT>
std::basic_ostream<CharT>& operator <<
(std::basic_ostream<CharT> &dst, QString const &src)
{
    dst << src.toStdString();
    return dst;
}

template <class CharT>
std::basic_ostream<CharT>& operator <<
(std::basic_ostream<CharT> &dst, QStringList const &src)
{
    for (auto v : src)
        dst  << v.toStdString() << ",";
    return dst;
}

namespace {

inline QStringList strings()
{
    return QStringList();
}

template <typename ...A>
QStringList strings(QString const &s, A &&...args)
{
    return QStringList(s) + strings(std::forward<A>(args)...);
}

/// Path to the test stand-in for the sync tool
inline QString fakeTool()
{
    return QString(DRIVESYNC_TEST_TOOL);
}

}

#define S_(...) strings(__VA_ARGS__).join(' ').toStdString()

#endif // _DRIVESYNC_TESTS_COMMON_HPP_
