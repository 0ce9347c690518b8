#ifndef _DRIVESYNC_ERROR_HPP_
#define _DRIVESYNC_ERROR_HPP_
/**
 * @file error.hpp
 * @brief Unified exceptions
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <exception>
#include <QVariantMap>
#include <QByteArray>
#include <QDebug>

namespace drivesync { namespace error {

/**
 * Exception carrying a map of error details. The "reason" key
 * classifies the error (InvalidPolicy, SpawnFailed etc.), "msg" is a
 * human readable text, all other keys are context.
 */
class Error : public std::exception
{
public:
    Error(QVariantMap const &from) : m(from) {}
    virtual ~Error() noexcept(true) {}
    virtual const char* what() const noexcept(true)
    {
        if (s_.isEmpty()) {
            QString s;
            QDebug(&s) << m;
            s_ = s.toUtf8();
        }
        return s_.constData();
    }

    QVariantMap m;

private:
    mutable QByteArray s_;
};

static inline QDebug operator << (QDebug dst, error::Error const &src)
{
    dst << src.m;
    return dst;
}

static inline void raise(QVariantMap const &m)
{
    throw Error(m);
}

static inline void raise(std::initializer_list<std::pair<QString, QVariant> > src)
{
    raise(QVariantMap(src));
}

template <typename T, typename T2, typename ... A>
void raise(T const &m1, T2 const &m2, A && ...args)
{
    QVariantMap x = m1;
    QVariantMap y = m2;
    x.unite(y);
    raise(x, std::forward<A>(args)...);
}

static inline QString reason(Error const &e)
{
    return e.m.value("reason").toString();
}

static inline QString message(Error const &e)
{
    auto res = e.m.value("msg").toString();
    auto cause = e.m.value("cause").toString();
    if (!cause.isEmpty())
        res = res.isEmpty() ? cause : res + ": " + cause;
    return res.isEmpty() ? reason(e) : res;
}

}}

#endif // _DRIVESYNC_ERROR_HPP_
