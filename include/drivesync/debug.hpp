#ifndef _DRIVESYNC_DEBUG_HPP_
#define _DRIVESYNC_DEBUG_HPP_
/**
 * @file debug.hpp
 * @brief Debug tracing support
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <QVariant>
#include <QDebug>
#include <QTextStream>

#include <memory>

namespace drivesync { namespace debug {

enum class Level { Debug = 1, Info, Warning, Error, Critical };

QDebug stream();

static inline void print(QDebug &&d)
{
    QDebug dd(std::move(d));
}

template <typename T, typename ... A>
void print(QDebug &&d, T &&v1, A&& ...args)
{
    d << v1;
    return print(std::move(d), std::forward<A>(args)...);
}

template <typename ... A>
void print(A&& ...args)
{
    return print(stream(), std::forward<A>(args)...);
}

/**
 * Tracing level from DRIVESYNC_DEBUG value: level name or number,
 * "off" or 0 disables tracing, empty or unknown value means Critical
 */
int parseLevel(QString const &);

void level(Level);
bool is_tracing_level(Level);

template <typename ... A>
void print_ge(Level print_level, A&& ...args)
{
    if (is_tracing_level(print_level))
        print(std::forward<A>(args)...);
}

template <typename ... A>
void debug(A&& ...args)
{
    print_ge(Level::Debug, std::forward<A>(args)...);
}

template <typename ... A>
void info(A&& ...args)
{
    print_ge(Level::Info, std::forward<A>(args)...);
}

template <typename ... A>
void warning(A&& ...args)
{
    print_ge(Level::Warning, std::forward<A>(args)...);
}

template <typename ... A>
void error(A&& ...args)
{
    print_ge(Level::Error, std::forward<A>(args)...);
}

template <typename ... A>
void critical(A&& ...args)
{
    print_ge(Level::Critical, std::forward<A>(args)...);
}

}}

#endif // _DRIVESYNC_DEBUG_HPP_
