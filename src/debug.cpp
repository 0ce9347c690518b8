/**
 * @file debug.cpp
 * @brief Debug tracing support
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/debug.hpp>

#include <QMap>

#include <atomic>
#include <mutex>

namespace drivesync { namespace debug {

namespace {

const char *env_name = "DRIVESYNC_DEBUG";

std::atomic<int> current_level(static_cast<int>(Level::Error));
std::once_flag init_flag;

void init()
{
    std::call_once(init_flag, []() {
            if (qEnvironmentVariableIsSet(env_name))
                current_level = parseLevel(QString::fromLocal8Bit(qgetenv(env_name)));
        });
}

}

int parseLevel(QString const &src)
{
    static const QMap<QString, int> names = {
        {"off", 0}, {"none", 0}
        , {"debug", static_cast<int>(Level::Debug)}
        , {"info", static_cast<int>(Level::Info)}
        , {"warning", static_cast<int>(Level::Warning)}
        , {"error", static_cast<int>(Level::Error)}
        , {"critical", static_cast<int>(Level::Critical)}
    };
    auto critical = static_cast<int>(Level::Critical);
    auto name = src.trimmed().toLower();
    if (name.isEmpty())
        return critical;
    if (names.contains(name))
        return names[name];

    bool ok = false;
    auto res = name.toInt(&ok);
    return (ok && res >= 0 && res <= critical) ? res : critical;
}

QDebug stream()
{
    init();
    return qDebug();
}

void level(Level level)
{
    init();
    current_level = static_cast<int>(level);
}

bool is_tracing_level(Level level)
{
    init();
    int current = current_level;
    return current && static_cast<int>(level) >= current;
}

}}
