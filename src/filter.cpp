/**
 * @file filter.cpp
 * @brief Translation of the folder policy into tool filter rules
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/filter.hpp>
#include <drivesync/error.hpp>
#include <drivesync/debug.hpp>

#include <QSet>

namespace drivesync { namespace filter {

using debug::Level;

template <typename ... Args>
void trace(Level l, Args &&...args)
{
    debug::print_ge(l, "Sync.filter:", std::forward<Args>(args)...);
}

QString Rule::arg() const
{
    return (kind == Include ? "--include=" : "--exclude=") + pattern;
}

QStringList FilterArgs::args() const
{
    QStringList res;
    for (auto const &rule : rules_)
        res.push_back(rule.arg());
    return res;
}

QString normalizePath(QString const &src)
{
    auto path = src.trimmed();
    if (path.startsWith('/'))
        error::raise({{"reason", "InvalidPolicy"}
                , {"msg", "Folder path should be relative to the remote root"}
                , {"path", src}});

    while (path.startsWith("./"))
        path = path.mid(2);
    while (path.endsWith('/'))
        path.chop(1);

    if (path.isEmpty() || path == ".")
        error::raise({{"reason", "InvalidPolicy"}
                , {"msg", "Empty folder path"}, {"path", src}});

    auto parts = path.split('/', QString::SkipEmptyParts);
    if (parts.contains(".."))
        error::raise({{"reason", "InvalidPolicy"}
                , {"msg", "Folder path should not refer to parent"}
                , {"path", src}});
    return parts.join('/');
}

QString escape(QString const &name)
{
    static const QString special("*?[]{}\\");
    QString res;
    res.reserve(name.size());
    for (auto c : name) {
        if (special.contains(c))
            res.push_back('\\');
        res.push_back(c);
    }
    return res;
}

namespace {

QStringList uniqueFolders(QStringList const &src)
{
    QStringList res;
    QSet<QString> seen;
    for (auto const &p : src) {
        auto path = normalizePath(p);
        if (seen.contains(path))
            continue;
        seen.insert(path);
        res.push_back(path);
    }
    return res;
}

}

FilterArgs build(SyncPolicy const &policy)
{
    if (policy.mode == SyncPolicy::Full)
        return FilterArgs();

    auto folders = uniqueFolders(policy.paths());
    if (folders.isEmpty())
        error::raise({{"reason", "InvalidPolicy"}
                , {"msg", "Selective sync requires at least one folder"}
                , {"mode", modeName(policy.mode)}});

    QList<Rule> rules;
    auto kind = (policy.mode == SyncPolicy::IncludeOnly
                 ? Rule::Include : Rule::Exclude);
    for (auto const &folder : folders)
        rules.push_back(Rule(kind, escape(folder) + "/**"));

    // the catch-all must stay the very last rule
    if (policy.mode == SyncPolicy::IncludeOnly)
        rules.push_back(Rule(Rule::Exclude, "*"));

    trace(Level::Debug, "Rules for", policy, ":", rules.size());
    return FilterArgs(rules);
}

}}
