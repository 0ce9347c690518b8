#ifndef _DRIVESYNC_FILTER_HPP_
#define _DRIVESYNC_FILTER_HPP_
/**
 * @file filter.hpp
 * @brief Translation of the folder policy into tool filter rules
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/policy.hpp>

#include <QList>
#include <QStringList>

namespace drivesync { namespace filter {

struct Rule
{
    enum Kind { Include, Exclude };

    Rule(Kind k, QString const &p) : kind(k), pattern(p) {}

    bool operator == (Rule const &that) const
    {
        return kind == that.kind && pattern == that.pattern;
    }

    /// Tool flag, e.g. "--include=Photos/**"
    QString arg() const;

    Kind kind;
    QString pattern;
};

/**
 * Ordered rule set. Order is significant: the tool applies the first
 * matching rule.
 */
class FilterArgs
{
public:
    FilterArgs() {}
    explicit FilterArgs(QList<Rule> const &rules) : rules_(rules) {}

    inline QList<Rule> const &rules() const { return rules_; }
    inline bool isEmpty() const { return rules_.isEmpty(); }
    inline int size() const { return rules_.size(); }

    QStringList args() const;

    bool operator == (FilterArgs const &that) const
    {
        return rules_ == that.rules_;
    }

private:
    QList<Rule> rules_;
};

/**
 * Build filter rules for the policy. Raises InvalidPolicy if
 * IncludeOnly/ExcludeOnly mode has no (valid) folders.
 */
FilterArgs build(SyncPolicy const &);

/// Normalized remote-relative folder path, raises InvalidPolicy on bad one
QString normalizePath(QString const &);

/// Escape filter glob metacharacters so the name is matched literally
QString escape(QString const &);

}}

#endif // _DRIVESYNC_FILTER_HPP_
