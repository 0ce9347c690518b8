/**
 * @file util.cpp
 * @brief Misc. helpful utilities
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/util.hpp>

#include <QString>
#include <QMap>

#include <cmath>
#include <algorithm>

namespace drivesync { namespace util {

namespace error = drivesync::error;

namespace {

long capacityUnitExponent(QString const &name)
{
    static const QMap<QChar, long> multipliers = {
        {'k', 1}, {'m', 2}, {'g', 3}, {'t', 4}, {'p', 5}
        , {'e', 6}, {'z', 7}, {'y', 8} };
    QRegExp unit_re("^([kmgtpezy]?)i?b?$");
    auto suffix = name.toLower().trimmed();
    if (!unit_re.exactMatch(suffix))
        error::raise({{"msg", "Wrong bytes unit format"}, {"suffix", suffix}});

    if (suffix.isEmpty() || suffix == QChar('b'))
        return 0;

    auto exp = multipliers.value(suffix[0], -1);
    if (exp == -1)
        error::raise({{"msg", "Wrong bytes unit multiplier"}
                      , {"suffix", suffix}});
    return exp;
}

}

double parseBytes(QString const &s, QString const &unit, long multiplier)
{
    auto value = s.trimmed();
    QRegExp not_num_re("[^0-9.]");
    auto num_end = value.indexOf(not_num_re);
    double res;
    bool ok = false;
    if (num_end == -1) {
        res = value.toDouble(&ok);
    } else {
        res = value.left(num_end).toDouble(&ok);
        auto exp = capacityUnitExponent(value.mid(num_end));

        if (unit != "b" && unit != "B")
            exp -= capacityUnitExponent(unit);

        res = res * std::pow(multiplier, exp);
    }
    if (!ok)
        error::raise({{"msg", "Can't parse bytes"}, {"value", value}});
    return res;
}

QString tail(QStringList const &src, int count, QString const &sep)
{
    auto from = std::max(0, src.size() - count);
    return src.mid(from).join(sep);
}

}}
