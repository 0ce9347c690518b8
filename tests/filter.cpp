#include <drivesync/filter.hpp>
#include <drivesync/error.hpp>

#include "tests_common.hpp"
#include <tut/tut.hpp>

#include <functional>

namespace error = drivesync::error;
namespace filter = drivesync::filter;
using drivesync::SyncPolicy;

namespace tut
{

struct filter_test
{
    virtual ~filter_test()
    {
    }
};

typedef test_group<filter_test> tf;
typedef tf::object object;
tf drivesync_filter_test("filter");

enum test_ids {
    tid_full =  1,
    tid_include,
    tid_exclude,
    tid_normalize,
    tid_invalid,
    tid_escape,
    tid_duplicates
};

namespace {

QString reasonOf(std::function<void ()> fn)
{
    try {
        fn();
    } catch (error::Error const &e) {
        return error::reason(e);
    }
    return QString();
}

}

template<> template<>
void object::test<tid_full>()
{
    auto res = filter::build(SyncPolicy::full());
    ensure("Full sync has no rules", res.isEmpty());
    ensure_equals("No args", res.args(), QStringList());

    SyncPolicy policy;
    policy.includedPaths = QStringList({"Photos"});
    policy.excludedPaths = QStringList({"Music"});
    ensure("Paths are ignored in full mode", filter::build(policy).isEmpty());
}

template<> template<>
void object::test<tid_include>()
{
    auto res = filter::build(SyncPolicy::includeOnly({"Photos", "Docs/Work"}));
    ensure_equals("Rules count", res.size(), 3);
    ensure_equals("Args", res.args()
                  , QStringList({"--include=Photos/**", "--include=Docs/Work/**"
                                  , "--exclude=*"}));
    ensure("Catch-all is the last rule"
           , res.rules().last() == filter::Rule(filter::Rule::Exclude, "*"));
}

template<> template<>
void object::test<tid_exclude>()
{
    auto res = filter::build(SyncPolicy::excludeOnly({"Music", "Videos/Old"}));
    ensure_equals("Args", res.args()
                  , QStringList({"--exclude=Music/**", "--exclude=Videos/Old/**"}));
    for (auto const &rule : res.rules())
        ensure("Only exclude rules", rule.kind == filter::Rule::Exclude);
}

template<> template<>
void object::test<tid_normalize>()
{
    ensure_equals("Trailing slash", filter::normalizePath("Photos/"), QString("Photos"));
    ensure_equals("Leading dot", filter::normalizePath("./Photos/2020"), QString("Photos/2020"));
    ensure_equals("Spaces", filter::normalizePath("  My Files "), QString("My Files"));
    ensure_equals("Double slash", filter::normalizePath("a//b"), QString("a/b"));
}

template<> template<>
void object::test<tid_invalid>()
{
    ensure_equals("Empty include set"
                  , reasonOf([]() { filter::build(SyncPolicy::includeOnly({})); })
                  , QString("InvalidPolicy"));
    ensure_equals("Empty exclude set"
                  , reasonOf([]() { filter::build(SyncPolicy::excludeOnly({})); })
                  , QString("InvalidPolicy"));
    ensure_equals("Absolute path"
                  , reasonOf([]() { filter::build(SyncPolicy::includeOnly({"/etc"})); })
                  , QString("InvalidPolicy"));
    ensure_equals("Parent reference"
                  , reasonOf([]() { filter::build(SyncPolicy::excludeOnly({"a/../b"})); })
                  , QString("InvalidPolicy"));
    ensure_equals("Only blank paths"
                  , reasonOf([]() { filter::build(SyncPolicy::includeOnly({" ", "./"})); })
                  , QString("InvalidPolicy"));
}

template<> template<>
void object::test<tid_escape>()
{
    ensure_equals("Plain name is kept", filter::escape("Photos 2020"), QString("Photos 2020"));
    ensure_equals("Glob chars", filter::escape("a*b?[c]{d}")
                  , QString("a\\*b\\?\\[c\\]\\{d\\}"));
    auto res = filter::build(SyncPolicy::includeOnly({"Best [2019]"}));
    ensure_equals("Escaped include", res.args().first()
                  , QString("--include=Best \\[2019\\]/**"));
}

template<> template<>
void object::test<tid_duplicates>()
{
    auto res = filter::build(SyncPolicy::includeOnly({"B", "A", "B/", "./A", "C"}));
    ensure_equals("First occurrence wins", res.args()
                  , QStringList({"--include=B/**", "--include=A/**"
                                  , "--include=C/**", "--exclude=*"}));
    ensure("Same policy gives same rules"
           , res == filter::build(SyncPolicy::includeOnly({"B", "A", "C"})));
}

}
