#include <drivesync/debug.hpp>

#include "tests_common.hpp"
#include <tut/tut.hpp>

namespace debug = drivesync::debug;
using debug::Level;

namespace tut
{

struct debug_test
{
    virtual ~debug_test()
    {
    }
};

typedef test_group<debug_test> tf;
typedef tf::object object;
tf drivesync_debug_test("debug");

enum test_ids {
    tid_level_names =  1,
    tid_level_numbers,
    tid_tracing_level
};

template<> template<>
void object::test<tid_level_names>()
{
    ensure_equals("Debug", debug::parseLevel("debug"), static_cast<int>(Level::Debug));
    ensure_equals("Case", debug::parseLevel(" Warning "), static_cast<int>(Level::Warning));
    ensure_equals("Off", debug::parseLevel("off"), 0);
    ensure_equals("Empty", debug::parseLevel(""), static_cast<int>(Level::Critical));
    ensure_equals("Unknown", debug::parseLevel("verbose"), static_cast<int>(Level::Critical));
}

template<> template<>
void object::test<tid_level_numbers>()
{
    ensure_equals("Number", debug::parseLevel("2"), static_cast<int>(Level::Info));
    ensure_equals("Zero", debug::parseLevel("0"), 0);
    ensure_equals("Too big", debug::parseLevel("42"), static_cast<int>(Level::Critical));
    ensure_equals("Negative", debug::parseLevel("-1"), static_cast<int>(Level::Critical));
}

template<> template<>
void object::test<tid_tracing_level>()
{
    auto saved = Level::Error;
    for (auto l : {Level::Debug, Level::Info, Level::Warning, Level::Error, Level::Critical}) {
        if (debug::is_tracing_level(l)) {
            saved = l;
            break;
        }
    }
    debug::level(Level::Warning);
    ensure("Info is skipped", !debug::is_tracing_level(Level::Info));
    ensure("Warning is traced", debug::is_tracing_level(Level::Warning));
    ensure("Error is traced", debug::is_tracing_level(Level::Error));
    debug::level(saved);
}

}
