#include <drivesync/progress.hpp>

#include "tests_common.hpp"
#include <tut/tut.hpp>

using drivesync::ProgressEvent;
namespace progress = drivesync::progress;

namespace tut
{

struct progress_test
{
    virtual ~progress_test()
    {
    }
};

typedef test_group<progress_test> tf;
typedef tf::object object;
tf drivesync_progress_test("progress");

enum test_ids {
    tid_bytes =  1,
    tid_one_line,
    tid_files,
    tid_copied,
    tid_dry_run,
    tid_error,
    tid_summary,
    tid_ignored,
    tid_event_data,
    tid_out_of_range
};

namespace {

const qint64 mib = 1024 * 1024;

}

template<> template<>
void object::test<tid_bytes>()
{
    progress::Parser parser;
    ProgressEvent ev;
    ensure("Stats bytes line"
           , parser.parse("Transferred:   \t    1.500 MiB / 10.000 MiB, 15%"
                          ", 512.000 KiB/s, ETA 17s", ev));
    ensure_equals("Type", ev.type, ProgressEvent::Progress);
    ensure_equals("Done", ev.bytesDone, static_cast<qint64>(1.5 * mib));
    ensure_equals("Total", ev.bytesTotal, 10 * mib);
    ensure("Not simulated", !ev.simulated);

    ensure("Nothing transferred yet"
           , parser.parse("Transferred:   0 B / 0 B, -, 0 B/s, ETA -", ev));
    ensure_equals("Zero done", ev.bytesDone, 0);
}

template<> template<>
void object::test<tid_one_line>()
{
    progress::Parser parser;
    ProgressEvent ev;
    ensure("One-line stats with log prefix"
           , parser.parse("2024/01/02 10:00:00 INFO  : 2 MiB / 8 MiB, 25%"
                          ", 1 MiB/s, ETA 6s", ev));
    ensure_equals("Done", ev.bytesDone, 2 * mib);
    ensure_equals("Total", ev.bytesTotal, 8 * mib);
    ensure_equals("Running total", parser.bytesDone(), 2 * mib);
}

template<> template<>
void object::test<tid_files>()
{
    progress::Parser parser;
    ProgressEvent ev;
    ensure("Files line", parser.parse("Transferred:            3 / 10, 30%", ev));
    ensure_equals("Type", ev.type, ProgressEvent::Progress);
    ensure_equals("Files done", ev.filesDone, 3);
    ensure_equals("Files total", ev.filesTotal, 10);
    ensure_equals("Bytes are not touched", ev.bytesDone, 0);
}

template<> template<>
void object::test<tid_copied>()
{
    progress::Parser parser;
    ProgressEvent ev;
    ensure("First copied", parser.parse
           ("2024/01/02 10:00:01 INFO  : Photos/a.jpg: Copied (new)", ev));
    ensure_equals("Current file", ev.currentFile, QString("Photos/a.jpg"));
    ensure_equals("Files done", ev.filesDone, 1);
    ensure("Second copied", parser.parse
           ("2024/01/02 10:00:02 INFO  : Photos/b c.jpg: Copied (replaced existing)"
            , ev));
    ensure_equals("Current file 2", ev.currentFile, QString("Photos/b c.jpg"));
    ensure_equals("Files done 2", ev.filesDone, 2);

    parser.reset();
    ensure_equals("Reset", parser.filesDone(), 0);
}

template<> template<>
void object::test<tid_dry_run>()
{
    progress::Parser parser;
    ProgressEvent ev;
    ensure("Dry run notice", parser.parse
           ("2024/01/02 10:00:01 NOTICE: Photos/a.jpg: Skipped copy as"
            " --dry-run is set (size 2Mi)", ev));
    ensure_equals("Type", ev.type, ProgressEvent::Progress);
    ensure_equals("File", ev.currentFile, QString("Photos/a.jpg"));
    ensure_equals("Files", ev.filesDone, 1);
    ensure_equals("Bytes", ev.bytesDone, 2 * mib);
    ensure("Second notice", parser.parse
           ("2024/01/02 10:00:01 NOTICE: b.txt: Skipped copy as"
            " --dry-run is set (size 1Ki)", ev));
    ensure_equals("Bytes accumulated", ev.bytesDone, 2 * mib + 1024);
    ensure_equals("Files accumulated", ev.filesDone, 2);
}

template<> template<>
void object::test<tid_error>()
{
    progress::Parser parser;
    ProgressEvent ev;
    ensure("Error line", parser.parse
           ("2024/01/02 10:00:02 ERROR : Docs/x.pdf: Failed to copy: permission denied"
            , ev));
    ensure_equals("Type", ev.type, ProgressEvent::Warning);
    ensure_equals("Path", ev.path, QString("Docs/x.pdf"));
    ensure_equals("Message", ev.message, QString("Failed to copy: permission denied"));

    ensure("Error without path", parser.parse
           ("2024/01/02 10:00:02 ERROR : Attempt 1/3 failed with 1 errors", ev));
    ensure_equals("Type 2", ev.type, ProgressEvent::Warning);
}

template<> template<>
void object::test<tid_summary>()
{
    progress::Parser parser;
    ProgressEvent ev;
    ensure("Elapsed", parser.parse("Elapsed time:        12.3s", ev));
    ensure_equals("Type", ev.type, ProgressEvent::Completed);
    ensure("Summary is set", !ev.message.isEmpty());
    ensure("Completed is terminal", ev.isTerminal());

    ensure("Nothing to transfer", parser.parse
           ("2024/01/02 10:00:00 NOTICE: There was nothing to transfer", ev));
    ensure_equals("Type 2", ev.type, ProgressEvent::Completed);
}

template<> template<>
void object::test<tid_ignored>()
{
    progress::Parser parser;
    ProgressEvent ev;
    ensure("Empty", !parser.parse("", ev));
    ensure("Junk", !parser.parse("hello world", ev));
    ensure("Checks line", !parser.parse("Checks:                10 / 10, 100%", ev));
    ensure("Debug line", !parser.parse
           ("2024/01/02 10:00:00 DEBUG : rclone: Version \"v1.65.2\" starting", ev));
    ensure("Malformed size", !parser.parse
           ("Transferred:   1.2.3 MiB / 10 MiB, 15%", ev));
    ensure_equals("Counters are not changed", parser.bytesDone(), 0);
}

template<> template<>
void object::test<tid_event_data>()
{
    auto ev = ProgressEvent::progress(10, 100, 1, 5, "a.txt");
    auto data = ev.data();
    ensure_equals("Type name", data["type"].toString(), QString("progress"));
    ensure_equals("Bytes", data["bytes_done"].toLongLong(), 10);
    ensure_equals("File", data["current_file"].toString(), QString("a.txt"));

    auto failed = ProgressEvent::failed("exit code 1").data();
    ensure_equals("Failed reason", failed["reason"].toString(), QString("exit code 1"));
    ensure("Warning is not terminal", !ProgressEvent::warning("a", "b").isTerminal());
}

template<> template<>
void object::test<tid_out_of_range>()
{
    progress::Parser parser;
    ProgressEvent ev;
    ensure("Stats", parser.parse("Transferred:   1 KiB / 2 KiB, 50%", ev));
    ensure("Files", parser.parse("Transferred:   3 / 7, 42%", ev));

    ensure("Huge done", !parser.parse
           ("Transferred:   99999999999999999999999 B / 1 B, 1%", ev));
    ensure("Huge total", !parser.parse
           ("Transferred:   1 B / 99999999999999999999999 B, 1%", ev));
    ensure("Huge unit", !parser.parse
           ("Transferred:   1 B / 100000 YiB, 1%", ev));
    ensure_equals("Done is kept", parser.bytesDone(), 1024);
    ensure_equals("Total is kept", parser.bytesTotal(), 2048);
    ensure_equals("Files are kept", parser.filesDone(), 3);
    ensure_equals("Files total is kept", parser.filesTotal(), 7);

    ensure("Huge dry run size", !parser.parse
           ("2024/01/02 10:00:00 NOTICE: a.bin: Skipped copy as --dry-run"
            " is set (size 100000 YiB)", ev));
    ensure_equals("File is not counted", parser.filesDone(), 3);
}

}
