/**
 * @file progress.cpp
 * @brief Sync events and the parser of the tool progress output
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <drivesync/progress.hpp>
#include <drivesync/util.hpp>
#include <drivesync/error.hpp>
#include <drivesync/debug.hpp>

#include <QRegExp>

#include <array>
#include <algorithm>
#include <limits>

namespace drivesync {

namespace {

const std::array<char const *, ProgressEvent::TypesEnd> type_names = {{
        "started", "estimated", "confirmation_required", "progress"
        , "warning", "paused", "resumed", "completed", "failed"
        , "cancelled"
    }};

}

QString typeName(ProgressEvent::Type t)
{
    return type_names.at(static_cast<size_t>(t));
}

ProgressEvent ProgressEvent::progress(qint64 bytesDone, qint64 bytesTotal
                                      , qint64 filesDone, qint64 filesTotal
                                      , QString const &currentFile)
{
    ProgressEvent res(Progress);
    res.bytesDone = bytesDone;
    res.bytesTotal = bytesTotal;
    res.filesDone = filesDone;
    res.filesTotal = filesTotal;
    res.currentFile = currentFile;
    return res;
}

ProgressEvent ProgressEvent::estimated(Type t, qint64 bytesTotal, qint64 filesTotal)
{
    ProgressEvent res(t);
    res.bytesTotal = bytesTotal;
    res.filesTotal = filesTotal;
    return res;
}

ProgressEvent ProgressEvent::warning(QString const &path, QString const &message)
{
    ProgressEvent res(Warning);
    res.path = path;
    res.message = message;
    return res;
}

ProgressEvent ProgressEvent::completed(QString const &summary)
{
    ProgressEvent res(Completed);
    res.message = summary;
    return res;
}

ProgressEvent ProgressEvent::failed(QString const &reason)
{
    ProgressEvent res(Failed);
    res.message = reason;
    return res;
}

QVariantMap ProgressEvent::data() const
{
    QVariantMap res = {{"type", typeName(type)}};
    switch (type) {
    case Progress:
        res["bytes_done"] = bytesDone;
        res["bytes_total"] = bytesTotal;
        res["files_done"] = filesDone;
        res["files_total"] = filesTotal;
        res["current_file"] = currentFile;
        res["simulated"] = simulated;
        break;
    case Estimated:
    case ConfirmationRequired:
        res["bytes_total"] = bytesTotal;
        res["files_total"] = filesTotal;
        break;
    case Warning:
        res["path"] = path;
        res["message"] = message;
        break;
    case Completed:
        res["summary"] = message;
        break;
    case Failed:
        res["reason"] = message;
        break;
    default:
        break;
    }
    return res;
}

QDebug operator << (QDebug d, ProgressEvent const &v)
{
    d << v.data();
    return d;
}

namespace progress {

using debug::Level;

template <typename ... Args>
void trace(Level l, Args &&...args)
{
    debug::print_ge(l, "Sync.progress:", std::forward<Args>(args)...);
}

namespace {

qint64 bytes(QString const &s)
{
    auto v = util::parseBytes(s);
    // 2^63 is the first double out of qint64 range
    if (!(v >= 0 && v < static_cast<double>(std::numeric_limits<qint64>::max())))
        error::raise({{"reason", "Parse"}, {"msg", "Byte count out of range"}
                , {"value", s}});
    return static_cast<qint64>(v);
}

}

Parser::Parser()
{
    reset();
}

void Parser::reset()
{
    bytes_done_ = 0;
    bytes_total_ = 0;
    files_done_ = 0;
    files_total_ = 0;
    current_file_.clear();
}

ProgressEvent Parser::current() const
{
    return ProgressEvent::progress(bytes_done_, bytes_total_
                                   , files_done_, files_total_
                                   , current_file_);
}

bool Parser::parse(QString const &line, ProgressEvent &event)
{
    try {
        return parseLine(line, event);
    } catch (error::Error const &e) {
        trace(Level::Debug, "Unparsed", line, e.m);
    } catch (std::exception const &e) {
        trace(Level::Debug, "Unparsed", line, e.what());
    }
    return false;
}

bool Parser::parseLine(QString const &src, ProgressEvent &event)
{
    auto line = src.trimmed();
    if (line.isEmpty())
        return false;

    QRegExp log_re("^\\d{4}/\\d{2}/\\d{2} \\d{2}:\\d{2}:\\d{2}(\\.\\d+)?"
                   "\\s+([A-Z]+)\\s*:\\s*(.*)$");
    if (log_re.exactMatch(line))
        return parseMessage(log_re.cap(2), log_re.cap(3).trimmed(), event);

    return parseStats(line, event);
}

bool Parser::parseMessage(QString const &level, QString const &text
                          , ProgressEvent &event)
{
    if (text.isEmpty())
        return false;

    if (level == "ERROR" || level == "CRITICAL") {
        QRegExp path_re("^([^:]+): (.+)$");
        if (path_re.exactMatch(text))
            event = ProgressEvent::warning(path_re.cap(1), path_re.cap(2));
        else
            event = ProgressEvent::warning(QString(), text);
        return true;
    }

    QRegExp copied_re("^(.+): (Multi-thread )?Copied \\(.*\\)$");
    if (copied_re.exactMatch(text)) {
        current_file_ = copied_re.cap(1);
        ++files_done_;
        files_total_ = std::max(files_total_, files_done_);
        event = current();
        return true;
    }

    QRegExp dry_run_re("^(.+): Skipped copy as --dry-run is set"
                       "( \\(size ([^)]+)\\))?$");
    if (dry_run_re.exactMatch(text)) {
        auto size = dry_run_re.cap(3);
        auto added = size.isEmpty() ? 0 : bytes(size);
        if (added > std::numeric_limits<qint64>::max() - bytes_done_)
            error::raise({{"reason", "Parse"}, {"msg", "Byte count overflow"}
                    , {"value", size}});
        current_file_ = dry_run_re.cap(1);
        ++files_done_;
        bytes_done_ += added;
        files_total_ = std::max(files_total_, files_done_);
        bytes_total_ = std::max(bytes_total_, bytes_done_);
        event = current();
        return true;
    }

    if (text.startsWith("There was nothing to transfer")) {
        event = ProgressEvent::completed(text);
        return true;
    }

    // one-line stats are printed with the log prefix
    return parseStats(text, event);
}

bool Parser::parseStats(QString const &text, ProgressEvent &event)
{
    QRegExp files_re("^Transferred:\\s+(\\d+)\\s*/\\s*(\\d+),\\s*(\\d+%|-)$");
    if (files_re.exactMatch(text)) {
        files_done_ = files_re.cap(1).toLongLong();
        files_total_ = files_re.cap(2).toLongLong();
        event = current();
        return true;
    }

    QRegExp bytes_re("^(Transferred:\\s+)?"
                     "([0-9.]+\\s*[kKMGTPEZY]?i?B(ytes)?)\\s*/\\s*"
                     "([0-9.]+\\s*[kKMGTPEZY]?i?B(ytes)?),\\s*(\\d+%|-).*$");
    if (bytes_re.exactMatch(text)) {
        auto unit_fix = [](QString v) {
            return v.replace("Bytes", "B");
        };
        auto done = bytes(unit_fix(bytes_re.cap(2)));
        auto total = bytes(unit_fix(bytes_re.cap(4)));
        bytes_done_ = done;
        bytes_total_ = total;
        event = current();
        return true;
    }

    QRegExp summary_re("^Elapsed time:\\s+(.+)$");
    if (summary_re.exactMatch(text)) {
        event = ProgressEvent::completed
            (QString("%1 files, %2 bytes transferred in %3")
             .arg(files_done_).arg(bytes_done_).arg(summary_re.cap(1)));
        return true;
    }
    return false;
}

}}
