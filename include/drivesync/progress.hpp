#ifndef _DRIVESYNC_PROGRESS_HPP_
#define _DRIVESYNC_PROGRESS_HPP_
/**
 * @file progress.hpp
 * @brief Sync events and the parser of the tool progress output
 * @copyright (C) 2026 drivesync contributors
 * @par License: LGPL 2.1 http://www.gnu.org/licenses/old-licenses/lgpl-2.1.html
 */

#include <QString>
#include <QVariantMap>
#include <QDebug>

namespace drivesync {

/**
 * Event reported for a sync run. Only the fields relevant to the type
 * are set. Completed, Failed and Cancelled are terminal: exactly one of
 * them ends each run.
 */
struct ProgressEvent
{
    enum Type {
        Started
        , Estimated
        , ConfirmationRequired
        , Progress
        , Warning
        , Paused
        , Resumed
        , Completed
        , Failed
        , Cancelled
        , TypesEnd
    };

    explicit ProgressEvent(Type t = Started)
        : type(t)
        , bytesDone(0)
        , bytesTotal(0)
        , filesDone(0)
        , filesTotal(0)
        , simulated(false)
    {}

    static ProgressEvent progress(qint64 bytesDone, qint64 bytesTotal
                                  , qint64 filesDone, qint64 filesTotal
                                  , QString const &currentFile);
    static ProgressEvent estimated(Type, qint64 bytesTotal, qint64 filesTotal);
    static ProgressEvent warning(QString const &path, QString const &message);
    static ProgressEvent completed(QString const &summary);
    static ProgressEvent failed(QString const &reason);

    inline bool isTerminal() const
    {
        return type == Completed || type == Failed || type == Cancelled;
    }

    /// Map with "type" and the relevant fields, e.g. to pass to QML
    QVariantMap data() const;

    Type type;
    qint64 bytesDone;
    qint64 bytesTotal;
    qint64 filesDone;
    qint64 filesTotal;
    QString currentFile;
    QString path;
    /// Warning message, Completed summary or Failed reason
    QString message;
    /// Set for Progress produced by a dry run
    bool simulated;
};

QString typeName(ProgressEvent::Type);
QDebug operator << (QDebug, ProgressEvent const &);

namespace progress {

/**
 * Incremental parser of the tool log output. The format is not a
 * contract, so any line which is not recognized produces no event.
 * Running totals are kept to fill in counters the tool reports only
 * per file.
 */
class Parser
{
public:
    Parser();

    /// Returns true and fills the event if the line is recognized
    bool parse(QString const &line, ProgressEvent &event);

    void reset();

    inline qint64 bytesDone() const { return bytes_done_; }
    inline qint64 bytesTotal() const { return bytes_total_; }
    inline qint64 filesDone() const { return files_done_; }
    inline qint64 filesTotal() const { return files_total_; }

private:
    bool parseLine(QString const &, ProgressEvent &);
    bool parseMessage(QString const &level, QString const &, ProgressEvent &);
    bool parseStats(QString const &, ProgressEvent &);
    ProgressEvent current() const;

    qint64 bytes_done_;
    qint64 bytes_total_;
    qint64 files_done_;
    qint64 files_total_;
    QString current_file_;
};

}}

#endif // _DRIVESYNC_PROGRESS_HPP_
