// Value types shared between the job worker and its observers.
// Snapshots are plain copies so they can cross threads freely.
#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

namespace nmf {

enum class JobType { Copy, Move };

// Pending -> Running -> {Completed | Failed | Canceled}.
// A pending job may also go straight to Canceled.
enum class JobStatus { Pending, Running, Completed, Failed, Canceled };

inline bool isTerminal(JobStatus s) {
    return s == JobStatus::Completed || s == JobStatus::Failed ||
           s == JobStatus::Canceled;
}

struct JobFailure {
    QString topSource; // top-level source being processed
    QString path;      // specific path that failed (may be a child)
    QString error;
};

struct JobSnapshot {
    quint64 id = 0;
    JobType type = JobType::Copy;
    JobStatus status = JobStatus::Pending;
    QStringList sources;
    QString destDir;
    int totalItems = 0;
    int doneItems = 0;
    QString currentSource;
    QString message;
    QString error;
    QVector<JobFailure> failures;
    qint64 enqueuedAtMs = 0;
    qint64 startedAtMs = 0;   // 0 until the job starts running
    qint64 completedAtMs = 0; // 0 until the job reaches a terminal status

    bool isTerminal() const { return nmf::isTerminal(status); }
};

// Outcome of running one job on the worker.
struct JobOutcome {
    JobStatus status = JobStatus::Completed;
    QString error;
};

enum class CancelResult {
    CanceledPending, // removed from the queue and recorded as canceled
    CancelRequested, // running job signaled; worker finishes the transition
    AlreadyFinished, // job is in history; nothing to do
    NotFound
};

} // namespace nmf
