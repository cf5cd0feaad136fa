// A queued copy/move request plus its run-time state.
#pragma once
#include "JobTypes.hpp"

#include <atomic>
#include <mutex>

namespace nmf {

class JobExecutor;
class JobManager;

// Request fields are immutable. Run-time fields are guarded by a per-job mutex
// and only changed by the manager and its worker; everyone else reads through
// snapshot().
class Job {
public:
    Job(quint64 id, JobType type, const QStringList &sources,
        const QString &destDir, qint64 enqueuedAtMs);

    Job(const Job &) = delete;
    Job &operator=(const Job &) = delete;

    quint64 id() const { return id_; }
    JobType type() const { return type_; }
    const QStringList &sources() const { return sources_; }
    const QString &destDir() const { return destDir_; }
    int totalItems() const { return totalItems_; }

    JobStatus status() const;
    JobSnapshot snapshot() const;

    // One-shot and idempotent; safe from any thread, never blocks.
    void requestCancel() { cancelRequested_.store(true); }
    bool cancelRequested() const { return cancelRequested_.load(); }

private:
    friend class JobExecutor;
    friend class JobManager;

    bool markRunning(qint64 nowMs);
    void beginItem(const QString &source, const QString &message);
    void setMessage(const QString &message);
    void setDoneItems(int done);
    void addFailure(const JobFailure &failure);
    // Moves the job to a terminal status. Returns false if already terminal.
    bool finish(JobStatus status, const QString &error, qint64 nowMs);

    const quint64 id_;
    const JobType type_;
    const QStringList sources_;
    const QString destDir_;
    const int totalItems_;

    mutable std::mutex mtx_;
    JobStatus status_ = JobStatus::Pending;
    int doneItems_ = 0;
    QString currentSource_;
    QString message_;
    QString error_;
    QVector<JobFailure> failures_;
    const qint64 enqueuedAtMs_;
    qint64 startedAtMs_ = 0;
    qint64 completedAtMs_ = 0;

    std::atomic<bool> cancelRequested_{false};
};

} // namespace nmf
