#include "Job.hpp"

#include <algorithm>

namespace nmf {

Job::Job(quint64 id, JobType type, const QStringList &sources,
         const QString &destDir, qint64 enqueuedAtMs)
    : id_(id), type_(type), sources_(sources), destDir_(destDir),
      totalItems_(static_cast<int>(sources.size())),
      enqueuedAtMs_(enqueuedAtMs) {}

JobStatus Job::status() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return status_;
}

JobSnapshot Job::snapshot() const {
    JobSnapshot s;
    s.id = id_;
    s.type = type_;
    s.sources = sources_;
    s.destDir = destDir_;
    s.totalItems = totalItems_;
    std::lock_guard<std::mutex> lk(mtx_);
    s.status = status_;
    s.doneItems = doneItems_;
    s.currentSource = currentSource_;
    s.message = message_;
    s.error = error_;
    s.failures = failures_;
    s.enqueuedAtMs = enqueuedAtMs_;
    s.startedAtMs = startedAtMs_;
    s.completedAtMs = completedAtMs_;
    return s;
}

bool Job::markRunning(qint64 nowMs) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (status_ != JobStatus::Pending)
        return false;
    status_ = JobStatus::Running;
    startedAtMs_ = nowMs;
    return true;
}

void Job::beginItem(const QString &source, const QString &message) {
    std::lock_guard<std::mutex> lk(mtx_);
    currentSource_ = source;
    message_ = message;
}

void Job::setMessage(const QString &message) {
    std::lock_guard<std::mutex> lk(mtx_);
    message_ = message;
}

void Job::setDoneItems(int done) {
    std::lock_guard<std::mutex> lk(mtx_);
    // Monotonic and bounded by the item count fixed at creation.
    doneItems_ = std::max(doneItems_, std::min(done, totalItems_));
}

void Job::addFailure(const JobFailure &failure) {
    std::lock_guard<std::mutex> lk(mtx_);
    failures_.push_back(failure);
}

bool Job::finish(JobStatus status, const QString &error, qint64 nowMs) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (isTerminal(status_) || !isTerminal(status))
        return false;
    status_ = status;
    error_ = error;
    completedAtMs_ = nowMs;
    return true;
}

} // namespace nmf
