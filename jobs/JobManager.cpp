// Queue implementation: a single worker thread pops jobs in FIFO order and
// hands them to JobExecutor; history keeps the most recent terminal jobs.
#include "JobManager.hpp"
#include "JobExecutor.hpp"
#include "JobFormat.hpp"
#include "JobLogging.hpp"

#include <QDateTime>

#include <algorithm>
#include <chrono>
#include <exception>

namespace nmf {

JobManager::JobManager(const JobManagerOptions &options, QObject *parent)
    : QObject(parent), opt_(options.normalized()) {
    if (opt_.debugLog)
        enableJobsDebugLogging(true);
    worker_ = std::thread(&JobManager::workerLoop, this);
    qCInfo(nmfJobs) << "job manager started"
                    << "historyMax=" << opt_.historyMax
                    << "bufferKiB=" << opt_.copyBufferKiB;
}

JobManager::~JobManager() { shutdown(); }

JobManager &JobManager::instance() {
    static JobManager manager(JobManagerOptions::load());
    return manager;
}

std::shared_ptr<Job> JobManager::enqueueCopy(const QStringList &sources,
                                             const QString &destDir) {
    return enqueue(JobType::Copy, sources, destDir);
}

std::shared_ptr<Job> JobManager::enqueueMove(const QStringList &sources,
                                             const QString &destDir) {
    return enqueue(JobType::Move, sources, destDir);
}

std::shared_ptr<Job> JobManager::enqueue(JobType type,
                                         const QStringList &sources,
                                         const QString &destDir) {
    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
    std::shared_ptr<Job> job;
    bool rejected = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        job = std::make_shared<Job>(nextJobId_++, type, sources, destDir, nowMs);
        if (closed_) {
            job->requestCancel();
            job->setMessage(QStringLiteral("Job manager is shut down"));
            job->finish(JobStatus::Canceled, QString(), nowMs);
            addHistoryLocked(job);
            rejected = true;
        } else {
            queue_.push_back(job);
        }
    }
    if (rejected) {
        qCWarning(nmfJobs) << "enqueue after shutdown; job canceled"
                           << "jobId=" << job->id();
    } else {
        qCInfo(nmfJobs) << "enqueue"
                        << "jobId=" << job->id()
                        << "type=" << jobTypeName(type)
                        << "items=" << sources.size() << "dest=" << destDir;
        workCv_.notify_one();
    }
    notify();
    return job;
}

CancelResult JobManager::cancel(quint64 id) {
    CancelResult result = CancelResult::NotFound;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto byId = [id](const std::shared_ptr<Job> &j) {
            return j->id() == id;
        };
        auto it = std::find_if(queue_.begin(), queue_.end(), byId);
        if (it != queue_.end()) {
            std::shared_ptr<Job> job = *it;
            queue_.erase(it);
            job->requestCancel();
            job->finish(JobStatus::Canceled, QString(),
                        QDateTime::currentMSecsSinceEpoch());
            addHistoryLocked(job);
            result = CancelResult::CanceledPending;
        } else if (current_ && current_->id() == id) {
            current_->requestCancel();
            result = CancelResult::CancelRequested;
        } else if (std::any_of(history_.begin(), history_.end(), byId)) {
            result = CancelResult::AlreadyFinished;
        }
    }
    qCInfo(nmfJobs) << "cancel requested"
                    << "jobId=" << id
                    << "result=" << cancelResultName(result);
    if (result == CancelResult::CanceledPending)
        idleCv_.notify_all();
    if (result == CancelResult::CanceledPending ||
        result == CancelResult::CancelRequested)
        notify();
    return result;
}

QVector<JobSnapshot> JobManager::list() const {
    std::lock_guard<std::mutex> lk(mtx_);
    QVector<JobSnapshot> out;
    out.reserve(static_cast<int>(queue_.size() + history_.size()) + 1);
    if (current_)
        out.push_back(current_->snapshot());
    for (const auto &j : queue_)
        out.push_back(j->snapshot());
    for (auto it = history_.rbegin(); it != history_.rend(); ++it)
        out.push_back((*it)->snapshot());
    return out;
}

std::optional<JobSnapshot> JobManager::find(quint64 id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (current_ && current_->id() == id)
        return current_->snapshot();
    for (const auto &j : queue_)
        if (j->id() == id)
            return j->snapshot();
    for (const auto &j : history_)
        if (j->id() == id)
            return j->snapshot();
    return std::nullopt;
}

quint64 JobManager::subscribe(Subscriber cb) {
    quint64 token = 0;
    std::size_t total = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        token = nextSubscriberId_++;
        subscribers_.emplace_back(token, std::move(cb));
        total = subscribers_.size();
    }
    qCDebug(nmfJobs) << "subscriber added" << "token=" << token
                     << "total=" << total;
    return token;
}

bool JobManager::unsubscribe(quint64 token) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                           [token](const std::pair<quint64, Subscriber> &s) {
                               return s.first == token;
                           });
    if (it == subscribers_.end())
        return false;
    subscribers_.erase(it);
    return true;
}

void JobManager::pauseQueue() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (paused_)
            return;
        paused_ = true;
    }
    qCInfo(nmfJobs) << "queue paused";
    notify();
}

void JobManager::resumeQueue() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!paused_)
            return;
        paused_ = false;
    }
    qCInfo(nmfJobs) << "queue resumed";
    workCv_.notify_one();
    notify();
}

bool JobManager::isQueuePaused() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return paused_;
}

bool JobManager::waitForIdle(int timeoutMs) {
    std::unique_lock<std::mutex> lk(mtx_);
    auto idle = [this]() { return idleLocked(); };
    if (timeoutMs < 0) {
        idleCv_.wait(lk, idle);
        return true;
    }
    return idleCv_.wait_for(lk, std::chrono::milliseconds(timeoutMs), idle);
}

void JobManager::clearHistory() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (history_.empty())
            return;
        history_.clear();
    }
    notify();
}

void JobManager::shutdown() {
    std::thread worker;
    int canceledPending = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!closed_) {
            closed_ = true;
            const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
            while (!queue_.empty()) {
                std::shared_ptr<Job> job = queue_.front();
                queue_.pop_front();
                job->requestCancel();
                job->finish(JobStatus::Canceled, QString(), nowMs);
                addHistoryLocked(job);
                ++canceledPending;
            }
            if (current_)
                current_->requestCancel();
        }
        // A subscriber running on the worker cannot join it; the worker exits
        // once the current job unwinds and a later shutdown() joins it.
        if (worker_.get_id() != std::this_thread::get_id())
            worker = std::move(worker_);
    }
    workCv_.notify_all();
    if (canceledPending > 0) {
        idleCv_.notify_all();
        notify();
    }
    if (!worker.joinable())
        return;
    worker.join();
    qCInfo(nmfJobs) << "job manager stopped"
                    << "canceledPending=" << canceledPending;
}

void JobManager::workerLoop() {
    TransferOptions transfer;
    transfer.chunkSize = opt_.copyBufferBytes();
    transfer.tempSuffix = opt_.tempSuffix.toStdString();
    JobExecutor executor(transfer, [this]() { notify(); });

    while (true) {
        std::shared_ptr<Job> job;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            workCv_.wait(lk, [this]() {
                return closed_ || (!paused_ && !queue_.empty());
            });
            if (closed_)
                break;
            job = queue_.front();
            queue_.pop_front();
            current_ = job;
            workerBusy_ = true;
            job->markRunning(QDateTime::currentMSecsSinceEpoch());
        }
        qCInfo(nmfJobs) << "start job"
                        << "jobId=" << job->id()
                        << "type=" << jobTypeName(job->type())
                        << "items=" << job->totalItems();
        notify();

        const JobOutcome outcome = executor.run(*job);

        {
            std::lock_guard<std::mutex> lk(mtx_);
            job->finish(outcome.status, outcome.error,
                        QDateTime::currentMSecsSinceEpoch());
            current_.reset();
            addHistoryLocked(job);
        }
        const JobSnapshot done = job->snapshot();
        if (outcome.status == JobStatus::Failed) {
            qCWarning(nmfJobs) << "job failed"
                               << "jobId=" << done.id
                               << "error=" << done.error;
        } else {
            qCInfo(nmfJobs) << "job finished"
                            << "jobId=" << done.id
                            << "status=" << jobStatusName(done.status)
                            << "done=" << done.doneItems << "/"
                            << done.totalItems;
        }
        notify();
        {
            std::lock_guard<std::mutex> lk(mtx_);
            workerBusy_ = false;
        }
        idleCv_.notify_all();
    }
    qCDebug(nmfJobs) << "worker exiting";
}

void JobManager::notify() {
    std::vector<std::pair<quint64, Subscriber>> subs;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        subs = subscribers_;
    }
    for (const auto &s : subs) {
        if (!s.second)
            continue;
        try {
            s.second();
        } catch (const std::exception &e) {
            qCWarning(nmfJobs) << "subscriber callback threw"
                               << "token=" << s.first << "what=" << e.what();
        } catch (...) {
            qCWarning(nmfJobs) << "subscriber callback threw a non-standard exception"
                               << "token=" << s.first;
        }
    }
    try {
        emit jobsChanged();
    } catch (const std::exception &e) {
        qCWarning(nmfJobs) << "jobsChanged receiver threw" << "what=" << e.what();
    } catch (...) {
        qCWarning(nmfJobs) << "jobsChanged receiver threw a non-standard exception";
    }
}

void JobManager::addHistoryLocked(std::shared_ptr<Job> job) {
    history_.push_back(std::move(job));
    while (static_cast<int>(history_.size()) > opt_.historyMax)
        history_.pop_front();
}

bool JobManager::idleLocked() const {
    return queue_.empty() && !current_ && !workerBusy_;
}

} // namespace nmf
