// Background copy/move queue: one worker thread runs jobs strictly in FIFO
// order while callers enqueue, cancel, list and subscribe without blocking.
#pragma once
#include "Job.hpp"
#include "JobManagerOptions.hpp"
#include "JobTypes.hpp"

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace nmf {

class JobManager : public QObject {
    Q_OBJECT
public:
    using Subscriber = std::function<void()>;

    // Starts the worker thread immediately.
    explicit JobManager(const JobManagerOptions &options = JobManagerOptions(),
                        QObject *parent = nullptr);
    ~JobManager() override;

    JobManager(const JobManager &) = delete;
    JobManager &operator=(const JobManager &) = delete;

    // Process-wide queue shared by every view, built on first use with
    // JobManagerOptions::load(). Prefer passing the instance to consumers.
    static JobManager &instance();

    // Paths are not validated here; problems surface when the job runs.
    std::shared_ptr<Job> enqueueCopy(const QStringList &sources,
                                     const QString &destDir);
    std::shared_ptr<Job> enqueueMove(const QStringList &sources,
                                     const QString &destDir);

    CancelResult cancel(quint64 id);

    // Current job first, then pending in queue order, then history newest first.
    QVector<JobSnapshot> list() const;
    std::optional<JobSnapshot> find(quint64 id) const;

    // Callbacks run after every state change, outside the manager lock, on
    // whichever thread made the change. They must not block.
    quint64 subscribe(Subscriber cb);
    bool unsubscribe(quint64 token);

    // While paused the worker starts no new job; the running one continues.
    void pauseQueue();
    void resumeQueue();
    bool isQueuePaused() const;

    // Waits until nothing is pending or running and the worker has delivered
    // its last notification. timeoutMs < 0 waits forever. Never call it from
    // a subscriber.
    bool waitForIdle(int timeoutMs = -1);

    void clearHistory();

    // Cancels pending work, signals the running job and joins the worker.
    void shutdown();

    const JobManagerOptions &options() const { return opt_; }

signals:
    // Emitted after subscriber callbacks, from the same thread.
    void jobsChanged();

private:
    std::shared_ptr<Job> enqueue(JobType type, const QStringList &sources,
                                 const QString &destDir);
    void workerLoop();
    void notify();
    void addHistoryLocked(std::shared_ptr<Job> job);
    bool idleLocked() const;

    const JobManagerOptions opt_;

    mutable std::mutex mtx_; // protects everything below
    std::condition_variable workCv_;
    std::condition_variable idleCv_;
    std::deque<std::shared_ptr<Job>> queue_;
    std::shared_ptr<Job> current_;
    std::deque<std::shared_ptr<Job>> history_; // oldest first
    std::vector<std::pair<quint64, Subscriber>> subscribers_;
    quint64 nextJobId_ = 1;
    quint64 nextSubscriberId_ = 1;
    bool workerBusy_ = false; // set from pop until the final notify
    bool paused_ = false;
    bool closed_ = false;

    std::thread worker_;
};

} // namespace nmf
