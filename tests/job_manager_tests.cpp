// Job queue tests without external framework (run via CTest).
#include "JobManager.hpp"

#include <QCoreApplication>
#include <QObject>
#include <QStringList>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr int kIdleTimeoutMs = 10000;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const QString &haystack, const QString &needle,
                       const std::string &msg) {
        check(haystack.contains(needle), msg);
    }
};

struct TempDir {
    fs::path path;

    explicit TempDir(const std::string &tag) {
        const auto now =
            std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() /
               ("nmf-jobs-" + tag + "-" +
                std::to_string(static_cast<long long>(::getpid())) + "-" +
                std::to_string(static_cast<long long>(now)));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    QString q(const std::string &rel = {}) const {
        return QString::fromStdString(rel.empty() ? path.string()
                                                  : (path / rel).string());
    }
};

bool writeFile(const fs::path &p, const std::string &content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        return false;
    out << content;
    return static_cast<bool>(out);
}

std::string contentOf(const fs::path &p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

QStringList qpaths(std::initializer_list<fs::path> paths) {
    QStringList out;
    for (const auto &p : paths)
        out << QString::fromStdString(p.string());
    return out;
}

std::vector<quint64> idsOf(const QVector<nmf::JobSnapshot> &jobs) {
    std::vector<quint64> out;
    for (const auto &j : jobs)
        out.push_back(j.id);
    return out;
}

nmf::JobManagerOptions testOptions() {
    nmf::JobManagerOptions opt;
    opt.copyBufferKiB = 4;
    return opt;
}

void test_copy_single_file(TestContext &t) {
    TempDir tmp("copy");
    t.check(writeFile(tmp.path / "a.txt", "hello"), "fixture: a.txt");
    fs::create_directories(tmp.path / "dst");

    nmf::JobManager mgr(testOptions());
    auto job = mgr.enqueueCopy(qpaths({tmp.path / "a.txt"}), tmp.q("dst"));
    t.check(job && job->id() > 0, "enqueue should return a job with an id");
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "copy job should finish");

    const auto snap = mgr.find(job->id());
    t.check(snap.has_value(), "finished job should stay in history");
    if (!snap)
        return;
    t.check(snap->status == nmf::JobStatus::Completed, "copy should complete");
    t.check(snap->totalItems == 1 && snap->doneItems == 1,
            "progress should read 1/1");
    t.check(snap->error.isEmpty() && snap->failures.isEmpty(),
            "completed job carries no error");
    t.check(snap->enqueuedAtMs > 0 && snap->startedAtMs >= snap->enqueuedAtMs &&
                snap->completedAtMs >= snap->startedAtMs,
            "timestamps should be ordered");
    t.check(contentOf(tmp.path / "dst" / "a.txt") == "hello",
            "destination should hold the copied bytes");
    t.check(fs::exists(tmp.path / "a.txt"), "copy keeps the source");
}

void test_move_directory(TestContext &t) {
    TempDir tmp("move");
    fs::create_directories(tmp.path / "dir" / "sub");
    t.check(writeFile(tmp.path / "dir" / "file.txt", "x"), "fixture: file");
    t.check(writeFile(tmp.path / "dir" / "sub" / "n.txt", "n"), "fixture: n");
    fs::create_directories(tmp.path / "b");

    nmf::JobManager mgr(testOptions());
    auto job = mgr.enqueueMove(qpaths({tmp.path / "dir"}), tmp.q("b"));
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "move job should finish");
    t.check(job->status() == nmf::JobStatus::Completed, "move should complete");
    t.check(!fs::exists(tmp.path / "dir"), "moved directory should be gone");
    t.check(contentOf(tmp.path / "b" / "dir" / "file.txt") == "x" &&
                contentOf(tmp.path / "b" / "dir" / "sub" / "n.txt") == "n",
            "tree should appear under the destination");
}

void test_fifo_order_and_pause(TestContext &t) {
    TempDir tmp("fifo-order");
    fs::create_directories(tmp.path / "dst");

    nmf::JobManager mgr(testOptions());
    std::mutex mtx;
    std::vector<quint64> started;
    mgr.subscribe([&]() {
        const auto jobs = mgr.list();
        std::lock_guard<std::mutex> lk(mtx);
        for (const auto &j : jobs) {
            if (j.status != nmf::JobStatus::Running)
                continue;
            if (started.empty() || started.back() != j.id)
                started.push_back(j.id);
        }
    });

    mgr.pauseQueue();
    t.check(mgr.isQueuePaused(), "queue should report paused");
    std::vector<quint64> enqueued;
    for (int i = 0; i < 5; ++i) {
        const fs::path src = tmp.path / ("f" + std::to_string(i) + ".txt");
        t.check(writeFile(src, std::to_string(i)), "fixture: source file");
        enqueued.push_back(mgr.enqueueCopy(qpaths({src}), tmp.q("dst"))->id());
    }

    const auto pending = mgr.list();
    t.check(idsOf(pending) == enqueued,
            "paused queue should list pending jobs in enqueue order");
    bool allPending = true;
    for (const auto &j : pending)
        allPending = allPending && j.status == nmf::JobStatus::Pending;
    t.check(allPending, "no job should start while paused");

    mgr.resumeQueue();
    t.check(!mgr.isQueuePaused(), "queue should report resumed");
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "queued jobs should drain");

    {
        std::lock_guard<std::mutex> lk(mtx);
        t.check(started == enqueued, "jobs should start in FIFO order");
    }
    const std::vector<quint64> newestFirst(enqueued.rbegin(), enqueued.rend());
    t.check(idsOf(mgr.list()) == newestFirst,
            "history should list newest first");
}

void test_history_bound(TestContext &t) {
    TempDir tmp("history");
    t.check(writeFile(tmp.path / "h.txt", "h"), "fixture: h.txt");
    fs::create_directories(tmp.path / "dst");

    nmf::JobManagerOptions opt = testOptions();
    opt.historyMax = 3;
    nmf::JobManager mgr(opt);
    std::vector<quint64> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(
            mgr.enqueueCopy(qpaths({tmp.path / "h.txt"}), tmp.q("dst"))->id());
        t.check(mgr.waitForIdle(kIdleTimeoutMs), "history job should finish");
    }
    const auto jobs = mgr.list();
    t.check(jobs.size() == 3, "history should be capped at historyMax");
    t.check(idsOf(jobs) == std::vector<quint64>({ids[4], ids[3], ids[2]}),
            "oldest history entries should be dropped first");
    t.check(!mgr.find(ids[0]).has_value(), "evicted job should not be found");
}

void test_cancel_pending(TestContext &t) {
    TempDir tmp("cancel-pending");
    t.check(writeFile(tmp.path / "p.txt", "p"), "fixture: p.txt");
    fs::create_directories(tmp.path / "dst");

    nmf::JobManager mgr(testOptions());
    mgr.pauseQueue();
    auto job = mgr.enqueueCopy(qpaths({tmp.path / "p.txt"}), tmp.q("dst"));

    t.check(mgr.cancel(job->id()) == nmf::CancelResult::CanceledPending,
            "pending job should be canceled directly");
    const auto snap = job->snapshot();
    t.check(snap.status == nmf::JobStatus::Canceled,
            "canceled pending job should be terminal");
    t.check(snap.startedAtMs == 0, "canceled pending job never started");
    t.check(snap.completedAtMs > 0, "canceled pending job has a completion time");
    t.check(mgr.waitForIdle(kIdleTimeoutMs),
            "paused queue with nothing pending is idle");

    t.check(mgr.cancel(job->id()) == nmf::CancelResult::AlreadyFinished,
            "second cancel should report already finished");
    t.check(mgr.cancel(999999) == nmf::CancelResult::NotFound,
            "unknown id should report not found");

    mgr.resumeQueue();
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "resumed queue stays idle");
    t.check(!fs::exists(tmp.path / "dst" / "p.txt"),
            "canceled pending job must not touch the filesystem");
}

void test_cancel_running(TestContext &t) {
    TempDir tmp("cancel-running");
    const std::string payload(512 * 1024, 'r');
    t.check(writeFile(tmp.path / "big.bin", payload), "fixture: big.bin");
    t.check(writeFile(tmp.path / "second.txt", "2"), "fixture: second.txt");
    fs::create_directories(tmp.path / "dst");

    nmf::JobManager mgr(testOptions());
    std::atomic<bool> fired{false};
    std::atomic<int> cancelResult{-1};
    mgr.subscribe([&]() {
        for (const auto &j : mgr.list()) {
            if (j.status != nmf::JobStatus::Running || j.currentSource.isEmpty())
                continue;
            bool expected = false;
            if (fired.compare_exchange_strong(expected, true))
                cancelResult = static_cast<int>(mgr.cancel(j.id));
        }
    });

    auto job = mgr.enqueueCopy(
        qpaths({tmp.path / "big.bin", tmp.path / "second.txt"}), tmp.q("dst"));
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "canceled job should finish");

    t.check(cancelResult.load() ==
                static_cast<int>(nmf::CancelResult::CancelRequested),
            "running job cancel should be a request");
    const auto snap = job->snapshot();
    t.check(snap.status == nmf::JobStatus::Canceled,
            "running job should end canceled");
    t.check(snap.failures.isEmpty() && snap.error.isEmpty(),
            "cancellation is not a failure");
    t.check(snap.doneItems == 0, "no item should count as done");
    t.check(!fs::exists(tmp.path / "dst" / "big.bin") &&
                !fs::exists(tmp.path / "dst" / "big.bin.part"),
            "canceled copy leaves neither final nor temporary file");
    t.check(!fs::exists(tmp.path / "dst" / "second.txt"),
            "later sources should not run after cancellation");
}

void test_cancel_before_first_item(TestContext &t) {
    TempDir tmp("cancel-start");
    t.check(writeFile(tmp.path / "s.txt", "s"), "fixture: s.txt");
    fs::create_directories(tmp.path / "dst");

    nmf::JobManager mgr(testOptions());
    std::atomic<bool> fired{false};
    mgr.subscribe([&]() {
        for (const auto &j : mgr.list()) {
            if (j.status != nmf::JobStatus::Running || !j.currentSource.isEmpty())
                continue;
            bool expected = false;
            if (fired.compare_exchange_strong(expected, true))
                mgr.cancel(j.id);
        }
    });
    auto job = mgr.enqueueMove(qpaths({tmp.path / "s.txt"}), tmp.q("dst"));
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "job should finish");
    t.check(job->status() == nmf::JobStatus::Canceled,
            "cancel before the first item should cancel the job");
    t.check(fs::exists(tmp.path / "s.txt"), "source should be untouched");
}

void test_failure_stops_job(TestContext &t) {
    TempDir tmp("failure");
    t.check(writeFile(tmp.path / "ok.txt", "ok"), "fixture: ok.txt");
    fs::create_directories(tmp.path / "dst");
    const fs::path missing = tmp.path / "missing.txt";

    nmf::JobManager mgr(testOptions());
    auto bad = mgr.enqueueCopy(qpaths({missing, tmp.path / "ok.txt"}),
                               tmp.q("dst"));
    auto good = mgr.enqueueCopy(qpaths({tmp.path / "ok.txt"}), tmp.q("dst") + "/later");
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "both jobs should finish");

    const auto snap = bad->snapshot();
    t.check(snap.status == nmf::JobStatus::Failed, "missing source fails the job");
    t.check(snap.doneItems == 0, "failed item should not count as done");
    t.check(snap.failures.size() == 1, "one failure record expected");
    if (snap.failures.size() == 1) {
        const QString m = QString::fromStdString(missing.string());
        t.check(snap.failures.front().topSource == m,
                "failure should name the top-level source");
        t.check(snap.failures.front().path == m,
                "failure path should be the missing file");
        t.checkContains(snap.failures.front().error, m + ": ",
                        "failure error should be prefixed with the path");
    }
    t.checkContains(snap.error, QString::fromStdString(missing.string()),
                    "job error should mention the failing path");
    t.check(!fs::exists(tmp.path / "dst" / "ok.txt"),
            "sources after a failure should not run");
    t.check(good->status() == nmf::JobStatus::Completed,
            "a failed job should not stop the next one");
    t.check(contentOf(tmp.path / "dst" / "later" / "ok.txt") == "ok",
            "next job should copy its file");
}

void test_child_failure_path(TestContext &t) {
    TempDir tmp("child-failure");
    const fs::path dir = tmp.path / "tree";
    fs::create_directories(dir);
    t.check(writeFile(dir / "a.txt", "a"), "fixture: a.txt");
    const fs::path fifo = dir / "b.fifo";
    t.check(::mkfifo(fifo.c_str(), 0600) == 0, "fixture: fifo");
    fs::create_directories(tmp.path / "dst");

    nmf::JobManager mgr(testOptions());
    auto job = mgr.enqueueCopy(qpaths({dir}), tmp.q("dst"));
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "job should finish");
    const auto snap = job->snapshot();
    t.check(snap.status == nmf::JobStatus::Failed,
            "unsupported child should fail the job");
    t.check(snap.failures.size() == 1, "one failure record expected");
    if (snap.failures.size() == 1) {
        t.check(snap.failures.front().topSource ==
                    QString::fromStdString(dir.string()),
                "top source should be the directory");
        t.check(snap.failures.front().path ==
                    QString::fromStdString(fifo.string()),
                "failure path should be the child");
    }
}

void test_notifications_and_unsubscribe(TestContext &t) {
    TempDir tmp("notify");
    t.check(writeFile(tmp.path / "1.txt", "1"), "fixture: 1.txt");
    t.check(writeFile(tmp.path / "2.txt", "2"), "fixture: 2.txt");
    fs::create_directories(tmp.path / "dst");

    nmf::JobManager mgr(testOptions());
    std::atomic<int> calls{0};
    std::atomic<int> emitted{0};
    const quint64 token = mgr.subscribe([&calls]() { ++calls; });
    QObject::connect(&mgr, &nmf::JobManager::jobsChanged,
                     [&emitted]() { ++emitted; });

    mgr.enqueueCopy(qpaths({tmp.path / "1.txt", tmp.path / "2.txt"}),
                    tmp.q("dst"));
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "job should finish");
    // enqueue, start, two per item, finish
    t.check(calls.load() >= 7, "subscriber should see every transition");
    t.check(emitted.load() == calls.load(),
            "jobsChanged should accompany every notification");

    t.check(mgr.unsubscribe(token), "unsubscribe should find the token");
    t.check(!mgr.unsubscribe(token), "second unsubscribe should fail");
    const int before = calls.load();
    mgr.enqueueCopy(qpaths({tmp.path / "1.txt"}), tmp.q("dst"));
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "second job should finish");
    t.check(calls.load() == before, "removed subscriber must not be called");
}

void test_throwing_subscriber(TestContext &t) {
    TempDir tmp("throwing");
    t.check(writeFile(tmp.path / "x.txt", "x"), "fixture: x.txt");

    nmf::JobManager mgr(testOptions());
    std::atomic<int> after{0};
    mgr.subscribe([]() { throw std::runtime_error("subscriber failure"); });
    mgr.subscribe([]() { throw 42; });
    mgr.subscribe([&after]() { ++after; });

    auto job = mgr.enqueueCopy(qpaths({tmp.path / "x.txt"}), tmp.q("dst"));
    t.check(mgr.waitForIdle(kIdleTimeoutMs),
            "worker should survive a throwing subscriber");
    t.check(job->status() == nmf::JobStatus::Completed,
            "job should complete despite the throwing subscriber");
    t.check(after.load() > 0, "later subscribers should still be called");
}

void test_list_order_while_running(TestContext &t) {
    TempDir tmp("list-order");
    t.check(writeFile(tmp.path / "l.txt", "l"), "fixture: l.txt");
    fs::create_directories(tmp.path / "dst");

    nmf::JobManager mgr(testOptions());
    const quint64 done =
        mgr.enqueueCopy(qpaths({tmp.path / "l.txt"}), tmp.q("dst"))->id();
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "first job should finish");

    mgr.pauseQueue();
    const quint64 j1 =
        mgr.enqueueCopy(qpaths({tmp.path / "l.txt"}), tmp.q("dst"))->id();
    const quint64 j2 =
        mgr.enqueueCopy(qpaths({tmp.path / "l.txt"}), tmp.q("dst"))->id();
    const quint64 j3 =
        mgr.enqueueCopy(qpaths({tmp.path / "l.txt"}), tmp.q("dst"))->id();

    std::mutex mtx;
    std::vector<quint64> captured;
    mgr.subscribe([&]() {
        const auto jobs = mgr.list();
        if (jobs.isEmpty() || jobs.front().id != j1 ||
            jobs.front().status != nmf::JobStatus::Running)
            return;
        std::lock_guard<std::mutex> lk(mtx);
        if (captured.empty())
            captured = idsOf(jobs);
    });
    mgr.resumeQueue();
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "queued jobs should finish");

    std::lock_guard<std::mutex> lk(mtx);
    t.check(captured == std::vector<quint64>({j1, j2, j3, done}),
            "list should be current, pending in order, then history");
}

void test_shutdown(TestContext &t) {
    TempDir tmp("shutdown");
    t.check(writeFile(tmp.path / "s.txt", "s"), "fixture: s.txt");

    nmf::JobManager mgr(testOptions());
    mgr.pauseQueue();
    auto a = mgr.enqueueCopy(qpaths({tmp.path / "s.txt"}), tmp.q("dst"));
    auto b = mgr.enqueueCopy(qpaths({tmp.path / "s.txt"}), tmp.q("dst"));
    mgr.shutdown();

    t.check(a->status() == nmf::JobStatus::Canceled &&
                b->status() == nmf::JobStatus::Canceled,
            "shutdown should cancel pending jobs");
    t.check(a->snapshot().startedAtMs == 0,
            "pending jobs canceled by shutdown never started");
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "stopped manager is idle");

    auto late = mgr.enqueueCopy(qpaths({tmp.path / "s.txt"}), tmp.q("dst"));
    const auto snap = late->snapshot();
    t.check(snap.status == nmf::JobStatus::Canceled,
            "enqueue after shutdown should be rejected as canceled");
    t.check(snap.message == QStringLiteral("Job manager is shut down"),
            "rejected job should explain why");
    t.check(mgr.find(late->id()).has_value(),
            "rejected job should be visible in history");
    t.check(!fs::exists(tmp.path / "dst"), "nothing should run after shutdown");

    mgr.shutdown(); // idempotent
}

void test_clear_history(TestContext &t) {
    TempDir tmp("clear");
    t.check(writeFile(tmp.path / "c.txt", "c"), "fixture: c.txt");

    nmf::JobManager mgr(testOptions());
    mgr.enqueueCopy(qpaths({tmp.path / "c.txt"}), tmp.q("dst"));
    t.check(mgr.waitForIdle(kIdleTimeoutMs), "job should finish");
    t.check(mgr.list().size() == 1, "finished job should be listed");
    mgr.clearHistory();
    t.check(mgr.list().isEmpty(), "clearHistory should drop finished jobs");
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_copy_single_file(t);
    test_move_directory(t);
    test_fifo_order_and_pause(t);
    test_history_bound(t);
    test_cancel_pending(t);
    test_cancel_running(t);
    test_cancel_before_first_item(t);
    test_failure_stops_job(t);
    test_child_failure_path(t);
    test_notifications_and_unsubscribe(t);
    test_throwing_subscriber(t);
    test_list_order_while_running(t);
    test_shutdown(t);
    test_clear_history(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] nmf_jobs_tests\n";
    return EXIT_SUCCESS;
}
