// Scheduler end-to-end tests against the mock native session (run via CTest).
#include "mirrorcore/MockNativeSession.hpp"
#include "mirrorcore/StatusBoard.hpp"
#include "mirrorcore/TaskScheduler.hpp"
#include "mirrorcore/TransferStatus.hpp"

#include <QCoreApplication>
#include <QEventLoop>
#include <QThread>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace mirrorcore;
using namespace std::chrono_literals;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

// Ordered record of listener callbacks across tasks.
struct EventLog {
    mutable std::mutex mtx;
    std::vector<std::string> events;

    void add(const std::string &e) {
        std::lock_guard<std::mutex> lk(mtx);
        events.push_back(e);
    }
    std::vector<std::string> all() const {
        std::lock_guard<std::mutex> lk(mtx);
        return events;
    }
    bool has(const std::string &e) const {
        std::lock_guard<std::mutex> lk(mtx);
        for (const auto &x : events)
            if (x == e)
                return true;
        return false;
    }
    int indexOf(const std::string &e) const {
        std::lock_guard<std::mutex> lk(mtx);
        for (std::size_t i = 0; i < events.size(); ++i)
            if (events[i] == e)
                return static_cast<int>(i);
        return -1;
    }
    int countWithPrefix(const std::string &prefix) const {
        std::lock_guard<std::mutex> lk(mtx);
        int n = 0;
        for (const auto &x : events)
            n += x.rfind(prefix, 0) == 0 ? 1 : 0;
        return n;
    }
};

class ChatListener : public TaskListener {
public:
    ChatListener(std::string tag, std::shared_ptr<EventLog> log,
                 std::uint64_t size = 0)
        : tag_(std::move(tag)), log_(std::move(log)), size_(size) {}

    bool isCancelled() const override { return cancelled.load(); }
    std::int64_t userId() const override { return 42; }
    std::uint64_t size() const override { return size_; }
    std::string name() const override { return tag_ + ".bin"; }

    void onStart() override {
        onOwnerThread = QThread::currentThread() ==
                        QCoreApplication::instance()->thread();
        log_->add(tag_ + ":start");
    }
    void onComplete() override { log_->add(tag_ + ":complete"); }
    void onUploadComplete(const std::string &link, int fileCount,
                          int folderCount, const std::string &mime) override {
        log_->add(tag_ + ":upload:" + link + ":" + std::to_string(fileCount) +
                  ":" + std::to_string(folderCount) + ":" + mime);
    }
    void onError(const std::string &message, const std::string &hint) override {
        log_->add(tag_ + ":error:" + message + "|" + hint);
    }

    std::atomic<bool> cancelled{false};
    std::atomic<bool> onOwnerThread{false};

private:
    std::string tag_;
    std::shared_ptr<EventLog> log_;
    std::uint64_t size_;
};

CoreConfig testConfig() {
    CoreConfig cfg;
    cfg.workerThreads = 4;
    cfg.loginTimeout = 500ms;
    cfg.resolveTimeout = 500ms;
    cfg.logoutTimeout = 500ms;
    cfg.handshakeAttempts = 2;
    cfg.timeoutEscalation = 1.0;
    return cfg;
}

TaskRequest request(TaskKind kind, const std::string &source,
                    const std::string &name = "") {
    TaskRequest req;
    req.kind = kind;
    req.source = source;
    req.destination = "/tmp/mirrorcore-" + source;
    req.name = name;
    return req;
}

// Pumps the event loop until pred holds or the deadline passes.
bool pumpUntil(const std::function<bool()> &pred,
               std::chrono::milliseconds timeout = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(2);
    }
    return true;
}

void test_capacity_and_promotion_order(TestContext &t) {
    CoreConfig cfg = testConfig();
    cfg.queueDownload = 1;
    TaskScheduler sched(cfg);
    auto log = std::make_shared<EventLog>();

    std::atomic<int> queuedSignals{0};
    std::atomic<int> finishedSignals{0};
    QObject::connect(&sched, &TaskScheduler::taskQueued,
                     [&queuedSignals](quint64) { ++queuedSignals; });
    QObject::connect(&sched, &TaskScheduler::taskFinished,
                     [&finishedSignals](quint64, const QString &) {
                         ++finishedSignals;
                     });

    std::promise<void> gate;
    MockScript first;
    first.name = "first.bin";
    first.size = 1000;
    first.chunks = 2;
    first.hold = gate.get_future().share();
    MockScript second;
    second.name = "second.bin";
    second.size = 500;

    auto l1 = std::make_shared<ChatListener>("t1", log);
    auto l2 = std::make_shared<ChatListener>("t2", log);
    const TaskId id1 =
        sched.submit(request(TaskKind::Download, "first"), l1,
                     sched.nativeBackend(std::make_unique<MockNativeSession>(first)));
    t.check(pumpUntil([&] { return log->has("t1:start"); }),
            "first task starts");
    t.check(l1->onOwnerThread.load(),
            "listener callbacks run on the scheduler thread");

    const TaskId id2 =
        sched.submit(request(TaskKind::Download, "second"), l2,
                     sched.nativeBackend(std::make_unique<MockNativeSession>(second)));
    t.check(pumpUntil([&] {
                return sched.admission().isQueued(id2) &&
                       sched.registry().contains(id2);
            }),
            "second task waits for the download slot");
    t.check(pumpUntil([&] {
                auto s = sched.registry().find(id1);
                return s && s->processedBytes() == 1000;
            }),
            "first transfer reaches its hold point");
    t.check(sched.admission().admittedCount(kBucketDownload) == 1,
            "only one download admitted");

    auto status1 = sched.registry().find(id1);
    auto status2 = sched.registry().find(id2);
    t.check(status1 && status1->state() == TaskState::Downloading,
            "running task reports Downloading");
    t.check(status2 && status2->state() == TaskState::Queued,
            "waiting task reports Queued");
    t.check(status1 && status1->name() == "first.bin",
            "resolved name visible in the status");
    t.check(!log->has("t2:start"), "queued task has not started");

    gate.set_value();
    t.check(sched.waitForIdle(10000ms), "all tasks finish");
    QCoreApplication::processEvents();

    const int c1 = log->indexOf("t1:complete");
    const int s2 = log->indexOf("t2:start");
    const int c2 = log->indexOf("t2:complete");
    t.check(c1 >= 0 && s2 >= 0 && c2 >= 0, "both tasks completed");
    t.check(c1 < s2, "second task starts only after the first completes");
    t.check(s2 < c2, "second task starts before it completes");
    t.check(log->countWithPrefix("t1:") == 2 && log->countWithPrefix("t2:") == 2,
            "one start and one terminal callback per task");
    t.check(queuedSignals.load() == 1, "one task was queued");
    t.check(finishedSignals.load() == 2, "two tasks finished");
    t.check(sched.registry().size() == 0, "registry empty after completion");
    t.check(sched.admission().admittedCount(kBucketDownload) == 0,
            "no slot leaked");
    t.check(sched.activeTasks() == 0, "no active drivers");
}

void test_cancel_while_queued(TestContext &t) {
    CoreConfig cfg = testConfig();
    cfg.queueAll = 1;
    TaskScheduler sched(cfg);
    auto log = std::make_shared<EventLog>();

    std::promise<void> gate;
    MockScript held;
    held.hold = gate.get_future().share();

    auto l1 = std::make_shared<ChatListener>("run", log);
    auto l2 = std::make_shared<ChatListener>("byid", log);
    auto l3 = std::make_shared<ChatListener>("byflag", log);
    sched.submit(request(TaskKind::Download, "a"), l1,
                 sched.nativeBackend(std::make_unique<MockNativeSession>(held)));
    t.check(pumpUntil([&] { return log->has("run:start"); }),
            "first task running");

    const TaskId id2 =
        sched.submit(request(TaskKind::Upload, "b"), l2,
                     sched.nativeBackend(std::make_unique<MockNativeSession>()));
    const TaskId id3 =
        sched.submit(request(TaskKind::Clone, "c"), l3,
                     sched.nativeBackend(std::make_unique<MockNativeSession>()));
    t.check(pumpUntil([&] {
                return sched.admission().isQueued(id2) &&
                       sched.admission().isQueued(id3);
            }),
            "upload and clone wait on the global bucket");

    std::string err;
    t.check(sched.cancel(id2, err), "cancel by id accepted");
    l3->cancelled = true;
    t.check(pumpUntil([&] {
                return log->has("byid:error:cancelled|") &&
                       log->has("byflag:error:cancelled|");
            }),
            "queued tasks report cancellation");
    t.check(!log->has("byid:start") && !log->has("byflag:start"),
            "cancelled queued tasks never start");
    t.check(sched.admission().admittedCount(kBucketAll) == 1,
            "cancelled tasks consumed no slot");

    t.check(!sched.cancel(987654, err), "unknown task is reported");
    t.checkContains(err, "Task not found", "unknown task message");

    gate.set_value();
    t.check(sched.waitForIdle(10000ms), "scheduler drains");
    QCoreApplication::processEvents();
    t.check(log->has("run:complete"), "running task unaffected");
}

void test_cancel_running(TestContext &t) {
    TaskScheduler sched(testConfig());
    auto log = std::make_shared<EventLog>();
    std::promise<void> never;
    MockScript held;
    held.hold = never.get_future().share();

    auto l = std::make_shared<ChatListener>("dl", log);
    const TaskId id =
        sched.submit(request(TaskKind::Download, "big"), l,
                     sched.nativeBackend(std::make_unique<MockNativeSession>(held)));
    t.check(pumpUntil([&] { return log->has("dl:start"); }), "task started");
    t.check(pumpUntil([&] {
                auto s = sched.registry().find(id);
                return s && s->processedBytes() == s->size();
            }),
            "transfer reached the hold point");
    std::string err;
    t.check(sched.cancel(id, err), "running task cancelled");
    t.check(sched.waitForIdle(10000ms), "cancelled driver exits");
    QCoreApplication::processEvents();
    t.check(log->has("dl:error:cancelled|"), "cancel reported once");
    t.check(log->countWithPrefix("dl:") == 2, "start plus one terminal");
    t.check(sched.admission().admittedCount(kBucketAll) == 0,
            "cancelled task freed its slot");
}

void test_upload_and_failures(TestContext &t) {
    TaskScheduler sched(testConfig());
    auto log = std::make_shared<EventLog>();

    MockScript upload;
    upload.link = "sftp://host/inbox/report.txt";
    auto lu = std::make_shared<ChatListener>("up", log);
    sched.submit(request(TaskKind::Upload, "report.txt", "report.txt"), lu,
                 sched.nativeBackend(std::make_unique<MockNativeSession>(upload)));

    MockScript denied;
    denied.loginError = nativecode::Access;
    auto ld = std::make_shared<ChatListener>("denied", log);
    sched.submit(request(TaskKind::Download, "secret"), ld,
                 sched.nativeBackend(std::make_unique<MockNativeSession>(denied)));

    MockScript silent;
    silent.dropLoginCallbacks = 10;
    auto ls = std::make_shared<ChatListener>("silent", log);
    sched.submit(request(TaskKind::Download, "slow"), ls,
                 sched.nativeBackend(std::make_unique<MockNativeSession>(silent)));

    auto ln = std::make_shared<ChatListener>("none", log);
    sched.submit(request(TaskKind::Download, "nowhere"), ln, nullptr);

    t.check(sched.waitForIdle(15000ms), "all tasks finish");
    QCoreApplication::processEvents();

    t.check(log->has("up:upload:sftp://host/inbox/report.txt:1:0:text/plain"),
            "upload completion carries link, counts and mime type");
    t.check(!log->has("up:complete"), "uploads use the upload callback");

    bool deniedOk = false;
    bool silentOk = false;
    for (const auto &e : log->all()) {
        if (e.rfind("denied:error:", 0) == 0)
            deniedOk = e.find("try again") == std::string::npos &&
                       e.back() == '|';
        if (e.rfind("silent:error:", 0) == 0)
            silentOk = e.find("try again") != std::string::npos &&
                       e.find("|retry") != std::string::npos;
    }
    t.check(deniedOk, "auth failure is reported without retry hint");
    t.check(silentOk, "handshake timeout suggests retrying");
    t.check(log->has("none:error:No backend for task|"),
            "missing backend fails the task");
    t.check(log->countWithPrefix("denied:") == 2,
            "failed task reports one start and one terminal");
    t.check(log->countWithPrefix("none:") == 1,
            "task without backend never starts");
}

void test_status_board(TestContext &t) {
    TaskRequest req = request(TaskKind::Download, "movie");
    req.name = "movie.mkv";
    req.backend = "mock";
    req.size = 2048;
    auto task = std::make_shared<Task>(77, req);

    TaskRegistry registry;
    auto queued = std::make_shared<QueueStatus>(task, [](TaskId) {
        return true;
    });
    const std::string queuedLine = StatusBoard::renderLine(*queued);
    t.check(queuedLine == "movie.mkv | Queued | 2.00 KiB | " + task->gid(),
            "queued line shows name, size and gid");

    auto status = makeTransferStatus(task);
    task->enterRunning();
    status->updateProgress(1024, 2048, 512.0);
    const std::string line = StatusBoard::renderLine(*status);
    t.checkContains(line, "movie.mkv | Downloading [#####-----] 50.0%",
                    "state, bar and percentage");
    t.checkContains(line, "1.00 KiB of 2.00 KiB", "processed of total");
    t.checkContains(line, "512 B/s", "speed");
    t.checkContains(line, "ETA 2s", "eta");
    t.checkContains(line, "mock | " + task->gid(), "backend and gid");

    registry.insert(task->id(), status);
    StatusBoard board(registry, 10ms);
    std::atomic<int> emissions{0};
    QStringList last;
    QObject::connect(&board, &StatusBoard::statusRendered,
                     [&](const QStringList &lines) {
                         ++emissions;
                         last = lines;
                     });
    board.start();
    t.check(board.isActive(), "board timer running");
    pumpUntil([&] { return emissions.load() >= 1; }, 2000ms);
    pumpUntil([] { return false; }, 60ms);
    t.check(emissions.load() == 1, "unchanged lines are not re-emitted");
    t.check(last.size() == 1, "one line per tracked task");

    status->updateProgress(2048, 2048, 512.0);
    t.check(pumpUntil([&] { return emissions.load() >= 2; }, 2000ms),
            "progress change is re-rendered");
    t.check(!last.isEmpty() && last.front().contains("100.0%"),
            "new line shows completion");
    board.stop();
    t.check(!board.isActive(), "board timer stopped");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_capacity_and_promotion_order(t);
    test_cancel_while_queued(t);
    test_cancel_running(t);
    test_upload_and_failures(t);
    test_status_board(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] mirrorcore_scheduler_tests\n";
    return EXIT_SUCCESS;
}
