// Callback bridge and native backend tests (run via CTest).
#include "mirrorcore/CallbackBridge.hpp"
#include "mirrorcore/MockNativeSession.hpp"
#include "mirrorcore/NativeTransferBackend.hpp"
#include "mirrorcore/TransferStatus.hpp"
#include "mirrorcore/WorkerPool.hpp"

#include <QCoreApplication>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
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

// What a session saw, kept after the backend destroyed it.
struct SessionTrace {
    std::vector<std::string> calls;
    int loginAttempts = 0;
    int releaseCount = 0;
    std::size_t listenersLeft = 0;
    bool destroyed = false;

    bool called(const std::string &name) const {
        return std::find(calls.begin(), calls.end(), name) != calls.end();
    }
};

class TracedSession : public MockNativeSession {
public:
    TracedSession(MockScript script, std::shared_ptr<SessionTrace> trace)
        : MockNativeSession(std::move(script)), trace_(std::move(trace)) {}
    ~TracedSession() override {
        trace_->calls = calls();
        trace_->loginAttempts = loginAttempts();
        trace_->releaseCount = releaseCount();
        trace_->listenersLeft = listenerCount();
        trace_->destroyed = true;
    }

private:
    std::shared_ptr<SessionTrace> trace_;
};

std::shared_ptr<Task> makeTask(TaskKind kind, const std::string &name = "") {
    static std::atomic<TaskId> next{1};
    TaskRequest req;
    req.userId = 1;
    req.kind = kind;
    req.backend = "mock";
    req.name = name;
    req.source = "remote/source.dat";
    req.destination = "/tmp/mirrorcore-dest";
    return std::make_shared<Task>(next++, req);
}

// Occupies one thread of the pool until the returned promise is set.
std::promise<void> blockOneThread(WorkerPool &pool) {
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    auto started = std::make_shared<std::promise<void>>();
    std::future<void> running = started->get_future();
    pool.dispatch([opened, started] {
        started->set_value();
        opened.wait();
    });
    running.wait();
    return gate;
}

// Returns once every job queued on the pool before this call has run.
bool flushPool(WorkerPool &pool) {
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> flushed = done->get_future();
    pool.dispatch([done] { done->set_value(); });
    return flushed.wait_for(5s) == std::future_status::ready;
}

template <typename Pred> bool waitUntil(Pred pred) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

NativeBackendOptions fastOptions() {
    NativeBackendOptions o;
    o.loginTimeout = 40ms;
    o.resolveTimeout = 200ms;
    o.logoutTimeout = 200ms;
    o.handshakeAttempts = 3;
    o.timeoutEscalation = 1.0;
    return o;
}

void test_bridge_resolves_matching_id(TestContext &t) {
    WorkerPool pool(2);
    CallbackBridge bridge(pool);
    CallResult r = bridge.call("resolve", [&bridge](CorrelationId id) {
        bridge.deliver(id + 1000, CallbackKind::RequestFinish, "resolve",
                       CallResult::success("wrong"));
        bridge.deliver(id, CallbackKind::RequestFinish, "resolve",
                       CallResult::success("file.bin", 42));
    });
    t.check(r.ok(), "call resolved by its own id");
    t.check(r.value == "file.bin" && r.size == 42,
            "payload from the matching callback");
    t.check(r.attempts == 1, "single attempt");
    t.check(bridge.pendingCount() == 0, "nothing left pending");
}

void test_bridge_retry_isolation(TestContext &t) {
    WorkerPool pool(2);
    CallbackBridge bridge(pool);
    std::mutex mtx;
    std::vector<CorrelationId> ids;

    CallOptions opts;
    opts.timeout = 30ms;
    opts.retryable = true;
    opts.maxAttempts = 3;
    opts.escalation = 1.0;
    CallResult r = bridge.call(
        "login",
        [&](CorrelationId id) {
            std::lock_guard<std::mutex> lk(mtx);
            ids.push_back(id);
        },
        opts);
    t.check(r.error == ErrorKind::TransientTimeout,
            "unanswered handshake ends in TransientTimeout");
    t.check(r.attempts == 3, "every attempt was used");
    t.check(r.message == "login timed out after 3 attempts",
            "timeout message names the attempts");
    t.check(ids.size() == 3 && ids[0] != ids[1] && ids[1] != ids[2],
            "each attempt gets a fresh correlation id");
    t.check(!bridge.deliver(ids[0], CallbackKind::RequestFinish, "login",
                            CallResult::success()),
            "late callback of a timed-out attempt is ignored");

    // First attempt stays silent, second answers; the first one's late
    // callback arrives after the call already returned.
    std::vector<CorrelationId> seen;
    r = bridge.call(
        "login",
        [&](CorrelationId id) {
            {
                std::lock_guard<std::mutex> lk(mtx);
                seen.push_back(id);
                if (seen.size() == 1)
                    return;
            }
            bridge.deliver(id, CallbackKind::RequestFinish, "login",
                           CallResult::success("second"));
        },
        opts);
    t.check(r.ok() && r.value == "second", "second attempt succeeds");
    t.check(r.attempts == 2, "success reports its attempt number");
    t.check(!bridge.deliver(seen[0], CallbackKind::RequestFinish, "login",
                            CallResult::failure(ErrorKind::TransferFailed,
                                                "stale")),
            "stale failure cannot touch the finished call");

    CallOptions once;
    once.timeout = 20ms;
    once.maxAttempts = 5; // ignored: not retryable
    int runs = 0;
    r = bridge.call("download", [&runs](CorrelationId) { ++runs; }, once);
    t.check(r.error == ErrorKind::TransientTimeout && r.attempts == 1,
            "non-retryable calls are issued once");
}

void test_bridge_non_terminal_steps(TestContext &t) {
    WorkerPool pool(2);
    BridgeOptions bo;
    bo.nonTerminalSteps = {"login"};
    CallbackBridge bridge(pool, bo);

    std::atomic<bool> loginResolved{true};
    CallResult r = bridge.call("login", [&](CorrelationId id) {
        loginResolved = bridge.deliver(id, CallbackKind::RequestFinish,
                                       "login", CallResult::success());
        bridge.deliver(id, CallbackKind::RequestStart, "fetchNodes",
                       CallResult::success());
        bridge.deliver(id, CallbackKind::RequestFinish, "fetchNodes",
                       CallResult::success("root"));
    });
    t.check(!loginResolved.load(), "successful login step does not resolve");
    t.check(r.ok() && r.value == "root", "fetchNodes completes the handshake");

    r = bridge.call("login", [&](CorrelationId id) {
        bridge.deliver(id, CallbackKind::RequestFinish, "login",
                       CallResult::failure(ErrorKind::PermanentAuthError,
                                           "Access denied", -11));
    });
    t.check(r.error == ErrorKind::PermanentAuthError,
            "failed non-terminal step resolves immediately");
    t.check(r.nativeCode == -11, "native code travels with the error");
}

void test_bridge_exception_boundary(TestContext &t) {
    WorkerPool pool(1);
    CallbackBridge bridge(pool);

    CallResult r = bridge.call("resolve", [](CorrelationId) {
        throw std::runtime_error("sdk exploded");
    });
    t.check(r.error == ErrorKind::BackendInstability,
            "throwing operation becomes BackendInstability");
    t.checkContains(r.message, "sdk exploded", "exception text is kept");

    r = bridge.call("resolve", [&bridge](CorrelationId id) {
        bridge.deliver(id, CallbackKind::RequestFinish, "resolve",
                       []() -> CallResult {
                           throw std::runtime_error("bad node");
                       });
    });
    t.check(r.error == ErrorKind::BackendInstability,
            "throwing translation becomes BackendInstability");
    t.checkContains(r.message, "bad node", "translation error text is kept");

    bridge.setProgressObserver(
        [](CorrelationId, std::uint64_t, std::uint64_t, double) {
            throw std::runtime_error("observer failure");
        });
    bridge.deliverProgress(1, 10, 100, 5.0);
    t.check(true, "throwing progress observer is contained");

    t.check(!bridge.deliver(999, CallbackKind::TransferFinish, "transfer",
                            CallResult::success()),
            "unknown ids are ignored");
}

void test_bridge_cancel(TestContext &t) {
    WorkerPool pool(2);
    CallbackBridge bridge(pool);
    std::thread canceller([&bridge] {
        while (bridge.pendingCount() == 0)
            std::this_thread::sleep_for(1ms);
        bridge.cancel("stop");
    });
    CallResult r = bridge.call("download", [](CorrelationId) {});
    canceller.join();
    t.check(r.error == ErrorKind::CancelledByUser,
            "cancel resolves a call without timeout");
    t.check(r.message == "stop", "cancel reason is reported");
    t.check(bridge.isCancelled(), "bridge remembers cancellation");

    bool ran = false;
    r = bridge.call("logout", [&ran](CorrelationId) { ran = true; });
    t.check(r.error == ErrorKind::CancelledByUser && r.attempts == 0,
            "calls after cancel fail without dispatching");
    t.check(!ran, "operation never ran after cancel");
    bridge.cancel("again");
    t.check(bridge.isCancelled(), "cancel is idempotent");
}

void test_bridge_drain(TestContext &t) {
    WorkerPool pool(2);
    BridgeOptions bo;
    bo.drainTimeout = 2000ms;
    CallbackBridge bridge(pool, bo);
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();

    CallOptions opts;
    opts.timeout = 10ms;
    CallResult r =
        bridge.call("logout", [opened](CorrelationId) { opened.wait(); }, opts);
    t.check(r.error == ErrorKind::TransientTimeout, "blocked call times out");
    t.check(bridge.inFlightCount() == 1, "operation still in flight");

    std::thread opener([&gate] {
        std::this_thread::sleep_for(20ms);
        gate.set_value();
    });
    t.check(bridge.drain(), "drain waits for the running operation");
    opener.join();
    t.check(bridge.inFlightCount() == 0, "nothing in flight after drain");

    r = bridge.call("login", [](CorrelationId) {});
    t.check(r.error == ErrorKind::BackendInstability,
            "calls after drain are refused");

    BridgeOptions quick;
    quick.drainTimeout = 20ms;
    CallbackBridge stuck(pool, quick);
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    r = stuck.call("logout", [released](CorrelationId) { released.wait(); },
                   opts);
    t.check(!stuck.drain(), "drain reports a timeout while work is stuck");
    release.set_value();
}

void test_bridge_timeout_counts_from_start(TestContext &t) {
    WorkerPool pool(1);
    CallbackBridge bridge(pool);
    std::promise<void> gate = blockOneThread(pool);
    std::thread opener([&gate] {
        std::this_thread::sleep_for(200ms);
        gate.set_value();
    });

    CallOptions opts;
    opts.timeout = 50ms;
    opts.retryable = true;
    opts.maxAttempts = 2;
    opts.escalation = 1.0;
    std::atomic<int> runs{0};
    const CallResult r = bridge.call(
        "login",
        [&](CorrelationId id) {
            ++runs;
            bridge.deliver(id, CallbackKind::RequestFinish, "login",
                           CallResult::success("ready"));
        },
        opts);
    opener.join();
    t.check(r.ok() && r.value == "ready",
            "waiting for a busy worker does not time the call out");
    t.check(r.attempts == 1 && runs.load() == 1,
            "first attempt answered once it got a worker");
}

void test_bridge_skips_withdrawn_attempt(TestContext &t) {
    WorkerPool pool(1);
    CallbackBridge bridge(pool);
    std::promise<void> gate = blockOneThread(pool);

    auto runs = std::make_shared<std::atomic<int>>(0);
    CallResult r;
    std::thread caller([&] {
        r = bridge.call("login", [runs](CorrelationId) { ++*runs; });
    });
    t.check(waitUntil([&] { return bridge.pendingCount() == 1; }),
            "call waits for a worker");
    bridge.cancel("stop");
    caller.join();
    t.check(r.error == ErrorKind::CancelledByUser,
            "cancel resolves a call still queued for a worker");

    gate.set_value();
    t.check(flushPool(pool), "pool drained");
    t.check(runs->load() == 0, "withdrawn attempt never reaches the session");
    t.check(bridge.inFlightCount() == 0, "skipped job leaves nothing in flight");
}

void test_bridge_destroyed_after_drain_timeout(TestContext &t) {
    WorkerPool pool(1);
    BridgeOptions bo;
    bo.drainTimeout = 20ms;
    auto bridge = std::make_unique<CallbackBridge>(pool, bo);

    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    CallOptions opts;
    opts.timeout = 10ms;
    CallResult r = bridge->call(
        "logout", [opened](CorrelationId) { opened.wait(); }, opts);
    t.check(r.error == ErrorKind::TransientTimeout,
            "stuck operation times out and keeps its worker");

    auto staleRuns = std::make_shared<std::atomic<int>>(0);
    std::thread caller([&] {
        r = bridge->call("login",
                         [staleRuns](CorrelationId) { ++*staleRuns; }, opts);
    });
    t.check(waitUntil([&] { return bridge->pendingCount() == 1; }),
            "second call queued behind the stuck one");
    t.check(!bridge->drain(), "drain times out on the stuck operation");
    caller.join();
    t.check(r.error == ErrorKind::BackendInstability,
            "queued call is closed by the drain");

    bridge.reset();
    gate.set_value();
    t.check(flushPool(pool), "pool drained");
    t.check(staleRuns->load() == 0,
            "queued job of a destroyed bridge does not run its operation");
}

void test_backend_cancel_while_waiting_for_worker(TestContext &t) {
    WorkerPool pool(1);
    std::promise<void> gate;
    MockScript heldScript;
    heldScript.size = 1000;
    heldScript.chunks = 2;
    heldScript.hold = gate.get_future().share();
    auto heldTask = makeTask(TaskKind::Download);
    auto heldStatus = makeTransferStatus(heldTask);
    auto heldTrace = std::make_shared<SessionTrace>();
    auto held = std::make_unique<NativeTransferBackend>(
        pool, std::make_unique<TracedSession>(heldScript, heldTrace),
        fastOptions());
    TransferOutcome heldOut;
    std::thread heldDriver([&] {
        heldOut = held->run(heldTask, *heldStatus, [] { return false; });
    });
    t.check(waitUntil([&] { return heldStatus->processedBytes() == 1000; }),
            "held transfer occupies the only worker");

    auto trace = std::make_shared<SessionTrace>();
    NativeBackendOptions opts = fastOptions();
    opts.loginTimeout = 100ms;
    auto waiting = std::make_unique<NativeTransferBackend>(
        pool, std::make_unique<TracedSession>(MockScript{}, trace), opts);
    auto task = makeTask(TaskKind::Download);
    auto status = makeTransferStatus(task);
    TransferOutcome out;
    std::thread driver(
        [&] { out = waiting->run(task, *status, [] { return false; }); });
    std::this_thread::sleep_for(400ms);
    waiting->cancel();
    driver.join();
    waiting.reset();

    t.check(out.error.kind == ErrorKind::CancelledByUser,
            "login waiting for a worker is not timed out, only cancelled");
    t.check(trace->destroyed && trace->loginAttempts == 0,
            "session released without ever logging in");
    t.check(trace->releaseCount == 1, "drained session is released");

    gate.set_value();
    heldDriver.join();
    held.reset();
    t.check(flushPool(pool), "stale login job drained");
    t.check(heldOut.ok(), "held transfer completes: " + heldOut.error.message);
}

void test_backend_transfer_pool_keeps_handshakes_free(TestContext &t) {
    WorkerPool calls(1);
    WorkerPool transfers(1);
    std::promise<void> gate;
    MockScript heldScript;
    heldScript.size = 1000;
    heldScript.chunks = 2;
    heldScript.hold = gate.get_future().share();
    auto heldTask = makeTask(TaskKind::Download);
    auto heldStatus = makeTransferStatus(heldTask);
    auto heldTrace = std::make_shared<SessionTrace>();
    NativeTransferBackend held(
        calls, transfers,
        std::make_unique<TracedSession>(heldScript, heldTrace), fastOptions());
    TransferOutcome heldOut;
    std::thread heldDriver([&] {
        heldOut = held.run(heldTask, *heldStatus, [] { return false; });
    });
    t.check(waitUntil([&] { return heldStatus->processedBytes() == 1000; }),
            "held transfer occupies the transfer pool");

    auto trace = std::make_shared<SessionTrace>();
    MockScript script;
    script.size = 2048;
    auto task = makeTask(TaskKind::Download);
    auto status = makeTransferStatus(task);
    NativeTransferBackend next(
        calls, transfers, std::make_unique<TracedSession>(script, trace),
        fastOptions());
    TransferOutcome out;
    std::thread driver(
        [&] { out = next.run(task, *status, [] { return false; }); });
    t.check(waitUntil([&] { return task->size() == 2048; }),
            "login and resolve run while another transfer is held");

    gate.set_value();
    heldDriver.join();
    driver.join();
    t.check(heldOut.ok(), "held transfer completes");
    t.check(out.ok(), "queued transfer completes: " + out.error.message);
    t.check(trace->loginAttempts == 1, "handshake needed a single attempt");
}

void test_backend_download_success(TestContext &t) {
    WorkerPool pool(2);
    auto trace = std::make_shared<SessionTrace>();
    MockScript script;
    script.name = "archive.zip";
    script.size = 4096;
    script.chunks = 4;
    auto task = makeTask(TaskKind::Download, "requested");
    auto status = makeTransferStatus(task);
    task->enterRunning();
    std::vector<CleanupStage> stages;
    TransferOutcome out;
    {
        NativeTransferBackend backend(
            pool, std::make_unique<TracedSession>(script, trace),
            fastOptions());
        t.check(backend.name() == "mock", "backend named after the session");
        out = backend.run(task, *status, [] { return false; });
        stages = backend.cleanupStages();
    }
    t.check(out.ok(), "download succeeds: " + out.error.message);
    t.check(out.link == "mock://link", "link from the transfer finish");
    t.check(out.fileCount == 1 && out.folderCount == 0, "one file");
    t.check(out.mimeType == "application/zip", "mime type from the name");
    t.check(task->size() == 4096, "resolved size applied to the task");
    t.check(status->name() == "archive.zip", "resolved name applied");
    t.check(status->processedBytes() == 4096, "progress reached the end");

    t.check(trace->destroyed, "session destroyed by cleanup");
    const std::vector<std::string> expected = {
        "login", "resolveSource:remote/source.dat",
        "download:remote/source.dat", "logout", "release"};
    t.check(trace->calls == expected,
            "login, resolve, transfer, logout, release in order");
    t.check(trace->releaseCount == 1, "native handle released once");
    t.check(trace->listenersLeft == 0, "listener unregistered");
    t.check(stages.size() == 4 &&
                stages[0] == CleanupStage::UnregisterListener &&
                stages[1] == CleanupStage::DrainSignals &&
                stages[2] == CleanupStage::ReleaseHandle &&
                stages[3] == CleanupStage::ClearReferences,
            "cleanup stages run in order");
}

void test_backend_upload_skips_resolve(TestContext &t) {
    WorkerPool pool(2);
    auto trace = std::make_shared<SessionTrace>();
    MockScript script;
    script.link = "sftp://host/inbox/notes.txt";
    auto task = makeTask(TaskKind::Upload, "notes.txt");
    auto status = makeTransferStatus(task);
    TransferOutcome out;
    {
        NativeTransferBackend backend(
            pool, std::make_unique<TracedSession>(script, trace),
            fastOptions());
        out = backend.run(task, *status, [] { return false; });
    }
    t.check(out.ok(), "upload succeeds");
    t.check(out.link == "sftp://host/inbox/notes.txt", "upload link kept");
    t.check(out.mimeType == "text/plain", "upload mime type");
    t.check(!trace->called("resolveSource:remote/source.dat"),
            "uploads do not resolve a remote source");
}

void test_backend_login_failures(TestContext &t) {
    WorkerPool pool(2);
    {
        auto trace = std::make_shared<SessionTrace>();
        MockScript script;
        script.loginError = nativecode::Access;
        auto task = makeTask(TaskKind::Download);
        auto status = makeTransferStatus(task);
        TransferOutcome out;
        {
            NativeTransferBackend backend(
                pool, std::make_unique<TracedSession>(script, trace),
                fastOptions());
            out = backend.run(task, *status, [] { return false; });
        }
        t.check(out.error.kind == ErrorKind::PermanentAuthError,
                "access denied maps to PermanentAuthError");
        t.check(!out.error.retryable(), "auth errors are not retryable");
        t.check(trace->loginAttempts == 1, "auth errors are not retried");
        t.check(trace->releaseCount == 1, "session released after failure");
    }
    {
        auto trace = std::make_shared<SessionTrace>();
        MockScript script;
        script.dropLoginCallbacks = 10;
        auto task = makeTask(TaskKind::Download);
        auto status = makeTransferStatus(task);
        TransferOutcome out;
        {
            NativeTransferBackend backend(
                pool, std::make_unique<TracedSession>(script, trace),
                fastOptions());
            out = backend.run(task, *status, [] { return false; });
        }
        t.check(out.error.kind == ErrorKind::TransientTimeout,
                "silent login ends in TransientTimeout");
        t.check(out.error.retryable(), "timeouts are retryable");
        t.check(trace->loginAttempts == 3, "handshake retried up to the cap");
        t.check(trace->releaseCount == 1, "session released after timeout");
    }
    {
        auto trace = std::make_shared<SessionTrace>();
        MockScript script;
        script.dropLoginCallbacks = 2;
        auto task = makeTask(TaskKind::Clone);
        auto status = makeTransferStatus(task);
        TransferOutcome out;
        {
            NativeTransferBackend backend(
                pool, std::make_unique<TracedSession>(script, trace),
                fastOptions());
            out = backend.run(task, *status, [] { return false; });
        }
        t.check(out.ok(), "third handshake attempt succeeds");
        t.check(trace->loginAttempts == 3, "two silent attempts then success");
        t.check(trace->called("copy:remote/source.dat"), "clone copies");
    }
}

void test_backend_resolve_failures(TestContext &t) {
    WorkerPool pool(2);
    {
        auto trace = std::make_shared<SessionTrace>();
        MockScript script;
        script.resolveError = nativecode::NotFound;
        auto task = makeTask(TaskKind::Download);
        auto status = makeTransferStatus(task);
        NativeTransferBackend backend(
            pool, std::make_unique<TracedSession>(script, trace),
            fastOptions());
        const TransferOutcome out =
            backend.run(task, *status, [] { return false; });
        t.check(out.error.kind == ErrorKind::TransferFailed,
                "missing source maps to TransferFailed");
    }
    {
        auto trace = std::make_shared<SessionTrace>();
        MockScript script;
        script.resolveTemporaryError = true;
        auto task = makeTask(TaskKind::Download);
        auto status = makeTransferStatus(task);
        NativeTransferBackend backend(
            pool, std::make_unique<TracedSession>(script, trace),
            fastOptions());
        const TransferOutcome out =
            backend.run(task, *status, [] { return false; });
        t.check(out.error.kind == ErrorKind::BackendInstability,
                "temporary request error maps to BackendInstability");
    }
    {
        auto trace = std::make_shared<SessionTrace>();
        MockScript script;
        script.throwInResolve = true;
        auto task = makeTask(TaskKind::Download);
        auto status = makeTransferStatus(task);
        TransferOutcome out;
        {
            NativeTransferBackend backend(
                pool, std::make_unique<TracedSession>(script, trace),
                fastOptions());
            out = backend.run(task, *status, [] { return false; });
        }
        t.check(out.error.kind == ErrorKind::BackendInstability,
                "exception in the SDK call maps to BackendInstability");
        t.checkContains(out.error.message, "mock resolve exploded",
                        "exception text reaches the outcome");
        t.check(trace->releaseCount == 1, "cleanup still releases");
    }
}

void test_backend_cancel_during_transfer(TestContext &t) {
    WorkerPool pool(2);
    auto trace = std::make_shared<SessionTrace>();
    std::promise<void> never;
    MockScript script;
    script.size = 1000;
    script.chunks = 2;
    script.hold = never.get_future().share();
    auto task = makeTask(TaskKind::Download);
    auto status = makeTransferStatus(task);
    task->enterRunning();

    TransferOutcome out;
    {
        NativeTransferBackend backend(
            pool, std::make_unique<TracedSession>(script, trace),
            fastOptions());
        status->setCancelHandler([&backend] { backend.cancel(); });
        std::thread driver([&] {
            out = backend.run(task, *status, [] { return false; });
        });
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (status->processedBytes() < 1000 &&
               std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(2ms);
        std::string err;
        t.check(status->cancel(err), "cancel accepted");
        driver.join();
    }
    t.check(out.error.kind == ErrorKind::CancelledByUser,
            "cancelled transfer reports CancelledByUser");
    t.check(trace->called("cancelTransfers"), "native transfers cancelled");
    t.check(!trace->called("logout"), "no logout after cancellation");
    t.check(trace->releaseCount == 1, "cancelled session is released");
}

void test_backend_requires_session(TestContext &t) {
    WorkerPool pool(1);
    bool threw = false;
    try {
        NativeTransferBackend backend(pool, nullptr);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    t.check(threw, "backend without session is rejected");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_bridge_resolves_matching_id(t);
    test_bridge_retry_isolation(t);
    test_bridge_non_terminal_steps(t);
    test_bridge_exception_boundary(t);
    test_bridge_cancel(t);
    test_bridge_drain(t);
    test_bridge_timeout_counts_from_start(t);
    test_bridge_skips_withdrawn_attempt(t);
    test_bridge_destroyed_after_drain_timeout(t);
    test_backend_download_success(t);
    test_backend_upload_skips_resolve(t);
    test_backend_login_failures(t);
    test_backend_resolve_failures(t);
    test_backend_cancel_during_transfer(t);
    test_backend_requires_session(t);
    test_backend_cancel_while_waiting_for_worker(t);
    test_backend_transfer_pool_keeps_handshakes_free(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] mirrorcore_bridge_tests\n";
    return EXIT_SUCCESS;
}
