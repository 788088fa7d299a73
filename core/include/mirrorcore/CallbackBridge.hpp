// Bridge between callback-driven native SDKs and the blocking task drivers.
//
// Every logical operation gets its own correlation id and promise. The native
// listener resolves only the promise whose id it carries, so a late callback
// from a timed-out attempt can never satisfy a later attempt. Exceptions raised
// while translating a callback are turned into a CallResult error and never
// unwind into the native SDK.
#pragma once
#include "TaskTypes.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace mirrorcore {

class WorkerPool;

using CorrelationId = std::uint64_t;

enum class CallbackKind {
    RequestStart,
    RequestFinish,
    RequestTemporaryError,
    TransferStart,
    TransferUpdate,
    TransferFinish,
    TransferTemporaryError
};

const char *callbackKindName(CallbackKind kind);

struct CallResult {
    ErrorKind error = ErrorKind::None;
    std::string message;
    int nativeCode = 0;
    // Request specific payload (resolved name, public link, local path...).
    std::string value;
    std::uint64_t size = 0;
    int attempts = 0;

    bool ok() const { return error == ErrorKind::None; }
    TaskError toError() const { return TaskError{error, message}; }

    static CallResult success(std::string value = {}, std::uint64_t size = 0);
    static CallResult failure(ErrorKind kind, std::string message,
                              int nativeCode = 0);
};

struct CallOptions {
    // Counted from the moment the operation starts on a worker, not from
    // dispatch. Unset: wait indefinitely (long transfers report liveness
    // through their own progress callbacks).
    std::optional<std::chrono::milliseconds> timeout;
    // Runs on the transfer pool instead of the call pool.
    bool longRunning = false;
    // Only retryable calls are re-issued after a timeout.
    bool retryable = false;
    int maxAttempts = 1;
    // Timeout multiplier applied before every retry.
    double escalation = 2.0;
};

struct BridgeOptions {
    // Steps whose successful completion is only a hop in a longer handshake
    // (e.g. "login", which implicitly triggers "fetchNodes"). Their success
    // callbacks are acknowledged but do not resolve the pending call.
    std::set<std::string> nonTerminalSteps;
    // How long drain() waits for dispatched operations to return.
    std::chrono::milliseconds drainTimeout{5000};
};

class CallbackBridge {
public:
    using Operation = std::function<void(CorrelationId)>;
    using ProgressObserver =
        std::function<void(CorrelationId, std::uint64_t /*done*/,
                           std::uint64_t /*total*/, double /*speed*/)>;

    // One pool for every call.
    explicit CallbackBridge(WorkerPool &pool, BridgeOptions opts = {});
    // Long-running calls go to transferPool.
    CallbackBridge(WorkerPool &callPool, WorkerPool &transferPool,
                   BridgeOptions opts = {});
    ~CallbackBridge();
    CallbackBridge(const CallbackBridge &) = delete;
    CallbackBridge &operator=(const CallbackBridge &) = delete;

    // Dispatches op(correlationId) to a worker pool and waits for the
    // matching callback. what names the call in logs and error messages.
    // An attempt withdrawn before a worker picked it up never runs op.
    CallResult call(const std::string &what, Operation op,
                    const CallOptions &opts = {});

    // Called from native callback threads. Returns true if the callback
    // resolved a pending call. Stale or unknown ids are ignored.
    bool deliver(CorrelationId id, CallbackKind kind, const std::string &step,
                 CallResult result) noexcept;
    // Same, translating the native callback arguments inside the guarded
    // boundary.
    bool deliver(CorrelationId id, CallbackKind kind, const std::string &step,
                 const std::function<CallResult()> &translate) noexcept;

    // Forwards transfer progress to the observer, guarded the same way.
    void deliverProgress(CorrelationId id, std::uint64_t done,
                         std::uint64_t total, double speed) noexcept;
    void setProgressObserver(ProgressObserver observer);

    // Cancellation observer: resolves every pending call with
    // CancelledByUser; later calls fail immediately. Idempotent.
    void cancel(const std::string &reason);
    bool isCancelled() const;

    // Teardown: withdraws pending calls, refuses new ones and waits (bounded)
    // for dispatched operations to return. Returns false on drain timeout.
    bool drain();

    std::size_t pendingCount() const;
    // Operations that started on a worker and have not returned yet.
    std::size_t inFlightCount() const;

private:
    struct Shared;
    struct DispatchTicket;
    WorkerPool &pool_;
    WorkerPool &transferPool_;
    const BridgeOptions opts_;
    std::shared_ptr<Shared> shared_;
};

} // namespace mirrorcore
