// Bridge implementation: one promise per correlation id, bounded retries on
// handshake timeouts and a guarded boundary for native callbacks.
#include "mirrorcore/CallbackBridge.hpp"
#include "mirrorcore/WorkerPool.hpp"
#include <QLoggingCategory>
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>
Q_LOGGING_CATEGORY(mcBridge, "mirrorcore.bridge")

namespace mirrorcore {

const char *callbackKindName(CallbackKind kind) {
    switch (kind) {
    case CallbackKind::RequestStart:
        return "RequestStart";
    case CallbackKind::RequestFinish:
        return "RequestFinish";
    case CallbackKind::RequestTemporaryError:
        return "RequestTemporaryError";
    case CallbackKind::TransferStart:
        return "TransferStart";
    case CallbackKind::TransferUpdate:
        return "TransferUpdate";
    case CallbackKind::TransferFinish:
        return "TransferFinish";
    case CallbackKind::TransferTemporaryError:
        return "TransferTemporaryError";
    }
    return "Unknown";
}

CallResult CallResult::success(std::string value, std::uint64_t size) {
    CallResult r;
    r.value = std::move(value);
    r.size = size;
    return r;
}

CallResult CallResult::failure(ErrorKind kind, std::string message,
                               int nativeCode) {
    CallResult r;
    r.error = kind == ErrorKind::None ? ErrorKind::TransferFailed : kind;
    r.message = std::move(message);
    r.nativeCode = nativeCode;
    return r;
}

struct CallbackBridge::Shared {
    struct PendingCall {
        std::promise<CallResult> promise;
        // Set once a worker picked the operation up; the attempt's timeout
        // only runs from then on.
        bool started = false;
    };
    using PendingMap = std::unordered_map<CorrelationId, PendingCall>;

    mutable std::mutex mtx; // protects everything below
    // Wakes callers waiting for their job to start and drain() waiting for
    // running operations.
    std::condition_variable cv;
    PendingMap pending;
    CorrelationId nextId = 1;
    bool cancelled = false;
    bool closed = false;
    std::string cancelReason;
    std::size_t inFlight = 0;
    ProgressObserver observer;

    // Moves the promise out under the lock and fulfils it outside, so only
    // the first resolution of an id can ever win.
    bool resolve(CorrelationId id, CallResult result) {
        std::promise<CallResult> p;
        {
            std::lock_guard<std::mutex> lk(mtx);
            auto it = pending.find(id);
            if (it == pending.end())
                return false;
            p = std::move(it->second.promise);
            pending.erase(it);
        }
        p.set_value(std::move(result));
        cv.notify_all();
        return true;
    }

    void resolveAll(PendingMap &taken, ErrorKind kind,
                    const std::string &message) {
        for (auto &kv : taken)
            kv.second.promise.set_value(CallResult::failure(kind, message));
        taken.clear();
        cv.notify_all();
    }
};

// Travels with a dispatched operation. Even when the pool drops the job
// before running it, the call cannot be left waiting on it.
struct CallbackBridge::DispatchTicket {
    std::shared_ptr<Shared> shared;
    CorrelationId id = 0;
    bool ran = false;
    bool running = false;

    DispatchTicket(std::shared_ptr<Shared> s, CorrelationId i)
        : shared(std::move(s)), id(i) {}
    DispatchTicket(const DispatchTicket &) = delete;
    DispatchTicket &operator=(const DispatchTicket &) = delete;

    // Called on the worker before the operation. False when the attempt was
    // withdrawn while the job sat in the queue.
    bool begin() {
        ran = true;
        {
            std::lock_guard<std::mutex> lk(shared->mtx);
            auto it = shared->pending.find(id);
            if (shared->closed || shared->cancelled ||
                it == shared->pending.end())
                return false;
            it->second.started = true;
            running = true;
            ++shared->inFlight;
        }
        shared->cv.notify_all();
        return true;
    }

    ~DispatchTicket() {
        if (!ran)
            shared->resolve(id, CallResult::failure(
                                    ErrorKind::BackendInstability,
                                    "operation dropped before it ran"));
        if (!running)
            return;
        {
            std::lock_guard<std::mutex> lk(shared->mtx);
            --shared->inFlight;
        }
        shared->cv.notify_all();
    }
};

namespace {

std::chrono::milliseconds escalate(std::chrono::milliseconds current,
                                   double factor) {
    if (!(factor > 1.0))
        return current;
    const double next = static_cast<double>(current.count()) * factor;
    return std::chrono::milliseconds(static_cast<std::int64_t>(next));
}

} // namespace

CallbackBridge::CallbackBridge(WorkerPool &pool, BridgeOptions opts)
    : CallbackBridge(pool, pool, std::move(opts)) {}

CallbackBridge::CallbackBridge(WorkerPool &callPool, WorkerPool &transferPool,
                               BridgeOptions opts)
    : pool_(callPool), transferPool_(transferPool), opts_(std::move(opts)),
      shared_(std::make_shared<Shared>()) {}

CallbackBridge::~CallbackBridge() { (void)drain(); }

CallResult CallbackBridge::call(const std::string &what, Operation op,
                                const CallOptions &opts) {
    const int maxAttempts =
        opts.retryable ? std::max(1, opts.maxAttempts) : 1;
    std::optional<std::chrono::milliseconds> timeout = opts.timeout;

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        CorrelationId id = 0;
        std::future<CallResult> fut;
        {
            std::lock_guard<std::mutex> lk(shared_->mtx);
            if (shared_->cancelled) {
                CallResult r = CallResult::failure(ErrorKind::CancelledByUser,
                                                   shared_->cancelReason);
                r.attempts = attempt - 1;
                return r;
            }
            if (shared_->closed) {
                CallResult r = CallResult::failure(
                    ErrorKind::BackendInstability, what + ": session closed");
                r.attempts = attempt - 1;
                return r;
            }
            // A fresh id per attempt: whatever arrives for an older attempt
            // finds nothing to resolve.
            id = shared_->nextId++;
            Shared::PendingCall call;
            fut = call.promise.get_future();
            shared_->pending.emplace(id, std::move(call));
        }
        qCDebug(mcBridge) << "call" << what.c_str() << "attempt=" << attempt
                          << "correlationId=" << id;

        WorkerPool &pool = opts.longRunning ? transferPool_ : pool_;
        const bool dispatched = pool.dispatch(
            [ticket = std::make_shared<DispatchTicket>(shared_, id), op,
             what]() {
                if (!ticket->begin()) {
                    qCDebug(mcBridge) << "withdrawn attempt skipped"
                                      << what.c_str()
                                      << "correlationId=" << ticket->id;
                    return;
                }
                try {
                    op(ticket->id);
                } catch (const std::exception &e) {
                    ticket->shared->resolve(
                        ticket->id,
                        CallResult::failure(ErrorKind::BackendInstability,
                                            std::string("native call threw: ") +
                                                e.what()));
                } catch (...) {
                    ticket->shared->resolve(
                        ticket->id,
                        CallResult::failure(ErrorKind::BackendInstability,
                                            "native call threw"));
                }
            });
        if (!dispatched)
            qCWarning(mcBridge) << "dispatch refused" << what.c_str();

        // Time spent queued behind other jobs does not count against the
        // attempt. Cancel, drain or a dropped job resolve the call instead.
        {
            std::unique_lock<std::mutex> lk(shared_->mtx);
            shared_->cv.wait(lk, [this, id] {
                auto it = shared_->pending.find(id);
                return it == shared_->pending.end() || it->second.started;
            });
        }

        bool ready = true;
        if (timeout.has_value()) {
            ready = fut.wait_for(*timeout) == std::future_status::ready;
            if (!ready) {
                bool withdrawn = false;
                {
                    std::lock_guard<std::mutex> lk(shared_->mtx);
                    withdrawn = shared_->pending.erase(id) > 0;
                }
                // Resolved between the timeout and the withdrawal: the result
                // still belongs to this attempt.
                ready = !withdrawn;
            }
        } else {
            fut.wait();
        }

        if (ready) {
            CallResult r = fut.get();
            r.attempts = attempt;
            if (!r.ok()) {
                qCWarning(mcBridge)
                    << "call failed" << what.c_str()
                    << "kind=" << errorKindName(r.error)
                    << "message=" << r.message.c_str();
            }
            return r;
        }

        qCWarning(mcBridge) << "call timed out" << what.c_str()
                            << "attempt=" << attempt << "of" << maxAttempts
                            << "timeoutMs=" << timeout->count();
        if (attempt < maxAttempts)
            timeout = escalate(*timeout, opts.escalation);
    }

    CallResult r = CallResult::failure(
        ErrorKind::TransientTimeout,
        what + " timed out after " + std::to_string(maxAttempts) +
            (maxAttempts == 1 ? " attempt" : " attempts"));
    r.attempts = maxAttempts;
    return r;
}

bool CallbackBridge::deliver(CorrelationId id, CallbackKind kind,
                             const std::string &step,
                             CallResult result) noexcept {
    try {
        switch (kind) {
        case CallbackKind::RequestStart:
        case CallbackKind::TransferStart:
        case CallbackKind::TransferUpdate:
            return false;
        case CallbackKind::TransferTemporaryError:
            // The SDK retries these on its own.
            qCWarning(mcBridge) << "temporary transfer error"
                                << "correlationId=" << id
                                << "message=" << result.message.c_str();
            return false;
        case CallbackKind::RequestFinish:
            if (result.ok() && opts_.nonTerminalSteps.count(step) > 0) {
                qCDebug(mcBridge) << "non-terminal step" << step.c_str()
                                  << "correlationId=" << id;
                return false;
            }
            break;
        case CallbackKind::RequestTemporaryError:
        case CallbackKind::TransferFinish:
            break;
        }
        const bool resolved = shared_->resolve(id, std::move(result));
        if (!resolved) {
            qCDebug(mcBridge) << "stale callback ignored"
                              << callbackKindName(kind) << step.c_str()
                              << "correlationId=" << id;
        }
        return resolved;
    } catch (const std::exception &e) {
        qCWarning(mcBridge) << "callback delivery failed:" << e.what();
    } catch (...) {
        qCWarning(mcBridge) << "callback delivery failed";
    }
    return false;
}

bool CallbackBridge::deliver(
    CorrelationId id, CallbackKind kind, const std::string &step,
    const std::function<CallResult()> &translate) noexcept {
    CallResult result;
    try {
        result = translate ? translate() : CallResult::success();
    } catch (const std::exception &e) {
        result = CallResult::failure(ErrorKind::BackendInstability,
                                     std::string("callback failed: ") +
                                         e.what());
    } catch (...) {
        result = CallResult::failure(ErrorKind::BackendInstability,
                                     "callback failed");
    }
    return deliver(id, kind, step, std::move(result));
}

void CallbackBridge::deliverProgress(CorrelationId id, std::uint64_t done,
                                     std::uint64_t total,
                                     double speed) noexcept {
    try {
        ProgressObserver observer;
        {
            std::lock_guard<std::mutex> lk(shared_->mtx);
            if (shared_->closed)
                return;
            observer = shared_->observer;
        }
        if (observer)
            observer(id, done, total, speed);
    } catch (const std::exception &e) {
        qCWarning(mcBridge) << "progress observer threw:" << e.what();
    } catch (...) {
        qCWarning(mcBridge) << "progress observer threw";
    }
}

void CallbackBridge::setProgressObserver(ProgressObserver observer) {
    std::lock_guard<std::mutex> lk(shared_->mtx);
    shared_->observer = std::move(observer);
}

void CallbackBridge::cancel(const std::string &reason) {
    Shared::PendingMap taken;
    {
        std::lock_guard<std::mutex> lk(shared_->mtx);
        if (shared_->cancelled)
            return;
        shared_->cancelled = true;
        shared_->cancelReason = reason.empty() ? "cancelled" : reason;
        taken.swap(shared_->pending);
    }
    qCInfo(mcBridge) << "cancel" << reason.c_str()
                     << "pending=" << taken.size();
    shared_->resolveAll(taken, ErrorKind::CancelledByUser,
                        reason.empty() ? "cancelled" : reason);
}

bool CallbackBridge::isCancelled() const {
    std::lock_guard<std::mutex> lk(shared_->mtx);
    return shared_->cancelled;
}

bool CallbackBridge::drain() {
    Shared::PendingMap taken;
    {
        std::lock_guard<std::mutex> lk(shared_->mtx);
        shared_->closed = true;
        shared_->observer = nullptr;
        taken.swap(shared_->pending);
    }
    shared_->resolveAll(taken, ErrorKind::BackendInstability,
                        "session closed");

    std::unique_lock<std::mutex> lk(shared_->mtx);
    const bool idle = shared_->cv.wait_for(
        lk, opts_.drainTimeout, [this] { return shared_->inFlight == 0; });
    if (!idle) {
        qCWarning(mcBridge) << "drain timeout"
                            << "inFlight=" << shared_->inFlight;
    }
    return idle;
}

std::size_t CallbackBridge::pendingCount() const {
    std::lock_guard<std::mutex> lk(shared_->mtx);
    return shared_->pending.size();
}

std::size_t CallbackBridge::inFlightCount() const {
    std::lock_guard<std::mutex> lk(shared_->mtx);
    return shared_->inFlight;
}

} // namespace mirrorcore
