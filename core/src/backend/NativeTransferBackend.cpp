#include "mirrorcore/NativeTransferBackend.hpp"
#include "mirrorcore/CoreConfig.hpp"
#include "mirrorcore/RuntimeLogging.hpp"
#include "mirrorcore/WorkerPool.hpp"
#include <QLoggingCategory>
#include <QMimeDatabase>
#include <QMimeType>
#include <QString>
#include <mutex>
#include <stdexcept>
#include <utility>
Q_LOGGING_CATEGORY(mcBackend, "mirrorcore.backend")

namespace mirrorcore {

namespace {

const std::string kTransferStep = "transfer";

ErrorKind requestErrorKind(int code) {
    switch (code) {
    case nativecode::Access:
        return ErrorKind::PermanentAuthError;
    case nativecode::Incomplete:
        return ErrorKind::CancelledByUser;
    case nativecode::NotFound:
    case nativecode::Args:
        return ErrorKind::TransferFailed;
    default:
        return ErrorKind::BackendInstability;
    }
}

ErrorKind transferErrorKind(int code) {
    return code == nativecode::Incomplete ? ErrorKind::CancelledByUser
                                          : ErrorKind::TransferFailed;
}

std::string mimeTypeFor(const std::string &name) {
    static const QMimeDatabase db;
    const QMimeType t = db.mimeTypeForFile(QString::fromStdString(name),
                                           QMimeDatabase::MatchExtension);
    return t.isValid() ? t.name().toStdString()
                       : std::string("application/octet-stream");
}

TransferOutcome cancelledOutcome() {
    TransferOutcome out;
    out.error = TaskError{ErrorKind::CancelledByUser, "cancelled"};
    return out;
}

} // namespace

NativeBackendOptions NativeBackendOptions::fromConfig(const CoreConfig &cfg) {
    NativeBackendOptions o;
    o.loginTimeout = cfg.loginTimeout;
    o.resolveTimeout = cfg.resolveTimeout;
    o.logoutTimeout = cfg.logoutTimeout;
    o.handshakeAttempts = cfg.handshakeAttempts;
    o.timeoutEscalation = cfg.timeoutEscalation;
    return o;
}

struct NativeTransferBackend::SessionSlot {
    std::mutex mtx; // protects session
    std::unique_ptr<NativeSession> session;

    NativeSession *get() {
        std::lock_guard<std::mutex> lk(mtx);
        return session.get();
    }

    NativeSession &live() {
        NativeSession *s = get();
        if (!s)
            throw std::runtime_error("native session already released");
        return *s;
    }
};

NativeTransferBackend::NativeTransferBackend(
    WorkerPool &pool, std::unique_ptr<NativeSession> nativeSession,
    NativeBackendOptions opts)
    : NativeTransferBackend(pool, pool, std::move(nativeSession), opts) {}

NativeTransferBackend::NativeTransferBackend(
    WorkerPool &callPool, WorkerPool &transferPool,
    std::unique_ptr<NativeSession> nativeSession, NativeBackendOptions opts)
    : name_(nativeSession ? nativeSession->backendName()
                          : std::string("native")),
      opts_(opts),
      // A successful login is followed by the node fetch; only the latter
      // completes the handshake.
      bridge_(callPool, transferPool,
              BridgeOptions{{requestTypeName(RequestType::Login)},
                            std::chrono::milliseconds(5000)}),
      cleanup_(name_), slot_(std::make_shared<SessionSlot>()) {
    if (!nativeSession)
        throw std::invalid_argument("NativeTransferBackend needs a session");
    slot_->session = std::move(nativeSession);
    slot_->session->addListener(this);

    auto drained = std::make_shared<bool>(false);
    cleanup_.setStage(CleanupStage::UnregisterListener, [this] {
        if (NativeSession *s = slot_->get())
            s->removeListener(this);
    });
    cleanup_.setStage(CleanupStage::DrainSignals, [this, drained] {
        *drained = bridge_.drain();
        if (!*drained)
            throw std::runtime_error("native operations still running");
    });
    cleanup_.setStage(CleanupStage::ReleaseHandle, [this, drained] {
        if (!*drained) {
            // Freeing under a running operation corrupts the native session.
            qCWarning(mcBackend) << "native handle not released"
                                 << "backend=" << name_.c_str();
            return;
        }
        if (NativeSession *s = slot_->get())
            s->release();
    });
    cleanup_.setStage(CleanupStage::ClearReferences, [this, drained] {
        std::lock_guard<std::mutex> lk(slot_->mtx);
        // Not drained: leaked on purpose, see ReleaseHandle.
        if (*drained)
            slot_->session.reset();
        else
            (void)slot_->session.release();
    });
}

NativeTransferBackend::~NativeTransferBackend() { (void)cleanup_.run(); }

TransferOutcome
NativeTransferBackend::run(const std::shared_ptr<Task> &task,
                           TransferStatus &status,
                           const std::function<bool()> &shouldCancel) {
    TransferOutcome out;
    try {
        out = transfer(task, status, shouldCancel);
    } catch (const std::exception &e) {
        out.error = TaskError{ErrorKind::BackendInstability, e.what()};
    }
    if (!bridge_.isCancelled() && !task->isCancelled())
        logout();
    if (!cleanup_.run()) {
        for (const auto &f : cleanup_.failures())
            qCWarning(mcBackend) << "cleanup:" << f.c_str();
    }
    return out;
}

TransferOutcome
NativeTransferBackend::transfer(const std::shared_ptr<Task> &task,
                                TransferStatus &status,
                                const std::function<bool()> &shouldCancel) {
    auto cancelled = [&]() {
        if (task->isCancelled() || bridge_.isCancelled())
            return true;
        if (shouldCancel && shouldCancel()) {
            std::string err;
            status.cancel(err);
            return true;
        }
        return false;
    };

    // status outlives every progress callback: the listener is removed and
    // the bridge drained before run() returns.
    bridge_.setProgressObserver(
        [task, &status, shouldCancel](CorrelationId, std::uint64_t done,
                                      std::uint64_t total, double speed) {
            status.updateProgress(done, total, speed);
            if (!task->isCancelled() && shouldCancel && shouldCancel()) {
                std::string err;
                status.cancel(err);
            }
        });
    struct ObserverReset {
        CallbackBridge &bridge;
        ~ObserverReset() { bridge.setProgressObserver(nullptr); }
    } observerReset{bridge_};

    if (cancelled())
        return cancelledOutcome();

    CallOptions handshake;
    handshake.retryable = true;
    handshake.maxAttempts = opts_.handshakeAttempts;
    handshake.escalation = opts_.timeoutEscalation;

    handshake.timeout = opts_.loginTimeout;
    CallResult r = bridge_.call(
        "login", [slot = slot_](CorrelationId id) { slot->live().login(id); },
        handshake);
    if (!r.ok())
        return TransferOutcome{r.toError(), {}, 0, 0, {}};
    qCInfo(mcBackend) << "logged in"
                      << "task=" << task->gid().c_str()
                      << "attempts=" << r.attempts;
    if (cancelled())
        return cancelledOutcome();

    const std::string source = task->source();
    const std::string destination = task->destination();
    if (task->kind() != TaskKind::Upload) {
        handshake.timeout = opts_.resolveTimeout;
        r = bridge_.call(
            "resolveSource",
            [slot = slot_, source](CorrelationId id) {
                slot->live().resolveSource(id, source);
            },
            handshake);
        if (!r.ok())
            return TransferOutcome{r.toError(), {}, 0, 0, {}};
        if (r.size > 0)
            task->setSize(r.size);
        if (!r.value.empty())
            status.setName(r.value);
        qCInfo(mcBackend) << "source resolved"
                          << "task=" << task->gid().c_str()
                          << "source=" << sensitive(source).c_str()
                          << "size=" << r.size;
        if (cancelled())
            return cancelledOutcome();
    }

    // Transfers report liveness through progress callbacks: no timeout.
    CallOptions longRunning;
    longRunning.longRunning = true;
    switch (task->kind()) {
    case TaskKind::Download:
        r = bridge_.call(
            "download",
            [slot = slot_, source, destination](CorrelationId id) {
                slot->live().startDownload(id, source, destination);
            },
            longRunning);
        break;
    case TaskKind::Upload:
        r = bridge_.call(
            "upload",
            [slot = slot_, source, destination](CorrelationId id) {
                slot->live().startUpload(id, source, destination);
            },
            longRunning);
        break;
    case TaskKind::Clone:
        r = bridge_.call(
            "copy",
            [slot = slot_, source, destination](CorrelationId id) {
                slot->live().startCopy(id, source, destination);
            },
            longRunning);
        break;
    }
    if (!r.ok())
        return TransferOutcome{r.toError(), {}, 0, 0, {}};
    if (cancelled())
        return cancelledOutcome();

    TransferOutcome out;
    out.link = r.value;
    out.fileCount = 1;
    out.folderCount = 0;
    out.mimeType = mimeTypeFor(status.name());
    return out;
}

void NativeTransferBackend::logout() {
    CallOptions opts;
    opts.timeout = opts_.logoutTimeout;
    const CallResult r = bridge_.call(
        "logout", [slot = slot_](CorrelationId id) { slot->live().logout(id); },
        opts);
    if (!r.ok()) {
        qCWarning(mcBackend) << "logout failed"
                             << "backend=" << name_.c_str()
                             << "message=" << r.message.c_str();
    }
}

void NativeTransferBackend::cancel() {
    bridge_.cancel("cancelled");
    std::lock_guard<std::mutex> lk(slot_->mtx);
    if (slot_->session)
        slot_->session->cancelTransfers();
}

void NativeTransferBackend::onRequestFinish(CorrelationId id, RequestType type,
                                            const NativeError &error,
                                            const NodeInfo &node) {
    bridge_.deliver(id, CallbackKind::RequestFinish, requestTypeName(type),
                    [&]() {
                        if (error.ok())
                            return CallResult::success(node.name, node.size);
                        return CallResult::failure(requestErrorKind(error.code),
                                                   error.message, error.code);
                    });
}

void NativeTransferBackend::onRequestTemporaryError(CorrelationId id,
                                                    RequestType type,
                                                    const NativeError &error) {
    bridge_.deliver(id, CallbackKind::RequestTemporaryError,
                    requestTypeName(type), [&]() {
                        return CallResult::failure(
                            ErrorKind::BackendInstability,
                            std::string(requestTypeName(type)) +
                                ": temporary error: " + error.message,
                            error.code);
                    });
}

void NativeTransferBackend::onTransferUpdate(CorrelationId id,
                                             std::uint64_t done,
                                             std::uint64_t total,
                                             double speed) {
    bridge_.deliverProgress(id, done, total, speed);
}

void NativeTransferBackend::onTransferFinish(CorrelationId id,
                                             const NativeError &error,
                                             const std::string &link) {
    bridge_.deliver(id, CallbackKind::TransferFinish, kTransferStep, [&]() {
        if (error.ok())
            return CallResult::success(link);
        return CallResult::failure(transferErrorKind(error.code),
                                   error.message, error.code);
    });
}

void NativeTransferBackend::onTransferTemporaryError(CorrelationId id,
                                                     const NativeError &error) {
    bridge_.deliver(id, CallbackKind::TransferTemporaryError, kTransferStep,
                    CallResult::failure(ErrorKind::TransferFailed,
                                        error.message, error.code));
}

} // namespace mirrorcore
