// TransferBackend driving a NativeSession through a CallbackBridge.
// Steps: login -> resolve source -> transfer -> logout -> cleanup.
#pragma once
#include "CallbackBridge.hpp"
#include "CleanupCoordinator.hpp"
#include "NativeSession.hpp"
#include "TransferBackend.hpp"
#include <chrono>
#include <memory>

namespace mirrorcore {

struct CoreConfig;
class WorkerPool;

struct NativeBackendOptions {
    std::chrono::milliseconds loginTimeout{30000};
    std::chrono::milliseconds resolveTimeout{15000};
    std::chrono::milliseconds logoutTimeout{10000};
    int handshakeAttempts = 3;
    double timeoutEscalation = 2.0;

    static NativeBackendOptions fromConfig(const CoreConfig &cfg);
};

class NativeTransferBackend : public TransferBackend, private NativeListener {
public:
    NativeTransferBackend(WorkerPool &pool,
                          std::unique_ptr<NativeSession> nativeSession,
                          NativeBackendOptions opts = {});
    // Transfers run on transferPool; login, resolve and logout on callPool.
    NativeTransferBackend(WorkerPool &callPool, WorkerPool &transferPool,
                          std::unique_ptr<NativeSession> nativeSession,
                          NativeBackendOptions opts = {});
    ~NativeTransferBackend() override;

    std::string name() const override { return name_; }
    TransferOutcome run(const std::shared_ptr<Task> &task,
                        TransferStatus &status,
                        const std::function<bool()> &shouldCancel) override;
    void cancel() override;

    // Stages executed by the teardown so far.
    std::vector<CleanupStage> cleanupStages() const {
        return cleanup_.executed();
    }

private:
    // NativeListener
    void onRequestFinish(CorrelationId id, RequestType type,
                         const NativeError &error,
                         const NodeInfo &node) override;
    void onRequestTemporaryError(CorrelationId id, RequestType type,
                                 const NativeError &error) override;
    void onTransferUpdate(CorrelationId id, std::uint64_t done,
                          std::uint64_t total, double speed) override;
    void onTransferFinish(CorrelationId id, const NativeError &error,
                          const std::string &link) override;
    void onTransferTemporaryError(CorrelationId id,
                                  const NativeError &error) override;

    TransferOutcome transfer(const std::shared_ptr<Task> &task,
                             TransferStatus &status,
                             const std::function<bool()> &shouldCancel);
    void logout();

    struct SessionSlot;

    const std::string name_;
    const NativeBackendOptions opts_;
    CallbackBridge bridge_;
    CleanupCoordinator cleanup_;
    // Shared with dispatched operations, which may outlive the backend.
    std::shared_ptr<SessionSlot> slot_;
};

} // namespace mirrorcore
