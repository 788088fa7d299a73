// Scripted in-memory NativeSession used by tests and the "mock" backend.
// Callbacks fire synchronously on the thread that issued the request.
#pragma once
#include "NativeSession.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace mirrorcore {

struct MockScript {
    std::string name = "mock.bin";
    std::uint64_t size = 1024;
    int chunks = 4;
    // Pause before every callback step.
    std::chrono::milliseconds stepDelay{0};
    // SDK reported speed; negative = not reported.
    double speed = -1.0;
    std::string link = "mock://link";

    // The first N login requests never answer (see replayDroppedLogins).
    int dropLoginCallbacks = 0;
    int loginError = nativecode::Ok;
    int resolveError = nativecode::Ok;
    bool resolveTemporaryError = false;
    bool throwInResolve = false;
    int transferError = nativecode::Ok;
    bool dropLogout = false;

    // When valid, transfers wait for it before reporting their finish.
    std::shared_future<void> hold;
};

class MockNativeSession : public NativeSession {
public:
    explicit MockNativeSession(MockScript script = {});
    ~MockNativeSession() override;

    std::string backendName() const override { return "mock"; }

    void addListener(NativeListener *listener) override;
    void removeListener(NativeListener *listener) override;

    void login(CorrelationId id) override;
    void fetchNodes(CorrelationId id) override;
    void resolveSource(CorrelationId id, const std::string &source) override;
    void startDownload(CorrelationId id, const std::string &source,
                       const std::string &localPath) override;
    void startUpload(CorrelationId id, const std::string &localPath,
                     const std::string &remotePath) override;
    void startCopy(CorrelationId id, const std::string &source,
                   const std::string &remotePath) override;
    void logout(CorrelationId id) override;
    void cancelTransfers() override;
    void release() override;

    // Answers every login request dropped so far, successfully, as a slow
    // native SDK eventually would.
    void replayDroppedLogins();

    std::vector<std::string> calls() const;
    int loginAttempts() const { return loginAttempts_.load(); }
    std::size_t listenerCount() const { return listeners_.size(); }
    int releaseCount() const { return releaseCount_.load(); }
    bool transfersCancelled() const { return cancelled_.load(); }

private:
    void record(const std::string &call);
    void pause() const;
    void finishRequest(CorrelationId id, RequestType type, int code,
                       const NodeInfo &node = {});
    void runTransfer(CorrelationId id, const std::string &what);

    const MockScript script_;
    NativeListenerSet listeners_;
    std::atomic<int> loginAttempts_{0};
    std::atomic<int> releaseCount_{0};
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mtx_; // protects calls_ and dropped_
    std::vector<std::string> calls_;
    std::vector<CorrelationId> dropped_;
};

} // namespace mirrorcore
