// NativeSession over SFTP (libssh2). Requests run blocking on the calling
// worker thread and answer through the listener callbacks before returning.
#pragma once
#include "NativeSession.hpp"
#include <atomic>
#include <mutex>
#include <string>

// Forward declarations of the internal libssh2 types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace mirrorcore {

class Libssh2Session : public NativeSession {
public:
    explicit Libssh2Session(SessionOptions opt);
    ~Libssh2Session() override;

    std::string backendName() const override { return "sftp"; }

    void addListener(NativeListener *listener) override;
    void removeListener(NativeListener *listener) override;

    // Connect + authenticate (Login), then open the SFTP subsystem
    // (FetchNodes).
    void login(CorrelationId id) override;
    void fetchNodes(CorrelationId id) override;
    // source is a remote path.
    void resolveSource(CorrelationId id, const std::string &source) override;
    void startDownload(CorrelationId id, const std::string &source,
                       const std::string &localPath) override;
    void startUpload(CorrelationId id, const std::string &localPath,
                     const std::string &remotePath) override;
    // Remote to remote copy streamed through this session.
    void startCopy(CorrelationId id, const std::string &source,
                   const std::string &remotePath) override;
    void logout(CorrelationId id) override;
    void cancelTransfers() override;
    void release() override;

    bool isConnected() const { return connected_.load(); }

private:
    bool tcpConnect(const std::string &host, uint16_t port, std::string &err);
    bool verifyHostKey(std::string &err);
    bool authenticate(std::string &err, int &code);
    bool openSftp(std::string &err);
    void teardownLocked();

    void finishRequest(CorrelationId id, RequestType type, int code,
                       const std::string &message, const NodeInfo &node = {});
    void transferUpdate(CorrelationId id, std::uint64_t done,
                        std::uint64_t total);
    void finishTransfer(CorrelationId id, int code, const std::string &message,
                        const std::string &link = {});

    const SessionOptions opt_;
    NativeListenerSet listeners_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> cancelled_{false};
    std::mutex ioMtx_; // serializes native calls on this session
    int sock_ = -1;
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;
};

} // namespace mirrorcore
