// Listener-based native SDK abstraction.
//
// Every request carries a correlation id chosen by the caller. The session
// answers through NativeListener callbacks tagged with that id, from whatever
// thread it likes. Requests never return results directly.
//
// login is a two-step handshake: a successful Login finish is followed by a
// FetchNodes finish under the same correlation id once the session is usable.
#pragma once
#include "CallbackBridge.hpp"
#include "SessionTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mirrorcore {

enum class RequestType { Login, FetchNodes, ResolveSource, Logout };

// Lower camel case step name ("login", "fetchNodes", ...).
const char *requestTypeName(RequestType type);

class NativeListener {
public:
    virtual ~NativeListener() = default;

    virtual void onRequestStart(CorrelationId id, RequestType type) {
        (void)id;
        (void)type;
    }
    virtual void onRequestFinish(CorrelationId id, RequestType type,
                                 const NativeError &error,
                                 const NodeInfo &node) = 0;
    virtual void onRequestTemporaryError(CorrelationId id, RequestType type,
                                         const NativeError &error) = 0;

    virtual void onTransferStart(CorrelationId id, std::uint64_t total) {
        (void)id;
        (void)total;
    }
    virtual void onTransferUpdate(CorrelationId id, std::uint64_t done,
                                  std::uint64_t total, double speed) = 0;
    // link is the destination reference (remote path, public link...).
    virtual void onTransferFinish(CorrelationId id, const NativeError &error,
                                  const std::string &link) = 0;
    virtual void onTransferTemporaryError(CorrelationId id,
                                          const NativeError &error) {
        (void)id;
        (void)error;
    }
};

// Listener bookkeeping shared by session implementations. Callbacks run under
// the set's lock so removal waits for a callback in progress.
class NativeListenerSet {
public:
    void add(NativeListener *listener);
    void remove(NativeListener *listener);
    std::size_t size() const;
    void forEach(const std::function<void(NativeListener &)> &fn) const;

private:
    mutable std::mutex mtx_;
    std::vector<NativeListener *> listeners_;
};

class NativeSession {
public:
    virtual ~NativeSession() = default;

    virtual std::string backendName() const = 0;

    virtual void addListener(NativeListener *listener) = 0;
    // No callback reaches the listener once this returns.
    virtual void removeListener(NativeListener *listener) = 0;

    virtual void login(CorrelationId id) = 0;
    virtual void fetchNodes(CorrelationId id) = 0;
    virtual void resolveSource(CorrelationId id, const std::string &source) = 0;
    virtual void startDownload(CorrelationId id, const std::string &source,
                               const std::string &localPath) = 0;
    virtual void startUpload(CorrelationId id, const std::string &localPath,
                             const std::string &remotePath) = 0;
    virtual void startCopy(CorrelationId id, const std::string &source,
                           const std::string &remotePath) = 0;
    virtual void logout(CorrelationId id) = 0;

    // Interrupts running transfers; they finish with nativecode::Incomplete.
    virtual void cancelTransfers() = 0;

    // Frees the native handle. Must only be called after every listener was
    // removed and no request is running.
    virtual void release() = 0;
};

} // namespace mirrorcore
