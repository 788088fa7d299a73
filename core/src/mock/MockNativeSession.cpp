#include "mirrorcore/MockNativeSession.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace mirrorcore {

namespace {

std::string messageFor(int code) {
    switch (code) {
    case nativecode::Ok:
        return {};
    case nativecode::Args:
        return "Invalid argument";
    case nativecode::Again:
        return "Temporary error, try again";
    case nativecode::NotFound:
        return "Not found";
    case nativecode::Access:
        return "Access denied";
    case nativecode::Incomplete:
        return "Transfer interrupted";
    case nativecode::Io:
        return "Read/write error";
    default:
        return "Native failure " + std::to_string(code);
    }
}

} // namespace

MockNativeSession::MockNativeSession(MockScript script)
    : script_(std::move(script)) {}

MockNativeSession::~MockNativeSession() = default;

void MockNativeSession::addListener(NativeListener *listener) {
    listeners_.add(listener);
}

void MockNativeSession::removeListener(NativeListener *listener) {
    listeners_.remove(listener);
}

void MockNativeSession::record(const std::string &call) {
    std::lock_guard<std::mutex> lk(mtx_);
    calls_.push_back(call);
}

void MockNativeSession::pause() const {
    if (script_.stepDelay.count() > 0)
        std::this_thread::sleep_for(script_.stepDelay);
}

void MockNativeSession::finishRequest(CorrelationId id, RequestType type,
                                      int code, const NodeInfo &node) {
    const NativeError error{code, messageFor(code)};
    listeners_.forEach([&](NativeListener &l) {
        l.onRequestFinish(id, type, error, node);
    });
}

void MockNativeSession::login(CorrelationId id) {
    record("login");
    const int attempt = ++loginAttempts_;
    if (attempt <= script_.dropLoginCallbacks) {
        std::lock_guard<std::mutex> lk(mtx_);
        dropped_.push_back(id);
        return;
    }
    listeners_.forEach(
        [&](NativeListener &l) { l.onRequestStart(id, RequestType::Login); });
    pause();
    finishRequest(id, RequestType::Login, script_.loginError);
    if (script_.loginError != nativecode::Ok)
        return;
    pause();
    finishRequest(id, RequestType::FetchNodes, nativecode::Ok);
}

void MockNativeSession::fetchNodes(CorrelationId id) {
    record("fetchNodes");
    pause();
    finishRequest(id, RequestType::FetchNodes, nativecode::Ok);
}

void MockNativeSession::resolveSource(CorrelationId id,
                                      const std::string &source) {
    record("resolveSource:" + source);
    if (script_.throwInResolve)
        throw std::runtime_error("mock resolve exploded");
    pause();
    if (script_.resolveTemporaryError) {
        const NativeError error{nativecode::Again,
                                messageFor(nativecode::Again)};
        listeners_.forEach([&](NativeListener &l) {
            l.onRequestTemporaryError(id, RequestType::ResolveSource, error);
        });
        return;
    }
    NodeInfo node;
    node.name = script_.name;
    node.size = script_.size;
    finishRequest(id, RequestType::ResolveSource, script_.resolveError, node);
}

void MockNativeSession::startDownload(CorrelationId id,
                                      const std::string &source,
                                      const std::string &localPath) {
    (void)localPath;
    runTransfer(id, "download:" + source);
}

void MockNativeSession::startUpload(CorrelationId id,
                                    const std::string &localPath,
                                    const std::string &remotePath) {
    (void)remotePath;
    runTransfer(id, "upload:" + localPath);
}

void MockNativeSession::startCopy(CorrelationId id, const std::string &source,
                                  const std::string &remotePath) {
    (void)remotePath;
    runTransfer(id, "copy:" + source);
}

void MockNativeSession::runTransfer(CorrelationId id, const std::string &what) {
    record(what);
    const std::uint64_t total = script_.size;
    listeners_.forEach(
        [&](NativeListener &l) { l.onTransferStart(id, total); });

    auto interrupted = [&]() {
        const NativeError error{nativecode::Incomplete,
                                messageFor(nativecode::Incomplete)};
        listeners_.forEach(
            [&](NativeListener &l) { l.onTransferFinish(id, error, {}); });
    };

    const int chunks = std::max(1, script_.chunks);
    for (int i = 1; i <= chunks; ++i) {
        if (cancelled_.load())
            return interrupted();
        pause();
        const std::uint64_t done = total * static_cast<std::uint64_t>(i) /
                                   static_cast<std::uint64_t>(chunks);
        listeners_.forEach([&](NativeListener &l) {
            l.onTransferUpdate(id, done, total, script_.speed);
        });
    }
    if (script_.hold.valid()) {
        while (script_.hold.wait_for(std::chrono::milliseconds(10)) !=
               std::future_status::ready) {
            if (cancelled_.load())
                return interrupted();
        }
    }
    if (cancelled_.load())
        return interrupted();

    const NativeError error{script_.transferError,
                            messageFor(script_.transferError)};
    const std::string link = error.ok() ? script_.link : std::string();
    listeners_.forEach(
        [&](NativeListener &l) { l.onTransferFinish(id, error, link); });
}

void MockNativeSession::logout(CorrelationId id) {
    record("logout");
    if (script_.dropLogout)
        return;
    pause();
    finishRequest(id, RequestType::Logout, nativecode::Ok);
}

void MockNativeSession::cancelTransfers() {
    record("cancelTransfers");
    cancelled_.store(true);
}

void MockNativeSession::release() {
    record("release");
    ++releaseCount_;
}

void MockNativeSession::replayDroppedLogins() {
    std::vector<CorrelationId> ids;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        ids.swap(dropped_);
    }
    for (CorrelationId id : ids) {
        finishRequest(id, RequestType::Login, nativecode::Ok);
        finishRequest(id, RequestType::FetchNodes, nativecode::Ok);
    }
}

std::vector<std::string> MockNativeSession::calls() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return calls_;
}

} // namespace mirrorcore
