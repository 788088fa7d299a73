#include "mirrorcore/NativeSession.hpp"
#include <algorithm>

namespace mirrorcore {

const char *requestTypeName(RequestType type) {
    switch (type) {
    case RequestType::Login:
        return "login";
    case RequestType::FetchNodes:
        return "fetchNodes";
    case RequestType::ResolveSource:
        return "resolveSource";
    case RequestType::Logout:
        return "logout";
    }
    return "unknown";
}

void NativeListenerSet::add(NativeListener *listener) {
    if (!listener)
        return;
    std::lock_guard<std::mutex> lk(mtx_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) ==
        listeners_.end())
        listeners_.push_back(listener);
}

void NativeListenerSet::remove(NativeListener *listener) {
    std::lock_guard<std::mutex> lk(mtx_);
    listeners_.erase(
        std::remove(listeners_.begin(), listeners_.end(), listener),
        listeners_.end());
}

std::size_t NativeListenerSet::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return listeners_.size();
}

void NativeListenerSet::forEach(
    const std::function<void(NativeListener &)> &fn) const {
    std::lock_guard<std::mutex> lk(mtx_);
    for (NativeListener *l : listeners_)
        fn(*l);
}

} // namespace mirrorcore
