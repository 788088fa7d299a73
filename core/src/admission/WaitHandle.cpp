#include "mirrorcore/WaitHandle.hpp"
#include <utility>

namespace mirrorcore {

const char *waitOutcomeName(WaitOutcome outcome) {
    switch (outcome) {
    case WaitOutcome::Pending:
        return "Pending";
    case WaitOutcome::Promoted:
        return "Promoted";
    case WaitOutcome::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

bool WaitHandle::fire(WaitOutcome outcome) {
    if (outcome == WaitOutcome::Pending)
        return false;
    std::vector<std::function<void(WaitOutcome)>> pending;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (outcome_ != WaitOutcome::Pending)
            return false;
        outcome_ = outcome;
        pending.swap(continuations_);
    }
    cv_.notify_all();
    // Continuations run outside the lock so they may touch the handle.
    for (auto &fn : pending)
        fn(outcome);
    return true;
}

WaitOutcome WaitHandle::outcome() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return outcome_;
}

WaitOutcome WaitHandle::wait() {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return outcome_ != WaitOutcome::Pending; });
    return outcome_;
}

WaitOutcome WaitHandle::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_for(lk, timeout,
                 [this] { return outcome_ != WaitOutcome::Pending; });
    return outcome_;
}

void WaitHandle::onFired(std::function<void(WaitOutcome)> fn) {
    WaitOutcome current = WaitOutcome::Pending;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        current = outcome_;
        if (current == WaitOutcome::Pending) {
            continuations_.push_back(std::move(fn));
            return;
        }
    }
    fn(current);
}

} // namespace mirrorcore
