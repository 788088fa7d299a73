// Single-fire signal handed to a queued task. It fires exactly once, either
// because the task was promoted or because it was cancelled while waiting.
#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace mirrorcore {

enum class WaitOutcome { Pending, Promoted, Cancelled };

const char *waitOutcomeName(WaitOutcome outcome);

class WaitHandle {
public:
    WaitHandle() = default;
    WaitHandle(const WaitHandle &) = delete;
    WaitHandle &operator=(const WaitHandle &) = delete;

    // Returns false (and changes nothing) if the handle already fired.
    bool fire(WaitOutcome outcome);

    WaitOutcome outcome() const;
    bool fired() const { return outcome() != WaitOutcome::Pending; }

    WaitOutcome wait();
    // Pending on timeout.
    WaitOutcome waitFor(std::chrono::milliseconds timeout);

    // Runs fn on the firing thread, or immediately if already fired.
    void onFired(std::function<void(WaitOutcome)> fn);

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    WaitOutcome outcome_ = WaitOutcome::Pending;
    std::vector<std::function<void(WaitOutcome)>> continuations_;
};

} // namespace mirrorcore
