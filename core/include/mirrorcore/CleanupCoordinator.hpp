// Teardown ordering for backends that wrap a native SDK session:
//   unregister listener -> drain pending signals -> release native handle
//   -> clear references
// A handle must not be released while a listener can still fire into it.
#pragma once
#include <array>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mirrorcore {

enum class CleanupStage {
    UnregisterListener = 0,
    DrainSignals = 1,
    ReleaseHandle = 2,
    ClearReferences = 3
};

const char *cleanupStageName(CleanupStage stage);

class CleanupCoordinator {
public:
    explicit CleanupCoordinator(std::string owner = {});
    // Runs the stages if nobody did.
    ~CleanupCoordinator();
    CleanupCoordinator(const CleanupCoordinator &) = delete;
    CleanupCoordinator &operator=(const CleanupCoordinator &) = delete;

    // Replaces the action of a stage. Ignored once run() started.
    void setStage(CleanupStage stage, std::function<void()> action);

    // Executes every registered stage once, in order. A stage that throws is
    // logged and the remaining stages still run. Returns false if any stage
    // failed; later calls are no-ops returning the first outcome.
    bool run();

    bool hasRun() const;
    // Stages executed so far, in execution order.
    std::vector<CleanupStage> executed() const;
    std::vector<std::string> failures() const;

private:
    const std::string owner_;
    mutable std::mutex mtx_;
    std::array<std::function<void()>, 4> stages_;
    bool started_ = false;
    bool ok_ = true;
    std::vector<CleanupStage> executed_;
    std::vector<std::string> failures_;
};

} // namespace mirrorcore
