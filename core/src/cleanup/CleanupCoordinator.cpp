#include "mirrorcore/CleanupCoordinator.hpp"
#include <QLoggingCategory>
#include <exception>
#include <utility>
Q_LOGGING_CATEGORY(mcCleanup, "mirrorcore.cleanup")

namespace mirrorcore {

const char *cleanupStageName(CleanupStage stage) {
    switch (stage) {
    case CleanupStage::UnregisterListener:
        return "UnregisterListener";
    case CleanupStage::DrainSignals:
        return "DrainSignals";
    case CleanupStage::ReleaseHandle:
        return "ReleaseHandle";
    case CleanupStage::ClearReferences:
        return "ClearReferences";
    }
    return "Unknown";
}

CleanupCoordinator::CleanupCoordinator(std::string owner)
    : owner_(std::move(owner)) {}

CleanupCoordinator::~CleanupCoordinator() { (void)run(); }

void CleanupCoordinator::setStage(CleanupStage stage,
                                  std::function<void()> action) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (started_)
        return;
    stages_[static_cast<std::size_t>(stage)] = std::move(action);
}

bool CleanupCoordinator::run() {
    std::array<std::function<void()>, 4> stages;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (started_)
            return ok_;
        started_ = true;
        stages.swap(stages_);
    }
    bool ok = true;
    for (std::size_t i = 0; i < stages.size(); ++i) {
        const auto stage = static_cast<CleanupStage>(i);
        if (!stages[i])
            continue;
        std::string failure;
        try {
            stages[i]();
        } catch (const std::exception &e) {
            failure = e.what();
        } catch (...) {
            failure = "unknown exception";
        }
        std::lock_guard<std::mutex> lk(mtx_);
        executed_.push_back(stage);
        if (!failure.empty()) {
            ok = false;
            failures_.push_back(std::string(cleanupStageName(stage)) + ": " +
                                failure);
            qCWarning(mcCleanup) << "cleanup stage failed"
                                 << "owner=" << owner_.c_str()
                                 << "stage=" << cleanupStageName(stage)
                                 << "error=" << failure.c_str();
        }
    }
    // Drop captured references only after every stage ran.
    stages = {};
    {
        std::lock_guard<std::mutex> lk(mtx_);
        ok_ = ok;
    }
    qCDebug(mcCleanup) << "cleanup finished"
                       << "owner=" << owner_.c_str() << "ok=" << ok;
    return ok;
}

bool CleanupCoordinator::hasRun() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return started_;
}

std::vector<CleanupStage> CleanupCoordinator::executed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return executed_;
}

std::vector<std::string> CleanupCoordinator::failures() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return failures_;
}

} // namespace mirrorcore
