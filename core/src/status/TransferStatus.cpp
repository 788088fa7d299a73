// Status adapters: progress/ETA math that never divides by zero and the
// cancellation hooks backends attach to their native transfer.
#include "mirrorcore/TransferStatus.hpp"
#include <cmath>
#include <limits>
#include <utility>

namespace mirrorcore {

double progressPercent(std::uint64_t processed, std::uint64_t size) {
    if (size == 0)
        return 0.0;
    if (processed >= size)
        return 100.0;
    return static_cast<double>(processed) / static_cast<double>(size) * 100.0;
}

std::optional<std::chrono::seconds> estimateEta(std::uint64_t processed,
                                                std::uint64_t size,
                                                double bytesPerSecond) {
    if (size == 0)
        return std::nullopt;
    if (processed >= size)
        return std::chrono::seconds(0);
    if (!(bytesPerSecond > 0.0) || !std::isfinite(bytesPerSecond))
        return std::nullopt;
    const double secs = static_cast<double>(size - processed) / bytesPerSecond;
    if (secs > static_cast<double>(std::numeric_limits<std::int32_t>::max()))
        return std::nullopt;
    return std::chrono::seconds(static_cast<std::int64_t>(std::ceil(secs)));
}

double TaskStatus::progress() const {
    return progressPercent(processedBytes(), size());
}

std::optional<std::chrono::seconds> TaskStatus::eta() const {
    return estimateEta(processedBytes(), size(), speed());
}

void SpeedMeter::sample(std::uint64_t done, clock::time_point now) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!hasSample_ || done < lastDone_) {
        hasSample_ = true;
        lastDone_ = done;
        lastTick_ = now;
        return;
    }
    const double elapsedSec =
        std::chrono::duration_cast<std::chrono::duration<double>>(now -
                                                                  lastTick_)
            .count();
    // Ignore bursts of callbacks landing in the same tick.
    if (elapsedSec < 0.000001)
        return;
    const double deltaBytes = static_cast<double>(done - lastDone_);
    speed_ = deltaBytes / elapsedSec;
    lastDone_ = done;
    lastTick_ = now;
}

double SpeedMeter::bytesPerSecond() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return speed_;
}

TransferStatus::TransferStatus(std::shared_ptr<Task> task,
                               TaskState runningState)
    : task_(std::move(task)), runningState_(runningState) {}

std::string TransferStatus::name() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return resolvedName_.empty() ? task_->name() : resolvedName_;
}

std::uint64_t TransferStatus::size() const { return task_->size(); }

std::uint64_t TransferStatus::processedBytes() const {
    const std::uint64_t done = processed_.load();
    const std::uint64_t total = task_->size();
    if (total > 0 && done > total)
        return total;
    return done;
}

double TransferStatus::speed() const {
    if (isTerminal(task_->phase()))
        return 0.0;
    const double reported = reportedSpeed_.load();
    if (reported >= 0.0)
        return reported;
    return meter_.bytesPerSecond();
}

std::string TransferStatus::gid() const { return task_->gid(); }

TaskState TransferStatus::state() const {
    switch (task_->phase()) {
    case TaskPhase::Completed:
        return TaskState::Completed;
    case TaskPhase::Error:
        return TaskState::Error;
    case TaskPhase::Cancelled:
        return TaskState::Cancelled;
    case TaskPhase::Created:
    case TaskPhase::Queued:
        return TaskState::Queued;
    case TaskPhase::Running:
        break;
    }
    return task_->isCancelled() ? TaskState::Cancelled : runningState_;
}

std::string TransferStatus::backend() const { return task_->backend(); }

bool TransferStatus::cancel(std::string &err) {
    (void)err;
    if (isTerminal(task_->phase()))
        return true;
    if (!task_->markCancelled())
        return true; // second cancel is a no-op
    std::function<void()> handler;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        handler = cancelHandler_;
    }
    if (handler)
        handler();
    return true;
}

void TransferStatus::updateProgress(std::uint64_t done, std::uint64_t total,
                                    double sdkSpeed) {
    if (total > 0 && task_->size() != total)
        task_->setSize(total);
    processed_.store(done);
    reportedSpeed_.store(sdkSpeed);
    meter_.sample(done);
}

void TransferStatus::setName(const std::string &name) {
    std::lock_guard<std::mutex> lk(mtx_);
    resolvedName_ = name;
}

void TransferStatus::setCancelHandler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lk(mtx_);
    cancelHandler_ = std::move(handler);
}

std::shared_ptr<TransferStatus> makeTransferStatus(std::shared_ptr<Task> task) {
    switch (task->kind()) {
    case TaskKind::Download:
        return std::make_shared<DownloadStatus>(std::move(task));
    case TaskKind::Upload:
        return std::make_shared<UploadStatus>(std::move(task));
    case TaskKind::Clone:
        return std::make_shared<CloneStatus>(std::move(task));
    }
    return std::make_shared<DownloadStatus>(std::move(task));
}

QueueStatus::QueueStatus(std::shared_ptr<Task> task,
                         std::function<bool(TaskId)> dequeue)
    : task_(std::move(task)), dequeue_(std::move(dequeue)) {}

TaskState QueueStatus::state() const {
    switch (task_->phase()) {
    case TaskPhase::Completed:
        return TaskState::Completed;
    case TaskPhase::Error:
        return TaskState::Error;
    case TaskPhase::Cancelled:
        return TaskState::Cancelled;
    default:
        break;
    }
    return task_->isCancelled() ? TaskState::Cancelled : TaskState::Queued;
}

bool QueueStatus::cancel(std::string &err) {
    (void)err;
    if (isTerminal(task_->phase()))
        return true;
    task_->markCancelled();
    // A task promoted in the meantime notices the flag on its own.
    if (dequeue_)
        dequeue_(task_->id());
    return true;
}

} // namespace mirrorcore
