// Status adapters for running and queued tasks.
#pragma once
#include "TaskStatus.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>

namespace mirrorcore {

// Measures transfer speed from progress samples when the native SDK does not
// report one itself.
class SpeedMeter {
public:
    using clock = std::chrono::steady_clock;

    void sample(std::uint64_t done, clock::time_point now = clock::now());
    double bytesPerSecond() const;

private:
    mutable std::mutex mtx_;
    bool hasSample_ = false;
    std::uint64_t lastDone_ = 0;
    clock::time_point lastTick_{};
    double speed_ = 0.0;
};

// Shared implementation for the Download/Upload/Clone adapters. The backend
// owning the task writes progress; the status board only reads.
class TransferStatus : public TaskStatus {
public:
    TransferStatus(std::shared_ptr<Task> task, TaskState runningState);

    std::string name() const override;
    std::uint64_t size() const override;
    std::uint64_t processedBytes() const override;
    double speed() const override;
    std::string gid() const override;
    TaskState state() const override;
    std::string backend() const override;
    bool cancel(std::string &err) override;
    std::shared_ptr<Task> task() const override { return task_; }

    // Backend side. total == 0 keeps the size already known.
    // sdkSpeed < 0 means "not reported", use the measured speed.
    void updateProgress(std::uint64_t done, std::uint64_t total,
                        double sdkSpeed = -1.0);
    void setName(const std::string &name);
    // Invoked once, on the first cancel(), to interrupt the native transfer.
    void setCancelHandler(std::function<void()> handler);

private:
    std::shared_ptr<Task> task_;
    const TaskState runningState_;
    std::atomic<std::uint64_t> processed_{0};
    std::atomic<double> reportedSpeed_{-1.0};
    SpeedMeter meter_;
    mutable std::mutex mtx_; // protects resolvedName_ and cancelHandler_
    std::string resolvedName_;
    std::function<void()> cancelHandler_;
};

class DownloadStatus final : public TransferStatus {
public:
    explicit DownloadStatus(std::shared_ptr<Task> task)
        : TransferStatus(std::move(task), TaskState::Downloading) {}
};

class UploadStatus final : public TransferStatus {
public:
    explicit UploadStatus(std::shared_ptr<Task> task)
        : TransferStatus(std::move(task), TaskState::Uploading) {}
};

class CloneStatus final : public TransferStatus {
public:
    explicit CloneStatus(std::shared_ptr<Task> task)
        : TransferStatus(std::move(task), TaskState::Cloning) {}
};

// Picks the adapter matching the task kind.
std::shared_ptr<TransferStatus> makeTransferStatus(std::shared_ptr<Task> task);

// Placeholder registered while a task waits for capacity.
class QueueStatus final : public TaskStatus {
public:
    // dequeue removes the task from its wait queue; it returns false when
    // the task was not queued any more.
    QueueStatus(std::shared_ptr<Task> task,
                std::function<bool(TaskId)> dequeue);

    std::string name() const override { return task_->name(); }
    std::uint64_t size() const override { return task_->size(); }
    std::uint64_t processedBytes() const override { return 0; }
    double speed() const override { return 0.0; }
    std::string gid() const override { return task_->gid(); }
    TaskState state() const override;
    std::string backend() const override { return task_->backend(); }
    bool cancel(std::string &err) override;
    std::shared_ptr<Task> task() const override { return task_; }

private:
    std::shared_ptr<Task> task_;
    std::function<bool(TaskId)> dequeue_;
};

} // namespace mirrorcore
