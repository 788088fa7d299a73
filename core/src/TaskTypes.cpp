#include "mirrorcore/TaskTypes.hpp"

#include <cstdio>
#include <utility>

namespace mirrorcore {

const char *taskKindName(TaskKind kind) {
    switch (kind) {
    case TaskKind::Download:
        return "Download";
    case TaskKind::Upload:
        return "Upload";
    case TaskKind::Clone:
        return "Clone";
    }
    return "Unknown";
}

const char *taskStateName(TaskState state) {
    switch (state) {
    case TaskState::Queued:
        return "Queued";
    case TaskState::Downloading:
        return "Downloading";
    case TaskState::Uploading:
        return "Uploading";
    case TaskState::Cloning:
        return "Cloning";
    case TaskState::Completed:
        return "Completed";
    case TaskState::Error:
        return "Error";
    case TaskState::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

const char *taskPhaseName(TaskPhase phase) {
    switch (phase) {
    case TaskPhase::Created:
        return "Created";
    case TaskPhase::Queued:
        return "Queued";
    case TaskPhase::Running:
        return "Running";
    case TaskPhase::Completed:
        return "Completed";
    case TaskPhase::Error:
        return "Error";
    case TaskPhase::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

const char *errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::TransientTimeout:
        return "TransientTimeout";
    case ErrorKind::PermanentAuthError:
        return "PermanentAuthError";
    case ErrorKind::CancelledByUser:
        return "CancelledByUser";
    case ErrorKind::BackendInstability:
        return "BackendInstability";
    case ErrorKind::TransferFailed:
        return "TransferFailed";
    }
    return "Unknown";
}

bool isTerminal(TaskPhase phase) {
    return phase == TaskPhase::Completed || phase == TaskPhase::Error ||
           phase == TaskPhase::Cancelled;
}

TaskState runningStateFor(TaskKind kind) {
    switch (kind) {
    case TaskKind::Download:
        return TaskState::Downloading;
    case TaskKind::Upload:
        return TaskState::Uploading;
    case TaskKind::Clone:
        return TaskState::Cloning;
    }
    return TaskState::Downloading;
}

std::vector<std::string> bucketsFor(TaskKind kind) {
    switch (kind) {
    case TaskKind::Download:
        return {kBucketAll, kBucketDownload};
    case TaskKind::Upload:
        return {kBucketAll, kBucketUpload};
    case TaskKind::Clone:
        return {kBucketAll};
    }
    return {kBucketAll};
}

std::string gidFor(TaskId id) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "mc%010llx",
                  static_cast<unsigned long long>(id));
    return buf;
}

Task::Task(TaskId id, TaskRequest request)
    : id_(id), gid_(gidFor(id)), request_(std::move(request)),
      createdAt_(std::chrono::system_clock::now()) {
    size_.store(request_.size);
}

bool Task::markCancelled() {
    bool expected = false;
    return cancelled_.compare_exchange_strong(expected, true);
}

bool Task::enterQueued() {
    TaskPhase expected = TaskPhase::Created;
    return phase_.compare_exchange_strong(expected, TaskPhase::Queued);
}

bool Task::enterRunning() {
    TaskPhase current = phase_.load();
    while (current == TaskPhase::Created || current == TaskPhase::Queued) {
        if (phase_.compare_exchange_weak(current, TaskPhase::Running))
            return true;
    }
    return false;
}

bool Task::finish(TaskPhase terminal) {
    if (!isTerminal(terminal))
        return false;
    TaskPhase current = phase_.load();
    while (!isTerminal(current)) {
        if (phase_.compare_exchange_weak(current, terminal))
            return true;
    }
    return false;
}

} // namespace mirrorcore
