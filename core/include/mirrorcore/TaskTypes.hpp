// Basic types shared by the orchestration core, backends and the status layer.
// Keep these structures simple so they can cross thread boundaries cheaply.
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace mirrorcore {

using TaskId = std::uint64_t;

// Bucket names used by the scheduler. Any other name is a valid bucket too.
inline const std::string kBucketAll = "all";
inline const std::string kBucketDownload = "download";
inline const std::string kBucketUpload = "upload";

enum class TaskKind { Download, Upload, Clone };

// Externally visible state reported by every status adapter.
enum class TaskState {
    Queued,
    Downloading,
    Uploading,
    Cloning,
    Completed,
    Error,
    Cancelled
};

// Lifecycle phase tracked by the core:
//  Created -> [Queued] -> Running -> Completed | Error | Cancelled
enum class TaskPhase { Created, Queued, Running, Completed, Error, Cancelled };

enum class ErrorKind {
    None,
    TransientTimeout,   // bridge handshake timed out; retryable
    PermanentAuthError, // credentials rejected; not retried
    CancelledByUser,
    BackendInstability, // session must not be reused
    TransferFailed
};

struct TaskError {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }
    bool retryable() const { return kind == ErrorKind::TransientTimeout; }
};

const char *taskKindName(TaskKind kind);
const char *taskStateName(TaskState state);
const char *taskPhaseName(TaskPhase phase);
const char *errorKindName(ErrorKind kind);

bool isTerminal(TaskPhase phase);

// Running state shown while a task of the given kind is active.
TaskState runningStateFor(TaskKind kind);

// Buckets a task of the given kind counts against.
std::vector<std::string> bucketsFor(TaskKind kind);

// Stable external identifier shown to users for a task id.
std::string gidFor(TaskId id);

// Submission parameters. Everything except the size is fixed at creation.
struct TaskRequest {
    std::int64_t userId = 0;
    TaskKind kind = TaskKind::Download;
    std::string backend; // "sftp", "mock", ...
    std::string name;
    std::string source;      // remote path/link for downloads, local for uploads
    std::string destination; // local for downloads, remote for uploads
    std::uint64_t size = 0;  // 0 = unknown until the backend resolves it
};

// One submitted transfer job. Shared by pointer between the registry entry,
// the admission queue and the backend; never copied.
class Task {
public:
    Task(TaskId id, TaskRequest request);
    Task(const Task &) = delete;
    Task &operator=(const Task &) = delete;

    TaskId id() const { return id_; }
    const std::string &gid() const { return gid_; }
    std::int64_t userId() const { return request_.userId; }
    TaskKind kind() const { return request_.kind; }
    const std::string &backend() const { return request_.backend; }
    const std::string &name() const { return request_.name; }
    const std::string &source() const { return request_.source; }
    const std::string &destination() const { return request_.destination; }
    std::chrono::system_clock::time_point createdAt() const {
        return createdAt_;
    }

    std::uint64_t size() const { return size_.load(); }
    void setSize(std::uint64_t bytes) { size_.store(bytes); }

    bool isCancelled() const { return cancelled_.load(); }
    // Returns true only for the call that flipped the flag.
    bool markCancelled();

    TaskPhase phase() const { return phase_.load(); }
    // Non-terminal moves; fails once the task reached a terminal phase.
    bool enterQueued();
    bool enterRunning();
    // Only the first terminal transition succeeds.
    bool finish(TaskPhase terminal);

private:
    const TaskId id_;
    const std::string gid_;
    const TaskRequest request_;
    const std::chrono::system_clock::time_point createdAt_;
    std::atomic<std::uint64_t> size_{0};
    std::atomic<bool> cancelled_{false};
    std::atomic<TaskPhase> phase_{TaskPhase::Created};
};

} // namespace mirrorcore
