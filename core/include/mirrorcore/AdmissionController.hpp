// Admission control: decides whether a task may run now or must wait, keeps
// one FIFO wait list per bucket and promotes waiting tasks when slots free up.
#pragma once
#include "TaskTypes.hpp"
#include "WaitHandle.hpp"
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mirrorcore {

struct AdmissionDecision {
    enum class Kind { Run, Queue } kind = Kind::Run;
    // Only set for Queue: the caller must wait on it before proceeding.
    std::shared_ptr<WaitHandle> waitHandle;
    // Bucket whose wait list holds the task (Queue only).
    std::string bucket;

    bool runNow() const { return kind == Kind::Run; }
};

struct BucketStats {
    std::string name;
    std::size_t cap = 0; // 0 = unlimited
    std::size_t admitted = 0;
    std::size_t queued = 0;
};

class AdmissionController {
public:
    // caps: bucket name -> cap (0 = unlimited). Buckets not listed are
    // created on first use with an unlimited cap.
    explicit AdmissionController(std::map<std::string, std::size_t> caps = {});
    AdmissionController(const AdmissionController &) = delete;
    AdmissionController &operator=(const AdmissionController &) = delete;

    // Never fails. All buckets are checked together: a task over capacity in
    // any one of them is queued on the most constrained full bucket.
    AdmissionDecision admit(const std::shared_ptr<Task> &task,
                            const std::vector<std::string> &buckets);

    // Frees every slot the task holds and promotes waiting tasks. No-op for
    // tasks that are not admitted, so a second release cannot miscount.
    void release(TaskId id);

    // Removes a waiting task and fires its handle with Cancelled. Returns
    // false if the task is not waiting.
    bool cancelQueued(TaskId id);

    std::size_t cap(const std::string &bucket) const;
    std::size_t admittedCount(const std::string &bucket) const;
    std::size_t queuedCount(const std::string &bucket) const;
    bool isAdmitted(TaskId id) const;
    bool isQueued(TaskId id) const;
    std::vector<BucketStats> stats() const;

private:
    struct Bucket {
        std::size_t cap = 0;
        std::size_t admitted = 0;
        std::deque<TaskId> waiting;
    };
    struct Waiter {
        std::shared_ptr<Task> task;
        std::string bucket;
        std::vector<std::string> buckets;
        std::shared_ptr<WaitHandle> handle;
    };
    using Firing = std::vector<std::pair<std::shared_ptr<WaitHandle>, WaitOutcome>>;

    Bucket &bucketLocked(const std::string &name);
    bool fitsLocked(const std::vector<std::string> &buckets) const;
    AdmissionDecision admitLocked(const std::shared_ptr<Task> &task,
                                  std::vector<std::string> buckets);
    bool releaseLocked(TaskId id, std::vector<std::string> &freed);
    void promoteLocked(const std::vector<std::string> &preferred,
                       Firing &toFire);
    static void fireAll(Firing &toFire);

    mutable std::mutex mtx_; // protects everything below
    std::map<std::string, Bucket> buckets_;
    std::unordered_map<TaskId, std::vector<std::string>> admitted_;
    std::unordered_map<TaskId, Waiter> waiting_;
};

} // namespace mirrorcore
