// Admission implementation: per-bucket counters and FIFO wait lists guarded by
// a single mutex. Wait handles are fired after the mutex is released.
#include "mirrorcore/AdmissionController.hpp"
#include <QLoggingCategory>
#include <algorithm>
#include <utility>
Q_LOGGING_CATEGORY(mcAdmission, "mirrorcore.admission")

namespace mirrorcore {

namespace {

std::vector<std::string> uniqueBuckets(std::vector<std::string> buckets) {
    std::vector<std::string> out;
    out.reserve(buckets.size());
    for (auto &b : buckets) {
        if (b.empty())
            continue;
        if (std::find(out.begin(), out.end(), b) == out.end())
            out.push_back(std::move(b));
    }
    if (out.empty())
        out.push_back(kBucketAll);
    return out;
}

} // namespace

AdmissionController::AdmissionController(
    std::map<std::string, std::size_t> caps) {
    for (const auto &kv : caps)
        buckets_[kv.first].cap = kv.second;
}

AdmissionController::Bucket &
AdmissionController::bucketLocked(const std::string &name) {
    return buckets_[name];
}

bool AdmissionController::fitsLocked(
    const std::vector<std::string> &buckets) const {
    for (const auto &name : buckets) {
        auto it = buckets_.find(name);
        if (it == buckets_.end())
            continue; // unknown bucket: unlimited and empty
        const Bucket &b = it->second;
        if (b.cap != 0 && b.admitted >= b.cap)
            return false;
    }
    return true;
}

AdmissionDecision
AdmissionController::admitLocked(const std::shared_ptr<Task> &task,
                                 std::vector<std::string> buckets) {
    AdmissionDecision d;
    const TaskId id = task->id();
    buckets = uniqueBuckets(std::move(buckets));

    // A task must not be counted twice.
    if (admitted_.count(id) > 0) {
        d.kind = AdmissionDecision::Kind::Run;
        return d;
    }
    auto itWaiting = waiting_.find(id);
    if (itWaiting != waiting_.end()) {
        d.kind = AdmissionDecision::Kind::Queue;
        d.waitHandle = itWaiting->second.handle;
        d.bucket = itWaiting->second.bucket;
        return d;
    }

    for (const auto &name : buckets)
        (void)bucketLocked(name);

    // Waiting tasks keep their place: a newcomer does not overtake a
    // non-empty wait list even if a slot happens to be free right now.
    bool anyWaiting = false;
    for (const auto &name : buckets)
        anyWaiting = anyWaiting || !buckets_[name].waiting.empty();

    if (!anyWaiting && fitsLocked(buckets)) {
        for (const auto &name : buckets)
            buckets_[name].admitted += 1;
        admitted_[id] = buckets;
        d.kind = AdmissionDecision::Kind::Run;
        return d;
    }

    // Queue on the most constrained bucket: the full (or contended) bucket
    // with the smallest cap, first listed on ties.
    std::string target;
    std::size_t targetCap = 0;
    for (const auto &name : buckets) {
        const Bucket &b = buckets_[name];
        const bool full = b.cap != 0 && b.admitted >= b.cap;
        if (!full && b.waiting.empty())
            continue;
        if (target.empty() || (b.cap != 0 && (targetCap == 0 ||
                                              b.cap < targetCap))) {
            target = name;
            targetCap = b.cap;
        }
    }
    if (target.empty())
        target = buckets.front();

    Waiter w;
    w.task = task;
    w.bucket = target;
    w.buckets = buckets;
    w.handle = std::make_shared<WaitHandle>();
    buckets_[target].waiting.push_back(id);
    d.kind = AdmissionDecision::Kind::Queue;
    d.waitHandle = w.handle;
    d.bucket = target;
    waiting_.emplace(id, std::move(w));
    return d;
}

AdmissionDecision
AdmissionController::admit(const std::shared_ptr<Task> &task,
                           const std::vector<std::string> &buckets) {
    AdmissionDecision d;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        d = admitLocked(task, buckets);
    }
    if (d.runNow()) {
        qCInfo(mcAdmission) << "admit run"
                            << "taskId=" << task->id();
    } else {
        qCInfo(mcAdmission) << "admit queue"
                            << "taskId=" << task->id()
                            << "bucket=" << d.bucket.c_str();
    }
    return d;
}

bool AdmissionController::releaseLocked(TaskId id,
                                        std::vector<std::string> &freed) {
    auto it = admitted_.find(id);
    if (it == admitted_.end())
        return false;
    freed = std::move(it->second);
    admitted_.erase(it);
    for (const auto &name : freed) {
        Bucket &b = bucketLocked(name);
        if (b.admitted > 0)
            b.admitted -= 1;
    }
    return true;
}

void AdmissionController::promoteLocked(
    const std::vector<std::string> &preferred, Firing &toFire) {
    std::vector<std::string> order = preferred;
    for (const auto &kv : buckets_) {
        if (std::find(order.begin(), order.end(), kv.first) == order.end())
            order.push_back(kv.first);
    }

    bool progressed = true;
    while (progressed) {
        progressed = false;
        for (const auto &name : order) {
            Bucket &b = bucketLocked(name);
            while (!b.waiting.empty()) {
                const TaskId head = b.waiting.front();
                auto it = waiting_.find(head);
                if (it == waiting_.end()) {
                    b.waiting.pop_front();
                    continue;
                }
                Waiter &w = it->second;
                if (w.task->isCancelled()) {
                    // Cancelled while waiting: skipped, never promoted, and
                    // it does not use up the slot.
                    toFire.emplace_back(w.handle, WaitOutcome::Cancelled);
                    waiting_.erase(it);
                    b.waiting.pop_front();
                    continue;
                }
                if (!fitsLocked(w.buckets))
                    break; // strict FIFO: the head blocks its bucket
                for (const auto &n : w.buckets)
                    bucketLocked(n).admitted += 1;
                admitted_[head] = w.buckets;
                toFire.emplace_back(w.handle, WaitOutcome::Promoted);
                waiting_.erase(it);
                b.waiting.pop_front();
                progressed = true;
            }
        }
    }
}

void AdmissionController::fireAll(Firing &toFire) {
    for (auto &entry : toFire)
        entry.first->fire(entry.second);
    toFire.clear();
}

void AdmissionController::release(TaskId id) {
    Firing toFire;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<std::string> freed;
        if (!releaseLocked(id, freed))
            return;
        promoteLocked(freed, toFire);
    }
    qCInfo(mcAdmission) << "release"
                        << "taskId=" << id << "woken=" << toFire.size();
    fireAll(toFire);
}

bool AdmissionController::cancelQueued(TaskId id) {
    Firing toFire;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = waiting_.find(id);
        if (it == waiting_.end())
            return false;
        Bucket &b = bucketLocked(it->second.bucket);
        auto pos = std::find(b.waiting.begin(), b.waiting.end(), id);
        if (pos != b.waiting.end())
            b.waiting.erase(pos);
        toFire.emplace_back(it->second.handle, WaitOutcome::Cancelled);
        const std::string bucket = it->second.bucket;
        waiting_.erase(it);
        // The removed entry may have been the head blocking others.
        promoteLocked({bucket}, toFire);
    }
    qCInfo(mcAdmission) << "cancelQueued"
                        << "taskId=" << id;
    fireAll(toFire);
    return true;
}

std::size_t AdmissionController::cap(const std::string &bucket) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = buckets_.find(bucket);
    return it == buckets_.end() ? 0 : it->second.cap;
}

std::size_t AdmissionController::admittedCount(const std::string &bucket) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = buckets_.find(bucket);
    return it == buckets_.end() ? 0 : it->second.admitted;
}

std::size_t AdmissionController::queuedCount(const std::string &bucket) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = buckets_.find(bucket);
    return it == buckets_.end() ? 0 : it->second.waiting.size();
}

bool AdmissionController::isAdmitted(TaskId id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return admitted_.count(id) > 0;
}

bool AdmissionController::isQueued(TaskId id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return waiting_.count(id) > 0;
}

std::vector<BucketStats> AdmissionController::stats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<BucketStats> out;
    out.reserve(buckets_.size());
    for (const auto &kv : buckets_) {
        BucketStats s;
        s.name = kv.first;
        s.cap = kv.second.cap;
        s.admitted = kv.second.admitted;
        s.queued = kv.second.waiting.size();
        out.push_back(s);
    }
    return out;
}

} // namespace mirrorcore
