#include "mirrorcore/TaskRegistry.hpp"
#include <QLoggingCategory>
#include <algorithm>
#include <utility>
Q_LOGGING_CATEGORY(mcRegistry, "mirrorcore.registry")

namespace mirrorcore {

bool TaskRegistry::insert(TaskId id, std::shared_ptr<TaskStatus> status) {
    bool inserted = false;
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            tasks_.emplace(id, std::move(status));
            inserted = true;
        } else {
            it->second = std::move(status);
        }
        count = tasks_.size();
    }
    qCDebug(mcRegistry) << (inserted ? "insert" : "replace")
                        << "taskId=" << id << "count=" << count;
    return inserted;
}

bool TaskRegistry::remove(TaskId id) {
    std::shared_ptr<TaskStatus> removed;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = tasks_.find(id);
        if (it == tasks_.end())
            return false;
        // Destroy the status object outside the lock.
        removed = std::move(it->second);
        tasks_.erase(it);
    }
    qCDebug(mcRegistry) << "remove" << "taskId=" << id;
    return true;
}

std::shared_ptr<TaskStatus> TaskRegistry::find(TaskId id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : it->second;
}

bool TaskRegistry::contains(TaskId id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tasks_.count(id) > 0;
}

std::vector<std::shared_ptr<TaskStatus>> TaskRegistry::snapshot() const {
    std::vector<std::pair<TaskId, std::shared_ptr<TaskStatus>>> entries;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        entries.reserve(tasks_.size());
        for (const auto &kv : tasks_)
            entries.emplace_back(kv.first, kv.second);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto &a, const auto &b) { return a.first < b.first; });
    std::vector<std::shared_ptr<TaskStatus>> out;
    out.reserve(entries.size());
    for (auto &e : entries)
        out.push_back(std::move(e.second));
    return out;
}

std::size_t TaskRegistry::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tasks_.size();
}

std::size_t TaskRegistry::countForUser(std::int64_t userId) const {
    std::vector<std::shared_ptr<TaskStatus>> all = snapshot();
    return static_cast<std::size_t>(
        std::count_if(all.begin(), all.end(), [userId](const auto &s) {
            auto t = s->task();
            return t && t->userId() == userId;
        }));
}

void TaskRegistry::clear() {
    std::unordered_map<TaskId, std::shared_ptr<TaskStatus>> dropped;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        dropped.swap(tasks_);
    }
    if (!dropped.empty())
        qCInfo(mcRegistry) << "clear" << "dropped=" << dropped.size();
}

} // namespace mirrorcore
