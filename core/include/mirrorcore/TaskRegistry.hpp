// Map of task id -> status object for every task the core currently tracks.
// Injected where needed; all mutation happens under one short-lived mutex.
#pragma once
#include "TaskStatus.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace mirrorcore {

class TaskRegistry {
public:
    TaskRegistry() = default;
    TaskRegistry(const TaskRegistry &) = delete;
    TaskRegistry &operator=(const TaskRegistry &) = delete;

    // Inserts or replaces the status object of a task (a queued placeholder
    // is replaced by the backend status once the task starts). Returns true
    // if the id was not registered before.
    bool insert(TaskId id, std::shared_ptr<TaskStatus> status);

    // Absence is not an error: cancellation and natural completion may race.
    bool remove(TaskId id);

    std::shared_ptr<TaskStatus> find(TaskId id) const;
    bool contains(TaskId id) const;

    // References are copied under the lock; rendering happens afterwards.
    // Ordered by task id (submission order).
    std::vector<std::shared_ptr<TaskStatus>> snapshot() const;

    std::size_t size() const;
    std::size_t countForUser(std::int64_t userId) const;

    // Drops every entry; used on shutdown after all drivers have exited.
    void clear();

private:
    mutable std::mutex mtx_;
    std::unordered_map<TaskId, std::shared_ptr<TaskStatus>> tasks_;
};

} // namespace mirrorcore
