// Uniform read-model every backend status adapter implements. A single polling
// loop renders any number of heterogeneous backends through this interface.
#pragma once
#include "TaskTypes.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace mirrorcore {

class TaskStatus {
public:
    virtual ~TaskStatus() = default;

    virtual std::string name() const = 0;
    virtual std::uint64_t size() const = 0;
    virtual std::uint64_t processedBytes() const = 0;
    // bytes per second
    virtual double speed() const = 0;
    // 0..100; 0 while the size is unknown
    virtual double progress() const;
    // Empty when it cannot be estimated (unknown size or zero speed).
    virtual std::optional<std::chrono::seconds> eta() const;
    virtual std::string gid() const = 0;
    virtual TaskState state() const = 0;
    virtual std::string backend() const = 0;

    // Idempotent: cancelling an already cancelled or finished task is a
    // no-op that returns true.
    virtual bool cancel(std::string &err) = 0;

    virtual std::shared_ptr<Task> task() const = 0;
};

double progressPercent(std::uint64_t processed, std::uint64_t size);

std::optional<std::chrono::seconds> estimateEta(std::uint64_t processed,
                                                std::uint64_t size,
                                                double bytesPerSecond);

} // namespace mirrorcore
