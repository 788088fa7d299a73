// Bounded pool for blocking native SDK calls, so neither the event loop nor a
// task driver ever runs native I/O inline.
#pragma once
#include <QThreadPool>
#include <atomic>
#include <functional>

namespace mirrorcore {

class WorkerPool {
public:
    explicit WorkerPool(int maxThreads);
    ~WorkerPool();
    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // Returns false once shutdown() was requested.
    bool dispatch(std::function<void()> job);

    // Stops accepting jobs and waits for running ones.
    void shutdown();

    int maxThreads() const;
    int activeThreads() const;

private:
    QThreadPool pool_;
    std::atomic<bool> stopping_{false};
};

} // namespace mirrorcore
