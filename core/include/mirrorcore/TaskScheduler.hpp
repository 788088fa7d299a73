// Submission entry point. Every task gets its own driver thread which goes
// through admission (possibly waiting in a queue), runs its backend and ends
// with exactly one terminal transition.
#pragma once
#include "AdmissionController.hpp"
#include "CoreConfig.hpp"
#include "NativeSession.hpp"
#include "TaskLifecycle.hpp"
#include "TaskRegistry.hpp"
#include "TransferBackend.hpp"
#include "WorkerPool.hpp"
#include <QObject>
#include <QString>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mirrorcore {

class TaskScheduler : public QObject {
    Q_OBJECT
public:
    // Listener callbacks are delivered on this object's thread.
    explicit TaskScheduler(const CoreConfig &cfg, QObject *parent = nullptr);
    ~TaskScheduler() override;

    // Missing name, size or user id in the request are taken from the
    // listener. Never blocks on admission.
    TaskId submit(TaskRequest request, std::shared_ptr<TaskListener> listener,
                  std::unique_ptr<TransferBackend> backend);

    // Backend driving the given session on this scheduler's worker pools.
    std::unique_ptr<TransferBackend>
    nativeBackend(std::unique_ptr<NativeSession> session);

    // Idempotent; a task already finished is not an error.
    bool cancel(TaskId id, std::string &err);
    void cancelAll();

    std::vector<std::shared_ptr<TaskStatus>> snapshot() const;

    // Waits until every driver exited, pumping this thread's event loop so
    // queued listener callbacks are delivered. False on timeout.
    bool waitForIdle(std::chrono::milliseconds timeout);

    std::size_t activeTasks() const;
    const CoreConfig &config() const { return cfg_; }
    TaskRegistry &registry() { return registry_; }
    AdmissionController &admission() { return admission_; }
    WorkerPool &pool() { return pool_; }
    WorkerPool &transferPool() { return transferPool_; }

signals:
    void taskQueued(quint64 id);
    void taskStarted(quint64 id);
    void taskFinished(quint64 id, const QString &phase);

private:
    void drive(const std::shared_ptr<Task> &task,
               const std::shared_ptr<TaskListener> &listener,
               std::shared_ptr<TransferBackend> backend);
    void runAdmitted(const std::shared_ptr<Task> &task,
                     const std::shared_ptr<TaskListener> &listener,
                     const std::shared_ptr<TransferBackend> &backend);
    void driverExited(TaskId id);
    void reapFinished();

    const CoreConfig cfg_;
    WorkerPool pool_;
    WorkerPool transferPool_;
    TaskRegistry registry_;
    AdmissionController admission_;
    TaskLifecycle lifecycle_;

    mutable std::mutex mtx_; // protects tasks_, workers_, finished_
    std::condition_variable idleCv_;
    std::unordered_map<TaskId, std::shared_ptr<Task>> tasks_;
    std::unordered_map<TaskId, std::thread> workers_;
    std::vector<TaskId> finished_;
    std::atomic<TaskId> nextId_{1};
};

} // namespace mirrorcore
