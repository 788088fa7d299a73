#include "mirrorcore/TaskScheduler.hpp"
#include "mirrorcore/NativeTransferBackend.hpp"
#include "mirrorcore/RuntimeLogging.hpp"
#include "mirrorcore/TransferStatus.hpp"
#include <QCoreApplication>
#include <QEventLoop>
#include <QLoggingCategory>
#include <QThread>
#include <exception>
#include <utility>
Q_LOGGING_CATEGORY(mcScheduler, "mirrorcore.scheduler")

namespace mirrorcore {

namespace {

// How often a queued driver looks at the listener's cancellation flag.
constexpr std::chrono::milliseconds kQueuedPoll{50};

} // namespace

TaskScheduler::TaskScheduler(const CoreConfig &cfg, QObject *parent)
    : QObject(parent), cfg_(cfg), pool_(cfg.workerThreads),
      transferPool_(cfg.transferThreads),
      admission_(cfg.bucketCaps()), lifecycle_(registry_, admission_, this) {
    applyLoggingRules();
    qCInfo(mcScheduler) << "scheduler ready"
                        << "all=" << cfg_.queueAll
                        << "download=" << cfg_.queueDownload
                        << "upload=" << cfg_.queueUpload
                        << "workers=" << cfg_.workerThreads
                        << "transferThreads=" << cfg_.transferThreads;
}

TaskScheduler::~TaskScheduler() {
    cancelAll();
    std::unordered_map<TaskId, std::thread> workersToJoin;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        workersToJoin.swap(workers_);
        finished_.clear();
    }
    for (auto &kv : workersToJoin) {
        if (kv.second.joinable())
            kv.second.join();
    }
    transferPool_.shutdown();
    pool_.shutdown();
    registry_.clear();
}

TaskId TaskScheduler::submit(TaskRequest request,
                             std::shared_ptr<TaskListener> listener,
                             std::unique_ptr<TransferBackend> backend) {
    reapFinished();
    if (listener) {
        if (request.name.empty())
            request.name = listener->name();
        if (request.size == 0)
            request.size = listener->size();
        if (request.userId == 0)
            request.userId = listener->userId();
    }
    if (request.backend.empty() && backend)
        request.backend = backend->name();

    const TaskId id = nextId_++;
    auto task = std::make_shared<Task>(id, std::move(request));
    lifecycle_.attach(id, listener);
    qCInfo(mcScheduler) << "submit"
                        << "task=" << task->gid().c_str()
                        << "kind=" << taskKindName(task->kind())
                        << "backend=" << task->backend().c_str()
                        << "user=" << task->userId()
                        << "name=" << sensitive(task->name()).c_str();

    std::shared_ptr<TransferBackend> shared(std::move(backend));
    std::lock_guard<std::mutex> lk(mtx_);
    tasks_[id] = task;
    workers_[id] = std::thread([this, task, listener, shared]() {
        drive(task, listener, shared);
        driverExited(task->id());
    });
    return id;
}

std::unique_ptr<TransferBackend>
TaskScheduler::nativeBackend(std::unique_ptr<NativeSession> session) {
    return std::make_unique<NativeTransferBackend>(
        pool_, transferPool_, std::move(session),
        NativeBackendOptions::fromConfig(cfg_));
}

void TaskScheduler::drive(const std::shared_ptr<Task> &task,
                          const std::shared_ptr<TaskListener> &listener,
                          std::shared_ptr<TransferBackend> backend) {
    try {
        if (!backend) {
            lifecycle_.fail(task, TaskError{ErrorKind::TransferFailed,
                                            "No backend for task"});
            return;
        }
        if (task->isCancelled() || (listener && listener->isCancelled())) {
            lifecycle_.cancel(task);
            return;
        }

        const AdmissionDecision decision =
            admission_.admit(task, bucketsFor(task->kind()));
        if (!decision.runNow()) {
            auto placeholder = std::make_shared<QueueStatus>(
                task,
                [this](TaskId id) { return admission_.cancelQueued(id); });
            lifecycle_.markQueued(task, placeholder);
            emit taskQueued(task->id());

            WaitOutcome outcome = WaitOutcome::Pending;
            while ((outcome = decision.waitHandle->waitFor(kQueuedPoll)) ==
                   WaitOutcome::Pending) {
                if (listener && listener->isCancelled()) {
                    task->markCancelled();
                    admission_.cancelQueued(task->id());
                }
            }
            if (outcome == WaitOutcome::Cancelled) {
                // Never reached Running and never held a slot.
                lifecycle_.cancel(task);
                return;
            }
            qCInfo(mcScheduler) << "promoted"
                                << "task=" << task->gid().c_str()
                                << "bucket=" << decision.bucket.c_str();
        }
        runAdmitted(task, listener, backend);
    } catch (const std::exception &e) {
        qCWarning(mcScheduler) << "driver failed"
                               << "task=" << task->gid().c_str()
                               << "error=" << e.what();
        lifecycle_.fail(task,
                        TaskError{ErrorKind::BackendInstability, e.what()});
    }
}

void TaskScheduler::runAdmitted(const std::shared_ptr<Task> &task,
                                const std::shared_ptr<TaskListener> &listener,
                                const std::shared_ptr<TransferBackend> &backend) {
    auto shouldCancel = [task, listener]() {
        return task->isCancelled() || (listener && listener->isCancelled());
    };
    if (shouldCancel()) {
        lifecycle_.cancel(task);
        return;
    }

    std::shared_ptr<TransferStatus> status = makeTransferStatus(task);
    std::weak_ptr<TransferBackend> weak = backend;
    status->setCancelHandler([weak]() {
        if (auto b = weak.lock())
            b->cancel();
    });
    if (!lifecycle_.markRunning(task, status)) {
        lifecycle_.cancel(task);
        return;
    }
    emit taskStarted(task->id());

    const TransferOutcome out = backend->run(task, *status, shouldCancel);

    bool finished = false;
    if (task->isCancelled() || out.error.kind == ErrorKind::CancelledByUser)
        finished = lifecycle_.cancel(task);
    else if (!out.ok())
        finished = lifecycle_.fail(task, out.error);
    else if (task->kind() == TaskKind::Upload)
        finished = lifecycle_.completeUpload(task, out.link, out.fileCount,
                                             out.folderCount, out.mimeType);
    else
        finished = lifecycle_.complete(task);
    if (finished)
        emit taskFinished(task->id(),
                          QString::fromLatin1(taskPhaseName(task->phase())));
}

void TaskScheduler::driverExited(TaskId id) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        tasks_.erase(id);
        finished_.push_back(id);
    }
    idleCv_.notify_all();
}

void TaskScheduler::reapFinished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (TaskId id : finished_) {
            auto it = workers_.find(id);
            if (it == workers_.end())
                continue;
            done.push_back(std::move(it->second));
            workers_.erase(it);
        }
        finished_.clear();
    }
    for (auto &t : done) {
        if (t.joinable())
            t.join();
    }
}

bool TaskScheduler::cancel(TaskId id, std::string &err) {
    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = tasks_.find(id);
        if (it != tasks_.end())
            task = it->second;
    }
    if (!task) {
        err = "Task not found: " + gidFor(id);
        return false;
    }
    qCInfo(mcScheduler) << "cancel requested"
                        << "task=" << task->gid().c_str()
                        << "phase=" << taskPhaseName(task->phase());
    if (auto status = registry_.find(id))
        return status->cancel(err);
    // Not registered yet: the driver sees the flag before admission.
    task->markCancelled();
    admission_.cancelQueued(id);
    return true;
}

void TaskScheduler::cancelAll() {
    std::vector<TaskId> ids;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        ids.reserve(tasks_.size());
        for (const auto &kv : tasks_)
            ids.push_back(kv.first);
    }
    for (TaskId id : ids) {
        std::string err;
        if (!cancel(id, err))
            qCDebug(mcScheduler) << "cancelAll:" << err.c_str();
    }
}

std::vector<std::shared_ptr<TaskStatus>> TaskScheduler::snapshot() const {
    return registry_.snapshot();
}

std::size_t TaskScheduler::activeTasks() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return tasks_.size();
}

bool TaskScheduler::waitForIdle(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const bool pumpEvents = QCoreApplication::instance() != nullptr &&
                            QThread::currentThread() == thread();
    bool idle = false;
    while (true) {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            if (tasks_.empty()) {
                idle = true;
            } else if (!pumpEvents) {
                idleCv_.wait_until(lk, deadline,
                                   [this] { return tasks_.empty(); });
                idle = tasks_.empty();
            }
        }
        if (pumpEvents)
            QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        if (idle || std::chrono::steady_clock::now() >= deadline)
            break;
        if (pumpEvents)
            QThread::msleep(5);
    }
    if (idle)
        reapFinished();
    return idle;
}

} // namespace mirrorcore
