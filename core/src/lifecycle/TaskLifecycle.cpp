#include "mirrorcore/TaskLifecycle.hpp"
#include "mirrorcore/AdmissionController.hpp"
#include "mirrorcore/TaskRegistry.hpp"
#include <QLoggingCategory>
#include <QMetaObject>
#include <QObject>
#include <exception>
#include <utility>
Q_LOGGING_CATEGORY(mcLifecycle, "mirrorcore.lifecycle")

namespace mirrorcore {

namespace {

// Gives the admission slot back when the terminal transition leaves scope,
// whatever happened before.
class SlotGuard {
public:
    SlotGuard(AdmissionController &admission, TaskId id)
        : admission_(admission), id_(id) {}
    ~SlotGuard() {
        try {
            admission_.cancelQueued(id_);
            admission_.release(id_);
        } catch (const std::exception &e) {
            qCWarning(mcLifecycle) << "slot release failed"
                                   << "task=" << id_ << "error=" << e.what();
        }
    }
    SlotGuard(const SlotGuard &) = delete;
    SlotGuard &operator=(const SlotGuard &) = delete;

private:
    AdmissionController &admission_;
    TaskId id_;
};

} // namespace

TaskLifecycle::TaskLifecycle(TaskRegistry &registry,
                             AdmissionController &admission, QObject *context)
    : registry_(registry), admission_(admission), context_(context),
      hasContext_(context != nullptr) {}

void TaskLifecycle::attach(TaskId id, std::shared_ptr<TaskListener> listener) {
    if (!listener)
        return;
    std::lock_guard<std::mutex> lk(mtx_);
    listeners_[id] = std::move(listener);
}

bool TaskLifecycle::markQueued(const std::shared_ptr<Task> &task,
                               std::shared_ptr<TaskStatus> placeholder) {
    if (!task->enterQueued())
        return false;
    registry_.insert(task->id(), std::move(placeholder));
    qCInfo(mcLifecycle) << "queued"
                        << "task=" << task->gid().c_str()
                        << "kind=" << taskKindName(task->kind());
    return true;
}

bool TaskLifecycle::markRunning(const std::shared_ptr<Task> &task,
                                std::shared_ptr<TaskStatus> status) {
    if (task->isCancelled() || !task->enterRunning())
        return false;
    registry_.insert(task->id(), std::move(status));
    qCInfo(mcLifecycle) << "running"
                        << "task=" << task->gid().c_str()
                        << "kind=" << taskKindName(task->kind())
                        << "backend=" << task->backend().c_str();
    post(listenerFor(task->id()), [](TaskListener &l) { l.onStart(); });
    return true;
}

bool TaskLifecycle::complete(const std::shared_ptr<Task> &task) {
    return finish(task, TaskPhase::Completed,
                  [](TaskListener &l) { l.onComplete(); });
}

bool TaskLifecycle::completeUpload(const std::shared_ptr<Task> &task,
                                   const std::string &link, int fileCount,
                                   int folderCount,
                                   const std::string &mimeType) {
    return finish(task, TaskPhase::Completed,
                  [link, fileCount, folderCount, mimeType](TaskListener &l) {
                      l.onUploadComplete(link, fileCount, folderCount,
                                         mimeType);
                  });
}

bool TaskLifecycle::fail(const std::shared_ptr<Task> &task,
                         const TaskError &error) {
    if (error.kind == ErrorKind::CancelledByUser)
        return cancel(task);
    const std::string message = userMessage(error);
    const std::string hint = error.retryable() ? kHintRetry : kHintNone;
    const bool finished =
        finish(task, TaskPhase::Error, [message, hint](TaskListener &l) {
            l.onError(message, hint);
        });
    if (finished) {
        qCWarning(mcLifecycle) << "task failed"
                               << "task=" << task->gid().c_str()
                               << "kind=" << errorKindName(error.kind)
                               << "message=" << error.message.c_str();
    }
    return finished;
}

bool TaskLifecycle::cancel(const std::shared_ptr<Task> &task) {
    task->markCancelled();
    return finish(task, TaskPhase::Cancelled, [](TaskListener &l) {
        l.onError(kCancelledMessage, kHintNone);
    });
}

std::string TaskLifecycle::userMessage(const TaskError &error) {
    std::string message =
        error.message.empty() ? errorKindName(error.kind) : error.message;
    if (error.retryable())
        message += ". Please try again.";
    return message;
}

bool TaskLifecycle::finish(const std::shared_ptr<Task> &task,
                           TaskPhase terminal, Notify notify) {
    if (!task->finish(terminal)) {
        qCDebug(mcLifecycle) << "terminal transition ignored"
                             << "task=" << task->gid().c_str()
                             << "requested=" << taskPhaseName(terminal)
                             << "current=" << taskPhaseName(task->phase());
        return false;
    }
    std::shared_ptr<TaskListener> listener;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = listeners_.find(task->id());
        if (it != listeners_.end()) {
            listener = std::move(it->second);
            listeners_.erase(it);
        }
    }
    // Releases on scope exit, after the post, so the terminal callback is
    // queued ahead of the onStart of any task promoted into that slot.
    SlotGuard slot(admission_, task->id());
    qCInfo(mcLifecycle) << "finished"
                        << "task=" << task->gid().c_str()
                        << "phase=" << taskPhaseName(terminal);
    registry_.remove(task->id());
    post(std::move(listener), std::move(notify));
    return true;
}

std::shared_ptr<TaskListener> TaskLifecycle::listenerFor(TaskId id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = listeners_.find(id);
    return it == listeners_.end() ? nullptr : it->second;
}

void TaskLifecycle::post(std::shared_ptr<TaskListener> listener,
                         Notify notify) {
    if (!listener || !notify)
        return;
    auto invoke = [listener, notify]() {
        try {
            notify(*listener);
        } catch (const std::exception &e) {
            qCWarning(mcLifecycle) << "listener callback threw:" << e.what();
        }
    };
    if (!hasContext_) {
        invoke();
        return;
    }
    QObject *context = context_.data();
    if (!context) {
        qCWarning(mcLifecycle) << "listener context gone, callback dropped";
        return;
    }
    QMetaObject::invokeMethod(context, invoke, Qt::QueuedConnection);
}

} // namespace mirrorcore
