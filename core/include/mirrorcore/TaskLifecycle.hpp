// Task state machine and the contract with the surrounding application.
//
//   Created -> [Queued] -> Running -> Completed | Error | Cancelled
//
// A terminal transition removes the task from the registry, releases its
// admission slot (promoting waiting tasks) and fires exactly one listener
// callback. Later terminal requests for the same task are ignored.
#pragma once
#include "TaskStatus.hpp"
#include "TaskTypes.hpp"
#include <QPointer>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

class QObject;

namespace mirrorcore {

class AdmissionController;
class TaskRegistry;

// Implemented by the surrounding application (bot, UI). Rendering and message
// formatting stay on that side.
class TaskListener {
public:
    virtual ~TaskListener() = default;

    virtual bool isCancelled() const = 0;
    virtual std::int64_t userId() const = 0;
    virtual std::uint64_t size() const = 0;
    virtual std::string name() const = 0;

    virtual void onStart() = 0;
    virtual void onComplete() = 0;
    virtual void onUploadComplete(const std::string &link, int fileCount,
                                  int folderCount,
                                  const std::string &mimeType) = 0;
    virtual void onError(const std::string &message,
                         const std::string &uiHint) = 0;
};

// Message passed to onError for cancelled tasks.
inline const std::string kCancelledMessage = "cancelled";
// uiHint values passed to onError.
inline const std::string kHintRetry = "retry";
inline const std::string kHintNone;

class TaskLifecycle {
public:
    // Listener callbacks are posted to context's thread when a context is
    // given (the event loop driving the application), otherwise invoked on
    // the calling thread.
    TaskLifecycle(TaskRegistry &registry, AdmissionController &admission,
                  QObject *context = nullptr);
    TaskLifecycle(const TaskLifecycle &) = delete;
    TaskLifecycle &operator=(const TaskLifecycle &) = delete;

    void attach(TaskId id, std::shared_ptr<TaskListener> listener);

    // Registers the queued placeholder; false if the task is not in Created.
    bool markQueued(const std::shared_ptr<Task> &task,
                    std::shared_ptr<TaskStatus> placeholder);
    // Registers the backend status and fires onStart. Refused for tasks
    // that are cancelled or already terminal.
    bool markRunning(const std::shared_ptr<Task> &task,
                     std::shared_ptr<TaskStatus> status);

    // Terminal transitions. Each returns true only for the call that
    // actually finished the task.
    bool complete(const std::shared_ptr<Task> &task);
    bool completeUpload(const std::shared_ptr<Task> &task,
                        const std::string &link, int fileCount,
                        int folderCount, const std::string &mimeType);
    bool fail(const std::shared_ptr<Task> &task, const TaskError &error);
    bool cancel(const std::shared_ptr<Task> &task);

    // Text shown to the user for a failure; suggests retrying only for
    // retryable error kinds.
    static std::string userMessage(const TaskError &error);

private:
    using Notify = std::function<void(TaskListener &)>;

    bool finish(const std::shared_ptr<Task> &task, TaskPhase terminal,
                Notify notify);
    std::shared_ptr<TaskListener> listenerFor(TaskId id) const;
    void post(std::shared_ptr<TaskListener> listener, Notify notify);

    TaskRegistry &registry_;
    AdmissionController &admission_;
    QPointer<QObject> context_;
    const bool hasContext_;
    mutable std::mutex mtx_; // protects listeners_
    std::unordered_map<TaskId, std::shared_ptr<TaskListener>> listeners_;
};

} // namespace mirrorcore
