// A backend performs exactly one task's transfer. The scheduler creates one
// per task and destroys it once run() returned.
#pragma once
#include "TaskTypes.hpp"
#include "TransferStatus.hpp"
#include <functional>
#include <memory>
#include <string>

namespace mirrorcore {

struct TransferOutcome {
    TaskError error;
    // Upload results, reported through onUploadComplete.
    std::string link;
    int fileCount = 0;
    int folderCount = 0;
    std::string mimeType;

    bool ok() const { return error.ok(); }
};

class TransferBackend {
public:
    virtual ~TransferBackend() = default;

    virtual std::string name() const = 0;

    // Blocks until the transfer ended and the backend released its native
    // resources. Progress goes to status; shouldCancel is polled between
    // steps and on every progress update. Never throws.
    virtual TransferOutcome run(const std::shared_ptr<Task> &task,
                                TransferStatus &status,
                                const std::function<bool()> &shouldCancel) = 0;

    // Interrupts run() from another thread. Idempotent.
    virtual void cancel() = 0;
};

} // namespace mirrorcore
