#include "mirrorcore/WorkerPool.hpp"
#include <QLoggingCategory>
#include <exception>
#include <utility>
Q_LOGGING_CATEGORY(mcPool, "mirrorcore.pool")

namespace mirrorcore {

WorkerPool::WorkerPool(int maxThreads) {
    pool_.setMaxThreadCount(maxThreads < 1 ? 1 : maxThreads);
    pool_.setObjectName(QStringLiteral("mirrorcore-workers"));
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::dispatch(std::function<void()> job) {
    if (stopping_.load() || !job)
        return false;
    pool_.start([fn = std::move(job)]() {
        // Jobs report their own failures; an escaping exception would take
        // the whole process down from a pool thread.
        try {
            fn();
        } catch (const std::exception &e) {
            qCWarning(mcPool) << "worker job threw:" << e.what();
        } catch (...) {
            qCWarning(mcPool) << "worker job threw a non-standard exception";
        }
    });
    return true;
}

void WorkerPool::shutdown() {
    if (stopping_.exchange(true))
        return;
    pool_.clear();
    pool_.waitForDone();
    qCInfo(mcPool) << "worker pool stopped";
}

int WorkerPool::maxThreads() const { return pool_.maxThreadCount(); }

int WorkerPool::activeThreads() const { return pool_.activeThreadCount(); }

} // namespace mirrorcore
