#include "mirrorcore/StatusBoard.hpp"
#include "mirrorcore/StatusFormat.hpp"
#include "mirrorcore/TaskRegistry.hpp"
#include <QLoggingCategory>
#include <cstdio>
#include <exception>
Q_LOGGING_CATEGORY(mcStatus, "mirrorcore.status")

namespace mirrorcore {

StatusBoard::StatusBoard(const TaskRegistry &registry,
                         std::chrono::milliseconds interval, QObject *parent)
    : QObject(parent), registry_(registry) {
    timer_.setInterval(static_cast<int>(interval.count()));
    connect(&timer_, &QTimer::timeout, this, &StatusBoard::tick);
}

void StatusBoard::start() { timer_.start(); }

void StatusBoard::stop() { timer_.stop(); }

std::string StatusBoard::renderLine(const TaskStatus &status) {
    const TaskState state = status.state();
    std::string line = status.name() + " | " + taskStateName(state);
    if (state == TaskState::Queued) {
        if (status.size() > 0)
            line += " | " + readableSize(status.size());
        return line + " | " + status.gid();
    }
    const double pct = status.progress();
    char pctBuf[16];
    std::snprintf(pctBuf, sizeof(pctBuf), "%.1f%%", pct);
    line += " " + progressBar(pct) + " " + pctBuf;
    line += " | " + readableSize(status.processedBytes()) + " of " +
            (status.size() > 0 ? readableSize(status.size())
                               : std::string("?"));
    line += " | " + readableSpeed(status.speed());
    line += " | ETA " + readableTime(status.eta());
    line += " | " + status.backend() + " | " + status.gid();
    return line;
}

QStringList StatusBoard::render() const {
    QStringList lines;
    for (const auto &status : registry_.snapshot()) {
        try {
            lines << QString::fromStdString(renderLine(*status));
        } catch (const std::exception &e) {
            qCWarning(mcStatus) << "status render failed:" << e.what();
        }
    }
    return lines;
}

void StatusBoard::tick() {
    const QStringList lines = render();
    if (lines == last_)
        return;
    last_ = lines;
    emit statusRendered(lines);
}

} // namespace mirrorcore
