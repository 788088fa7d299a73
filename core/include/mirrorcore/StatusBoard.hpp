// Polls the registry and renders one text line per tracked task. Works only
// through the TaskStatus interface, whatever backend produced the status.
#pragma once
#include "TaskStatus.hpp"
#include <QObject>
#include <QStringList>
#include <QTimer>
#include <chrono>
#include <string>

namespace mirrorcore {

class TaskRegistry;

class StatusBoard : public QObject {
    Q_OBJECT
public:
    StatusBoard(const TaskRegistry &registry,
                std::chrono::milliseconds interval,
                QObject *parent = nullptr);

    void start();
    void stop();
    bool isActive() const { return timer_.isActive(); }

    // One rendering pass over the current snapshot.
    QStringList render() const;

    static std::string renderLine(const TaskStatus &status);

signals:
    // Emitted by the timer whenever the rendered lines changed.
    void statusRendered(const QStringList &lines);

private slots:
    void tick();

private:
    const TaskRegistry &registry_;
    QTimer timer_;
    QStringList last_;
};

} // namespace mirrorcore
