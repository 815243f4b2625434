/*
 * scheduler.h — Cancellable deferred tasks on the GUI thread
 *
 * Every deferral in the selection engine (capture debounce, keep-alive ticks,
 * pulse removal) goes through a Scheduler. A task is identified by the handle
 * returned from schedule(); cancel() guarantees the task will not run.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_SCHEDULER_H
#define MARGINREADER_SCHEDULER_H

#include <QElapsedTimer>
#include <QHash>
#include <QObject>

#include <functional>

class QTimer;

class Scheduler
{
public:
    using Handle = quint64;   // 0 is never a valid handle
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    virtual Handle schedule(int delayMs, Task task) = 0;
    virtual void cancel(Handle handle) = 0;

    // Monotonic milliseconds
    virtual qint64 elapsed() const = 0;
};

// QTimer-backed implementation, one single-shot timer per pending task.
class TimerScheduler : public QObject, public Scheduler
{
    Q_OBJECT

public:
    explicit TimerScheduler(QObject *parent = nullptr);
    ~TimerScheduler() override;

    Handle schedule(int delayMs, Task task) override;
    void cancel(Handle handle) override;
    qint64 elapsed() const override;

    int pendingCount() const { return m_timers.size(); }

private:
    QHash<Handle, QTimer *> m_timers;
    Handle m_nextHandle = 1;
    QElapsedTimer m_clock;
};

#endif // MARGINREADER_SCHEDULER_H
