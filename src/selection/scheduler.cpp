/*
 * scheduler.cpp — Cancellable deferred tasks on the GUI thread
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "scheduler.h"

#include <QTimer>

#include <utility>

TimerScheduler::TimerScheduler(QObject *parent)
    : QObject(parent)
{
    m_clock.start();
}

TimerScheduler::~TimerScheduler()
{
    for (QTimer *timer : std::as_const(m_timers))
        timer->stop();
    qDeleteAll(m_timers);
    m_timers.clear();
}

Scheduler::Handle TimerScheduler::schedule(int delayMs, Task task)
{
    const Handle handle = m_nextHandle++;

    auto *timer = new QTimer(this);
    timer->setSingleShot(true);
    timer->setInterval(qMax(0, delayMs));
    connect(timer, &QTimer::timeout, this, [this, handle, task = std::move(task)]() {
        QTimer *fired = m_timers.take(handle);
        if (!fired)
            return; // cancelled after the timeout was dispatched
        fired->deleteLater();
        task();
    });

    m_timers.insert(handle, timer);
    timer->start();
    return handle;
}

void TimerScheduler::cancel(Handle handle)
{
    QTimer *timer = m_timers.take(handle);
    if (!timer)
        return;
    timer->stop();
    timer->deleteLater();
}

qint64 TimerScheduler::elapsed() const
{
    return m_clock.elapsed();
}
