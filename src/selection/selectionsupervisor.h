/*
 * selectionsupervisor.h — Keep a just-captured selection from collapsing
 *
 * Re-renders of the content widget (triggered by unrelated state changes)
 * and stray platform events can turn a live selection into a caret. While
 * Watching, every tick compares the native selection against the saved
 * range and re-applies the range if the selection collapsed. The window is
 * a hard timeout; commit/cancel stop it immediately.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_SELECTIONSUPERVISOR_H
#define MARGINREADER_SELECTIONSUPERVISOR_H

#include <QObject>

#include "scheduler.h"
#include "selectionrecord.h"

class SelectionSurface;

class SelectionSupervisor : public QObject
{
    Q_OBJECT

public:
    enum class State { Idle, Watching };

    SelectionSupervisor(SelectionSurface *surface, Scheduler *scheduler,
                        QObject *parent = nullptr);
    ~SelectionSupervisor() override;

    void setKeepAliveWindow(int ms) { m_keepAliveMs = ms; }
    void setTickInterval(int ms) { m_tickIntervalMs = qMax(1, ms); }
    int keepAliveWindow() const { return m_keepAliveMs; }
    int tickInterval() const { return m_tickIntervalMs; }

    // Enter Watching for `range`. Any previous tick chain is cancelled first.
    void start(const SavedRange &range);
    void stop();

    State state() const { return m_state; }
    bool isWatching() const { return m_state == State::Watching; }
    SavedRange savedRange() const { return m_range; }
    int restoreCount() const { return m_restoreCount; }

Q_SIGNALS:
    void watchingChanged(bool watching);
    void selectionRestored();

private:
    void scheduleTick();
    void tick(quint64 chain);

    SelectionSurface *m_surface = nullptr;
    Scheduler *m_scheduler = nullptr;
    State m_state = State::Idle;
    SavedRange m_range;

    Scheduler::Handle m_tickHandle = 0;
    quint64 m_chain = 0;        // bumped on every start/stop
    qint64 m_deadline = 0;
    int m_keepAliveMs = 10000;
    int m_tickIntervalMs = 100;
    int m_restoreCount = 0;
};

#endif // MARGINREADER_SELECTIONSUPERVISOR_H
