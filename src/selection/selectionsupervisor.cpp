/*
 * selectionsupervisor.cpp — Keep a just-captured selection from collapsing
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "selectionsupervisor.h"
#include "selectionsurface.h"

#include <QDebug>

SelectionSupervisor::SelectionSupervisor(SelectionSurface *surface, Scheduler *scheduler,
                                         QObject *parent)
    : QObject(parent)
    , m_surface(surface)
    , m_scheduler(scheduler)
{
}

SelectionSupervisor::~SelectionSupervisor()
{
    if (m_tickHandle)
        m_scheduler->cancel(m_tickHandle);
}

void SelectionSupervisor::start(const SavedRange &range)
{
    if (m_tickHandle) {
        m_scheduler->cancel(m_tickHandle);
        m_tickHandle = 0;
    }
    ++m_chain;

    if (range.isNull()) {
        stop();
        return;
    }

    m_range = range;
    m_deadline = m_scheduler->elapsed() + m_keepAliveMs;
    m_restoreCount = 0;

    const bool wasWatching = isWatching();
    m_state = State::Watching;
    if (!wasWatching)
        Q_EMIT watchingChanged(true);

    scheduleTick();
}

void SelectionSupervisor::stop()
{
    if (m_tickHandle) {
        m_scheduler->cancel(m_tickHandle);
        m_tickHandle = 0;
    }
    ++m_chain;
    m_range = SavedRange();

    if (m_state == State::Idle)
        return;
    m_state = State::Idle;
    Q_EMIT watchingChanged(false);
}

void SelectionSupervisor::scheduleTick()
{
    const quint64 chain = m_chain;
    m_tickHandle = m_scheduler->schedule(m_tickIntervalMs, [this, chain]() {
        tick(chain);
    });
}

void SelectionSupervisor::tick(quint64 chain)
{
    // A tick from a chain that was stopped or restarted after it was
    // dispatched must not act on the new state.
    if (chain != m_chain || m_state != State::Watching)
        return;
    m_tickHandle = 0;

    if (m_scheduler->elapsed() >= m_deadline) {
        stop();
        return;
    }

    const NativeSelection current = m_surface->readSelection();
    const bool lost = !current.readable || current.collapsed
        || current.text.trimmed().isEmpty();

    if (lost && !m_range.isNull()) {
        if (m_surface->applyRange(m_range)) {
            ++m_restoreCount;
            Q_EMIT selectionRestored();
        } else {
            qDebug() << "SelectionSupervisor: could not restore range"
                     << m_range.anchor << m_range.position;
        }
    }

    // selectionRestored() handlers may have stopped us
    if (chain == m_chain && m_state == State::Watching)
        scheduleTick();
}
