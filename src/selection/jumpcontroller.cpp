/*
 * jumpcontroller.cpp — Scroll to an annotation marker and pulse it
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "jumpcontroller.h"
#include "selectionsurface.h"

JumpController::JumpController(MarkerSurface *surface, Scheduler *scheduler,
                               QObject *parent)
    : QObject(parent)
    , m_surface(surface)
    , m_scheduler(scheduler)
{
}

JumpController::~JumpController()
{
    if (m_pulseHandle)
        m_scheduler->cancel(m_pulseHandle);
}

bool JumpController::jumpTo(int annotationId)
{
    if (!m_surface->revealMarker(annotationId))
        return false;

    clearPulse();

    m_pulsedId = annotationId;
    m_surface->setMarkerPulse(annotationId, true);
    Q_EMIT pulseStarted(annotationId);

    m_pulseHandle = m_scheduler->schedule(m_pulseDurationMs, [this]() {
        m_pulseHandle = 0;
        endPulse();
    });
    return true;
}

void JumpController::clearPulse()
{
    if (m_pulseHandle) {
        m_scheduler->cancel(m_pulseHandle);
        m_pulseHandle = 0;
    }
    endPulse();
}

void JumpController::endPulse()
{
    if (m_pulsedId < 0)
        return;
    const int id = m_pulsedId;
    m_pulsedId = -1;
    m_surface->setMarkerPulse(id, false);
    Q_EMIT pulseFinished(id);
}
