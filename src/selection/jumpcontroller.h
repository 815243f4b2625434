/*
 * jumpcontroller.h — Scroll to an annotation marker and pulse it
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_JUMPCONTROLLER_H
#define MARGINREADER_JUMPCONTROLLER_H

#include <QObject>

#include "scheduler.h"

class MarkerSurface;

class JumpController : public QObject
{
    Q_OBJECT

public:
    JumpController(MarkerSurface *surface, Scheduler *scheduler,
                   QObject *parent = nullptr);
    ~JumpController() override;

    void setPulseDuration(int ms) { m_pulseDurationMs = ms; }
    int pulseDuration() const { return m_pulseDurationMs; }

    // No-op (false) if the marker is not rendered. Calling again while a
    // pulse is running restarts it instead of stacking.
    bool jumpTo(int annotationId);

    // -1 when no pulse is active
    int pulsedAnnotation() const { return m_pulsedId; }

    void clearPulse();

Q_SIGNALS:
    void pulseStarted(int annotationId);
    void pulseFinished(int annotationId);

private:
    void endPulse();

    MarkerSurface *m_surface = nullptr;
    Scheduler *m_scheduler = nullptr;
    Scheduler::Handle m_pulseHandle = 0;
    int m_pulsedId = -1;
    int m_pulseDurationMs = 1500;
};

#endif // MARGINREADER_JUMPCONTROLLER_H
