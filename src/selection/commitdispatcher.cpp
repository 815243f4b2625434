/*
 * commitdispatcher.cpp — Toolbar actions to collaborator requests
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "commitdispatcher.h"
#include "selectioncapture.h"
#include "selectionsupervisor.h"
#include "selectionsurface.h"

CommitDispatcher::CommitDispatcher(SelectionCapture *capture,
                                   SelectionSupervisor *supervisor,
                                   SelectionSurface *surface, QObject *parent)
    : QObject(parent)
    , m_capture(capture)
    , m_supervisor(supervisor)
    , m_surface(surface)
{
}

void CommitDispatcher::commitAnnotate(AnnotationKind kind)
{
    QString text;
    if (!takeSelection(&text))
        return;
    Q_EMIT annotateRequested(text, kind);
}

void CommitDispatcher::commitCreateNote()
{
    QString text;
    if (!takeSelection(&text))
        return;
    Q_EMIT createNoteRequested(text);
}

void CommitDispatcher::commitExplain()
{
    QString text;
    if (!takeSelection(&text))
        return;
    Q_EMIT explainRequested(text);
}

void CommitDispatcher::cancel()
{
    tearDown();
}

// The text is taken and the state torn down before the request goes out:
// receivers may open modal dialogs, and no keep-alive tick may run under them.
bool CommitDispatcher::takeSelection(QString *text)
{
    if (!m_capture->hasSelection())
        return false;
    *text = m_capture->record().text;
    tearDown();
    return !text->isEmpty();
}

void CommitDispatcher::tearDown()
{
    m_supervisor->stop();
    m_capture->clear();
    m_surface->clearNativeSelection();
    Q_EMIT selectionDismissed();
}
