/*
 * commitdispatcher.h — Toolbar actions to collaborator requests
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_COMMITDISPATCHER_H
#define MARGINREADER_COMMITDISPATCHER_H

#include <QObject>
#include <QString>

#include "annotation.h"

class SelectionCapture;
class SelectionSupervisor;
class SelectionSurface;

class CommitDispatcher : public QObject
{
    Q_OBJECT

public:
    CommitDispatcher(SelectionCapture *capture, SelectionSupervisor *supervisor,
                     SelectionSurface *surface, QObject *parent = nullptr);

public Q_SLOTS:
    // Without a live SelectionRecord the commits do nothing.
    void commitAnnotate(AnnotationKind kind);
    void commitHighlight() { commitAnnotate(AnnotationKind::Highlight); }
    void commitUnderline() { commitAnnotate(AnnotationKind::Underline); }
    void commitCreateNote();
    void commitExplain();
    // Always tears down.
    void cancel();

Q_SIGNALS:
    void annotateRequested(const QString &text, AnnotationKind kind);
    void createNoteRequested(const QString &text);
    void explainRequested(const QString &text);
    void selectionDismissed();

private:
    bool takeSelection(QString *text);
    void tearDown();

    SelectionCapture *m_capture = nullptr;
    SelectionSupervisor *m_supervisor = nullptr;
    SelectionSurface *m_surface = nullptr;
};

#endif // MARGINREADER_COMMITDISPATCHER_H
