/*
 * readercontent.h — Chapter reading surface with selection toolbar and annotations
 *
 * Owns the content view, the floating toolbar and the selection engine:
 * capture on pointer release, keep-alive supervision, toolbar placement,
 * commit dispatch and marker jumps. Consumes the chapter, the annotation
 * set and jump requests; emits the user's commits.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_READERCONTENT_H
#define MARGINREADER_READERCONTENT_H

#include <QList>
#include <QWidget>

#include "annotatedcontentcache.h"
#include "annotation.h"
#include "chapter.h"
#include "commitdispatcher.h"
#include "jumpcontroller.h"
#include "scheduler.h"
#include "selectioncapture.h"
#include "selectionsupervisor.h"
#include "toolbarpositioner.h"

class ReaderView;
class SelectionToolbar;

class ReaderContent : public QWidget
{
    Q_OBJECT

public:
    explicit ReaderContent(QWidget *parent = nullptr);
    ~ReaderContent() override;

    // A different title or content invalidates the live selection.
    void setChapter(const Chapter &chapter);
    const Chapter &chapter() const { return m_chapter; }

    void setAnnotations(const QList<Annotation> &annotations);
    const QList<Annotation> &annotations() const { return m_annotations; }

    // Negative ids are ignored. If the marker is not rendered yet the jump is
    // retried once after the next render.
    void requestJump(int annotationId);

    // Pull timings, colors and toolbar geometry from MarginReaderSettings
    void applySettings();

    ReaderView *view() const { return m_view; }
    SelectionToolbar *toolbar() const { return m_toolbar; }
    SelectionCapture *selectionCapture() { return &m_capture; }
    SelectionSupervisor *selectionSupervisor() { return &m_supervisor; }
    CommitDispatcher *commitDispatcher() { return &m_dispatcher; }
    JumpController *jumpController() { return &m_jump; }

Q_SIGNALS:
    void annotateRequested(const QString &text, AnnotationKind kind);
    void createNoteRequested(const QString &text);
    void explainRequested(const QString &text);
    void annotationClicked(int annotationId);

protected:
    void resizeEvent(QResizeEvent *event) override;
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    void render();
    void showToolbar();
    void hideToolbar();
    void updateToolbarPosition();

    // Declaration order matters: the engine parts below reference the view
    // and the scheduler, and must be destroyed before the scheduler.
    ReaderView *m_view = nullptr;
    SelectionToolbar *m_toolbar = nullptr;
    TimerScheduler m_scheduler;
    SelectionCapture m_capture;
    SelectionSupervisor m_supervisor;
    CommitDispatcher m_dispatcher;
    JumpController m_jump;

    AnnotatedContentCache m_cache;
    Chapter m_chapter;
    QList<Annotation> m_annotations;
    int m_pendingJump = -1;
    ToolbarPositioner::Geometry m_toolbarGeometry;
};

#endif // MARGINREADER_READERCONTENT_H
