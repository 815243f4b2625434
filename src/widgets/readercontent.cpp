/*
 * readercontent.cpp — Chapter reading surface with selection toolbar and annotations
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "readercontent.h"
#include "marginreadersettings.h"
#include "readerview.h"
#include "selectiontoolbar.h"

#include <QApplication>
#include <QScrollBar>
#include <QVBoxLayout>

namespace {

bool isWithin(const QWidget *widget, const QWidget *container)
{
    return widget == container || container->isAncestorOf(widget);
}

} // namespace

ReaderContent::ReaderContent(QWidget *parent)
    : QWidget(parent)
    , m_view(new ReaderView(this))
    , m_toolbar(new SelectionToolbar(this))
    , m_capture(m_view, &m_scheduler)
    , m_supervisor(m_view, &m_scheduler)
    , m_dispatcher(&m_capture, &m_supervisor, m_view)
    , m_jump(m_view, &m_scheduler)
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);
    layout->addWidget(m_view);

    // Pointer lifecycle: a new press ends the previous keep-alive, a release
    // triggers a deferred capture.
    connect(m_view, &ReaderView::pointerPressed,
            &m_supervisor, &SelectionSupervisor::stop);
    connect(m_view, &ReaderView::pointerReleased,
            &m_capture, &SelectionCapture::onPointerRelease);
    connect(m_view, &ReaderView::annotationClicked,
            this, &ReaderContent::annotationClicked);
    connect(m_view, &ReaderView::contentRendered, this, [this]() {
        if (m_pendingJump < 0)
            return;
        const int id = m_pendingJump;
        m_pendingJump = -1;
        m_jump.jumpTo(id);
    });
    connect(m_view->verticalScrollBar(), &QScrollBar::valueChanged,
            this, &ReaderContent::updateToolbarPosition);

    connect(&m_capture, &SelectionCapture::selectionCaptured, this, [this]() {
        m_supervisor.start(m_capture.savedRange());
        showToolbar();
    });
    connect(&m_capture, &SelectionCapture::selectionCleared, this, [this]() {
        m_supervisor.stop();
        hideToolbar();
    });
    connect(&m_supervisor, &SelectionSupervisor::selectionRestored,
            this, &ReaderContent::updateToolbarPosition);

    connect(m_toolbar, &SelectionToolbar::highlightRequested,
            &m_dispatcher, &CommitDispatcher::commitHighlight);
    connect(m_toolbar, &SelectionToolbar::underlineRequested,
            &m_dispatcher, &CommitDispatcher::commitUnderline);
    connect(m_toolbar, &SelectionToolbar::createNoteRequested,
            &m_dispatcher, &CommitDispatcher::commitCreateNote);
    connect(m_toolbar, &SelectionToolbar::explainRequested,
            &m_dispatcher, &CommitDispatcher::commitExplain);
    connect(m_toolbar, &SelectionToolbar::cancelRequested,
            &m_dispatcher, &CommitDispatcher::cancel);

    connect(&m_dispatcher, &CommitDispatcher::selectionDismissed,
            this, &ReaderContent::hideToolbar);
    connect(&m_dispatcher, &CommitDispatcher::annotateRequested,
            this, &ReaderContent::annotateRequested);
    connect(&m_dispatcher, &CommitDispatcher::createNoteRequested,
            this, &ReaderContent::createNoteRequested);
    connect(&m_dispatcher, &CommitDispatcher::explainRequested,
            this, &ReaderContent::explainRequested);

    // Presses anywhere else in the application dismiss the selection
    qApp->installEventFilter(this);

    applySettings();
    render();
}

ReaderContent::~ReaderContent()
{
    qApp->removeEventFilter(this);
    // The view outlives the engine members; keep it from reaching them
    // while QWidget tears down the children.
    disconnect(m_view, nullptr, this, nullptr);
    disconnect(m_view, nullptr, &m_capture, nullptr);
    disconnect(m_view, nullptr, &m_supervisor, nullptr);
    disconnect(m_view->verticalScrollBar(), nullptr, this, nullptr);
    m_supervisor.stop();
    m_jump.clearPulse();
}

void ReaderContent::setChapter(const Chapter &chapter)
{
    if (chapter == m_chapter)
        return;

    const bool contentChanged = chapter.title != m_chapter.title
        || chapter.content != m_chapter.content;
    m_chapter = chapter;

    if (contentChanged) {
        m_pendingJump = -1;
        m_dispatcher.cancel();
        m_jump.clearPulse();
    }
    render();
}

void ReaderContent::setAnnotations(const QList<Annotation> &annotations)
{
    m_annotations = annotations;
    render();
}

void ReaderContent::requestJump(int annotationId)
{
    if (annotationId < 0)
        return;

    if (m_jump.jumpTo(annotationId)) {
        m_pendingJump = -1;
        return;
    }
    m_pendingJump = annotationId;
}

void ReaderContent::applySettings()
{
    auto *settings = MarginReaderSettings::self();

    m_capture.setCaptureDelay(settings->captureDelay());
    m_capture.setSettleDelay(settings->settleDelay());
    m_supervisor.setKeepAliveWindow(settings->keepAliveWindow());
    m_supervisor.setTickInterval(settings->supervisorTickInterval());
    m_jump.setPulseDuration(settings->pulseDuration());

    m_view->setAnnotationColors(settings->highlightColor(),
                                settings->underlineColor());
    m_view->setPulseColor(settings->pulseColor());

    m_toolbarGeometry.offset = settings->toolbarOffset();
    m_toolbarGeometry.padding = settings->toolbarPadding();
    m_toolbar->setExplainEnabled(settings->showExplainAction());
    updateToolbarPosition();
}

void ReaderContent::render()
{
    const QString &markup = m_cache.annotated(m_chapter.content, m_annotations);
    m_view->setContent(m_chapter.title, markup);
}

void ReaderContent::showToolbar()
{
    m_toolbar->adjustSize();
    m_toolbar->show();
    m_toolbar->raise();
    updateToolbarPosition();
}

void ReaderContent::hideToolbar()
{
    m_toolbar->hide();
}

void ReaderContent::updateToolbarPosition()
{
    if (!m_toolbar->isVisible() || !m_capture.hasSelection())
        return;

    // Follow the live selection while it exists; the captured box is only
    // valid for the scroll position at capture time.
    QRectF box = m_capture.record().boundingBox;
    const NativeSelection live = m_view->readSelection();
    if (live.readable && !live.collapsed)
        box = live.boundingBox;
    box.translate(m_view->pos());

    m_toolbarGeometry.toolbarSize = m_toolbar->sizeHint();
    const QPointF pos = ToolbarPositioner::place(box, QSizeF(size()),
                                                 m_toolbarGeometry);
    m_toolbar->move(pos.toPoint());
}

void ReaderContent::resizeEvent(QResizeEvent *event)
{
    QWidget::resizeEvent(event);
    updateToolbarPosition();
}

bool ReaderContent::eventFilter(QObject *watched, QEvent *event)
{
    if (event->type() == QEvent::MouseButtonPress && m_capture.hasSelection()) {
        auto *widget = qobject_cast<QWidget *>(watched);
        if (widget && !isWithin(widget, m_view) && !isWithin(widget, m_toolbar))
            m_dispatcher.cancel();
    }
    return QWidget::eventFilter(watched, event);
}
