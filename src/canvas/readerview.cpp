/*
 * readerview.cpp — Read-only chapter view and content root of the selection engine
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "readerview.h"
#include "anchormatcher.h"

#include <QMouseEvent>
#include <QPropertyAnimation>
#include <QRegularExpression>
#include <QScrollBar>
#include <QTextBlock>
#include <QTextDocument>
#include <QTextDocumentFragment>
#include <QTextFragment>
#include <QTimer>
#include <QUrl>

namespace {

// Rendered length of the first wrapper named `name` in the annotated markup,
// nested wrappers included. -1 if the wrapper is absent.
int markerTextLength(const QString &markup, const QString &name)
{
    static const QRegularExpression anchorTag(
        QStringLiteral("<(/?)a\\b[^>]*>"), QRegularExpression::CaseInsensitiveOption);

    const int nameAt = markup.indexOf(QStringLiteral("name=\"%1\"").arg(name));
    if (nameAt < 0)
        return -1;
    const int contentStart = markup.indexOf(QLatin1Char('>'), nameAt) + 1;
    if (contentStart <= 0)
        return -1;

    int depth = 1;
    QRegularExpressionMatchIterator it = anchorTag.globalMatch(markup, contentStart);
    while (it.hasNext()) {
        const QRegularExpressionMatch tag = it.next();
        depth += tag.captured(1).isEmpty() ? 1 : -1;
        if (depth == 0) {
            const QString inner = markup.mid(contentStart, tag.capturedStart() - contentStart);
            return QTextDocumentFragment::fromHtml(inner).toPlainText().size();
        }
    }
    return -1;
}

} // namespace

ReaderView::ReaderView(QWidget *parent)
    : QTextBrowser(parent)
{
    setOpenLinks(false);
    setOpenExternalLinks(false);
    setTextInteractionFlags(Qt::TextSelectableByMouse | Qt::TextSelectableByKeyboard
                            | Qt::LinksAccessibleByMouse);
    setFrameShape(QFrame::NoFrame);

    // Smooth scrolling for jumps to annotation markers
    m_scrollAnimation = new QPropertyAnimation(verticalScrollBar(), "value", this);
    m_scrollAnimation->setDuration(kScrollAnimationMs);
    m_scrollAnimation->setEasingCurve(QEasingCurve::OutCubic);

    connect(this, &QTextBrowser::anchorClicked, this, [this](const QUrl &url) {
        int id = -1;
        if (AnchorMatcher::parseMarkerHref(url.toString(), &id))
            Q_EMIT annotationClicked(id);
    });

    updateStyleSheet();
}

// --- Rendering ---

bool ReaderView::setContent(const QString &title, const QString &annotatedMarkup)
{
    // Output stability: an unchanged pair must not reset the document, or the
    // live selection inside it is destroyed.
    if (m_renderCount > 0 && title == m_title && annotatedMarkup == m_markup)
        return false;

    m_title = title;
    m_markup = annotatedMarkup;
    render();
    return true;
}

void ReaderView::render()
{
    const int scroll = verticalScrollBar()->value();

    QString html;
    if (!m_title.isEmpty())
        html += QStringLiteral("<h1>%1</h1>").arg(m_title.toHtmlEscaped());
    html += m_markup;
    setHtml(html);

    m_rootStart = 0;
    if (!m_title.isEmpty()) {
        const QTextBlock body = document()->firstBlock().next();
        m_rootStart = body.isValid() ? body.position()
                                     : qMax(0, document()->characterCount() - 1);
    }

    // The layout may not have grown the scroll range yet; restore again once
    // it has.
    verticalScrollBar()->setValue(scroll);
    QTimer::singleShot(0, this, [this, scroll]() {
        verticalScrollBar()->setValue(scroll);
    });

    ++m_renderCount;
    updateExtraSelections();
    Q_EMIT contentRendered();
}

void ReaderView::setAnnotationColors(const QColor &highlight, const QColor &underline)
{
    if (highlight == m_highlightColor && underline == m_underlineColor)
        return;
    m_highlightColor = highlight;
    m_underlineColor = underline;
    updateStyleSheet();
    if (m_renderCount > 0)
        render();
}

void ReaderView::setPulseColor(const QColor &color)
{
    m_pulseColor = color;
    updateExtraSelections();
}

void ReaderView::updateStyleSheet()
{
    const QString text = palette().color(QPalette::Text).name();
    document()->setDefaultStyleSheet(QStringLiteral(
        "a { color: %3; text-decoration: none; }\n"
        "a.annotation-highlight { background-color: %1; color: %3; text-decoration: none; }\n"
        "a.annotation-underline { color: %2; text-decoration: underline; }\n")
        .arg(m_highlightColor.name(), m_underlineColor.name(), text));
}

// --- SelectionSurface ---

NativeSelection ReaderView::readSelection() const
{
    NativeSelection selection;
    if (!document())
        return selection;

    selection.readable = true;
    const QTextCursor cursor = textCursor();
    selection.range.anchor = cursor.anchor();
    selection.range.position = cursor.position();
    selection.collapsed = !cursor.hasSelection();
    if (selection.collapsed)
        return selection;

    QString text = cursor.selectedText();
    text.replace(QChar::ParagraphSeparator, QLatin1Char('\n'));
    text.replace(QChar::LineSeparator, QLatin1Char('\n'));
    text.replace(QChar::Nbsp, QLatin1Char(' '));
    selection.text = text;

    selection.insideRoot = cursor.selectionStart() >= m_rootStart;
    selection.boundingBox = selectionRect(cursor);
    return selection;
}

// Widget coordinates. A selection spanning lines is widened to the viewport.
QRectF ReaderView::selectionRect(const QTextCursor &cursor) const
{
    QTextCursor first(document());
    first.setPosition(cursor.selectionStart());
    QTextCursor last(document());
    last.setPosition(cursor.selectionEnd());

    const QRect a = cursorRect(first);
    const QRect b = cursorRect(last);

    QRectF rect;
    if (a.top() == b.top()) {
        rect = QRectF(QPointF(a.left(), a.top()),
                      QPointF(b.right(), qMax(a.bottom(), b.bottom())));
    } else {
        rect = QRectF(QPointF(0, a.top()),
                      QPointF(viewport()->width(), b.bottom()));
    }
    return rect.translated(viewport()->pos());
}

bool ReaderView::applyRange(SavedRange range)
{
    if (range.isNull())
        return false;

    const int last = document()->characterCount() - 1;
    if (range.anchor > last || range.position > last)
        return false;

    QTextCursor cursor(document());
    cursor.setPosition(range.anchor);
    cursor.setPosition(range.position, QTextCursor::KeepAnchor);
    if (!cursor.hasSelection())
        return false;

    setCursorKeepingScroll(cursor);
    return true;
}

void ReaderView::clearNativeSelection()
{
    QTextCursor cursor = textCursor();
    if (!cursor.hasSelection())
        return;
    cursor.clearSelection();
    setCursorKeepingScroll(cursor);
}

void ReaderView::setCursorKeepingScroll(const QTextCursor &cursor)
{
    const int v = verticalScrollBar()->value();
    const int h = horizontalScrollBar()->value();
    setTextCursor(cursor);
    verticalScrollBar()->setValue(v);
    horizontalScrollBar()->setValue(h);
}

// --- MarkerSurface ---

QTextCursor ReaderView::markerCursor(int annotationId) const
{
    const QString href = AnchorMatcher::markerHref(annotationId);
    const QString name = AnchorMatcher::markerName(annotationId);
    const int length = markerTextLength(m_markup, name);

    for (QTextBlock block = document()->begin(); block.isValid(); block = block.next()) {
        for (QTextBlock::iterator it = block.begin(); !it.atEnd(); ++it) {
            const QTextFragment fragment = it.fragment();
            if (!fragment.isValid())
                continue;
            // A nested marker at the very start carries this marker's name
            // but its own href.
            const QTextCharFormat format = fragment.charFormat();
            if (format.anchorHref() != href && !format.anchorNames().contains(name))
                continue;

            const int start = fragment.position();
            int end = start + fragment.length();
            if (length > 0)
                end = qMin(start + length, block.position() + block.length() - 1);

            QTextCursor cursor(document());
            cursor.setPosition(start);
            cursor.setPosition(end, QTextCursor::KeepAnchor);
            return cursor;
        }
    }
    return QTextCursor();
}

bool ReaderView::revealMarker(int annotationId)
{
    const QTextCursor marker = markerCursor(annotationId);
    if (marker.isNull())
        return false;

    QTextCursor start(document());
    start.setPosition(marker.selectionStart());
    const QRect rect = cursorRect(start);

    QScrollBar *bar = verticalScrollBar();
    const int target = qBound(bar->minimum(),
                              bar->value() + rect.center().y() - viewport()->height() / 2,
                              bar->maximum());

    m_scrollAnimation->stop();
    m_scrollAnimation->setStartValue(bar->value());
    m_scrollAnimation->setEndValue(target);
    m_scrollAnimation->start();
    return true;
}

void ReaderView::setMarkerPulse(int annotationId, bool on)
{
    if (on)
        m_pulsedId = annotationId;
    else if (m_pulsedId == annotationId)
        m_pulsedId = -1;
    updateExtraSelections();
}

void ReaderView::updateExtraSelections()
{
    QList<QTextEdit::ExtraSelection> selections;
    if (m_pulsedId >= 0) {
        const QTextCursor marker = markerCursor(m_pulsedId);
        if (!marker.isNull()) {
            QTextEdit::ExtraSelection pulse;
            pulse.cursor = marker;
            pulse.format.setBackground(m_pulseColor);
            selections.append(pulse);
        }
    }
    setExtraSelections(selections);
}

// --- Pointer events ---

void ReaderView::mousePressEvent(QMouseEvent *event)
{
    if (event->button() == Qt::LeftButton)
        Q_EMIT pointerPressed();
    QTextBrowser::mousePressEvent(event);
}

void ReaderView::mouseReleaseEvent(QMouseEvent *event)
{
    QTextBrowser::mouseReleaseEvent(event);
    if (event->button() == Qt::LeftButton)
        Q_EMIT pointerReleased();
}
