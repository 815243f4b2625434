/*
 * readerview.h — Read-only chapter view and content root of the selection engine
 *
 * Renders the chapter title plus the annotated chapter markup and exposes
 * its QTextCursor selection and annotation markers to the engine. The title
 * block lies outside the content root: its text is not part of the
 * annotatable buffer.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_READERVIEW_H
#define MARGINREADER_READERVIEW_H

#include <QColor>
#include <QTextBrowser>
#include <QTextCursor>

#include "selectionsurface.h"

class QPropertyAnimation;

class ReaderView : public QTextBrowser, public SelectionSurface, public MarkerSurface
{
    Q_OBJECT

public:
    explicit ReaderView(QWidget *parent = nullptr);

    // Resets the document only if title or markup changed. Returns true if
    // the document was re-rendered.
    bool setContent(const QString &title, const QString &annotatedMarkup);
    QString currentMarkup() const { return m_markup; }
    QString currentTitle() const { return m_title; }
    int renderCount() const { return m_renderCount; }

    // First character position belonging to the chapter body
    int rootStart() const { return m_rootStart; }

    void setAnnotationColors(const QColor &highlight, const QColor &underline);
    void setPulseColor(const QColor &color);

    // SelectionSurface
    NativeSelection readSelection() const override;
    bool applyRange(SavedRange range) override;
    void clearNativeSelection() override;

    // MarkerSurface
    bool revealMarker(int annotationId) override;
    void setMarkerPulse(int annotationId, bool on) override;

    // Extent of the first rendered marker for the id; null cursor if absent
    QTextCursor markerCursor(int annotationId) const;

Q_SIGNALS:
    void pointerPressed();
    void pointerReleased();
    void annotationClicked(int annotationId);
    void contentRendered();

protected:
    void mousePressEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;

private:
    void render();
    void updateStyleSheet();
    void updateExtraSelections();
    QRectF selectionRect(const QTextCursor &cursor) const;
    void setCursorKeepingScroll(const QTextCursor &cursor);

    QString m_title;
    QString m_markup;
    int m_rootStart = 0;
    int m_renderCount = 0;

    QColor m_highlightColor = QColor(0xfd, 0xe6, 0x8a);
    QColor m_underlineColor = QColor(0x3b, 0x82, 0xf6);
    QColor m_pulseColor = QColor(0xfb, 0xbf, 0x24);
    int m_pulsedId = -1;

    QPropertyAnimation *m_scrollAnimation = nullptr;
    static constexpr int kScrollAnimationMs = 300;
};

#endif // MARGINREADER_READERVIEW_H
