/*
 * selectioncapture.cpp — Turn a pointer release into the single SelectionRecord
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "selectioncapture.h"
#include "selectionsurface.h"

#include <QDebug>

SelectionCapture::SelectionCapture(SelectionSurface *surface, Scheduler *scheduler,
                                   QObject *parent)
    : QObject(parent)
    , m_surface(surface)
    , m_scheduler(scheduler)
{
}

SelectionCapture::~SelectionCapture()
{
    cancelPending();
}

void SelectionCapture::onPointerRelease()
{
    cancelPending();
    m_pendingHandle = m_scheduler->schedule(m_captureDelayMs, [this]() {
        m_pendingHandle = 0;
        readAfterRelease(false);
    });
}

void SelectionCapture::readAfterRelease(bool settling)
{
    const NativeSelection selection = m_surface->readSelection();
    QString text;

    const bool empty = !selection.readable || selection.collapsed
        || selection.text.trimmed().isEmpty();
    if (empty) {
        // The platform may still be updating its selection at the end of a
        // drag; only a second empty reading counts.
        const int remaining = m_settleDelayMs - m_captureDelayMs;
        if (!settling && remaining > 0) {
            m_pendingHandle = m_scheduler->schedule(remaining, [this]() {
                m_pendingHandle = 0;
                readAfterRelease(true);
            });
            return;
        }
        clearRecord();
        return;
    }

    if (!accept(selection, &text)) {
        clearRecord();
        return;
    }

    m_record.text = text;
    m_record.boundingBox = selection.boundingBox;
    m_savedRange = selection.range;
    Q_EMIT selectionCaptured(m_record);
}

SelectionRecord SelectionCapture::captureNow()
{
    cancelPending();

    const NativeSelection selection = m_surface->readSelection();
    QString text;
    if (!accept(selection, &text)) {
        clearRecord();
        return {};
    }

    m_record.text = text;
    m_record.boundingBox = selection.boundingBox;
    m_savedRange = selection.range;
    Q_EMIT selectionCaptured(m_record);
    return m_record;
}

bool SelectionCapture::accept(const NativeSelection &selection, QString *trimmed) const
{
    if (!selection.readable || selection.collapsed)
        return false;

    // Selections leaking out of the content root (title, chrome) are
    // rejected: their text is not part of the annotatable buffer.
    if (!selection.insideRoot)
        return false;

    const QString text = selection.text.trimmed();
    if (text.isEmpty())
        return false;

    *trimmed = text;
    return true;
}

void SelectionCapture::clear()
{
    cancelPending();
    clearRecord();
}

void SelectionCapture::cancelPending()
{
    if (m_pendingHandle == 0)
        return;
    m_scheduler->cancel(m_pendingHandle);
    m_pendingHandle = 0;
}

void SelectionCapture::clearRecord()
{
    const bool hadSelection = m_record.isValid() || !m_savedRange.isNull();
    m_record = SelectionRecord();
    m_savedRange = SavedRange();
    if (hadSelection)
        Q_EMIT selectionCleared();
}
