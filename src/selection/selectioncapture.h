/*
 * selectioncapture.h — Turn a pointer release into the single SelectionRecord
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_SELECTIONCAPTURE_H
#define MARGINREADER_SELECTIONCAPTURE_H

#include <QObject>

#include "scheduler.h"
#include "selectionrecord.h"

class SelectionSurface;

class SelectionCapture : public QObject
{
    Q_OBJECT

public:
    SelectionCapture(SelectionSurface *surface, Scheduler *scheduler,
                     QObject *parent = nullptr);
    ~SelectionCapture() override;

    // Delay between release and the first read, and the (longer) delay after
    // which an empty reading is taken as a real clear rather than a drag
    // artifact. Both measured from the release.
    void setCaptureDelay(int ms) { m_captureDelayMs = ms; }
    void setSettleDelay(int ms) { m_settleDelayMs = ms; }
    int captureDelay() const { return m_captureDelayMs; }
    int settleDelay() const { return m_settleDelayMs; }

    // Debounced entry point. A newer release cancels a pending read.
    void onPointerRelease();

    // Read and validate the native selection right now. Returns the stored
    // record, or an invalid record if the selection was rejected.
    SelectionRecord captureNow();

    const SelectionRecord &record() const { return m_record; }
    SavedRange savedRange() const { return m_savedRange; }
    bool hasSelection() const { return m_record.isValid(); }
    bool isPending() const { return m_pendingHandle != 0; }

    // Drop the record, the saved range and any pending read.
    void clear();

Q_SIGNALS:
    void selectionCaptured(const SelectionRecord &record);
    void selectionCleared();

private:
    void readAfterRelease(bool settling);
    bool accept(const NativeSelection &selection, QString *trimmed) const;
    void cancelPending();
    void clearRecord();

    SelectionSurface *m_surface = nullptr;
    Scheduler *m_scheduler = nullptr;
    Scheduler::Handle m_pendingHandle = 0;
    int m_captureDelayMs = 10;
    int m_settleDelayMs = 60;

    SelectionRecord m_record;
    SavedRange m_savedRange;
};

#endif // MARGINREADER_SELECTIONCAPTURE_H
