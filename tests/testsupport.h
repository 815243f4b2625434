/*
 * testsupport.h — Deterministic scheduler and fake surfaces for engine tests
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_TESTSUPPORT_H
#define MARGINREADER_TESTSUPPORT_H

#include <QList>
#include <QPair>
#include <QSet>
#include <QString>

#include <ostream>
#include <utility>
#include <vector>

#include "scheduler.h"
#include "selectionsurface.h"

inline void PrintTo(const QString &value, std::ostream *os)
{
    *os << '"' << value.toStdString() << '"';
}

// Virtual clock. Tasks run only from advance(), in due order.
class ManualScheduler : public Scheduler
{
public:
    Handle schedule(int delayMs, Task task) override
    {
        const Handle handle = m_nextHandle++;
        m_pending.push_back({handle, m_now + qMax(0, delayMs), m_nextSeq++, std::move(task)});
        return handle;
    }

    void cancel(Handle handle) override
    {
        for (auto it = m_pending.begin(); it != m_pending.end(); ++it) {
            if (it->handle == handle) {
                m_pending.erase(it);
                return;
            }
        }
    }

    qint64 elapsed() const override { return m_now; }

    void advance(qint64 ms)
    {
        const qint64 target = m_now + ms;
        for (;;) {
            auto next = m_pending.end();
            for (auto it = m_pending.begin(); it != m_pending.end(); ++it) {
                if (it->due > target)
                    continue;
                if (next == m_pending.end() || it->due < next->due
                    || (it->due == next->due && it->seq < next->seq))
                    next = it;
            }
            if (next == m_pending.end())
                break;
            m_now = next->due;
            Task task = std::move(next->task);
            m_pending.erase(next);
            task();
        }
        m_now = target;
    }

    int pendingCount() const { return int(m_pending.size()); }

private:
    struct Pending {
        Handle handle;
        qint64 due;
        quint64 seq;
        Task task;
    };

    std::vector<Pending> m_pending;
    Handle m_nextHandle = 1;
    quint64 m_nextSeq = 0;
    qint64 m_now = 0;
};

class FakeSelectionSurface : public SelectionSurface
{
public:
    NativeSelection readSelection() const override
    {
        ++readCount;
        return current;
    }

    bool applyRange(SavedRange range) override
    {
        applied.append(range);
        if (!acceptApply)
            return false;
        current.readable = true;
        current.collapsed = false;
        current.range = range;
        current.text = selectedText;
        return true;
    }

    void clearNativeSelection() override
    {
        ++clearCount;
        collapse();
    }

    void select(const QString &text, SavedRange range, bool insideRoot = true)
    {
        selectedText = text;
        current.readable = true;
        current.collapsed = false;
        current.insideRoot = insideRoot;
        current.text = text;
        current.range = range;
        current.boundingBox = QRectF(100, 200, 80, 20);
    }

    void collapse()
    {
        current.collapsed = true;
        current.text.clear();
        current.range = SavedRange{current.range.position, current.range.position};
    }

    NativeSelection current;
    QString selectedText;
    QList<SavedRange> applied;
    bool acceptApply = true;
    int clearCount = 0;
    mutable int readCount = 0;
};

class FakeMarkerSurface : public MarkerSurface
{
public:
    bool revealMarker(int annotationId) override
    {
        revealed.append(annotationId);
        return rendered.contains(annotationId);
    }

    void setMarkerPulse(int annotationId, bool on) override
    {
        pulses.append(qMakePair(annotationId, on));
        if (on)
            pulsing.insert(annotationId);
        else
            pulsing.remove(annotationId);
    }

    QSet<int> rendered;
    QSet<int> pulsing;
    QList<int> revealed;
    QList<QPair<int, bool>> pulses;
};

#endif // MARGINREADER_TESTSUPPORT_H
