/*
 * selectionrecord.h — Transient selection state shared by the engine parts
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_SELECTIONRECORD_H
#define MARGINREADER_SELECTIONRECORD_H

#include <QMetaType>
#include <QRectF>
#include <QString>

// Snapshot of the native selection extent, in character offsets of the
// rendered document. Offsets survive re-renders because annotation wrappers
// add markup but no text. Always passed by value: each restoration builds
// a fresh native cursor from its own copy.
struct SavedRange {
    int anchor = -1;
    int position = -1;

    bool isNull() const { return anchor < 0 || position < 0 || anchor == position; }
    int start() const { return qMin(anchor, position); }
    int end() const { return qMax(anchor, position); }

    bool operator==(const SavedRange &o) const {
        return anchor == o.anchor && position == o.position;
    }
    bool operator!=(const SavedRange &o) const { return !(*this == o); }
};

// The single live selection. Invalid (empty text) means "no selection".
struct SelectionRecord {
    QString text;          // trimmed selection text
    QRectF boundingBox;    // in view widget coordinates

    bool isValid() const { return !text.isEmpty(); }
};

// What the surface reports when asked about the native selection.
struct NativeSelection {
    bool readable = false;     // false if the platform could not be queried
    bool collapsed = true;     // caret or nothing
    bool insideRoot = false;   // anchor lies within the content root
    QString text;              // untrimmed selection text
    QRectF boundingBox;
    SavedRange range;
};

Q_DECLARE_METATYPE(SelectionRecord)

#endif // MARGINREADER_SELECTIONRECORD_H
