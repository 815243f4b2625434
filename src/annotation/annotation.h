/*
 * annotation.h — Committed annotation as handed to the overlay engine
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_ANNOTATION_H
#define MARGINREADER_ANNOTATION_H

#include <QList>
#include <QMetaType>
#include <QString>

enum class AnnotationKind {
    Highlight,
    Underline
};

// Identity is `id`. anchorText is the literal join key used to re-locate the
// annotation in regenerated chapter markup; offsets are never stored.
struct Annotation {
    int id = -1;
    QString anchorText;
    AnnotationKind kind = AnnotationKind::Highlight;
    QString note; // free text from "create note"; ignored by the matcher

    bool operator==(const Annotation &o) const {
        return id == o.id && anchorText == o.anchorText && kind == o.kind
            && note == o.note;
    }
    bool operator!=(const Annotation &o) const { return !(*this == o); }
};

// "highlight" / "underline", used in markup attributes and JSON
QString annotationKindName(AnnotationKind kind);
AnnotationKind annotationKindFromName(const QString &name, bool *ok = nullptr);

Q_DECLARE_METATYPE(AnnotationKind)

#endif // MARGINREADER_ANNOTATION_H
