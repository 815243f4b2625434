/*
 * annotation.cpp — Committed annotation as handed to the overlay engine
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "annotation.h"

QString annotationKindName(AnnotationKind kind)
{
    switch (kind) {
    case AnnotationKind::Underline:
        return QStringLiteral("underline");
    case AnnotationKind::Highlight:
        break;
    }
    return QStringLiteral("highlight");
}

AnnotationKind annotationKindFromName(const QString &name, bool *ok)
{
    const QString n = name.trimmed().toLower();
    if (ok)
        *ok = true;
    if (n == QLatin1String("underline"))
        return AnnotationKind::Underline;
    if (n != QLatin1String("highlight") && ok)
        *ok = false;
    return AnnotationKind::Highlight;
}
