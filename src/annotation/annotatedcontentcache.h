/*
 * annotatedcontentcache.h — Output-stable memo of the annotated chapter buffer
 *
 * Re-rendering with an unchanged (buffer, annotation set) pair must hand the
 * view the very same markup, or the view resets its document and destroys a
 * live selection. The cache returns its stored, implicitly shared string
 * until either input changes by value.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_ANNOTATEDCONTENTCACHE_H
#define MARGINREADER_ANNOTATEDCONTENTCACHE_H

#include <QList>
#include <QString>

#include "annotation.h"

class AnnotatedContentCache
{
public:
    // Annotation order is irrelevant: the set is normalized by id before
    // comparison and before matching.
    const QString &annotated(const QString &buffer,
                             const QList<Annotation> &annotations);

    void invalidate();
    bool isValid() const { return m_valid; }

    // Number of times the matcher actually ran
    int computeCount() const { return m_computeCount; }

private:
    static QList<Annotation> normalized(const QList<Annotation> &annotations);

    QString m_buffer;
    QList<Annotation> m_annotations;
    QString m_result;
    bool m_valid = false;
    int m_computeCount = 0;
};

#endif // MARGINREADER_ANNOTATEDCONTENTCACHE_H
