/*
 * annotatedcontentcache.cpp — Output-stable memo of the annotated chapter buffer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "annotatedcontentcache.h"
#include "anchormatcher.h"

#include <algorithm>

QList<Annotation> AnnotatedContentCache::normalized(const QList<Annotation> &annotations)
{
    QList<Annotation> sorted = annotations;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Annotation &a, const Annotation &b) { return a.id < b.id; });
    return sorted;
}

const QString &AnnotatedContentCache::annotated(const QString &buffer,
                                                const QList<Annotation> &annotations)
{
    QList<Annotation> set = normalized(annotations);
    if (m_valid && buffer == m_buffer && set == m_annotations)
        return m_result;

    m_result = AnchorMatcher::annotate(buffer, set);
    m_buffer = buffer;
    m_annotations = std::move(set);
    m_valid = true;
    ++m_computeCount;
    return m_result;
}

void AnnotatedContentCache::invalidate()
{
    m_valid = false;
    m_buffer.clear();
    m_annotations.clear();
    m_result.clear();
}
