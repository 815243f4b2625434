/*
 * anchormatcher.h — Wrap annotation anchors inside sanitized chapter markup
 *
 * The buffer is treated as an opaque character stream with embedded tags.
 * Each accepted occurrence of an anchor is wrapped in an <a> carrying the
 * annotation id and kind, so the renderer can route clicks and locate
 * markers without any stored offsets.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_ANCHORMATCHER_H
#define MARGINREADER_ANCHORMATCHER_H

#include <QList>
#include <QRegularExpression>
#include <QString>

#include "annotation.h"

namespace AnchorMatcher {

// Returns the annotated copy of `buffer`. Longer anchors are wrapped first
// (stable for equal lengths) so a contained anchor never splits the outer
// wrapper. An annotation whose matcher cannot be built is skipped.
QString annotate(const QString &buffer, const QList<Annotation> &annotations);

// Literal matcher for an anchor: metacharacters escaped, every whitespace
// run matches any whitespace run. The anchor is rendered text, so quotes,
// ampersands, angle brackets and non-ASCII characters also match their
// entity and character-reference spellings in the markup. The pattern is
// empty for an anchor that has no non-whitespace characters.
QRegularExpression buildMatcher(const QString &anchorText);

// True if `position` lies inside a tag, i.e. scanning backward from it
// reaches '<' before '>'.
bool isInsideTag(const QString &buffer, int position);

// Wrapper markup for one matched span.
QString wrap(const QString &matchedText, const Annotation &annotation);

// "annotation:<id>" link target and "annotation-<id>" anchor name
QString markerHref(int annotationId);
QString markerName(int annotationId);
bool parseMarkerHref(const QString &href, int *annotationId);

} // namespace AnchorMatcher

#endif // MARGINREADER_ANCHORMATCHER_H
