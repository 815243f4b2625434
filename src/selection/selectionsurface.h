/*
 * selectionsurface.h — Engine-facing view of the native selection and markers
 *
 * The rendering widget implements both interfaces; the engine components only
 * ever talk to it through them.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_SELECTIONSURFACE_H
#define MARGINREADER_SELECTIONSURFACE_H

#include "selectionrecord.h"

class SelectionSurface
{
public:
    virtual ~SelectionSurface() = default;

    virtual NativeSelection readSelection() const = 0;

    // Re-apply a saved extent. Returns false if the range no longer fits the
    // rendered document; callers treat that as a dropped attempt.
    virtual bool applyRange(SavedRange range) = 0;

    virtual void clearNativeSelection() = 0;
};

class MarkerSurface
{
public:
    virtual ~MarkerSurface() = default;

    // Scroll the marker for `annotationId` to the viewport center.
    // Returns false if no such marker is rendered.
    virtual bool revealMarker(int annotationId) = 0;

    virtual void setMarkerPulse(int annotationId, bool on) = 0;
};

#endif // MARGINREADER_SELECTIONSURFACE_H
