/*
 * toolbarpositioner.cpp — Placement of the floating selection toolbar
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "toolbarpositioner.h"

#include <QtGlobal>

namespace ToolbarPositioner {

QPointF place(const QRectF &boundingBox, const QSizeF &viewport, const Geometry &geometry)
{
    const qreal width = geometry.toolbarSize.width();
    const qreal height = geometry.toolbarSize.height();
    const qreal pad = geometry.padding;

    // Horizontal: centered, then clamped
    qreal left = boundingBox.center().x() - width / 2.0;
    const qreal maxLeft = viewport.width() - pad - width;
    if (maxLeft < pad)
        left = pad; // viewport narrower than the toolbar
    else
        left = qBound(pad, left, maxLeft);

    // Vertical: above, else below, else pinned to the top padding
    qreal top = boundingBox.top() - geometry.offset - height;
    if (top < pad) {
        top = boundingBox.bottom() + geometry.offset;
        if (top + height > viewport.height() - pad)
            top = pad;
    }

    return QPointF(left, top);
}

} // namespace ToolbarPositioner
