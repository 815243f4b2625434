/*
 * toolbarpositioner.h — Placement of the floating selection toolbar
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_TOOLBARPOSITIONER_H
#define MARGINREADER_TOOLBARPOSITIONER_H

#include <QPointF>
#include <QRectF>
#include <QSizeF>

namespace ToolbarPositioner {

struct Geometry {
    QSizeF toolbarSize = QSizeF(200, 40);
    qreal offset = 10;      // gap between selection and toolbar
    qreal padding = 10;     // minimum distance to the viewport edges
};

// Top-left corner for the toolbar. Centered above the selection; flipped
// below it if it would leave the top edge; clamped to `padding` if it would
// then leave the bottom edge. Horizontally the whole toolbar stays within
// [padding, viewport width - padding].
QPointF place(const QRectF &boundingBox, const QSizeF &viewport,
              const Geometry &geometry = Geometry());

} // namespace ToolbarPositioner

#endif // MARGINREADER_TOOLBARPOSITIONER_H
