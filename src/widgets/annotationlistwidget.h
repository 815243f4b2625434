// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MARGINREADER_ANNOTATIONLISTWIDGET_H
#define MARGINREADER_ANNOTATIONLISTWIDGET_H

#include <QHash>
#include <QList>
#include <QWidget>

#include "annotation.h"

class QPoint;
class QTreeWidget;
class QTreeWidgetItem;

// Side panel listing the current chapter's annotations.
class AnnotationListWidget : public QWidget
{
    Q_OBJECT

public:
    explicit AnnotationListWidget(QWidget *parent = nullptr);

    void setAnnotations(const QList<Annotation> &annotations);
    void clear();
    int count() const;

    // Make `annotationId` the current row without emitting jumpRequested
    void selectAnnotation(int annotationId);
    int currentAnnotation() const;

Q_SIGNALS:
    void jumpRequested(int annotationId);
    void editNoteRequested(int annotationId);
    void removeRequested(int annotationId);

private Q_SLOTS:
    void onItemClicked(QTreeWidgetItem *item, int column);
    void onContextMenu(const QPoint &pos);

private:
    static int itemId(const QTreeWidgetItem *item);

    QTreeWidget *m_treeWidget = nullptr;
    QHash<int, QTreeWidgetItem *> m_itemsById;
};

#endif // MARGINREADER_ANNOTATIONLISTWIDGET_H
