// SPDX-License-Identifier: GPL-2.0-or-later

#include "annotationlistwidget.h"

#include <KLocalizedString>

#include <QIcon>
#include <QMenu>
#include <QTreeWidget>
#include <QVBoxLayout>

AnnotationListWidget::AnnotationListWidget(QWidget *parent)
    : QWidget(parent)
{
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);

    m_treeWidget = new QTreeWidget(this);
    m_treeWidget->setHeaderHidden(true);
    m_treeWidget->setRootIsDecorated(false);
    m_treeWidget->setContextMenuPolicy(Qt::CustomContextMenu);
    m_treeWidget->setTextElideMode(Qt::ElideRight);
    layout->addWidget(m_treeWidget);

    connect(m_treeWidget, &QTreeWidget::itemClicked,
            this, &AnnotationListWidget::onItemClicked);
    connect(m_treeWidget, &QTreeWidget::customContextMenuRequested,
            this, &AnnotationListWidget::onContextMenu);
}

void AnnotationListWidget::setAnnotations(const QList<Annotation> &annotations)
{
    const int current = currentAnnotation();

    m_treeWidget->clear();
    m_itemsById.clear();

    for (const Annotation &annotation : annotations) {
        auto *item = new QTreeWidgetItem();
        item->setText(0, annotation.anchorText.simplified());
        item->setData(0, Qt::UserRole, annotation.id);
        item->setIcon(0, QIcon::fromTheme(annotation.kind == AnnotationKind::Underline
                                              ? QStringLiteral("format-text-underline")
                                              : QStringLiteral("draw-highlight")));
        item->setToolTip(0, annotation.note.isEmpty() ? annotation.anchorText
                                                      : annotation.note);
        m_treeWidget->addTopLevelItem(item);
        m_itemsById.insert(annotation.id, item);
    }

    if (current >= 0)
        selectAnnotation(current);
}

void AnnotationListWidget::clear()
{
    m_treeWidget->clear();
    m_itemsById.clear();
}

int AnnotationListWidget::count() const
{
    return m_treeWidget->topLevelItemCount();
}

int AnnotationListWidget::itemId(const QTreeWidgetItem *item)
{
    if (!item)
        return -1;
    bool ok = false;
    const int id = item->data(0, Qt::UserRole).toInt(&ok);
    return ok ? id : -1;
}

int AnnotationListWidget::currentAnnotation() const
{
    return itemId(m_treeWidget->currentItem());
}

void AnnotationListWidget::onItemClicked(QTreeWidgetItem *item, int column)
{
    Q_UNUSED(column);

    const int id = itemId(item);
    if (id >= 0)
        Q_EMIT jumpRequested(id);
}

void AnnotationListWidget::onContextMenu(const QPoint &pos)
{
    const int id = itemId(m_treeWidget->itemAt(pos));
    if (id < 0)
        return;

    QMenu menu(this);
    QAction *goTo = menu.addAction(QIcon::fromTheme(QStringLiteral("go-jump")),
                                   i18n("Go to Annotation"));
    QAction *editNote = menu.addAction(QIcon::fromTheme(QStringLiteral("document-edit")),
                                       i18n("Edit Note…"));
    menu.addSeparator();
    QAction *remove = menu.addAction(QIcon::fromTheme(QStringLiteral("edit-delete")),
                                     i18n("Remove Annotation"));

    QAction *chosen = menu.exec(m_treeWidget->viewport()->mapToGlobal(pos));
    if (chosen == goTo)
        Q_EMIT jumpRequested(id);
    else if (chosen == editNote)
        Q_EMIT editNoteRequested(id);
    else if (chosen == remove)
        Q_EMIT removeRequested(id);
}

void AnnotationListWidget::selectAnnotation(int annotationId)
{
    QTreeWidgetItem *target = m_itemsById.value(annotationId, nullptr);
    if (m_treeWidget->currentItem() == target)
        return;
    m_treeWidget->blockSignals(true);
    m_treeWidget->setCurrentItem(target);
    if (target)
        m_treeWidget->scrollToItem(target);
    m_treeWidget->blockSignals(false);
}
