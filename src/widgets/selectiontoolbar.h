// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MARGINREADER_SELECTIONTOOLBAR_H
#define MARGINREADER_SELECTIONTOOLBAR_H

#include <QFrame>

class QToolButton;

// Floating action menu shown above a live selection.
class SelectionToolbar : public QFrame
{
    Q_OBJECT

public:
    explicit SelectionToolbar(QWidget *parent = nullptr);

    void setExplainEnabled(bool enabled);

Q_SIGNALS:
    void highlightRequested();
    void underlineRequested();
    void createNoteRequested();
    void explainRequested();
    void cancelRequested();

private:
    QToolButton *addButton(const QString &icon, const QString &toolTip);

    QToolButton *m_highlightBtn = nullptr;
    QToolButton *m_underlineBtn = nullptr;
    QToolButton *m_noteBtn = nullptr;
    QToolButton *m_explainBtn = nullptr;
    QToolButton *m_cancelBtn = nullptr;
};

#endif // MARGINREADER_SELECTIONTOOLBAR_H
