// SPDX-License-Identifier: GPL-2.0-or-later

#include "selectiontoolbar.h"

#include <KLocalizedString>

#include <QHBoxLayout>
#include <QIcon>
#include <QToolButton>

SelectionToolbar::SelectionToolbar(QWidget *parent)
    : QFrame(parent)
{
    setFrameShape(QFrame::StyledPanel);
    setFrameShadow(QFrame::Raised);
    setAutoFillBackground(true);
    setFocusPolicy(Qt::NoFocus);

    auto *layout = new QHBoxLayout(this);
    layout->setContentsMargins(4, 4, 4, 4);
    layout->setSpacing(2);

    m_highlightBtn = addButton(QStringLiteral("draw-highlight"), i18n("Highlight"));
    m_underlineBtn = addButton(QStringLiteral("format-text-underline"), i18n("Underline"));

    auto *separator = new QFrame;
    separator->setFrameShape(QFrame::VLine);
    separator->setFrameShadow(QFrame::Sunken);
    layout->addWidget(separator);

    m_noteBtn = addButton(QStringLiteral("document-edit"), i18n("Create Note"));
    m_explainBtn = addButton(QStringLiteral("help-hint"), i18n("Explain"));
    m_cancelBtn = addButton(QStringLiteral("dialog-cancel"), i18n("Cancel"));

    connect(m_highlightBtn, &QToolButton::clicked,
            this, &SelectionToolbar::highlightRequested);
    connect(m_underlineBtn, &QToolButton::clicked,
            this, &SelectionToolbar::underlineRequested);
    connect(m_noteBtn, &QToolButton::clicked,
            this, &SelectionToolbar::createNoteRequested);
    connect(m_explainBtn, &QToolButton::clicked,
            this, &SelectionToolbar::explainRequested);
    connect(m_cancelBtn, &QToolButton::clicked,
            this, &SelectionToolbar::cancelRequested);

    adjustSize();
    hide();
}

QToolButton *SelectionToolbar::addButton(const QString &icon, const QString &toolTip)
{
    auto *button = new QToolButton;
    button->setIcon(QIcon::fromTheme(icon));
    button->setToolTip(toolTip);
    button->setAutoRaise(true);
    // Clicking must not take focus from the view, or its selection repaints
    // as inactive.
    button->setFocusPolicy(Qt::NoFocus);
    layout()->addWidget(button);
    return button;
}

void SelectionToolbar::setExplainEnabled(bool enabled)
{
    m_explainBtn->setVisible(enabled);
    adjustSize();
}
