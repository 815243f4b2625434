#include "preferencesdialog.h"
#include "marginreadersettings.h"

#include <KColorButton>
#include <KLocalizedString>

#include <QCheckBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QSpinBox>
#include <QVBoxLayout>

namespace {

QSpinBox *msSpin(const QString &name, int min, int max)
{
    auto *spin = new QSpinBox;
    spin->setObjectName(name);
    spin->setRange(min, max);
    spin->setSuffix(i18n(" ms"));
    return spin;
}

} // namespace

MarginReaderConfigDialog::MarginReaderConfigDialog(QWidget *parent)
    : KConfigDialog(parent, QStringLiteral("settings"), MarginReaderSettings::self())
{
    // ===== Selection Page =====
    auto *selectionPage = new QWidget;
    auto *selectionLayout = new QVBoxLayout(selectionPage);

    auto *captureGroup = new QGroupBox(i18n("Capture"));
    auto *captureForm = new QFormLayout(captureGroup);
    captureForm->addRow(i18n("Read selection after release:"),
                        msSpin(QStringLiteral("kcfg_CaptureDelay"), 0, 1000));
    captureForm->addRow(i18n("Retry empty selection after:"),
                        msSpin(QStringLiteral("kcfg_SettleDelay"), 0, 2000));
    selectionLayout->addWidget(captureGroup);

    auto *keepAliveGroup = new QGroupBox(i18n("Keep-Alive"));
    auto *keepAliveForm = new QFormLayout(keepAliveGroup);
    keepAliveForm->addRow(i18n("Protect selection for:"),
                          msSpin(QStringLiteral("kcfg_KeepAliveWindow"), 0, 60000));
    keepAliveForm->addRow(i18n("Check every:"),
                          msSpin(QStringLiteral("kcfg_SupervisorTickInterval"), 1, 1000));
    selectionLayout->addWidget(keepAliveGroup);
    selectionLayout->addStretch();

    addPage(selectionPage, i18n("Selection"), QStringLiteral("edit-select-text"));

    // ===== Toolbar Page =====
    auto *toolbarPage = new QWidget;
    auto *toolbarLayout = new QVBoxLayout(toolbarPage);

    auto *placementGroup = new QGroupBox(i18n("Placement"));
    auto *placementForm = new QFormLayout(placementGroup);
    auto *offsetSpin = new QSpinBox;
    offsetSpin->setObjectName(QStringLiteral("kcfg_ToolbarOffset"));
    offsetSpin->setRange(0, 100);
    offsetSpin->setSuffix(i18n(" px"));
    placementForm->addRow(i18n("Distance from selection:"), offsetSpin);
    auto *paddingSpin = new QSpinBox;
    paddingSpin->setObjectName(QStringLiteral("kcfg_ToolbarPadding"));
    paddingSpin->setRange(0, 100);
    paddingSpin->setSuffix(i18n(" px"));
    placementForm->addRow(i18n("Distance from view edges:"), paddingSpin);
    toolbarLayout->addWidget(placementGroup);

    auto *explainCheck = new QCheckBox(i18n("Show the Explain action"));
    explainCheck->setObjectName(QStringLiteral("kcfg_ShowExplainAction"));
    toolbarLayout->addWidget(explainCheck);
    toolbarLayout->addStretch();

    addPage(toolbarPage, i18n("Toolbar"), QStringLiteral("configure-toolbars"));

    // ===== Annotations Page =====
    auto *annotationsPage = new QWidget;
    auto *annotationsLayout = new QVBoxLayout(annotationsPage);

    auto *colorsGroup = new QGroupBox(i18n("Colors"));
    auto *colorsForm = new QFormLayout(colorsGroup);
    auto *highlightButton = new KColorButton;
    highlightButton->setObjectName(QStringLiteral("kcfg_HighlightColor"));
    colorsForm->addRow(i18n("Highlight:"), highlightButton);
    auto *underlineButton = new KColorButton;
    underlineButton->setObjectName(QStringLiteral("kcfg_UnderlineColor"));
    colorsForm->addRow(i18n("Underline:"), underlineButton);
    auto *pulseButton = new KColorButton;
    pulseButton->setObjectName(QStringLiteral("kcfg_PulseColor"));
    colorsForm->addRow(i18n("Jump pulse:"), pulseButton);
    annotationsLayout->addWidget(colorsGroup);

    auto *jumpForm = new QFormLayout;
    jumpForm->addRow(i18n("Pulse duration:"),
                     msSpin(QStringLiteral("kcfg_PulseDuration"), 0, 10000));
    annotationsLayout->addLayout(jumpForm);
    annotationsLayout->addStretch();

    addPage(annotationsPage, i18n("Annotations"), QStringLiteral("draw-highlight"));
}
