#include "mainwindow.h"

#include <KActionCollection>
#include <KConfigGroup>
#include <KLocalizedString>
#include <KRecentFilesAction>
#include <KSharedConfig>
#include <KStandardAction>
#include <KToolBar>

#include "annotationlistwidget.h"
#include "annotationstore.h"
#include "chapter.h"
#include "marginreadersettings.h"
#include "preferencesdialog.h"
#include "readercontent.h"

#include <QAction>
#include <QApplication>
#include <QCloseEvent>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QInputDialog>
#include <QLabel>
#include <QSplitter>
#include <QStatusBar>

namespace {

// Anchors can be whole paragraphs; keep dialog labels short
QString shortQuote(const QString &text)
{
    const QString simplified = text.simplified();
    if (simplified.size() <= 60)
        return simplified;
    return simplified.left(57) + QStringLiteral("...");
}

} // namespace

MainWindow::MainWindow(QWidget *parent)
    : KXmlGuiWindow(parent)
{
    setAttribute(Qt::WA_DeleteOnClose, false);

    m_store = new AnnotationStore(this);

    // Central widget: annotation list beside the reading surface
    m_splitter = new QSplitter(Qt::Horizontal, this);

    m_annotationList = new AnnotationListWidget;
    m_content = new ReaderContent;
    m_splitter->addWidget(m_annotationList);
    m_splitter->addWidget(m_content);
    m_splitter->setStretchFactor(0, 0);
    m_splitter->setStretchFactor(1, 1);
    m_splitter->setCollapsible(1, false);
    m_splitter->setSizes({250, 950});

    setCentralWidget(m_splitter);

    connect(m_content, &ReaderContent::annotateRequested,
            this, &MainWindow::onAnnotateRequested);
    connect(m_content, &ReaderContent::createNoteRequested,
            this, &MainWindow::onCreateNoteRequested);
    connect(m_content, &ReaderContent::explainRequested,
            this, &MainWindow::onExplainRequested);
    connect(m_content, &ReaderContent::annotationClicked,
            this, &MainWindow::onAnnotationClicked);

    connect(m_annotationList, &AnnotationListWidget::jumpRequested,
            m_content, &ReaderContent::requestJump);
    connect(m_annotationList, &AnnotationListWidget::editNoteRequested,
            this, &MainWindow::onEditNoteRequested);
    connect(m_annotationList, &AnnotationListWidget::removeRequested,
            this, &MainWindow::onRemoveRequested);

    connect(m_store, &AnnotationStore::annotationsChanged,
            this, &MainWindow::onAnnotationsChanged);

    setupActions();

    m_filePathLabel = new QLabel;
    m_filePathLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    statusBar()->addWidget(m_filePathLabel, 1);
    statusBar()->showMessage(i18n("Ready"));

    setMinimumSize(640, 480);
    resize(1200, 800);

    restoreSession();
}

MainWindow::~MainWindow() = default;

void MainWindow::closeEvent(QCloseEvent *event)
{
    saveSession();

    KConfigGroup recentGroup(KSharedConfig::openConfig(),
                             QStringLiteral("RecentFiles"));
    if (m_recentFilesAction)
        m_recentFilesAction->saveEntries(recentGroup);

    KXmlGuiWindow::closeEvent(event);
}

void MainWindow::setupActions()
{
    KActionCollection *ac = actionCollection();

    // Standard actions
    KStandardAction::quit(qApp, &QApplication::quit, ac);
    KStandardAction::preferences(this, &MainWindow::showPreferences, ac);

    // File > Open
    KStandardAction::open(this, &MainWindow::onFileOpen, ac);

    // File > Open Recent
    m_recentFilesAction = KStandardAction::openRecent(
        this, &MainWindow::onFileOpenRecent, ac);
    KConfigGroup recentGroup(KSharedConfig::openConfig(),
                             QStringLiteral("RecentFiles"));
    m_recentFilesAction->loadEntries(recentGroup);

    // File > Close
    KStandardAction::close(this, &MainWindow::onFileClose, ac);

    // View > Show Annotations
    auto *toggleList = ac->addAction(QStringLiteral("view_show_annotations"));
    toggleList->setText(i18n("Show &Annotations"));
    toggleList->setIcon(QIcon::fromTheme(QStringLiteral("view-list-details")));
    toggleList->setCheckable(true);
    toggleList->setChecked(true);
    connect(toggleList, &QAction::toggled,
            m_annotationList, &QWidget::setVisible);

    setupGUI(Default, QStringLiteral("marginreaderui.rc"));

    toolBar()->setToolButtonStyle(Qt::ToolButtonTextBesideIcon);
}

void MainWindow::onFileOpen()
{
    const QUrl url = QFileDialog::getOpenFileUrl(
        this,
        i18n("Open Chapter"),
        QUrl::fromLocalFile(QDir::homePath()),
        i18n("Documents (*.html *.htm *.xhtml *.md *.markdown *.txt);;All Files (*)"));

    if (url.isValid())
        openFile(url);
}

void MainWindow::onFileOpenRecent(const QUrl &url)
{
    openFile(url);
}

void MainWindow::onFileClose()
{
    m_content->setChapter(Chapter());
    m_content->setAnnotations({});
    m_annotationList->clear();
    m_filePathLabel->clear();
    setCaption(QString());
}

bool MainWindow::openFile(const QUrl &url)
{
    if (!url.isLocalFile())
        return false;

    const QString filePath = url.toLocalFile();

    Chapter chapter;
    if (!ChapterLoader::load(filePath, &chapter)) {
        statusBar()->showMessage(i18n("Failed to open %1", filePath), 5000);
        return false;
    }

    m_content->setChapter(chapter);
    reloadAnnotations();

    m_recentFilesAction->addUrl(url);
    m_filePathLabel->setText(chapter.sourcePath);
    setCaption(chapter.title);
    return true;
}

QString MainWindow::currentFilePath() const
{
    return m_content->chapter().sourcePath;
}

void MainWindow::reloadAnnotations()
{
    const QList<Annotation> annotations = m_store->annotations(currentFilePath());
    m_content->setAnnotations(annotations);
    m_annotationList->setAnnotations(annotations);
}

void MainWindow::onAnnotationsChanged(const QString &filePath)
{
    if (filePath == currentFilePath())
        reloadAnnotations();
}

void MainWindow::onAnnotateRequested(const QString &text, AnnotationKind kind)
{
    const QString filePath = currentFilePath();
    if (filePath.isEmpty())
        return;

    if (m_store->add(filePath, text, kind) < 0)
        statusBar()->showMessage(i18n("Could not save the annotation."), 5000);
}

void MainWindow::onCreateNoteRequested(const QString &text)
{
    const QString filePath = currentFilePath();
    if (filePath.isEmpty())
        return;

    bool ok = false;
    const QString note = QInputDialog::getMultiLineText(
        this, i18n("Create Note"),
        i18n("Note for \"%1\":", shortQuote(text)), QString(), &ok);
    if (!ok)
        return;

    if (m_store->add(filePath, text, AnnotationKind::Highlight, note) < 0)
        statusBar()->showMessage(i18n("Could not save the note."), 5000);
}

void MainWindow::onExplainRequested(const QString &text)
{
    statusBar()->showMessage(i18n("Explain: \"%1\"", shortQuote(text)), 5000);
}

void MainWindow::onAnnotationClicked(int annotationId)
{
    m_annotationList->selectAnnotation(annotationId);

    const QList<Annotation> &annotations = m_content->annotations();
    for (const Annotation &annotation : annotations) {
        if (annotation.id == annotationId && !annotation.note.isEmpty()) {
            statusBar()->showMessage(annotation.note, 8000);
            break;
        }
    }
}

void MainWindow::onEditNoteRequested(int annotationId)
{
    const QList<Annotation> &annotations = m_content->annotations();
    for (const Annotation &annotation : annotations) {
        if (annotation.id != annotationId)
            continue;

        bool ok = false;
        const QString note = QInputDialog::getMultiLineText(
            this, i18n("Edit Note"),
            i18n("Note for \"%1\":", shortQuote(annotation.anchorText)),
            annotation.note, &ok);
        if (ok && !m_store->setNote(currentFilePath(), annotationId, note))
            statusBar()->showMessage(i18n("Could not save the note."), 5000);
        return;
    }
}

void MainWindow::onRemoveRequested(int annotationId)
{
    if (!m_store->remove(currentFilePath(), annotationId))
        statusBar()->showMessage(i18n("Could not remove the annotation."), 5000);
}

void MainWindow::showPreferences()
{
    if (KConfigDialog::showDialog(QStringLiteral("settings")))
        return;

    auto *dialog = new MarginReaderConfigDialog(this);
    connect(dialog, &KConfigDialog::settingsChanged,
            this, &MainWindow::onSettingsChanged);
    dialog->show();
}

void MainWindow::onSettingsChanged()
{
    m_content->applySettings();
}

void MainWindow::saveSession()
{
    KConfigGroup group(KSharedConfig::openConfig(),
                       QStringLiteral("Session"));

    group.writeEntry("SplitterSizes", m_splitter->sizes());
    group.writeEntry("AnnotationsVisible", !m_annotationList->isHidden());
    group.sync();
}

void MainWindow::restoreSession()
{
    KConfigGroup group(KSharedConfig::openConfig(),
                       QStringLiteral("Session"));

    const QList<int> splitterSizes = group.readEntry("SplitterSizes", QList<int>());
    if (splitterSizes.size() == 2)
        m_splitter->setSizes(splitterSizes);

    const bool listVisible = group.readEntry("AnnotationsVisible", true);
    if (QAction *toggle = actionCollection()->action(QStringLiteral("view_show_annotations")))
        toggle->setChecked(listVisible);
}
