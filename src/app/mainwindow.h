#ifndef MARGINREADER_MAINWINDOW_H
#define MARGINREADER_MAINWINDOW_H

#include <KXmlGuiWindow>

#include "annotation.h"

class QCloseEvent;
class QLabel;
class QSplitter;
class KRecentFilesAction;
class AnnotationListWidget;
class AnnotationStore;
class ReaderContent;

class MainWindow : public KXmlGuiWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    bool openFile(const QUrl &url);
    QString currentFilePath() const;

    ReaderContent *readerContent() const { return m_content; }
    AnnotationListWidget *annotationList() const { return m_annotationList; }
    AnnotationStore *annotationStore() const { return m_store; }

protected:
    void closeEvent(QCloseEvent *event) override;

private Q_SLOTS:
    void onFileOpen();
    void onFileOpenRecent(const QUrl &url);
    void onFileClose();
    void onAnnotateRequested(const QString &text, AnnotationKind kind);
    void onCreateNoteRequested(const QString &text);
    void onExplainRequested(const QString &text);
    void onAnnotationClicked(int annotationId);
    void onEditNoteRequested(int annotationId);
    void onRemoveRequested(int annotationId);
    void onAnnotationsChanged(const QString &filePath);
    void showPreferences();
    void onSettingsChanged();

private:
    void setupActions();
    void reloadAnnotations();
    void saveSession();
    void restoreSession();

    QSplitter *m_splitter = nullptr;
    ReaderContent *m_content = nullptr;
    AnnotationListWidget *m_annotationList = nullptr;
    AnnotationStore *m_store = nullptr;
    KRecentFilesAction *m_recentFilesAction = nullptr;
    QLabel *m_filePathLabel = nullptr;
};

#endif // MARGINREADER_MAINWINDOW_H
