#include <QApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QUrl>

#include <KAboutData>
#include <KLocalizedString>

#include "mainwindow.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("marginreader");

    KAboutData aboutData(
        QStringLiteral("marginreader"),
        i18n("MarginReader"),
        QStringLiteral("0.1.0"),
        i18n("A chapter reader with persistent highlights and notes"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2026"));
    aboutData.setOrganizationDomain("marginreader.org");
    aboutData.setDesktopFileName(
        QStringLiteral("org.marginreader.MarginReader"));

    KAboutData::setApplicationData(aboutData);
    app.setWindowIcon(QIcon::fromTheme(QStringLiteral("document-viewer")));

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(
        QStringLiteral("file"),
        i18n("Chapter to open (HTML, Markdown or plain text)"),
        QStringLiteral("[file]"));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    MainWindow window;

    const QStringList args = parser.positionalArguments();
    if (!args.isEmpty()) {
        const QFileInfo fi(args.first());
        if (fi.exists() && fi.isFile())
            window.openFile(QUrl::fromLocalFile(fi.absoluteFilePath()));
    }

    window.show();
    return app.exec();
}
