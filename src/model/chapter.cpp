/*
 * chapter.cpp — Chapter markup handed to the reader, and a simple file loader
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "chapter.h"
#include "markdownconverter.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStringList>
#include <QTextDocumentFragment>

namespace ChapterLoader {

QString htmlBody(const QString &html, QString *title)
{
    static const QRegularExpression titleRe(
        QStringLiteral("<title[^>]*>(.*?)</title>"),
        QRegularExpression::CaseInsensitiveOption
            | QRegularExpression::DotMatchesEverythingOption);
    static const QRegularExpression bodyRe(
        QStringLiteral("<body[^>]*>(.*)</body>"),
        QRegularExpression::CaseInsensitiveOption
            | QRegularExpression::DotMatchesEverythingOption);
    static const QRegularExpression activeRe(
        QStringLiteral("<(script|style)\\b[^>]*>.*?</\\1\\s*>"),
        QRegularExpression::CaseInsensitiveOption
            | QRegularExpression::DotMatchesEverythingOption);

    if (title) {
        const QRegularExpressionMatch m = titleRe.match(html);
        // Plain text: the view escapes the title when it renders it
        if (m.hasMatch())
            *title = QTextDocumentFragment::fromHtml(m.captured(1)).toPlainText().simplified();
    }

    const QRegularExpressionMatch body = bodyRe.match(html);
    QString content = body.hasMatch() ? body.captured(1) : html;
    content.remove(activeRe);
    return content.trimmed();
}

QString markdownToHtml(const QString &markdown, QString *title)
{
    MarkdownConverter converter;
    converter.setExtractTitle(title != nullptr);
    if (!converter.convert(markdown))
        return plainTextToHtml(markdown);

    // The view renders the title itself
    if (title && !converter.title().isEmpty())
        *title = converter.title();
    return converter.html();
}

QString plainTextToHtml(const QString &text)
{
    static const QRegularExpression blankLines(QStringLiteral("\\n\\s*\\n"));

    QString normalized = text;
    normalized.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));

    QString html;
    const QStringList paragraphs = normalized.split(blankLines, Qt::SkipEmptyParts);
    for (const QString &paragraph : paragraphs) {
        const QString p = paragraph.simplified();
        if (p.isEmpty())
            continue;
        html += QStringLiteral("<p>") + p.toHtmlEscaped() + QStringLiteral("</p>\n");
    }
    return html;
}

bool load(const QString &path, Chapter *chapter)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "ChapterLoader: cannot open" << path << file.errorString();
        return false;
    }

    const QString text = QString::fromUtf8(file.readAll());
    const QFileInfo fi(path);
    const QString suffix = fi.suffix().toLower();

    Chapter result;
    result.sourcePath = fi.absoluteFilePath();

    if (suffix == QLatin1String("html") || suffix == QLatin1String("htm")
        || suffix == QLatin1String("xhtml")) {
        result.content = htmlBody(text, &result.title);
    } else if (suffix == QLatin1String("md") || suffix == QLatin1String("markdown")) {
        result.content = markdownToHtml(text, &result.title);
    } else {
        result.content = plainTextToHtml(text);
    }

    if (result.title.isEmpty())
        result.title = fi.completeBaseName();

    *chapter = result;
    return true;
}

} // namespace ChapterLoader
