/*
 * chapter.h — Chapter markup handed to the reader, and a simple file loader
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_CHAPTER_H
#define MARGINREADER_CHAPTER_H

#include <QString>

struct Chapter {
    QString title;
    QString content;     // sanitized markup, read-only for the engine
    QString sourcePath;  // key for the annotation store

    bool isEmpty() const { return title.isEmpty() && content.isEmpty(); }
    bool operator==(const Chapter &o) const {
        return title == o.title && content == o.content && sourcePath == o.sourcePath;
    }
    bool operator!=(const Chapter &o) const { return !(*this == o); }
};

namespace ChapterLoader {

// Reads .html/.htm/.xhtml (body only, scripts and styles stripped), .md
// (MD4C, raw HTML escaped, first level-1 heading as title) or plain text (one <p> per paragraph).
// Returns false if the file cannot be read.
bool load(const QString &path, Chapter *chapter);

// Conversion helpers, exposed for tests
QString htmlBody(const QString &html, QString *title = nullptr);
QString markdownToHtml(const QString &markdown, QString *title = nullptr);
QString plainTextToHtml(const QString &text);

} // namespace ChapterLoader

#endif // MARGINREADER_CHAPTER_H
