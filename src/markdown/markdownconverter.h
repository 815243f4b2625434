/*
 * markdownconverter.h — Markdown chapters to sanitized reader markup via MD4C
 *
 * Raw HTML in the source is not passed through (MD_FLAG_NOHTML): the output
 * only contains the tags emitted here, so it is safe to hand to the
 * annotation overlay. The first level-1 heading can be lifted out as the
 * chapter title, since the reader renders the title itself.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MARGINREADER_MARKDOWNCONVERTER_H
#define MARGINREADER_MARKDOWNCONVERTER_H

#include <QString>

#include <md4c.h>

class MarkdownConverter
{
public:
    MarkdownConverter() = default;

    void setExtractTitle(bool extract) { m_extractTitle = extract; }

    // Returns false if MD4C aborted; html() then holds what was emitted so far.
    bool convert(const QString &markdown);

    QString html() const { return m_html; }
    QString title() const { return m_title.simplified(); }

private:
    // MD4C static callbacks
    static int sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sEnterSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sLeaveSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size,
                     void *userdata);

    // Instance handlers
    int enterBlock(MD_BLOCKTYPE type, void *detail);
    int leaveBlock(MD_BLOCKTYPE type, void *detail);
    int enterSpan(MD_SPANTYPE type, void *detail);
    int leaveSpan(MD_SPANTYPE type, void *detail);
    int onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size);

    // Helpers
    void append(const QString &text);
    static QString extractAttribute(const MD_ATTRIBUTE &attr);
    static QString resolveEntity(const QString &entity);

    QString m_html;
    QString m_title;
    bool m_extractTitle = true;
    bool m_titleTaken = false;
    bool m_inTitle = false;
    int m_imageDepth = 0;
};

#endif // MARGINREADER_MARKDOWNCONVERTER_H
