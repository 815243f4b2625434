/*
 * markdownconverter.cpp — Markdown chapters to sanitized reader markup via MD4C
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "markdownconverter.h"

#include <QByteArray>
#include <QDebug>
#include <QHash>

bool MarkdownConverter::convert(const QString &markdown)
{
    m_html.clear();
    m_title.clear();
    m_titleTaken = false;
    m_inTitle = false;
    m_imageDepth = 0;

    MD_PARSER parser = {};
    parser.abi_version = 0;
    parser.flags = MD_DIALECT_GITHUB
                 | MD_FLAG_NOHTML;
    parser.enter_block = &MarkdownConverter::sEnterBlock;
    parser.leave_block = &MarkdownConverter::sLeaveBlock;
    parser.enter_span  = &MarkdownConverter::sEnterSpan;
    parser.leave_span  = &MarkdownConverter::sLeaveSpan;
    parser.text        = &MarkdownConverter::sText;

    const QByteArray utf8 = markdown.toUtf8();
    const int result = md_parse(utf8.constData(), static_cast<MD_SIZE>(utf8.size()),
                                &parser, this);
    if (result != 0) {
        qWarning() << "MarkdownConverter: md_parse failed with" << result;
        return false;
    }
    return true;
}

// --- Static callbacks (delegate to instance) ---

int MarkdownConverter::sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{
    return static_cast<MarkdownConverter *>(userdata)->enterBlock(type, detail);
}

int MarkdownConverter::sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{
    return static_cast<MarkdownConverter *>(userdata)->leaveBlock(type, detail);
}

int MarkdownConverter::sEnterSpan(MD_SPANTYPE type, void *detail, void *userdata)
{
    return static_cast<MarkdownConverter *>(userdata)->enterSpan(type, detail);
}

int MarkdownConverter::sLeaveSpan(MD_SPANTYPE type, void *detail, void *userdata)
{
    return static_cast<MarkdownConverter *>(userdata)->leaveSpan(type, detail);
}

int MarkdownConverter::sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size,
                             void *userdata)
{
    return static_cast<MarkdownConverter *>(userdata)->onText(type, text, size);
}

// --- Blocks ---

int MarkdownConverter::enterBlock(MD_BLOCKTYPE type, void *detail)
{
    switch (type) {
    case MD_BLOCK_DOC:
        break;
    case MD_BLOCK_P:
        m_html += QStringLiteral("<p>");
        break;
    case MD_BLOCK_H: {
        const auto *d = static_cast<MD_BLOCK_H_DETAIL *>(detail);
        if (m_extractTitle && !m_titleTaken && d->level == 1) {
            m_inTitle = true;
            break;
        }
        m_html += QStringLiteral("<h%1>").arg(d->level);
        break;
    }
    case MD_BLOCK_QUOTE:
        m_html += QStringLiteral("<blockquote>\n");
        break;
    case MD_BLOCK_UL:
        m_html += QStringLiteral("<ul>\n");
        break;
    case MD_BLOCK_OL: {
        const auto *d = static_cast<MD_BLOCK_OL_DETAIL *>(detail);
        if (d->start == 1)
            m_html += QStringLiteral("<ol>\n");
        else
            m_html += QStringLiteral("<ol start=\"%1\">\n").arg(d->start);
        break;
    }
    case MD_BLOCK_LI:
        m_html += QStringLiteral("<li>");
        break;
    case MD_BLOCK_HR:
        m_html += QStringLiteral("<hr/>\n");
        break;
    case MD_BLOCK_CODE:
        m_html += QStringLiteral("<pre><code>");
        break;
    case MD_BLOCK_HTML:
        // Not produced with MD_FLAG_NOHTML
        break;
    case MD_BLOCK_TABLE:
        m_html += QStringLiteral("<table>\n");
        break;
    case MD_BLOCK_THEAD:
        m_html += QStringLiteral("<thead>\n");
        break;
    case MD_BLOCK_TBODY:
        m_html += QStringLiteral("<tbody>\n");
        break;
    case MD_BLOCK_TR:
        m_html += QStringLiteral("<tr>");
        break;
    case MD_BLOCK_TH:
        m_html += QStringLiteral("<th>");
        break;
    case MD_BLOCK_TD:
        m_html += QStringLiteral("<td>");
        break;
    }
    return 0;
}

int MarkdownConverter::leaveBlock(MD_BLOCKTYPE type, void *detail)
{
    switch (type) {
    case MD_BLOCK_DOC:
        break;
    case MD_BLOCK_P:
        m_html += QStringLiteral("</p>\n");
        break;
    case MD_BLOCK_H: {
        if (m_inTitle) {
            m_inTitle = false;
            m_titleTaken = true;
            break;
        }
        const auto *d = static_cast<MD_BLOCK_H_DETAIL *>(detail);
        m_html += QStringLiteral("</h%1>\n").arg(d->level);
        break;
    }
    case MD_BLOCK_QUOTE:
        m_html += QStringLiteral("</blockquote>\n");
        break;
    case MD_BLOCK_UL:
        m_html += QStringLiteral("</ul>\n");
        break;
    case MD_BLOCK_OL:
        m_html += QStringLiteral("</ol>\n");
        break;
    case MD_BLOCK_LI:
        m_html += QStringLiteral("</li>\n");
        break;
    case MD_BLOCK_HR:
        break;
    case MD_BLOCK_CODE:
        m_html += QStringLiteral("</code></pre>\n");
        break;
    case MD_BLOCK_HTML:
        break;
    case MD_BLOCK_TABLE:
        m_html += QStringLiteral("</table>\n");
        break;
    case MD_BLOCK_THEAD:
        m_html += QStringLiteral("</thead>\n");
        break;
    case MD_BLOCK_TBODY:
        m_html += QStringLiteral("</tbody>\n");
        break;
    case MD_BLOCK_TR:
        m_html += QStringLiteral("</tr>\n");
        break;
    case MD_BLOCK_TH:
        m_html += QStringLiteral("</th>");
        break;
    case MD_BLOCK_TD:
        m_html += QStringLiteral("</td>");
        break;
    }
    return 0;
}

// --- Spans ---

int MarkdownConverter::enterSpan(MD_SPANTYPE type, void *detail)
{
    // Inside the title and image alt text only plain text is kept
    if (m_inTitle || m_imageDepth > 0) {
        if (type == MD_SPAN_IMG)
            ++m_imageDepth;
        return 0;
    }

    switch (type) {
    case MD_SPAN_EM:
        m_html += QStringLiteral("<em>");
        break;
    case MD_SPAN_STRONG:
        m_html += QStringLiteral("<strong>");
        break;
    case MD_SPAN_A: {
        const auto *d = static_cast<MD_SPAN_A_DETAIL *>(detail);
        m_html += QStringLiteral("<a href=\"%1\">")
                      .arg(extractAttribute(d->href).toHtmlEscaped());
        break;
    }
    case MD_SPAN_IMG:
        // Images are not rendered; the alt text stands in for them
        ++m_imageDepth;
        break;
    case MD_SPAN_CODE:
        m_html += QStringLiteral("<code>");
        break;
    case MD_SPAN_DEL:
        m_html += QStringLiteral("<s>");
        break;
    case MD_SPAN_U:
        m_html += QStringLiteral("<u>");
        break;
    default:
        break;
    }
    return 0;
}

int MarkdownConverter::leaveSpan(MD_SPANTYPE type, void *detail)
{
    Q_UNUSED(detail);

    if (type == MD_SPAN_IMG) {
        --m_imageDepth;
        return 0;
    }
    if (m_inTitle || m_imageDepth > 0)
        return 0;

    switch (type) {
    case MD_SPAN_EM:
        m_html += QStringLiteral("</em>");
        break;
    case MD_SPAN_STRONG:
        m_html += QStringLiteral("</strong>");
        break;
    case MD_SPAN_A:
        m_html += QStringLiteral("</a>");
        break;
    case MD_SPAN_CODE:
        m_html += QStringLiteral("</code>");
        break;
    case MD_SPAN_DEL:
        m_html += QStringLiteral("</s>");
        break;
    case MD_SPAN_U:
        m_html += QStringLiteral("</u>");
        break;
    default:
        break;
    }
    return 0;
}

// --- Text ---

int MarkdownConverter::onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size)
{
    const QString str = QString::fromUtf8(text, static_cast<int>(size));

    switch (type) {
    case MD_TEXT_NULLCHAR:
        append(QString(QChar::ReplacementCharacter));
        break;
    case MD_TEXT_BR:
        if (m_inTitle || m_imageDepth > 0)
            append(QStringLiteral(" "));
        else
            m_html += QStringLiteral("<br/>");
        break;
    case MD_TEXT_SOFTBR:
        append(QStringLiteral("\n"));
        break;
    case MD_TEXT_ENTITY:
        append(resolveEntity(str));
        break;
    default:
        append(str);
        break;
    }
    return 0;
}

void MarkdownConverter::append(const QString &text)
{
    if (m_inTitle)
        m_title += text;
    else
        m_html += text.toHtmlEscaped();
}

QString MarkdownConverter::extractAttribute(const MD_ATTRIBUTE &attr)
{
    if (!attr.text || attr.size == 0)
        return {};
    return QString::fromUtf8(attr.text, static_cast<int>(attr.size));
}

QString MarkdownConverter::resolveEntity(const QString &entity)
{
    static const QHash<QString, QString> entities = {
        {QStringLiteral("&amp;"),    QStringLiteral("&")},
        {QStringLiteral("&lt;"),     QStringLiteral("<")},
        {QStringLiteral("&gt;"),     QStringLiteral(">")},
        {QStringLiteral("&quot;"),   QStringLiteral("\"")},
        {QStringLiteral("&apos;"),   QStringLiteral("'")},
        {QStringLiteral("&nbsp;"),   QString(QChar(0x00A0))},
        {QStringLiteral("&mdash;"),  QString(QChar(0x2014))},
        {QStringLiteral("&ndash;"),  QString(QChar(0x2013))},
        {QStringLiteral("&lsquo;"),  QString(QChar(0x2018))},
        {QStringLiteral("&rsquo;"),  QString(QChar(0x2019))},
        {QStringLiteral("&ldquo;"),  QString(QChar(0x201C))},
        {QStringLiteral("&rdquo;"),  QString(QChar(0x201D))},
        {QStringLiteral("&hellip;"), QString(QChar(0x2026))},
    };

    auto it = entities.constFind(entity);
    if (it != entities.constEnd())
        return it.value();

    // Numeric entities: &#1234; or &#x12AB;
    if (entity.startsWith(QLatin1String("&#")) && entity.endsWith(QLatin1Char(';'))) {
        const bool hex = entity.size() > 3
            && (entity.at(2) == QLatin1Char('x') || entity.at(2) == QLatin1Char('X'));
        const QString digits = entity.mid(hex ? 3 : 2, entity.size() - (hex ? 4 : 3));
        bool ok = false;
        const uint code = digits.toUInt(&ok, hex ? 16 : 10);
        if (ok && code > 0 && code <= 0x10FFFF) {
            const char32_t ch = code;
            return QString::fromUcs4(&ch, 1);
        }
    }

    // Unknown named entity: keep it literally
    return entity;
}
