/*
 * anchormatcher.cpp — Wrap annotation anchors inside sanitized chapter markup
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "anchormatcher.h"

#include <QDebug>
#include <QSet>
#include <QStringList>
#include <QStringView>

#include <algorithm>
#include <utility>

namespace AnchorMatcher {

static const QLatin1String kHrefScheme("annotation:");

namespace {

struct NamedEntity {
    char32_t code;
    const char *name;
};

// Entities sanitizers and the markdown converter commonly leave in text
const NamedEntity kNamedEntities[] = {
    {U'&', "amp"},       {U'<', "lt"},        {U'>', "gt"},
    {U'"', "quot"},      {U'\'', "apos"},
    {0x00A0, "nbsp"},    {0x00A9, "copy"},    {0x00AE, "reg"},
    {0x2013, "ndash"},   {0x2014, "mdash"},   {0x2018, "lsquo"},
    {0x2019, "rsquo"},   {0x201C, "ldquo"},   {0x201D, "rdquo"},
    {0x2026, "hellip"},  {0x2122, "trade"},   {0x00AB, "laquo"},
    {0x00BB, "raquo"},
};

bool hasEntityForms(char32_t code)
{
    return code >= 0x80 || code == U'&' || code == U'<' || code == U'>'
        || code == U'"' || code == U'\'';
}

// One character of the rendered text as it may appear in markup: literally,
// as a named entity, or as a decimal or hex character reference.
QString characterPattern(char32_t code)
{
    const QString literal = QString::fromUcs4(&code, 1);
    if (!hasEntityForms(code))
        return QRegularExpression::escape(literal);

    QStringList forms;
    // Raw angle brackets delimit tags
    if (code != U'<' && code != U'>')
        forms.append(QRegularExpression::escape(literal));
    for (const NamedEntity &entity : kNamedEntities) {
        if (entity.code == code)
            forms.append(QLatin1Char('&') + QLatin1String(entity.name) + QLatin1Char(';'));
    }
    forms.append(QStringLiteral("&#0*%1;").arg(static_cast<uint>(code)));
    forms.append(QStringLiteral("(?i:&#x0*%1;)").arg(static_cast<uint>(code), 0, 16));
    return QStringLiteral("(?:") + forms.join(QLatin1Char('|')) + QLatin1Char(')');
}

} // namespace

QRegularExpression buildMatcher(const QString &anchorText)
{
    static const QRegularExpression whitespaceRun(
        QStringLiteral("\\s+"), QRegularExpression::UseUnicodePropertiesOption);

    const QStringList words = anchorText.split(whitespaceRun, Qt::SkipEmptyParts);
    if (words.isEmpty())
        return QRegularExpression();

    QStringList escaped;
    escaped.reserve(words.size());
    for (const QString &word : words) {
        QString pattern;
        const QList<uint> codes = word.toUcs4();
        for (uint code : codes)
            pattern += characterPattern(static_cast<char32_t>(code));
        escaped.append(pattern);
    }

    // Any whitespace run, including non-breaking spaces written as entities
    const QString separator =
        QStringLiteral("(?:\\s|&nbsp;|&#0*160;|(?i:&#x0*a0;))+");
    return QRegularExpression(escaped.join(separator),
                              QRegularExpression::UseUnicodePropertiesOption);
}

bool isInsideTag(const QString &buffer, int position)
{
    if (position <= 0)
        return false;
    const int lastOpen = buffer.lastIndexOf(QLatin1Char('<'), position - 1);
    if (lastOpen < 0)
        return false;
    const int lastClose = buffer.lastIndexOf(QLatin1Char('>'), position - 1);
    return lastOpen > lastClose;
}

QString markerHref(int annotationId)
{
    return kHrefScheme + QString::number(annotationId);
}

QString markerName(int annotationId)
{
    return QStringLiteral("annotation-") + QString::number(annotationId);
}

bool parseMarkerHref(const QString &href, int *annotationId)
{
    if (!href.startsWith(kHrefScheme))
        return false;
    bool ok = false;
    const int id = QStringView(href).mid(kHrefScheme.size()).toInt(&ok);
    if (!ok)
        return false;
    if (annotationId)
        *annotationId = id;
    return true;
}

QString wrap(const QString &matchedText, const Annotation &annotation)
{
    const QString id = QString::number(annotation.id);
    const QString kind = annotationKindName(annotation.kind);
    return QStringLiteral("<a href=\"%1\" name=\"%2\" class=\"annotation-%3\" "
                          "data-annotation-id=\"%4\" data-annotation-kind=\"%3\">")
               .arg(markerHref(annotation.id), markerName(annotation.id), kind, id)
        + matchedText + QStringLiteral("</a>");
}

QString annotate(const QString &buffer, const QList<Annotation> &annotations)
{
    if (annotations.isEmpty())
        return buffer;

    QList<Annotation> sorted = annotations;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Annotation &a, const Annotation &b) {
        return a.anchorText.size() > b.anchorText.size();
    });

    QString content = buffer;
    QSet<int> applied;

    for (const Annotation &annotation : std::as_const(sorted)) {
        if (applied.contains(annotation.id))
            continue;

        const QRegularExpression matcher = buildMatcher(annotation.anchorText);
        if (matcher.pattern().isEmpty() || !matcher.isValid()) {
            qWarning() << "AnchorMatcher: skipping annotation" << annotation.id
                       << matcher.errorString();
            continue;
        }
        applied.insert(annotation.id);

        QString out;
        out.reserve(content.size() + 160);
        int copied = 0;
        int wrapped = 0;

        QRegularExpressionMatchIterator it = matcher.globalMatch(content);
        while (it.hasNext()) {
            const QRegularExpressionMatch match = it.next();
            const int start = match.capturedStart();
            const QString text = match.captured();

            // Tag-internal text (attribute values) and spans crossing a tag
            // boundary are left alone; wrapping them would break the markup.
            if (isInsideTag(content, start)
                || text.contains(QLatin1Char('<')) || text.contains(QLatin1Char('>')))
                continue;

            out += QStringView(content).mid(copied, start - copied);
            out += wrap(text, annotation);
            copied = match.capturedEnd();
            ++wrapped;
        }

        if (wrapped == 0)
            continue;

        out += QStringView(content).mid(copied);
        content = out;
    }

    return content;
}

} // namespace AnchorMatcher
