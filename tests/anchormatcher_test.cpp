// SPDX-License-Identifier: GPL-2.0-or-later

#include <gtest/gtest.h>

#include "anchormatcher.h"
#include "testsupport.h"

namespace {

Annotation makeAnnotation(int id, const QString &anchor,
                          AnnotationKind kind = AnnotationKind::Highlight)
{
    Annotation a;
    a.id = id;
    a.anchorText = anchor;
    a.kind = kind;
    return a;
}

int wrapperCount(const QString &markup)
{
    return markup.count(QStringLiteral("data-annotation-id="));
}

} // namespace

TEST(AnchorMatcherTest, LeavesContentUnchangedWithoutAnnotations)
{
    const QString buffer = QStringLiteral("<p>Hello world</p>");
    EXPECT_EQ(AnchorMatcher::annotate(buffer, {}), buffer);
}

TEST(AnchorMatcherTest, WrapsAnchorWithIdAndKind)
{
    const QString result = AnchorMatcher::annotate(
        QStringLiteral("<p>Hello world</p>"),
        {makeAnnotation(7, QStringLiteral("world"))});

    EXPECT_EQ(result,
              QStringLiteral("<p>Hello <a href=\"annotation:7\" name=\"annotation-7\" "
                             "class=\"annotation-highlight\" data-annotation-id=\"7\" "
                             "data-annotation-kind=\"highlight\">world</a></p>"));
}

TEST(AnchorMatcherTest, UnderlineKindIsCarried)
{
    const QString result = AnchorMatcher::annotate(
        QStringLiteral("<p>Hello world</p>"),
        {makeAnnotation(3, QStringLiteral("Hello"), AnnotationKind::Underline)});

    EXPECT_TRUE(result.contains(QStringLiteral("class=\"annotation-underline\"")));
    EXPECT_TRUE(result.contains(QStringLiteral("data-annotation-kind=\"underline\">Hello</a>")));
}

TEST(AnchorMatcherTest, MetacharactersMatchLiterally)
{
    const QString buffer = QStringLiteral("<p>It costs (USD) $5.00 today, not 5x00.</p>");

    const QString result = AnchorMatcher::annotate(
        buffer, {makeAnnotation(1, QStringLiteral("(USD) $5.00"))});
    EXPECT_TRUE(result.contains(QStringLiteral("\">(USD) $5.00</a>")));

    // '.' must not act as a wildcard
    EXPECT_EQ(AnchorMatcher::annotate(buffer, {makeAnnotation(2, QStringLiteral("5.00."))}),
              buffer);
    EXPECT_EQ(AnchorMatcher::annotate(buffer, {makeAnnotation(3, QStringLiteral("5.00 "))}),
              AnchorMatcher::annotate(buffer, {makeAnnotation(3, QStringLiteral("5.00"))}));
}

TEST(AnchorMatcherTest, WhitespaceRunsMatchAnyWhitespace)
{
    const QString buffer = QStringLiteral("<p>Hello\n   world</p>");

    const QString result = AnchorMatcher::annotate(
        buffer, {makeAnnotation(4, QStringLiteral("Hello world"))});

    // The original whitespace is kept inside the wrapper
    EXPECT_TRUE(result.contains(QStringLiteral("\">Hello\n   world</a>")));
}

TEST(AnchorMatcherTest, SkipsMatchesInsideTags)
{
    const QString buffer = QStringLiteral("<p title=\"world\">world</p>");

    const QString result = AnchorMatcher::annotate(
        buffer, {makeAnnotation(5, QStringLiteral("world"))});

    EXPECT_EQ(wrapperCount(result), 1);
    EXPECT_TRUE(result.startsWith(QStringLiteral("<p title=\"world\"><a ")));
}

TEST(AnchorMatcherTest, SkipsMatchesCrossingTagBoundaries)
{
    const QString buffer = QStringLiteral("<p>x<br>y and <b>bold</b> text</p>");

    EXPECT_EQ(AnchorMatcher::annotate(buffer, {makeAnnotation(1, QStringLiteral("x<br>y"))}),
              buffer);
    EXPECT_EQ(AnchorMatcher::annotate(buffer, {makeAnnotation(2, QStringLiteral("bold text"))}),
              buffer);
}

TEST(AnchorMatcherTest, WrapsEveryOccurrence)
{
    const QString result = AnchorMatcher::annotate(
        QStringLiteral("<p>one two one</p>"), {makeAnnotation(1, QStringLiteral("one"))});

    EXPECT_EQ(wrapperCount(result), 2);
}

TEST(AnchorMatcherTest, LongerAnchorWrapsFirst)
{
    const Annotation inner = makeAnnotation(1, QStringLiteral("world"));
    const Annotation outer = makeAnnotation(2, QStringLiteral("Hello world"));

    const QString result = AnchorMatcher::annotate(
        QStringLiteral("<p>Hello world</p>"), {inner, outer});

    const QString expected = QStringLiteral("<p>")
        + AnchorMatcher::wrap(QStringLiteral("Hello ")
                                  + AnchorMatcher::wrap(QStringLiteral("world"), inner),
                              outer)
        + QStringLiteral("</p>");
    EXPECT_EQ(result, expected);
}

TEST(AnchorMatcherTest, LengthPriorityNestsShorterAnchor)
{
    const Annotation longer = makeAnnotation(1, QStringLiteral("quick brown fox"));
    const Annotation shorter = makeAnnotation(2, QStringLiteral("brown fox"));

    const QString result = AnchorMatcher::annotate(
        QStringLiteral("<p>the quick brown fox</p>"), {longer, shorter});

    EXPECT_EQ(result.count(QStringLiteral("data-annotation-id=\"1\"")), 1);
    EXPECT_EQ(result.count(QStringLiteral("data-annotation-id=\"2\"")), 1);
    EXPECT_EQ(result,
              QStringLiteral("<p>the ")
                  + AnchorMatcher::wrap(QStringLiteral("quick ")
                                            + AnchorMatcher::wrap(QStringLiteral("brown fox"),
                                                                  shorter),
                                        longer)
                  + QStringLiteral("</p>"));
}

TEST(AnchorMatcherTest, AttributeTextIsNeverWrapped)
{
    const QString result = AnchorMatcher::annotate(
        QStringLiteral("<img alt=\"quick fox\">quick fox</img>"),
        {makeAnnotation(1, QStringLiteral("quick fox"))});

    EXPECT_EQ(wrapperCount(result), 1);
    EXPECT_TRUE(result.startsWith(QStringLiteral("<img alt=\"quick fox\"><a ")));
    EXPECT_TRUE(result.endsWith(QStringLiteral("\">quick fox</a></img>")));
}

TEST(AnchorMatcherTest, EqualInputsGiveEqualOutput)
{
    const QString buffer = QStringLiteral("<p>one two <b>three</b> two one</p>");
    const QList<Annotation> annotations = {
        makeAnnotation(1, QStringLiteral("two")),
        makeAnnotation(2, QStringLiteral("two one")),
        makeAnnotation(3, QStringLiteral("three"), AnnotationKind::Underline),
    };

    const QString first = AnchorMatcher::annotate(buffer, annotations);
    const QString second = AnchorMatcher::annotate(QString(buffer), QList<Annotation>(annotations));
    EXPECT_EQ(first, second);
    EXPECT_NE(first, buffer);
}

TEST(AnchorMatcherTest, QuotesAndAmpersandsMatchEscapedMarkup)
{
    const QString buffer =
        QStringLiteral("<p>He said &quot;no&quot; to AT&amp;T &amp; left.</p>");

    const QString quoted = AnchorMatcher::annotate(
        buffer, {makeAnnotation(1, QStringLiteral("He said \"no\""))});
    EXPECT_TRUE(quoted.contains(QStringLiteral("\">He said &quot;no&quot;</a>")));

    const QString company = AnchorMatcher::annotate(
        buffer, {makeAnnotation(2, QStringLiteral("AT&T"))});
    EXPECT_TRUE(company.contains(QStringLiteral("\">AT&amp;T</a>")));
}

TEST(AnchorMatcherTest, TypographicCharactersMatchEntities)
{
    const QString buffer =
        QStringLiteral("<p>It&rsquo;s late&#8212;very late, ten&nbsp;miles &#X2019;out&#x2019;.</p>");

    const QString apostrophe = AnchorMatcher::annotate(
        buffer, {makeAnnotation(1, QStringLiteral("It\u2019s late\u2014very"))});
    EXPECT_TRUE(apostrophe.contains(QStringLiteral("\">It&rsquo;s late&#8212;very</a>")));

    const QString spaced = AnchorMatcher::annotate(
        buffer, {makeAnnotation(2, QStringLiteral("ten miles"))});
    EXPECT_TRUE(spaced.contains(QStringLiteral("\">ten&nbsp;miles</a>")));

    const QString hex = AnchorMatcher::annotate(
        buffer, {makeAnnotation(3, QStringLiteral("\u2019out\u2019"))});
    EXPECT_TRUE(hex.contains(QStringLiteral("\">&#X2019;out&#x2019;</a>")));
}

TEST(AnchorMatcherTest, AngleBracketsMatchOnlyAsEntities)
{
    const QString result = AnchorMatcher::annotate(
        QStringLiteral("<p>if a &lt; b then</p>"), {makeAnnotation(1, QStringLiteral("a < b"))});

    EXPECT_TRUE(result.contains(QStringLiteral("\">a &lt; b</a>")));
}

TEST(AnchorMatcherTest, PartialOverlapKeepsFirstOfEqualLength)
{
    const QString result = AnchorMatcher::annotate(
        QStringLiteral("<p>alpha beta gamma</p>"),
        {makeAnnotation(1, QStringLiteral("alpha beta")),
         makeAnnotation(2, QStringLiteral("beta gamma"))});

    EXPECT_TRUE(result.contains(QStringLiteral("data-annotation-id=\"1\"")));
    EXPECT_FALSE(result.contains(QStringLiteral("data-annotation-id=\"2\"")));
}

TEST(AnchorMatcherTest, DuplicateIdIsAppliedOnce)
{
    const Annotation a = makeAnnotation(3, QStringLiteral("world"));
    const QString result = AnchorMatcher::annotate(QStringLiteral("<p>Hello world</p>"), {a, a});

    EXPECT_EQ(wrapperCount(result), 1);
}

TEST(AnchorMatcherTest, BlankAnchorIsSkipped)
{
    const QString buffer = QStringLiteral("<p>Hello world</p>");

    EXPECT_EQ(AnchorMatcher::annotate(buffer, {makeAnnotation(1, QStringLiteral("  \t "))}),
              buffer);
    EXPECT_TRUE(AnchorMatcher::buildMatcher(QStringLiteral("   ")).pattern().isEmpty());
}

TEST(AnchorMatcherTest, UnmatchedAnchorLeavesContentUnchanged)
{
    const QString buffer = QStringLiteral("<p>Hello world</p>");
    EXPECT_EQ(AnchorMatcher::annotate(buffer, {makeAnnotation(1, QStringLiteral("absent"))}),
              buffer);
}

TEST(AnchorMatcherTest, InsideTagDetection)
{
    const QString buffer = QStringLiteral("<p class=\"x\">text</p>");

    EXPECT_FALSE(AnchorMatcher::isInsideTag(buffer, 0));
    EXPECT_TRUE(AnchorMatcher::isInsideTag(buffer, 3));
    EXPECT_FALSE(AnchorMatcher::isInsideTag(buffer, buffer.indexOf(QStringLiteral("text"))));
}

TEST(AnchorMatcherTest, MarkerHrefParsing)
{
    int id = -1;
    EXPECT_EQ(AnchorMatcher::markerHref(12), QStringLiteral("annotation:12"));
    EXPECT_EQ(AnchorMatcher::markerName(12), QStringLiteral("annotation-12"));

    EXPECT_TRUE(AnchorMatcher::parseMarkerHref(QStringLiteral("annotation:12"), &id));
    EXPECT_EQ(id, 12);
    EXPECT_FALSE(AnchorMatcher::parseMarkerHref(QStringLiteral("https://example.org"), &id));
    EXPECT_FALSE(AnchorMatcher::parseMarkerHref(QStringLiteral("annotation:abc"), &id));
}
