// SPDX-License-Identifier: GPL-2.0-or-later

#include <gtest/gtest.h>

#include "commitdispatcher.h"
#include "selectioncapture.h"
#include "selectionsupervisor.h"
#include "testsupport.h"

class CommitDispatcherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        QObject::connect(&dispatcher, &CommitDispatcher::annotateRequested,
                         [this](const QString &text, AnnotationKind kind) {
            requests.append(QStringLiteral("annotate:") + annotationKindName(kind)
                            + QLatin1Char(':') + text);
        });
        QObject::connect(&dispatcher, &CommitDispatcher::createNoteRequested,
                         [this](const QString &text) {
            requests.append(QStringLiteral("note:") + text);
        });
        QObject::connect(&dispatcher, &CommitDispatcher::explainRequested,
                         [this](const QString &text) {
            requests.append(QStringLiteral("explain:") + text);
        });
        QObject::connect(&dispatcher, &CommitDispatcher::selectionDismissed,
                         [this]() { ++dismissed; });
    }

    void selectAndWatch()
    {
        surface.select(QStringLiteral("  brown fox "), SavedRange{10, 22});
        ASSERT_TRUE(capture.captureNow().isValid());
        supervisor.start(capture.savedRange());
        ASSERT_TRUE(supervisor.isWatching());
    }

    void expectTornDown()
    {
        EXPECT_FALSE(capture.hasSelection());
        EXPECT_TRUE(capture.savedRange().isNull());
        EXPECT_FALSE(supervisor.isWatching());
        EXPECT_TRUE(surface.current.collapsed);
        EXPECT_EQ(surface.clearCount, 1);
        EXPECT_EQ(scheduler.pendingCount(), 0);
        EXPECT_EQ(dismissed, 1);
    }

    ManualScheduler scheduler;
    FakeSelectionSurface surface;
    SelectionCapture capture{&surface, &scheduler};
    SelectionSupervisor supervisor{&surface, &scheduler};
    CommitDispatcher dispatcher{&capture, &supervisor, &surface};

    QStringList requests;
    int dismissed = 0;
};

TEST_F(CommitDispatcherTest, HighlightEmitsTrimmedTextAndClearsState)
{
    selectAndWatch();
    dispatcher.commitHighlight();

    EXPECT_EQ(requests, QStringList{QStringLiteral("annotate:highlight:brown fox")});
    expectTornDown();
}

TEST_F(CommitDispatcherTest, UnderlineEmitsAndClearsState)
{
    selectAndWatch();
    dispatcher.commitUnderline();

    EXPECT_EQ(requests, QStringList{QStringLiteral("annotate:underline:brown fox")});
    expectTornDown();
}

TEST_F(CommitDispatcherTest, CreateNoteEmitsAndClearsState)
{
    selectAndWatch();
    dispatcher.commitCreateNote();

    EXPECT_EQ(requests, QStringList{QStringLiteral("note:brown fox")});
    expectTornDown();
}

TEST_F(CommitDispatcherTest, ExplainEmitsAndClearsState)
{
    selectAndWatch();
    dispatcher.commitExplain();

    EXPECT_EQ(requests, QStringList{QStringLiteral("explain:brown fox")});
    expectTornDown();
}

TEST_F(CommitDispatcherTest, CancelClearsWithoutRequest)
{
    selectAndWatch();
    dispatcher.cancel();

    EXPECT_TRUE(requests.isEmpty());
    expectTornDown();
}

TEST_F(CommitDispatcherTest, ReceiverSeesTornDownState)
{
    selectAndWatch();

    bool watchingDuringRequest = true;
    bool selectionDuringRequest = true;
    QObject::connect(&dispatcher, &CommitDispatcher::createNoteRequested,
                     [&](const QString &) {
        watchingDuringRequest = supervisor.isWatching();
        selectionDuringRequest = capture.hasSelection();
    });

    dispatcher.commitCreateNote();
    EXPECT_FALSE(watchingDuringRequest);
    EXPECT_FALSE(selectionDuringRequest);
}

TEST_F(CommitDispatcherTest, NoSelectionMeansNoRequest)
{
    dispatcher.commitHighlight();
    dispatcher.commitExplain();

    EXPECT_TRUE(requests.isEmpty());
    EXPECT_EQ(dismissed, 0);
}

TEST_F(CommitDispatcherTest, NoKeepAliveTickAfterCommit)
{
    selectAndWatch();
    dispatcher.commitHighlight();

    surface.collapse();
    scheduler.advance(1000);
    EXPECT_TRUE(surface.applied.isEmpty());
}
