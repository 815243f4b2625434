// SPDX-License-Identifier: GPL-2.0-or-later

#include <gtest/gtest.h>

#include "selectioncapture.h"
#include "testsupport.h"

class SelectionCaptureTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        QObject::connect(&capture, &SelectionCapture::selectionCaptured,
                         [this](const SelectionRecord &record) {
            ++captured;
            lastRecord = record;
        });
        QObject::connect(&capture, &SelectionCapture::selectionCleared,
                         [this]() { ++cleared; });
    }

    ManualScheduler scheduler;
    FakeSelectionSurface surface;
    SelectionCapture capture{&surface, &scheduler};

    int captured = 0;
    int cleared = 0;
    SelectionRecord lastRecord;
};

TEST_F(SelectionCaptureTest, ReadIsDeferredAfterRelease)
{
    surface.select(QStringLiteral("  quick brown  "), SavedRange{4, 19});

    capture.onPointerRelease();
    EXPECT_TRUE(capture.isPending());
    EXPECT_EQ(surface.readCount, 0);

    scheduler.advance(9);
    EXPECT_EQ(captured, 0);

    scheduler.advance(1);
    EXPECT_EQ(captured, 1);
    EXPECT_FALSE(capture.isPending());
    EXPECT_EQ(capture.record().text, QStringLiteral("quick brown"));
    EXPECT_EQ(lastRecord.text, QStringLiteral("quick brown"));
    EXPECT_EQ(capture.record().boundingBox, QRectF(100, 200, 80, 20));
    EXPECT_EQ(capture.savedRange(), (SavedRange{4, 19}));
}

TEST_F(SelectionCaptureTest, RapidReleasesCoalesce)
{
    surface.select(QStringLiteral("fox"), SavedRange{16, 19});

    capture.onPointerRelease();
    scheduler.advance(5);
    capture.onPointerRelease();
    scheduler.advance(5);
    EXPECT_EQ(captured, 0);
    EXPECT_EQ(scheduler.pendingCount(), 1);

    scheduler.advance(5);
    EXPECT_EQ(captured, 1);
    EXPECT_EQ(surface.readCount, 1);
}

TEST_F(SelectionCaptureTest, WhitespaceSelectionIsRejected)
{
    surface.select(QStringLiteral(" \n\t "), SavedRange{3, 7});

    capture.onPointerRelease();
    scheduler.advance(100);

    EXPECT_EQ(captured, 0);
    EXPECT_FALSE(capture.hasSelection());
}

TEST_F(SelectionCaptureTest, SelectionOutsideContentRootIsRejected)
{
    surface.select(QStringLiteral("Chapter One"), SavedRange{0, 11}, false);

    capture.onPointerRelease();
    scheduler.advance(100);

    EXPECT_EQ(captured, 0);
    EXPECT_FALSE(capture.hasSelection());
}

TEST_F(SelectionCaptureTest, EmptyFirstReadingIsRetriedAfterSettle)
{
    capture.onPointerRelease();
    scheduler.advance(10);
    EXPECT_EQ(captured, 0);
    EXPECT_TRUE(capture.isPending());

    // The platform finishes updating its selection late
    surface.select(QStringLiteral("jumps"), SavedRange{20, 25});
    scheduler.advance(50);

    EXPECT_EQ(captured, 1);
    EXPECT_EQ(capture.record().text, QStringLiteral("jumps"));
}

TEST_F(SelectionCaptureTest, SecondEmptyReadingClearsRecord)
{
    surface.select(QStringLiteral("jumps"), SavedRange{20, 25});
    capture.onPointerRelease();
    scheduler.advance(10);
    ASSERT_TRUE(capture.hasSelection());

    surface.collapse();
    capture.onPointerRelease();
    scheduler.advance(10);
    EXPECT_TRUE(capture.hasSelection());

    scheduler.advance(50);
    EXPECT_FALSE(capture.hasSelection());
    EXPECT_TRUE(capture.savedRange().isNull());
    EXPECT_EQ(cleared, 1);
}

TEST_F(SelectionCaptureTest, UnreadableSelectionIsTreatedAsEmpty)
{
    surface.current.readable = false;

    capture.onPointerRelease();
    scheduler.advance(100);

    EXPECT_EQ(captured, 0);
    EXPECT_EQ(cleared, 0);
}

TEST_F(SelectionCaptureTest, CaptureNowReadsSynchronously)
{
    surface.select(QStringLiteral("brown"), SavedRange{10, 15});
    capture.onPointerRelease();

    const SelectionRecord record = capture.captureNow();
    EXPECT_TRUE(record.isValid());
    EXPECT_EQ(record.text, QStringLiteral("brown"));
    EXPECT_FALSE(capture.isPending());

    surface.collapse();
    EXPECT_FALSE(capture.captureNow().isValid());
    EXPECT_FALSE(capture.hasSelection());
}

TEST_F(SelectionCaptureTest, ClearDropsPendingRead)
{
    surface.select(QStringLiteral("brown"), SavedRange{10, 15});
    capture.onPointerRelease();
    capture.clear();

    scheduler.advance(100);
    EXPECT_EQ(captured, 0);
    EXPECT_EQ(scheduler.pendingCount(), 0);
}
