// SPDX-License-Identifier: GPL-2.0-or-later

#include <gtest/gtest.h>

#include "selectionsupervisor.h"
#include "testsupport.h"

class SelectionSupervisorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        surface.select(QStringLiteral("quick brown"), range);
        QObject::connect(&supervisor, &SelectionSupervisor::watchingChanged,
                         [this](bool watching) { transitions.append(watching); });
    }

    const SavedRange range{4, 15};
    ManualScheduler scheduler;
    FakeSelectionSurface surface;
    SelectionSupervisor supervisor{&surface, &scheduler};
    QList<bool> transitions;
};

TEST_F(SelectionSupervisorTest, RestoresCollapsedSelectionOnNextTick)
{
    supervisor.start(range);
    EXPECT_TRUE(supervisor.isWatching());

    scheduler.advance(500);
    EXPECT_TRUE(surface.applied.isEmpty());

    // An unrelated re-render collapses the selection
    surface.collapse();
    scheduler.advance(100);

    ASSERT_EQ(surface.applied.size(), 1);
    EXPECT_EQ(surface.applied.first(), range);
    EXPECT_EQ(supervisor.restoreCount(), 1);
    EXPECT_FALSE(surface.current.collapsed);
    EXPECT_TRUE(supervisor.isWatching());
}

TEST_F(SelectionSupervisorTest, StopsWhenWindowExpires)
{
    supervisor.start(range);
    scheduler.advance(10000);

    EXPECT_FALSE(supervisor.isWatching());
    EXPECT_EQ(scheduler.pendingCount(), 0);

    surface.collapse();
    scheduler.advance(1000);
    EXPECT_TRUE(surface.applied.isEmpty());
    EXPECT_EQ(transitions, (QList<bool>{true, false}));
}

TEST_F(SelectionSupervisorTest, StopCancelsPendingTicks)
{
    supervisor.start(range);
    scheduler.advance(150);
    supervisor.stop();

    EXPECT_EQ(supervisor.state(), SelectionSupervisor::State::Idle);
    EXPECT_EQ(scheduler.pendingCount(), 0);
    EXPECT_TRUE(supervisor.savedRange().isNull());

    surface.collapse();
    scheduler.advance(1000);
    EXPECT_TRUE(surface.applied.isEmpty());
}

TEST_F(SelectionSupervisorTest, RestartReplacesPreviousChain)
{
    const SavedRange other{20, 25};

    supervisor.start(range);
    scheduler.advance(50);
    supervisor.start(other);
    EXPECT_EQ(scheduler.pendingCount(), 1);
    EXPECT_EQ(transitions, (QList<bool>{true}));

    surface.collapse();
    scheduler.advance(100);

    ASSERT_EQ(surface.applied.size(), 1);
    EXPECT_EQ(surface.applied.first(), other);
    EXPECT_EQ(supervisor.savedRange(), other);
}

TEST_F(SelectionSupervisorTest, RestartExtendsWindow)
{
    supervisor.start(range);
    scheduler.advance(9000);
    supervisor.start(range);
    scheduler.advance(8000);

    EXPECT_TRUE(supervisor.isWatching());
}

TEST_F(SelectionSupervisorTest, FailedRestorationIsTolerated)
{
    surface.acceptApply = false;
    supervisor.start(range);
    surface.collapse();

    scheduler.advance(300);

    EXPECT_EQ(surface.applied.size(), 3);
    EXPECT_EQ(supervisor.restoreCount(), 0);
    EXPECT_TRUE(supervisor.isWatching());
}

TEST_F(SelectionSupervisorTest, NullRangeDoesNotWatch)
{
    supervisor.start(SavedRange{7, 7});

    EXPECT_FALSE(supervisor.isWatching());
    EXPECT_EQ(scheduler.pendingCount(), 0);
    EXPECT_TRUE(transitions.isEmpty());
}

TEST_F(SelectionSupervisorTest, IntactSelectionIsLeftAlone)
{
    supervisor.start(range);
    scheduler.advance(2000);

    EXPECT_TRUE(surface.applied.isEmpty());
    EXPECT_EQ(surface.readCount, 20);
}
