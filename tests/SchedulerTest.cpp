// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <memory>

#include <gtest/gtest.h>

#include "AppScheduler.hpp"
#include "TestFakes.hpp"

struct SchedulerTest : ::testing::Test
{
    FakeClock clock;
    AppLoop loop{clock};
    FakeIdle idle;
    FakePresenter presenter;
    std::unique_ptr<AppScheduler> scheduler;

    void Begin(long workMSec = Sec(10), long breakMSec = Sec(5), long postponeMSec = Sec(3), long idleMSec = Sec(2))
    {
        AppScheduler::Durations durations;
        durations.workMSec = workMSec;
        durations.breakMSec = breakMSec;
        durations.postponeMSec = postponeMSec;
        durations.idleMSec = idleMSec;

        scheduler.reset(new AppScheduler(loop, idle, presenter, durations));
        ASSERT_TRUE(scheduler->Start().ok);
    }

    void At(long t) { ASSERT_TRUE(RunUntil(loop, clock, t).ok); }
};

TEST_F(SchedulerTest, StartRunsWorkTimerAndWatchesIdle)
{
    Begin();
    EXPECT_TRUE(scheduler->WorkTimer().IsRunning());
    EXPECT_FALSE(scheduler->BreakTimer().IsRunning());
    EXPECT_FALSE(scheduler->PostponeTimer().IsRunning());
    EXPECT_FALSE(scheduler->IsIdle());
    EXPECT_FALSE(scheduler->IsPromptVisible());
    EXPECT_EQ(Sec(2), idle.thresholdMSec);
}

TEST_F(SchedulerTest, BreakTimerIsShortenedByIdleThreshold)
{
    Begin(Sec(10), Sec(5), Sec(3), Sec(2));
    EXPECT_EQ(Sec(3), scheduler->BreakTimer().Interval());
}

TEST_F(SchedulerTest, NoIdlePromptStaysShown)
{
    Begin();
    At(Sec(10) - 1);
    EXPECT_FALSE(presenter.shown);

    At(Sec(10));
    EXPECT_TRUE(presenter.shown);
    EXPECT_TRUE(scheduler->IsPromptVisible());
    EXPECT_FALSE(scheduler->WorkTimer().IsRunning());

    At(Sec(600));
    EXPECT_TRUE(presenter.shown);
    EXPECT_EQ(1, presenter.showCount);
    EXPECT_EQ(0, presenter.closeCount);
}

TEST_F(SchedulerTest, FullIdleCreditClosesPromptAndRestartsWork)
{
    Begin();
    At(Sec(10));
    ASSERT_TRUE(presenter.shown);

    At(Sec(12));
    ASSERT_TRUE(idle.IdleStart().ok);
    EXPECT_TRUE(scheduler->IsIdle());
    EXPECT_TRUE(scheduler->BreakTimer().IsRunning());
    EXPECT_FALSE(scheduler->WorkTimer().IsRunning());

    At(Sec(15) - 1);
    EXPECT_TRUE(presenter.shown);
    At(Sec(15));
    EXPECT_FALSE(presenter.shown);
    EXPECT_FALSE(scheduler->IsPromptVisible());
    EXPECT_EQ(1, presenter.closeCount);
    EXPECT_FALSE(scheduler->WorkTimer().IsRunning()); // only restarts when activity resumes

    At(Sec(40));
    ASSERT_TRUE(idle.IdleEnd().ok);
    EXPECT_FALSE(scheduler->IsIdle());
    EXPECT_TRUE(scheduler->WorkTimer().IsRunning());
    EXPECT_EQ(Sec(10), scheduler->WorkTimer().Remaining());

    At(Sec(50) - 1);
    EXPECT_FALSE(presenter.shown);
    At(Sec(50));
    EXPECT_TRUE(presenter.shown);
    EXPECT_EQ(2, presenter.showCount);
}

TEST_F(SchedulerTest, BriefIdleDuringWorkIsExcludedFromWorkTime)
{
    Begin();
    At(Sec(3));
    ASSERT_TRUE(idle.IdleStart().ok);
    EXPECT_FALSE(scheduler->WorkTimer().IsRunning());
    EXPECT_EQ(Sec(7), scheduler->WorkTimer().Remaining());

    At(Sec(4));
    ASSERT_TRUE(idle.IdleEnd().ok);
    EXPECT_TRUE(scheduler->WorkTimer().IsRunning());
    EXPECT_FALSE(scheduler->BreakTimer().IsRunning());

    At(Sec(11) - 1);
    EXPECT_FALSE(presenter.shown);
    At(Sec(11));
    EXPECT_TRUE(presenter.shown);
}

TEST_F(SchedulerTest, LongIdleDuringWorkCountsAsBreak)
{
    Begin();
    At(Sec(3));
    ASSERT_TRUE(idle.IdleStart().ok);

    At(Sec(30));
    EXPECT_FALSE(scheduler->BreakTimer().IsRunning());
    EXPECT_EQ(0, presenter.showCount);
    EXPECT_EQ(0, presenter.closeCount);

    ASSERT_TRUE(idle.IdleEnd().ok);
    EXPECT_EQ(Sec(10), scheduler->WorkTimer().Remaining());

    At(Sec(40) - 1);
    EXPECT_FALSE(presenter.shown);
    At(Sec(40));
    EXPECT_TRUE(presenter.shown);
}

TEST_F(SchedulerTest, DismissedPromptReturnsAfterPostpone)
{
    Begin();
    At(Sec(10));

    long t = Sec(10);
    for(int i = 1; i <= 5; i++)
    {
        ASSERT_TRUE(presenter.shown);
        ASSERT_EQ(i, presenter.showCount);

        ASSERT_TRUE(presenter.Dismiss().ok);
        EXPECT_FALSE(scheduler->IsPromptVisible());
        EXPECT_TRUE(scheduler->PostponeTimer().IsRunning());

        At(t + Sec(3) - 1);
        EXPECT_FALSE(presenter.shown);
        t += Sec(3);
        At(t);
    }
    EXPECT_TRUE(presenter.shown);
    EXPECT_FALSE(scheduler->WorkTimer().IsRunning());
}

TEST_F(SchedulerTest, PostponeLoopEndsWithIdleBreak)
{
    Begin();
    At(Sec(10));
    ASSERT_TRUE(presenter.Dismiss().ok);

    At(Sec(11));
    ASSERT_TRUE(idle.IdleStart().ok);

    // postpone expires first and nags again while the user is away
    At(Sec(13));
    EXPECT_TRUE(presenter.shown);

    At(Sec(14));
    EXPECT_FALSE(presenter.shown);
    EXPECT_FALSE(scheduler->PostponeTimer().IsRunning());

    At(Sec(60));
    EXPECT_EQ(2, presenter.showCount);
}

TEST_F(SchedulerTest, BreakCreditCancelsPendingPostpone)
{
    Begin(Sec(10), Sec(5), Sec(30), Sec(2));
    At(Sec(10));
    ASSERT_TRUE(presenter.Dismiss().ok);
    ASSERT_TRUE(idle.IdleStart().ok);
    ASSERT_TRUE(scheduler->PostponeTimer().IsRunning());

    At(Sec(13));
    EXPECT_FALSE(scheduler->PostponeTimer().IsRunning());
    EXPECT_FALSE(presenter.shown);
    EXPECT_EQ(1, presenter.showCount);
}

TEST_F(SchedulerTest, IdleInterruptingDueReminderKeepsItDue)
{
    Begin();
    At(Sec(10));
    ASSERT_TRUE(presenter.shown);

    At(Sec(12));
    ASSERT_TRUE(idle.IdleStart().ok);
    At(Sec(14));
    ASSERT_TRUE(idle.IdleEnd().ok);

    EXPECT_FALSE(scheduler->WorkTimer().IsRunning());
    EXPECT_FALSE(scheduler->BreakTimer().IsRunning());
    EXPECT_TRUE(scheduler->IsPromptVisible());
    EXPECT_TRUE(presenter.shown);

    At(Sec(300));
    EXPECT_TRUE(presenter.shown);
    EXPECT_EQ(1, presenter.showCount);
    EXPECT_FALSE(scheduler->WorkTimer().IsRunning());
}

TEST_F(SchedulerTest, BreakCreditRestartsEachIdleEpisode)
{
    Begin();
    At(Sec(10));

    At(Sec(12));
    ASSERT_TRUE(idle.IdleStart().ok);
    At(Sec(14));
    ASSERT_TRUE(idle.IdleEnd().ok);

    At(Sec(20));
    ASSERT_TRUE(idle.IdleStart().ok);
    EXPECT_EQ(Sec(3), scheduler->BreakTimer().Remaining());
    At(Sec(23) - 1);
    EXPECT_TRUE(presenter.shown);
    At(Sec(23));
    EXPECT_FALSE(presenter.shown);
}

TEST_F(SchedulerTest, EachIdleStartRegistersOneActiveWatch)
{
    Begin();
    At(Sec(3));
    ASSERT_TRUE(idle.IdleStart().ok);
    ASSERT_TRUE(idle.IdleEnd().ok);
    At(Sec(6));
    ASSERT_TRUE(idle.IdleStart().ok);
    EXPECT_EQ(2, idle.activeWatchCount);
}

TEST_F(SchedulerTest, PostponeActionStartsPostponeOnce)
{
    Begin();
    At(Sec(10));
    At(Sec(11));
    ASSERT_TRUE(presenter.PressPostpone().ok);
    EXPECT_TRUE(scheduler->PostponeTimer().IsRunning());
    EXPECT_FALSE(scheduler->IsPromptVisible());

    At(Sec(14) - 1);
    EXPECT_FALSE(presenter.shown);
    At(Sec(14));
    EXPECT_TRUE(presenter.shown);
}

TEST_F(SchedulerTest, ProgrammaticCloseDoesNotPostpone)
{
    Begin();
    At(Sec(10));
    ASSERT_TRUE(presenter.onClosed(AppPresenter::ProgrammaticClose).ok);
    EXPECT_FALSE(scheduler->PostponeTimer().IsRunning());
}

TEST_F(SchedulerTest, UnknownActionIsIgnored)
{
    Begin();
    At(Sec(10));
    ASSERT_TRUE(presenter.onAction("snooze-forever").ok);
    EXPECT_FALSE(scheduler->PostponeTimer().IsRunning());
    EXPECT_TRUE(scheduler->IsPromptVisible());
}

TEST_F(SchedulerTest, ShowAndCloseAreIdempotent)
{
    Begin();
    At(Sec(10));
    ASSERT_TRUE(scheduler->OnWorkExpired().ok);
    EXPECT_EQ(1, presenter.showCount);

    scheduler->Shutdown();
    scheduler->Shutdown();
    EXPECT_EQ(1, presenter.closeCount);
    EXPECT_FALSE(presenter.shown);
}

TEST_F(SchedulerTest, ShutdownWithoutPromptClosesNothing)
{
    Begin();
    At(Sec(5));
    scheduler->Shutdown();
    EXPECT_EQ(0, presenter.closeCount);
}

TEST_F(SchedulerTest, ThresholdAtOrAboveBreakGrantsCreditOnDetection)
{
    Begin(Sec(10), Sec(2), Sec(3), Sec(2));
    EXPECT_EQ(0, scheduler->BreakTimer().Interval());

    At(Sec(10));
    ASSERT_TRUE(presenter.shown);
    At(Sec(12));
    ASSERT_TRUE(idle.IdleStart().ok);
    At(Sec(12));
    EXPECT_FALSE(presenter.shown);
    EXPECT_FALSE(scheduler->BreakTimer().IsRunning());
}

TEST_F(SchedulerTest, ContractViolationSurfacesAsFailure)
{
    Begin();
    AppScheduler::IdleContext context;
    context.wasWorking = true;
    context.idleStartMSec = 0;

    // no idle episode is open, so the work timer is already running
    AppResult result = scheduler->OnIdleEnd(context);
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(scheduler->WorkTimer().IsRunning());
}
