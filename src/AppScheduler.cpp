// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <algorithm>
#include <cstring>

#include "AppScheduler.hpp"
#include "AppLog.hpp"

#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

constexpr auto PostponeActionId = "postpone";

AppScheduler::AppScheduler(AppLoop& loop_, AppIdle& idle_, AppPresenter& presenter_, const Durations& durations_)
    : loop(loop_), idle(idle_), presenter(presenter_), durations(durations_),
      workTimer(loop_, "work", durations_.workMSec, [this]() { return OnWorkExpired(); }),
      breakTimer(loop_, "break", std::max(durations_.breakMSec - durations_.idleMSec, 0L), [this]() { return OnBreakExpired(); }),
      postponeTimer(loop_, "postpone", durations_.postponeMSec, [this]() { return OnPostponeExpired(); })
{
    presenter.onClosed = [this](AppPresenter::CloseReason reason) { return OnPromptClosed(reason); };
    presenter.onAction = [this](const std::string& actionId) { return OnPromptAction(actionId); };
}

AppResult AppScheduler::Start()
{
    AppLog::Info(__FILENAME__, "work %lds break %lds postpone %lds idle %lds",
        AppSeconds(durations.workMSec), AppSeconds(durations.breakMSec),
        AppSeconds(durations.postponeMSec), AppSeconds(durations.idleMSec));

    isIdle = false; // assume active on start

    AppResult result = workTimer.Start(true);
    if(!result) return result;

    idle.WatchIdle(durations.idleMSec, [this]() { return OnIdleStart(); });
    return AppResult::Ok();
}

void AppScheduler::Shutdown()
{
    ClosePrompt();
}

AppResult AppScheduler::OnWorkExpired()
{
    AppLog::Info(__FILENAME__, "break due");
    ShowPrompt();
    return AppResult::Ok();
}

AppResult AppScheduler::OnIdleStart()
{
    AppLog::Info(__FILENAME__, "idle start");

    IdleContext context;
    context.wasWorking = workTimer.IsRunning();
    context.idleStartMSec = loop.NowMSec() - durations.idleMSec;

    // idle time must not use up work time
    if(context.wasWorking)
    {
        AppResult result = workTimer.Stop();
        if(!result) return result;
    }

    AppResult result = breakTimer.Start(true);
    if(!result) return result;

    isIdle = true;
    idle.WatchActive([this, context]() { return OnIdleEnd(context); });
    return AppResult::Ok();
}

AppResult AppScheduler::OnIdleEnd(const IdleContext& context)
{
    AppLog::Info(__FILENAME__, "idle end: %ld seconds elapsed", AppSeconds(loop.NowMSec() - context.idleStartMSec));

    isIdle = false;

    if(breakTimer.IsRunning())
    {
        // not idle long enough to count as a break
        AppResult result = breakTimer.Stop();
        if(!result) return result;

        if(context.wasWorking)
            return workTimer.Start(false);

        AppLog::Info(__FILENAME__, "break still due");
        return AppResult::Ok();
    }

    // break was taken while idle, work starts over from now
    return workTimer.Start(true);
}

AppResult AppScheduler::OnBreakExpired()
{
    AppLog::Info(__FILENAME__, "break taken");

    ClosePrompt();
    if(postponeTimer.IsRunning())
        return postponeTimer.Stop();

    return AppResult::Ok();
}

AppResult AppScheduler::OnPromptClosed(AppPresenter::CloseReason reason)
{
    AppLog::Info(__FILENAME__, "prompt %s", AppPresenter::ReasonName(reason));

    // nb: our own Close() already cleared promptVisible, the report arrives later
    if(reason == AppPresenter::ProgrammaticClose)
        return AppResult::Ok();

    return Postpone(AppPresenter::ReasonName(reason));
}

AppResult AppScheduler::OnPromptAction(const std::string& actionId)
{
    if(actionId != PostponeActionId)
    {
        AppLog::Warn(__FILENAME__, "unknown prompt action '%s'", actionId.c_str());
        return AppResult::Ok();
    }

    return Postpone(PostponeActionId);
}

AppResult AppScheduler::OnPostponeExpired()
{
    AppLog::Info(__FILENAME__, "postpone over");
    ShowPrompt();
    return AppResult::Ok();
}

AppResult AppScheduler::Postpone(const char* szWhy)
{
    ClosePrompt();

    // an action click reports both the action and an ActionInvoked close
    if(postponeTimer.IsRunning())
    {
        AppLog::Info(__FILENAME__, "postpone (%s) already pending", szWhy);
        return AppResult::Ok();
    }

    return postponeTimer.Start(true);
}

void AppScheduler::ShowPrompt()
{
    if(promptVisible) return;

    promptVisible = true;
    presenter.Show();
}

void AppScheduler::ClosePrompt()
{
    if(!promptVisible) return;

    promptVisible = false;
    presenter.Close();
}
