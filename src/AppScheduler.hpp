#ifndef _APPSCHEDULER_HPP_
#define _APPSCHEDULER_HPP_

// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <string>

#include "AppLoop.hpp"
#include "AppTimer.hpp"
#include "AppIdle.hpp"
#include "AppPresenter.hpp"

// Decides when a break is due and when idle time has paid for it.
//
// workTimer runs while the user is active and not owed a break. When it
// expires the prompt is shown and stays due until an idle episode lasts the
// full break duration. breakTimer counts that idle credit; it is shortened by
// the idle threshold because that much inactivity has already passed when
// idle is detected. Dismissing the prompt starts postponeTimer, which shows
// it again on expiry.
struct AppScheduler
{
    struct Durations
    {
        long workMSec;
        long breakMSec;
        long postponeMSec;
        long idleMSec; // idle detection threshold
    };

    // carried from idle start to the matching idle end
    struct IdleContext
    {
        bool wasWorking;
        long idleStartMSec; // when inactivity began, not when it was detected
    };

    AppScheduler(AppLoop& loop_, AppIdle& idle_, AppPresenter& presenter_, const Durations& durations_);

    AppScheduler(const AppScheduler&) = delete;
    AppScheduler& operator=(const AppScheduler&) = delete;

    AppResult Start();
    void Shutdown();

    AppResult OnWorkExpired();
    AppResult OnIdleStart();
    AppResult OnIdleEnd(const IdleContext& context);
    AppResult OnBreakExpired();
    AppResult OnPromptClosed(AppPresenter::CloseReason reason);
    AppResult OnPromptAction(const std::string& actionId);
    AppResult OnPostponeExpired();

    bool IsIdle() const { return isIdle; }
    bool IsPromptVisible() const { return promptVisible; }

    const AppTimer& WorkTimer() const { return workTimer; }
    const AppTimer& BreakTimer() const { return breakTimer; }
    const AppTimer& PostponeTimer() const { return postponeTimer; }

private:
    AppResult Postpone(const char* szWhy);
    void ShowPrompt();
    void ClosePrompt();

    AppLoop& loop;
    AppIdle& idle;
    AppPresenter& presenter;
    const Durations durations;

    AppTimer workTimer;
    AppTimer breakTimer;
    AppTimer postponeTimer;

    bool isIdle = false;
    bool promptVisible = false;
};

#endif //_APPSCHEDULER_HPP_
