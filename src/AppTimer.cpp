// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <algorithm>
#include <cstring>

#include "AppTimer.hpp"
#include "AppLog.hpp"

#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

AppTimer::AppTimer(AppLoop& loop_, const char* szName, long intervalMSec_, expiry_type fnExpiry_)
    : loop(loop_), name(szName), intervalMSec(std::max(intervalMSec_, 0L)),
      remainingMSec(std::max(intervalMSec_, 0L)), fnExpiry(std::move(fnExpiry_))
{
}

AppTimer::~AppTimer()
{
    if(running) loop.Remove(sourceId);
}

AppResult AppTimer::Start(bool reset)
{
    if(running)
        return AppResult::Fail(__FILENAME__, "%s timer started while running", name.c_str());

    if(reset) remainingMSec = intervalMSec;

    AppLog::Info(__FILENAME__, "%s %s: %ld seconds remaining",
        reset ? "starting" : "resuming", name.c_str(), AppSeconds(remainingMSec));

    startMSec = loop.NowMSec();
    running = true;
    sourceId = loop.Add(remainingMSec, [this]() { return Expire(); });
    return AppResult::Ok();
}

AppResult AppTimer::Stop()
{
    if(!running)
        return AppResult::Fail(__FILENAME__, "%s timer stopped while not running", name.c_str());

    loop.Remove(sourceId);
    sourceId = 0;

    long elapsed = loop.NowMSec() - startMSec;
    remainingMSec = std::max(remainingMSec - elapsed, 0L);
    running = false;

    AppLog::Info(__FILENAME__, "pausing %s: %ld seconds elapsed, %ld remaining",
        name.c_str(), AppSeconds(elapsed), AppSeconds(remainingMSec));
    return AppResult::Ok();
}

AppResult AppTimer::Expire()
{
    sourceId = 0;
    running = false;
    remainingMSec = intervalMSec;

    AppLog::Info(__FILENAME__, "%s expired", name.c_str());
    return fnExpiry();
}
