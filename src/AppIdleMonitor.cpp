// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <algorithm>
#include <cstring>

#include "AppIdleMonitor.hpp"
#include "AppLog.hpp"

#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)
//#define CHATTY

constexpr long AppIdleMonitor::DefaultPollMSec;
constexpr long AppIdleMonitor::MinPollMSec;

AppIdleMonitor::AppIdleMonitor(AppLoop& loop_, query_type fnQuery_, long pollMSec_)
    : loop(loop_), fnQuery(std::move(fnQuery_)), pollMSec(std::max(pollMSec_, MinPollMSec))
{
}

AppIdleMonitor::~AppIdleMonitor()
{
    if(sourceId) loop.Remove(sourceId);
}

void AppIdleMonitor::WatchIdle(long thresholdMSec_, watch_type fnIdle_)
{
    thresholdMSec = thresholdMSec_;
    fnIdle = std::move(fnIdle_);

    AppLog::Info(__FILENAME__, "watching for %ld seconds idle", AppSeconds(thresholdMSec));
    Schedule(0);
}

void AppIdleMonitor::WatchActive(watch_type fnActive_)
{
    if(!inEpisode) AppLog::Warn(__FILENAME__, "active watch added while not idle");
    fnActive = std::move(fnActive_);
}

void AppIdleMonitor::Schedule(long delayMSec)
{
    if(sourceId) loop.Remove(sourceId);
    sourceId = loop.Add(delayMSec, [this]() { return Poll(); });
}

AppResult AppIdleMonitor::Poll()
{
    sourceId = 0;

    long idleMSec = 0;
    AppResult result = fnQuery(idleMSec);
    if(!result) return result;

#ifdef CHATTY
    AppLog::Info(__FILENAME__, "idle for %ld msec", idleMSec);
#endif

    if(!inEpisode)
    {
        if(idleMSec < thresholdMSec)
        {
            Schedule(std::max(thresholdMSec - idleMSec, MinPollMSec));
            return AppResult::Ok();
        }

        inEpisode = true;
        idleSinceMSec = loop.NowMSec() - idleMSec;
        Schedule(pollMSec);
        return fnIdle ? fnIdle() : AppResult::Ok();
    }

    // nb: new input lands at least thresholdMSec after idleSinceMSec, half of that absorbs clock skew
    if(loop.NowMSec() - idleMSec <= idleSinceMSec + thresholdMSec / 2)
    {
        Schedule(pollMSec);
        return AppResult::Ok();
    }

    // input happened since the last poll
    inEpisode = false;
    Schedule(std::max(thresholdMSec - idleMSec, MinPollMSec));

    watch_type fn = std::move(fnActive);
    fnActive = nullptr;
    return fn ? fn() : AppResult::Ok();
}
