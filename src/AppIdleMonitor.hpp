#ifndef _APPIDLEMONITOR_HPP_
#define _APPIDLEMONITOR_HPP_

// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <cstdint>
#include <functional>

#include "AppIdle.hpp"
#include "AppLoop.hpp"

// Turns an input idle counter (msec since the last keyboard or pointer
// input) into idle episodes. Polls sparsely while active, every pollMSec
// while idle. The episode ends once a poll shows input later than the
// one it started from.
struct AppIdleMonitor : AppIdle
{
    typedef std::function<AppResult(long&)> query_type;

    static constexpr long DefaultPollMSec = 1000;
    static constexpr long MinPollMSec = 50;

    AppIdleMonitor(AppLoop& loop_, query_type fnQuery_, long pollMSec_ = DefaultPollMSec);
    ~AppIdleMonitor();

    AppIdleMonitor(const AppIdleMonitor&) = delete;
    AppIdleMonitor& operator=(const AppIdleMonitor&) = delete;

    void WatchIdle(long thresholdMSec_, watch_type fnIdle_) override;
    void WatchActive(watch_type fnActive_) override;

    bool InEpisode() const { return inEpisode; }

private:
    AppResult Poll();
    void Schedule(long delayMSec);

    AppLoop& loop;
    query_type fnQuery;
    long pollMSec;

    long thresholdMSec = 0;
    watch_type fnIdle;
    watch_type fnActive;

    bool inEpisode = false;
    long idleSinceMSec = 0; // loop time of the last input before the episode
    uint32_t sourceId = 0;
};

#endif //_APPIDLEMONITOR_HPP_
