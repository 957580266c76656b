#ifndef _APPTIMER_HPP_
#define _APPTIMER_HPP_

// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <cstdint>
#include <string>
#include <functional>

#include "AppLoop.hpp"

// Single-shot countdown that can be stopped and later started again with
// whatever time it had left. Remaining time only changes on Stop and expiry.
struct AppTimer
{
    typedef std::function<AppResult(void)> expiry_type;

    AppTimer(AppLoop& loop_, const char* szName, long intervalMSec, expiry_type fnExpiry_);
    ~AppTimer();

    AppTimer(const AppTimer&) = delete;
    AppTimer& operator=(const AppTimer&) = delete;

    AppResult Start(bool reset);
    AppResult Stop();

    bool IsRunning() const { return running; }
    long Remaining() const { return remainingMSec; }
    long Interval() const { return intervalMSec; }

private:
    AppResult Expire();

    AppLoop& loop;
    std::string name;
    const long intervalMSec;
    long remainingMSec;
    long startMSec = 0;
    bool running = false;
    uint32_t sourceId = 0;
    expiry_type fnExpiry;
};

#endif //_APPTIMER_HPP_
