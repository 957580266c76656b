#ifndef _APPIDLE_HPP_
#define _APPIDLE_HPP_

// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <functional>

#include "AppResult.hpp"

// Source of idle-start and idle-end notifications.
struct AppIdle
{
    typedef std::function<AppResult(void)> watch_type;

    virtual ~AppIdle() = default;

    // persistent, fires once per idle episode when inactivity reaches thresholdMSec
    virtual void WatchIdle(long thresholdMSec, watch_type fnIdle) = 0;

    // one-shot, fires when activity resumes. only register during an idle episode.
    // context travels in the closure.
    virtual void WatchActive(watch_type fnActive) = 0;
};

#endif //_APPIDLE_HPP_
