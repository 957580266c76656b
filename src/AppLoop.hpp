#ifndef _APPLOOP_HPP_
#define _APPLOOP_HPP_

// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <cstdint>
#include <list>
#include <functional>

#include "AppResult.hpp"
#include "AppTime.hpp"

// One-shot timeouts dispatched serially on the calling thread.
// Sources due at the same time run in the order they were added.
struct AppLoop
{
    typedef std::function<AppResult(void)> handler_type;

    struct source_type
    {
        uint32_t id;
        long dueMSec;
        handler_type fn;
    };
    std::list<source_type> sources;
    uint32_t nextId = 1;

    const AppClock& clock;

    explicit AppLoop(const AppClock& clock_) : clock(clock_) {}

    long NowMSec() const { return clock.NowMSec(); }

    uint32_t Add(long delayMSec, handler_type fn);
    void Remove(uint32_t id);
    bool IsPending(uint32_t id) const;

    // msec until the earliest source is due, 0 if overdue, -1 when nothing is pending
    long WaitMSec() const;

    // runs every source that is due, stops at the first failed handler
    AppResult Dispatch();
};

#endif //_APPLOOP_HPP_
