#ifndef _APPTIME_HPP_
#define _APPTIME_HPP_

// Copyright 2025 orthopteroid@gmail.com, MIT License

// milliseconds from an arbitrary epoch, never goes backwards
struct AppClock
{
    virtual ~AppClock() = default;
    virtual long NowMSec() const = 0;
};

struct AppMonotonicClock : AppClock
{
    long NowMSec() const override;
};

inline long AppSeconds(long msec) { return msec / 1000; }

#endif //_APPTIME_HPP_
