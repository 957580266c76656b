// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <algorithm>
#include <cstring>

#include "AppLoop.hpp"
#include "AppLog.hpp"

#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)
//#define CHATTY

uint32_t AppLoop::Add(long delayMSec, handler_type fn)
{
    uint32_t id = nextId++;
    if(nextId == 0) nextId = 1; // 0 is never a valid id

    sources.push_back({ id, NowMSec() + std::max(delayMSec, 0L), std::move(fn) });

#ifdef CHATTY
    AppLog::Info(__FILENAME__, "add source %u in %ld msec", id, delayMSec);
#endif

    return id;
}

void AppLoop::Remove(uint32_t id)
{
    auto it = std::find_if(sources.begin(), sources.end(), [id](const source_type& s) { return s.id == id; });
    if(it != sources.end()) sources.erase(it);
}

bool AppLoop::IsPending(uint32_t id) const
{
    return sources.end() != std::find_if(sources.begin(), sources.end(), [id](const source_type& s) { return s.id == id; });
}

long AppLoop::WaitMSec() const
{
    if(sources.empty()) return -1;

    auto earliest = std::min_element(sources.begin(), sources.end(),
        [](const source_type& a, const source_type& b) { return a.dueMSec < b.dueMSec; });
    return std::max(earliest->dueMSec - NowMSec(), 0L);
}

AppResult AppLoop::Dispatch()
{
    const long now = NowMSec();
    while(true)
    {
        // nb: rescan every time, handlers add and remove sources
        auto due = sources.end();
        for(auto it = sources.begin(); it != sources.end(); ++it)
        {
            if(it->dueMSec > now) continue;
            if(due == sources.end() || it->dueMSec < due->dueMSec) due = it;
        }
        if(due == sources.end()) break;

        handler_type fn = std::move(due->fn);
#ifdef CHATTY
        AppLog::Info(__FILENAME__, "dispatch source %u", due->id);
#endif
        sources.erase(due);

        AppResult result = fn();
        if(!result) return result;
    }
    return AppResult::Ok();
}
