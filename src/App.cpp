// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>

#include "AppPlatform.hpp"
#include "AppTime.hpp"
#include "AppLog.hpp"
#include "AppLoop.hpp"
#include "AppConfig.hpp"
#include "AppIdleMonitor.hpp"
#include "AppPrompt.hpp"
#include "AppScheduler.hpp"

#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

const int kUsageExit = 2;

AppPlatform platform;

static void LogFailure(const AppResult& result)
{
    AppLog::Err(result.component.c_str(), "%s", result.what.c_str());
}

static int app_run(const AppConfig& config)
{
    AppMonotonicClock clock;
    AppLoop loop(clock);
    AppIdleMonitor idle(loop, [](long& idleMSec) { return platform.QueryIdle(idleMSec); });
    AppPrompt prompt(platform, loop);
    AppScheduler scheduler(loop, idle, prompt, config.Durations());

    bool appQuit = false;
    auto fnEvent = [&](const AppPlatform::Event& event)
    {
        if(event.kind == AppPlatform::Event::Quit)
        {
            appQuit = true;
            return AppResult::Ok();
        }
        return prompt.HandleEvent(event);
    };

    AppResult result = scheduler.Start();
    while(result && !appQuit)
    {
        result = loop.Dispatch();
        if(!result) break;

        result = platform.Tick(loop.WaitMSec(), fnEvent);
    }

    // handler state is suspect after a failure, leave without touching it
    if(!result)
    {
        LogFailure(result);
        return EXIT_FAILURE;
    }

    AppLog::Info(__FILENAME__, "shutting down");
    scheduler.Shutdown();
    platform.Flush();
    return EXIT_SUCCESS;
}

int app_main(int argc, char* argv[])
{
    AppConfig config;
    AppResult result = config.Parse(argc, argv);
    if(!result)
    {
        fprintf(stderr, "%s: %s\n", argv[0], result.what.c_str());
        AppConfig::Usage(stderr, argv[0]);
        return kUsageExit;
    }

    AppLog::SetVerbose(config.debug);

    result = platform.Bind("Break Reminder");
    if(!result)
    {
        LogFailure(result);
        platform.Release();
        return EXIT_FAILURE;
    }

    int status;
    try
    {
        status = app_run(config);
    }
    catch(const std::exception& e)
    {
        AppLog::Err(__FILENAME__, "exception in event handler: %s", e.what());
        status = EXIT_FAILURE;
    }

    platform.Release();
    return status;
}
