// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <cstdlib>
#include <cstring>
#include <cmath>
#include <cerrno>
#include <getopt.h>

#include "AppConfig.hpp"
#include "AppLog.hpp"

#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

enum { OptMinuteMSec = 256 };

// keeps loop due times far from overflow
static const double MaxDurationMSec = 366.0 * 24 * 60 * 60 * 1000;

static const struct option longOptions[] =
{
    { "work",        required_argument, nullptr, 'w' },
    { "break",       required_argument, nullptr, 'b' },
    { "postpone",    required_argument, nullptr, 'p' },
    { "idle",        required_argument, nullptr, 'i' },
    { "debug",       no_argument,       nullptr, 'd' },
    { "minute-msec", required_argument, nullptr, OptMinuteMSec },
    { nullptr, 0, nullptr, 0 }
};

static const char* OptionName(int opt)
{
    for(auto p = longOptions; p->name; p++)
        if(p->val == opt) return p->name;
    return "?";
}

static bool ParseMinutes(const char* sz, double& minutes)
{
    char* pEnd = nullptr;
    errno = 0;
    double value = strtod(sz, &pEnd);
    if(errno != 0 || pEnd == sz || *pEnd != 0 || !std::isfinite(value)) return false;
    minutes = value;
    return true;
}

static bool ParseMSec(const char* sz, long& msec)
{
    char* pEnd = nullptr;
    errno = 0;
    long value = strtol(sz, &pEnd, 10);
    if(errno != 0 || pEnd == sz || *pEnd != 0) return false;
    msec = value;
    return true;
}

AppResult AppConfig::Parse(int argc, char* argv[])
{
    optind = 0; // nb: 0 fully reinitializes glibc getopt, Parse can run more than once
    opterr = 0;

    int opt;
    while(-1 != (opt = getopt_long(argc, argv, ":w:b:p:i:d", longOptions, nullptr)))
    {
        bool valid = true;
        switch(opt)
        {
            case 'w': valid = ParseMinutes(optarg, workMin); break;
            case 'b': valid = ParseMinutes(optarg, breakMin); break;
            case 'p': valid = ParseMinutes(optarg, postponeMin); break;
            case 'i': valid = ParseMinutes(optarg, idleMin); break;
            case 'd': debug = true; break;
            case OptMinuteMSec: valid = ParseMSec(optarg, minuteMSec); break;
            case ':':
                if(optopt == OptMinuteMSec)
                    return AppResult::Fail(__FILENAME__, "option '--minute-msec' requires an argument");
                return AppResult::Fail(__FILENAME__, "option '-%c' requires an argument", optopt);
            default:
                if(optopt) return AppResult::Fail(__FILENAME__, "unrecognized option '-%c'", optopt);
                return AppResult::Fail(__FILENAME__, "unrecognized option '%s'", argv[optind - 1]);
        }
        if(!valid)
            return AppResult::Fail(__FILENAME__, "option '--%s' has invalid value '%s'", OptionName(opt), optarg);
    }

    if(optind < argc)
        return AppResult::Fail(__FILENAME__, "unexpected argument '%s'", argv[optind]);

    return Validate();
}

AppResult AppConfig::Validate() const
{
    if(minuteMSec <= 0)
        return AppResult::Fail(__FILENAME__, "minute-msec must be positive, got %ld", minuteMSec);

    const struct { const char* szName; double minutes; } durations[] =
    {
        { "work", workMin }, { "break", breakMin }, { "postpone", postponeMin }, { "idle", idleMin }
    };
    for(auto& d: durations)
    {
        if(d.minutes * double(minuteMSec) > MaxDurationMSec)
            return AppResult::Fail(__FILENAME__, "%s duration must be at most a year, got %g minutes", d.szName, d.minutes);
        if(!(d.minutes > 0) || ToMSec(d.minutes) <= 0)
            return AppResult::Fail(__FILENAME__, "%s duration must be positive, got %g minutes", d.szName, d.minutes);
    }

    // idle could never be noticed before every work interval ran out
    if(ToMSec(idleMin) >= ToMSec(workMin))
        return AppResult::Fail(__FILENAME__, "idle threshold (%g minutes) must be shorter than work duration (%g minutes)",
            idleMin, workMin);

    if(ToMSec(idleMin) >= ToMSec(breakMin))
        AppLog::Warn(__FILENAME__, "idle threshold (%g minutes) is not shorter than break duration (%g minutes), "
            "any detected idle counts as a full break", idleMin, breakMin);

    return AppResult::Ok();
}

long AppConfig::ToMSec(double minutes) const
{
    return long(std::llround(minutes * double(minuteMSec)));
}

AppScheduler::Durations AppConfig::Durations() const
{
    AppScheduler::Durations d;
    d.workMSec = ToMSec(workMin);
    d.breakMSec = ToMSec(breakMin);
    d.postponeMSec = ToMSec(postponeMin);
    d.idleMSec = ToMSec(idleMin);
    return d;
}

void AppConfig::Usage(FILE* pFile, const char* szProgram)
{
    fprintf(pFile,
        "usage: %s [-w|--work MIN] [-b|--break MIN] [-p|--postpone MIN] [-i|--idle MIN] [-d|--debug]\n"
        "  -w, --work MIN      minutes of work between breaks (default 60)\n"
        "  -b, --break MIN     minutes of idle that count as a break (default 5)\n"
        "  -p, --postpone MIN  minutes before a dismissed reminder returns (default 5)\n"
        "  -i, --idle MIN      minutes without input before the user is idle (default 1)\n"
        "  -d, --debug         verbose logging\n"
        "      --minute-msec N length of a minute in milliseconds (default 60000)\n",
        szProgram);
}
