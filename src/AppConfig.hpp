#ifndef _APPCONFIG_HPP_
#define _APPCONFIG_HPP_

// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <cstdio>

#include "AppResult.hpp"
#include "AppScheduler.hpp"

// command line options, durations in (possibly fractional) minutes
struct AppConfig
{
    double workMin = 60;
    double breakMin = 5;
    double postponeMin = 5;
    double idleMin = 1;
    bool debug = false;
    long minuteMSec = 60 * 1000; // test hook, shrinks a minute for manual runs

    AppResult Parse(int argc, char* argv[]);
    AppResult Validate() const;

    long ToMSec(double minutes) const;
    AppScheduler::Durations Durations() const;

    static void Usage(FILE* pFile, const char* szProgram);
};

#endif //_APPCONFIG_HPP_
