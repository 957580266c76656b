// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <stdarg.h>
#include <stdlib.h>
#include <cstdio>
#include <ctime>

#include "AppLog.hpp"

namespace AppLog {

static bool verbose = false;

void SetVerbose(bool verbose_) { verbose = verbose_; }

static void Emit(FILE* pFile, const char* szLevel, const char* szComponent, const char* sz, va_list args)
{
    char szStamp[32];
    time_t now = time(nullptr);
    struct tm local;
    localtime_r(&now, &local);
    strftime(szStamp, sizeof(szStamp), "%Y-%m-%d %H:%M:%S", &local);

    fprintf(pFile, "%s %-5s %s: ", szStamp, szLevel, szComponent);
    vfprintf(pFile, sz, args);
    fputc('\n', pFile);

    fflush(pFile); // nb: journald only sees whole lines
}

void Info(const char *szComponent, const char *sz, ...)
{
    if(!verbose) return;

    va_list args;
    va_start(args, sz);
    Emit(stdout, "INFO", szComponent, sz, args);
    va_end(args);
}

void Warn(const char *szComponent, const char *sz, ...)
{
    va_list args;
    va_start(args, sz);
    Emit(stdout, "WARN", szComponent, sz, args);
    va_end(args);
}

void Err(const char *szComponent, const char *sz, ...)
{
    va_list args;
    va_start(args, sz);
    Emit(stderr, "ERROR", szComponent, sz, args);
    va_end(args);
}

};
