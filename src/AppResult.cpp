// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <stdarg.h>
#include <cstdio>

#include "AppResult.hpp"

AppResult AppResult::Fail(const char* szComponent, const char* sz, ...)
{
    char buf[512];

    va_list args;
    va_start(args, sz);
    vsnprintf(buf, sizeof(buf), sz, args);
    va_end(args);

    AppResult result;
    result.ok = false;
    result.component = szComponent;
    result.what = buf;
    return result;
}
