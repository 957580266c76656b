// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <time.h>

#include "AppTime.hpp"

long AppMonotonicClock::NowMSec() const
{
    struct timespec spec;
    clock_gettime(CLOCK_MONOTONIC, &spec);
    return spec.tv_sec * 1000 + spec.tv_nsec / 1000000;
}
