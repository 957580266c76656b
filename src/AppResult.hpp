#ifndef _APPRESULT_HPP_
#define _APPRESULT_HPP_

// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <string>

// Outcome of an event handler. A failed result is fatal to the process:
// the loop stops dispatching and app_main exits.
struct AppResult
{
    bool ok = true;
    std::string component;
    std::string what;

    static AppResult Ok() { return AppResult(); }
    static AppResult Fail(const char* szComponent, const char* sz, ...) __attribute__((format(printf, 2, 3)));

    explicit operator bool() const { return ok; }
};

#endif //_APPRESULT_HPP_
