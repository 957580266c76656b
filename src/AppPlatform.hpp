#ifndef _APPPLATFORM_HPP_
#define _APPPLATFORM_HPP_

// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <cstdint>
#include <functional>

#include "AppResult.hpp"

// Window system binding: one prompt window, the session idle counter,
// and an event pump that sleeps until input, a signal or a timeout.
struct AppPlatform
{
    struct Event
    {
        static const char KeyEscape = 27;

        enum Kind: uint8_t {
            Adornment, Key, Touch, Quit,
            Close, Refresh, // adornments
            Begin // touch
        };

        Kind kind;
        union U_
        {
            struct Adornment_
            {
                Kind adKind;
            } adornment;
            struct Key_
            {
                char key;
            } key;
            struct Touch_
            {
                Kind toKind;
                int16_t x, y;
            } touch; // mouse button press
        } u;
    };

    static const int Width = 360;
    static const int Height = 140;

    AppResult Bind(const char* szWindowname);
    void Release();

    // waitMSec < 0 waits until an event arrives
    AppResult Tick(long waitMSec, std::function<AppResult(const Event &)> fnEvent);

    // msec since the last keyboard or pointer input anywhere in the session
    AppResult QueryIdle(long& idleMSec);

    void Show();
    void Hide();
    bool IsShown() const;

    void Clear();
    void DrawText(int x, int y, const char* sz);
    void DrawFrame(int x, int y, int w, int h);
    int TextWidth(const char* sz);
    void Flush();
};

#endif //_APPPLATFORM_HPP_
