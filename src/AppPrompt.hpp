#ifndef _APPPROMPT_HPP_
#define _APPPROMPT_HPP_

// Copyright 2025 orthopteroid@gmail.com, MIT License

#include "AppPresenter.hpp"
#include "AppPlatform.hpp"
#include "AppLoop.hpp"

// Break prompt drawn into the platform window, with a postpone button.
struct AppPrompt : AppPresenter
{
    static const int ButtonWidth = 100;
    static const int ButtonHeight = 26;

    AppPlatform& platform;
    AppLoop& loop;

    AppPrompt(AppPlatform& platform_, AppLoop& loop_) : platform(platform_), loop(loop_) {}

    void Show() override;
    void Close() override;

    AppResult HandleEvent(const AppPlatform::Event& event);

    void Render();
    bool HitButton(int x, int y) const;

private:
    AppResult Postpone();
    AppResult Dismiss();
};

#endif //_APPPROMPT_HPP_
