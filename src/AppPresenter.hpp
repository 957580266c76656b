#ifndef _APPPRESENTER_HPP_
#define _APPPRESENTER_HPP_

// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <cstdint>
#include <string>
#include <functional>

#include "AppResult.hpp"

// Shows the break prompt and reports how it went away.
struct AppPresenter
{
    enum CloseReason: uint8_t {
        UserDismissed,      // window closed or escaped by the user
        ProgrammaticClose,  // Close() was called
        ActionInvoked       // closed because an action button was used
    };

    static const char* ReasonName(CloseReason reason)
    {
        switch(reason)
        {
            case UserDismissed: return "dismissed";
            case ProgrammaticClose: return "closed";
            case ActionInvoked: return "action";
        }
        return "?";
    }

    std::function<AppResult(CloseReason)> onClosed;
    std::function<AppResult(const std::string&)> onAction;

    virtual ~AppPresenter() = default;

    // both idempotent
    virtual void Show() = 0;
    virtual void Close() = 0;
};

#endif //_APPPRESENTER_HPP_
