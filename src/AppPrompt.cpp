// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <cstring>

#include "AppPrompt.hpp"
#include "AppLog.hpp"

#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

const int AppPrompt::ButtonWidth;
const int AppPrompt::ButtonHeight;

static const char* szTitle = "Break Time";
static const char* szBodyArr[] = {
    "Step away from the keyboard for a few minutes.",
    "This closes by itself once you have been away.",
};
static const char* szButton = "Postpone";

static int ButtonLeft() { return (AppPlatform::Width - AppPrompt::ButtonWidth) / 2; }
static int ButtonTop() { return AppPlatform::Height - AppPrompt::ButtonHeight - 14; }

void AppPrompt::Show()
{
    if( platform.IsShown() ) return;

    AppLog::Info(__FILENAME__, "show");
    platform.Show(); // drawn on expose
}

void AppPrompt::Close()
{
    if( !platform.IsShown() ) return;

    AppLog::Info(__FILENAME__, "close");
    platform.Hide();

    // report later, the caller is usually the scheduler itself
    loop.Add(0, [this]() { return onClosed ? onClosed(ProgrammaticClose) : AppResult::Ok(); });
}

AppResult AppPrompt::HandleEvent(const AppPlatform::Event& event)
{
    if( !platform.IsShown() ) return AppResult::Ok(); // stale input for a hidden window

    switch( event.kind )
    {
        case AppPlatform::Event::Adornment:
            if( event.u.adornment.adKind == AppPlatform::Event::Refresh )
                Render();
            else if( event.u.adornment.adKind == AppPlatform::Event::Close )
                return Dismiss();
            break;
        case AppPlatform::Event::Key:
            if( event.u.key.key == 'p' || event.u.key.key == 'P' )
                return Postpone();
            if( event.u.key.key == AppPlatform::Event::KeyEscape )
                return Dismiss();
            break;
        case AppPlatform::Event::Touch:
            if( event.u.touch.toKind == AppPlatform::Event::Begin && HitButton( event.u.touch.x, event.u.touch.y ))
                return Postpone();
            break;
        default:
            break;
    }
    return AppResult::Ok();
}

void AppPrompt::Render()
{
    platform.Clear();

    platform.DrawText( 20, 30, szTitle );
    int y = 58;
    for( auto sz: szBodyArr )
    {
        platform.DrawText( 20, y, sz );
        y += 18;
    }

    platform.DrawFrame( ButtonLeft(), ButtonTop(), ButtonWidth, ButtonHeight );
    platform.DrawText( ButtonLeft() + (ButtonWidth - platform.TextWidth( szButton )) / 2,
                       ButtonTop() + ButtonHeight / 2 + 4, szButton );

    platform.Flush();
}

bool AppPrompt::HitButton(int x, int y) const
{
    return x >= ButtonLeft() && x < ButtonLeft() + ButtonWidth &&
           y >= ButtonTop() && y < ButtonTop() + ButtonHeight;
}

AppResult AppPrompt::Postpone()
{
    AppLog::Info(__FILENAME__, "postpone pressed");
    platform.Hide();

    if( onAction )
    {
        AppResult result = onAction( "postpone" );
        if( !result ) return result;
    }
    return onClosed ? onClosed( ActionInvoked ) : AppResult::Ok();
}

AppResult AppPrompt::Dismiss()
{
    AppLog::Info(__FILENAME__, "dismissed");
    platform.Hide();
    return onClosed ? onClosed( UserDismissed ) : AppResult::Ok();
}
