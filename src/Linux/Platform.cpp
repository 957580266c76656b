// Copyright 2025 orthopteroid@gmail.com, MIT License

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <algorithm>
#include <functional>
#include <csignal>

#include <unistd.h>
#include <time.h>
#include <signal.h>
#include <sys/select.h>

#include <X11/X.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/Xatom.h>
#include <X11/keysym.h>
#include <X11/extensions/scrnsaver.h>

#include "AppPlatform.hpp"
#include "AppLog.hpp"

#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

const char AppPlatform::Event::KeyEscape;
const int AppPlatform::Width;
const int AppPlatform::Height;

struct State
{
    // window
    Display* xDisplayPtr = 0;
    Window xWindow = 0;
    Atom xWMDeleteWindowAtom;
    GC xGC = 0;
    XFontStruct* xFontPtr = 0;
    bool shown = false;

    // idle
    XScreenSaverInfo* xssInfoPtr = 0;

    // platform
    int windowFD = -1;
    fd_set fdReadSet;
    sigset_t origMask;
    bool maskSaved = false;
};
static State state;

static volatile sig_atomic_t quitSignal = 0;

static void OnSignal(int sig)
{
    quitSignal = sig;
}

AppResult AppPlatform::Bind(const char* szWindowname)
{
    state.xDisplayPtr = XOpenDisplay( NULL );
    if( state.xDisplayPtr == NULL )
        return AppResult::Fail(__FILENAME__, "cannot open display '%s'", XDisplayName( NULL ));

    int eventBase, errorBase;
    if( !XScreenSaverQueryExtension( state.xDisplayPtr, &eventBase, &errorBase ))
        return AppResult::Fail(__FILENAME__, "MIT-SCREEN-SAVER extension unavailable, cannot detect idle");

    state.xssInfoPtr = XScreenSaverAllocInfo();
    if( !state.xssInfoPtr )
        return AppResult::Fail(__FILENAME__, "XScreenSaverAllocInfo failed");

    int screen = DefaultScreen( state.xDisplayPtr );

    XSetWindowAttributes swa;
    swa.background_pixel  = WhitePixel( state.xDisplayPtr, screen );
    swa.border_pixel      = 0;
    swa.event_mask        =
        ExposureMask |
        KeyPressMask |
        ButtonPressMask |
        StructureNotifyMask;

    state.xWindow = XCreateWindow(
        state.xDisplayPtr,
        RootWindow( state.xDisplayPtr, screen ),
        0, 0, Width, Height, 0, CopyFromParent, InputOutput,
        CopyFromParent,
        CWBackPixel|CWBorderPixel|CWEventMask, &swa
    );

    XStoreName( state.xDisplayPtr, state.xWindow, szWindowname );

    // fixed size, the layout is not responsive
    XSizeHints* sizeHintsPtr = XAllocSizeHints();
    if( sizeHintsPtr )
    {
        sizeHintsPtr->flags = PMinSize | PMaxSize;
        sizeHintsPtr->min_width = sizeHintsPtr->max_width = Width;
        sizeHintsPtr->min_height = sizeHintsPtr->max_height = Height;
        XSetWMNormalHints( state.xDisplayPtr, state.xWindow, sizeHintsPtr );
        XFree( sizeHintsPtr );
    }

    // ask the window-manager to keep the prompt above other windows
    Atom wmStateAtom = XInternAtom( state.xDisplayPtr, "_NET_WM_STATE", False );
    Atom wmAboveAtom = XInternAtom( state.xDisplayPtr, "_NET_WM_STATE_ABOVE", False );
    XChangeProperty( state.xDisplayPtr, state.xWindow, wmStateAtom, XA_ATOM, 32, PropModeReplace,
                     (unsigned char*) &wmAboveAtom, 1 );

    // register a new atom for window-manager close-events for delivery to the event-queue
    state.xWMDeleteWindowAtom = XInternAtom( state.xDisplayPtr, "WM_DELETE_WINDOW", True );
    XSetWMProtocols( state.xDisplayPtr, state.xWindow, &state.xWMDeleteWindowAtom, 1 );

    state.xGC = XCreateGC( state.xDisplayPtr, state.xWindow, 0, NULL );
    XSetForeground( state.xDisplayPtr, state.xGC, BlackPixel( state.xDisplayPtr, screen ));
    state.xFontPtr = XLoadQueryFont( state.xDisplayPtr, "fixed" );
    if( state.xFontPtr )
        XSetFont( state.xDisplayPtr, state.xGC, state.xFontPtr->fid );
    else
        AppLog::Warn(__FILENAME__, "font 'fixed' not found, using server default");

    XSync( state.xDisplayPtr, false );

    // get fd/socket of X display
    state.windowFD = ConnectionNumber( state.xDisplayPtr );

    // signals stay blocked except while waiting in pselect
    struct sigaction sa;
    memset( &sa, 0, sizeof(sa) );
    sa.sa_handler = OnSignal;
    sigemptyset( &sa.sa_mask );
    sigaction( SIGINT, &sa, NULL );
    sigaction( SIGTERM, &sa, NULL );

    sigset_t blockMask;
    sigemptyset( &blockMask );
    sigaddset( &blockMask, SIGINT );
    sigaddset( &blockMask, SIGTERM );
    sigprocmask( SIG_BLOCK, &blockMask, &state.origMask );
    state.maskSaved = true;

    AppLog::Info(__FILENAME__, "%s bound to display %s", __func__, DisplayString( state.xDisplayPtr ));
    return AppResult::Ok();
}

void AppPlatform::Release()
{
    if( state.maskSaved )
    {
        sigprocmask( SIG_SETMASK, &state.origMask, NULL );
        state.maskSaved = false;
    }

    if( !state.xDisplayPtr ) return;

    if( state.xssInfoPtr ) { XFree( state.xssInfoPtr ); state.xssInfoPtr = 0; }
    if( state.xFontPtr ) { XFreeFont( state.xDisplayPtr, state.xFontPtr ); state.xFontPtr = 0; }
    if( state.xGC ) { XFreeGC( state.xDisplayPtr, state.xGC ); state.xGC = 0; }
    if( state.xWindow ) { XDestroyWindow( state.xDisplayPtr, state.xWindow ); state.xWindow = 0; }

    XCloseDisplay( state.xDisplayPtr );
    state.xDisplayPtr = 0;
    state.windowFD = -1;
    state.shown = false;
}

AppResult AppPlatform::Tick(long waitMSec, std::function<AppResult(const Event &)> fnEvent)
{
    // nb: Xlib may already hold events read off the socket, don't sleep on them
    if( !quitSignal && XPending( state.xDisplayPtr ) == 0 )
    {
        struct timespec timeout;
        struct timespec* pTimeout = NULL;
        if( waitMSec >= 0 )
        {
            timeout.tv_sec = waitMSec / 1000;
            timeout.tv_nsec = (waitMSec % 1000) * 1000 * 1000;
            pTimeout = &timeout;
        }

        FD_ZERO( &state.fdReadSet );
        FD_SET( state.windowFD, &state.fdReadSet ); // set x-event bit
        int fdReadyCount = pselect( state.windowFD + 1, &state.fdReadSet, NULL, NULL, pTimeout,
                                    &state.origMask ); // nb: signals only land here
        if( fdReadyCount < 0 && errno != EINTR )
            return AppResult::Fail(__FILENAME__, "pselect failed: %s", strerror( errno ));
    }

    Event event;

    if( quitSignal )
    {
        AppLog::Info(__FILENAME__, "caught signal %d", int( quitSignal ));
        quitSignal = 0;
        event.kind = Event::Quit;
        return fnEvent( event );
    }

    KeySym keysym = 0;
    char buf[2];

    XEvent xEvent;
    while( XPending( state.xDisplayPtr )) // gobble messages in batches
    {
        XNextEvent( state.xDisplayPtr, &xEvent );
        AppResult result;
        switch( xEvent.type )
        {
            case Expose:
                if( xEvent.xexpose.count != 0 ) break; // only the last of a series
                event.kind = Event::Adornment;
                event.u.adornment.adKind = Event::Kind::Refresh;
                result = fnEvent( event );
                break;
            case ClientMessage:
                if((unsigned long) xEvent.xclient.data.l[0] == state.xWMDeleteWindowAtom )
                {
                    event.kind = Event::Adornment;
                    event.u.adornment.adKind = Event::Kind::Close;
                    result = fnEvent( event );
                }
                break;
            case KeyPress:
                event.kind = Event::Key;
                if( 0 < XLookupString( &xEvent.xkey, buf, 1, &keysym, nullptr ))
                {
                    event.u.key.key = keysym == XK_Escape ? Event::KeyEscape : (char) keysym; // may be non-ascii
                    result = fnEvent( event );
                }
                break;
            case ButtonPress:
                if( xEvent.xbutton.button != Button1 ) break;
                event.kind = Event::Touch;
                event.u.touch.toKind = Event::Kind::Begin;
                event.u.touch.x = int16_t( xEvent.xbutton.x );
                event.u.touch.y = int16_t( xEvent.xbutton.y );
                result = fnEvent( event );
                break;
            default:
                break;
        }
        if( !result ) return result;
    }

    return AppResult::Ok();
}

AppResult AppPlatform::QueryIdle(long& idleMSec)
{
    if( !XScreenSaverQueryInfo( state.xDisplayPtr, DefaultRootWindow( state.xDisplayPtr ), state.xssInfoPtr ))
        return AppResult::Fail(__FILENAME__, "XScreenSaverQueryInfo failed");

    idleMSec = long( state.xssInfoPtr->idle );
    return AppResult::Ok();
}

void AppPlatform::Show()
{
    if( state.shown ) return;
    state.shown = true;
    XMapRaised( state.xDisplayPtr, state.xWindow );
    XFlush( state.xDisplayPtr );
}

void AppPlatform::Hide()
{
    if( !state.shown ) return;
    state.shown = false;
    XUnmapWindow( state.xDisplayPtr, state.xWindow );
    XFlush( state.xDisplayPtr );
}

bool AppPlatform::IsShown() const
{
    return state.shown;
}

void AppPlatform::Clear()
{
    XClearWindow( state.xDisplayPtr, state.xWindow );
}

void AppPlatform::DrawText(int x, int y, const char* sz)
{
    XDrawString( state.xDisplayPtr, state.xWindow, state.xGC, x, y, sz, int( strlen( sz )));
}

void AppPlatform::DrawFrame(int x, int y, int w, int h)
{
    XDrawRectangle( state.xDisplayPtr, state.xWindow, state.xGC, x, y, (unsigned) w, (unsigned) h );
}

int AppPlatform::TextWidth(const char* sz)
{
    if( !state.xFontPtr ) return 6 * int( strlen( sz )); // server default is about 6px wide
    return XTextWidth( state.xFontPtr, sz, int( strlen( sz )));
}

void AppPlatform::Flush()
{
    XFlush( state.xDisplayPtr );
}

extern int app_main(int argc, char* argv[]);

int main(int argc, char *argv[])
{
    return app_main(argc, argv);
}
