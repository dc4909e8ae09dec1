#include <cstdlib>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include "shared_x11.h"
#include "loaders/loader_x11.h"

namespace ImOverlay {

// Holds on to the loader so libX11 outlives the connection at exit.
struct display_closer {
    std::shared_ptr<libx11_loader> libx11;
    void operator()(Display* dpy) const {
        if (dpy && libx11)
            libx11->XCloseDisplay(dpy);
    }
};

static std::unique_ptr<Display, display_closer> display;
static std::once_flag display_once;

static void open_display()
{
    auto libx11 = get_libx11();
    if (!libx11->IsLoaded()) {
        SPDLOG_WARN("libX11 not available, keybinds and clipboard are disabled");
        return;
    }

    const char *name = getenv("DISPLAY");
    if (!name || !*name) {
        SPDLOG_DEBUG("DISPLAY is not set, no X11 connection");
        return;
    }

    display = std::unique_ptr<Display, display_closer>(libx11->XOpenDisplay(name),
                                                       display_closer{libx11});
    if (!display)
        SPDLOG_ERROR("XOpenDisplay failed to open display '{}'", name);
    else
        SPDLOG_DEBUG("private X11 connection to '{}'", name);
}

bool init_x11()
{
    std::call_once(display_once, open_display);
    return display != nullptr;
}

Display* get_xdisplay()
{
    return display.get();
}

}
