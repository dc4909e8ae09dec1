#pragma once
#ifndef IMOVERLAY_SHARED_X11_H
#define IMOVERLAY_SHARED_X11_H

#include <X11/Xlib.h>

namespace ImOverlay {

// Private connection, separate from the host's, for keymap polling and the
// clipboard. Null until init_x11() succeeds.
Display* get_xdisplay();
bool init_x11();

}

#endif //IMOVERLAY_SHARED_X11_H
