#pragma once
#ifndef IMOVERLAY_KEYBINDS_H
#define IMOVERLAY_KEYBINDS_H

#include <vector>
#include "timing.hpp"
#include "overlay_params.h"

namespace ImOverlay {

// True when every key of a non-empty combination is held, polled through
// the private X11 connection.
bool keys_are_pressed(const std::vector<KeySym>& keys);

struct keybind_state {
   Clock::time_point last_check;
   Clock::time_point last_toggle_press;
};

// Polls the keymap at most every 100ms. Returns true when the overlay
// toggle combination was pressed, at most once per 400ms.
bool check_keybinds(keybind_state& state, const overlay_params& params);

}

#endif //IMOVERLAY_KEYBINDS_H
