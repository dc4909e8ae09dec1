#include <spdlog/spdlog.h>
#include "keybinds.h"
#include "shared_x11.h"
#include "loaders/loader_x11.h"

namespace ImOverlay {

bool keys_are_pressed(const std::vector<KeySym>& keys) {

    if (keys.empty() || !init_x11())
        return false;

    auto libx11 = get_libx11();
    char keys_return[32];
    size_t pressed = 0;

    libx11->XQueryKeymap(get_xdisplay(), keys_return);

    for (KeySym ks : keys) {
        KeyCode kc2 = libx11->XKeysymToKeycode(get_xdisplay(), ks);
        if (!kc2)
            return false;

        if (keys_return[kc2 >> 3] & (1 << (kc2 & 7)))
            pressed++;
    }

    return pressed == keys.size();
}

bool check_keybinds(keybind_state& state, const overlay_params& params) {
   auto now = Clock::now();

   if (now - state.last_check < 100ms)
      return false;
   state.last_check = now;

   const auto keyPressDelay = 400ms;

   if (now - state.last_toggle_press >= keyPressDelay &&
       keys_are_pressed(params.toggle_overlay)) {
      state.last_toggle_press = now;
      SPDLOG_DEBUG("overlay toggle pressed");
      return true;
   }

   return false;
}

}
