#pragma once
#ifndef IMOVERLAY_INPUT_MANAGER_H
#define IMOVERLAY_INPUT_MANAGER_H

#include <atomic>
#include <mutex>
#include <vector>
#include <variant>
#include <X11/Xlib.h>
#include <imgui.h>
#include "timing.hpp"

namespace ImOverlay {

// What a forwarded event was recognized as.
enum class input_result {
   unknown,
   mouse_move,
   mouse_left,
   mouse_right,
   mouse_middle,
   character,
   scroll,
   zoom,
   key,
};

ImGuiKey keysym_to_imgui_key(KeySym keysym);

// Queues X11 input for the overlay's ImGui context. process() may be called
// from the host's event thread, collect_input() runs on the render thread.
class input_manager {
public:
   explicit input_manager(bool ctrl_wheel_zoom = true);

   input_result process(const XEvent& ev);
   // Key event after keysym lookup. `key` is the unshifted keysym of the
   // physical key, `text` the keysym after modifiers (0 for none) and
   // `state` the X11 modifier mask from before the event.
   input_result on_key(KeySym key, KeySym text, unsigned int state, bool pressed);

   // Sets display size and delta time, then replays queued events into
   // `io`. Returns true if any events were replayed.
   bool collect_input(ImGuiIO& io, ImVec2 display_size);

   bool has_pending() const;
   void clear();
   void set_ctrl_wheel_zoom(bool enable) { ctrl_wheel_zoom = enable; }

   struct mouse_pos_event { float x, y; };
   struct mouse_button_event { int button; bool down; };
   struct wheel_event { float x, y; };
   struct zoom_event { float factor; };
   struct key_event { ImGuiKey key; bool down; };
   struct char_event { unsigned int c; };
   struct focus_event { bool focused; };

   typedef std::variant<mouse_pos_event, mouse_button_event, wheel_event,
                        zoom_event, key_event, char_event, focus_event> input_event;

private:
   struct modifiers {
      bool ctrl = false, shift = false, alt = false, super = false;
   };

   void push(input_event ev);
   void alter_modifiers(unsigned int state);
   void push_modifiers(const modifiers& mods);
   input_result on_button(const XButtonEvent& ev, bool pressed);
   input_result handle_key(KeySym key, KeySym text, unsigned int state, bool pressed);

   std::atomic<bool> ctrl_wheel_zoom;
   mutable std::mutex mtx;
   std::vector<input_event> events;
   modifiers current_mods;
   Clock::time_point last_frame;
   bool first_frame = true;
};

}

#endif //IMOVERLAY_INPUT_MANAGER_H
