#include <cfloat>
#include <cstdint>
#include <algorithm>
#include <type_traits>
#include <X11/keysym.h>
#include <xkbcommon/xkbcommon.h>
#include <spdlog/spdlog.h>
#include "input_manager.h"
#include "loaders/loader_x11.h"

namespace ImOverlay {

ImGuiKey keysym_to_imgui_key(KeySym keysym)
{
   if (keysym >= XK_a && keysym <= XK_z)
      return ImGuiKey(ImGuiKey_A + (keysym - XK_a));
   if (keysym >= XK_A && keysym <= XK_Z)
      return ImGuiKey(ImGuiKey_A + (keysym - XK_A));
   if (keysym >= XK_0 && keysym <= XK_9)
      return ImGuiKey(ImGuiKey_0 + (keysym - XK_0));
   if (keysym >= XK_KP_0 && keysym <= XK_KP_9)
      return ImGuiKey(ImGuiKey_Keypad0 + (keysym - XK_KP_0));
   if (keysym >= XK_F1 && keysym <= XK_F12)
      return ImGuiKey(ImGuiKey_F1 + (keysym - XK_F1));

   switch (keysym) {
   case XK_BackSpace: return ImGuiKey_Backspace;
   case XK_Tab:
   case XK_ISO_Left_Tab: return ImGuiKey_Tab;
   case XK_Return: return ImGuiKey_Enter;
   case XK_Escape: return ImGuiKey_Escape;
   case XK_space: return ImGuiKey_Space;
   case XK_Page_Up: return ImGuiKey_PageUp;
   case XK_Page_Down: return ImGuiKey_PageDown;
   case XK_End: return ImGuiKey_End;
   case XK_Home: return ImGuiKey_Home;
   case XK_Left: return ImGuiKey_LeftArrow;
   case XK_Up: return ImGuiKey_UpArrow;
   case XK_Right: return ImGuiKey_RightArrow;
   case XK_Down: return ImGuiKey_DownArrow;
   case XK_Insert: return ImGuiKey_Insert;
   case XK_Delete: return ImGuiKey_Delete;
   case XK_Caps_Lock: return ImGuiKey_CapsLock;
   case XK_Num_Lock: return ImGuiKey_NumLock;
   case XK_Scroll_Lock: return ImGuiKey_ScrollLock;
   case XK_Print: return ImGuiKey_PrintScreen;
   case XK_Pause: return ImGuiKey_Pause;
   case XK_Menu: return ImGuiKey_Menu;

   case XK_semicolon: return ImGuiKey_Semicolon;
   case XK_equal: return ImGuiKey_Equal;
   case XK_comma: return ImGuiKey_Comma;
   case XK_minus: return ImGuiKey_Minus;
   case XK_period: return ImGuiKey_Period;
   case XK_slash: return ImGuiKey_Slash;
   case XK_grave: return ImGuiKey_GraveAccent;
   case XK_bracketleft: return ImGuiKey_LeftBracket;
   case XK_backslash: return ImGuiKey_Backslash;
   case XK_bracketright: return ImGuiKey_RightBracket;
   case XK_apostrophe: return ImGuiKey_Apostrophe;

   // keypad with num lock off
   case XK_KP_Insert: return ImGuiKey_Keypad0;
   case XK_KP_End: return ImGuiKey_Keypad1;
   case XK_KP_Down: return ImGuiKey_Keypad2;
   case XK_KP_Page_Down: return ImGuiKey_Keypad3;
   case XK_KP_Left: return ImGuiKey_Keypad4;
   case XK_KP_Begin: return ImGuiKey_Keypad5;
   case XK_KP_Right: return ImGuiKey_Keypad6;
   case XK_KP_Home: return ImGuiKey_Keypad7;
   case XK_KP_Up: return ImGuiKey_Keypad8;
   case XK_KP_Page_Up: return ImGuiKey_Keypad9;
   case XK_KP_Delete:
   case XK_KP_Decimal: return ImGuiKey_KeypadDecimal;
   case XK_KP_Divide: return ImGuiKey_KeypadDivide;
   case XK_KP_Multiply: return ImGuiKey_KeypadMultiply;
   case XK_KP_Subtract: return ImGuiKey_KeypadSubtract;
   case XK_KP_Add: return ImGuiKey_KeypadAdd;
   case XK_KP_Enter: return ImGuiKey_KeypadEnter;
   case XK_KP_Equal: return ImGuiKey_KeypadEqual;

   case XK_Shift_L: return ImGuiKey_LeftShift;
   case XK_Shift_R: return ImGuiKey_RightShift;
   case XK_Control_L: return ImGuiKey_LeftCtrl;
   case XK_Control_R: return ImGuiKey_RightCtrl;
   case XK_Alt_L: return ImGuiKey_LeftAlt;
   case XK_Alt_R: return ImGuiKey_RightAlt;
   case XK_Super_L: return ImGuiKey_LeftSuper;
   case XK_Super_R: return ImGuiKey_RightSuper;
   default: return ImGuiKey_None;
   }
}

input_manager::input_manager(bool ctrl_wheel_zoom)
   : ctrl_wheel_zoom(ctrl_wheel_zoom)
{
}

void input_manager::push(input_event ev)
{
   events.push_back(std::move(ev));
}

void input_manager::push_modifiers(const modifiers& mods)
{
   if (mods.ctrl != current_mods.ctrl)
      push(key_event{ImGuiMod_Ctrl, mods.ctrl});
   if (mods.shift != current_mods.shift)
      push(key_event{ImGuiMod_Shift, mods.shift});
   if (mods.alt != current_mods.alt)
      push(key_event{ImGuiMod_Alt, mods.alt});
   if (mods.super != current_mods.super)
      push(key_event{ImGuiMod_Super, mods.super});
   current_mods = mods;
}

void input_manager::alter_modifiers(unsigned int state)
{
   modifiers mods;
   mods.ctrl = state & ControlMask;
   mods.shift = state & ShiftMask;
   mods.alt = state & Mod1Mask;
   mods.super = state & Mod4Mask;
   push_modifiers(mods);
}

input_result input_manager::on_button(const XButtonEvent& ev, bool pressed)
{
   alter_modifiers(ev.state);

   switch (ev.button) {
   case Button1:
   case Button2:
   case Button3:
   case 8:
   case 9: {
      // X11 numbers middle before right, ImGui the other way around
      int button = 0;
      input_result result = input_result::mouse_left;
      switch (ev.button) {
      case Button2: button = ImGuiMouseButton_Middle; result = input_result::mouse_middle; break;
      case Button3: button = ImGuiMouseButton_Right; result = input_result::mouse_right; break;
      case 8: button = 3; result = input_result::mouse_middle; break;
      case 9: button = 4; result = input_result::mouse_middle; break;
      default: break;
      }
      push(mouse_pos_event{float(int16_t(ev.x)), float(int16_t(ev.y))});
      push(mouse_button_event{button, pressed});
      return result;
   }
   case Button4:
   case Button5:
   case 6:
   case 7: {
      // wheel "buttons" send a press and a release per notch
      if (!pressed)
         return input_result::scroll;

      const bool vertical = ev.button == Button4 || ev.button == Button5;
      const float delta = (ev.button == Button4 || ev.button == 6) ? 1.f : -1.f;

      if (ctrl_wheel_zoom && (ev.state & ControlMask)) {
         push(zoom_event{delta > 0 ? 1.5f : 0.5f});
         return input_result::zoom;
      }

      push(mouse_pos_event{float(int16_t(ev.x)), float(int16_t(ev.y))});
      if (vertical)
         push(wheel_event{0.f, delta});
      else
         push(wheel_event{delta, 0.f});
      return input_result::scroll;
   }
   default:
      return input_result::unknown;
   }
}

input_result input_manager::handle_key(KeySym key, KeySym text, unsigned int state, bool pressed)
{
   modifiers mods;
   mods.ctrl = state & ControlMask;
   mods.shift = state & ShiftMask;
   mods.alt = state & Mod1Mask;
   mods.super = state & Mod4Mask;

   // the state mask predates the event itself
   switch (key) {
   case XK_Control_L: case XK_Control_R: mods.ctrl = pressed; break;
   case XK_Shift_L: case XK_Shift_R: mods.shift = pressed; break;
   case XK_Alt_L: case XK_Alt_R: mods.alt = pressed; break;
   case XK_Super_L: case XK_Super_R: mods.super = pressed; break;
   default: break;
   }
   push_modifiers(mods);

   input_result result = input_result::unknown;
   ImGuiKey imkey = keysym_to_imgui_key(key);
   if (imkey != ImGuiKey_None) {
      push(key_event{imkey, pressed});
      result = input_result::key;
   }

   if (pressed && text && !(mods.ctrl && !mods.alt)) {
      uint32_t c = xkb_keysym_to_utf32(text);
      if (c >= 0x20 && c != 0x7f && !(c >= 0x80 && c < 0xa0)) {
         push(char_event{c});
         if (result == input_result::unknown)
            result = input_result::character;
      }
   }

   return result;
}

input_result input_manager::on_key(KeySym key, KeySym text, unsigned int state, bool pressed)
{
   std::lock_guard lk(mtx);
   return handle_key(key, text, state, pressed);
}

input_result input_manager::process(const XEvent& ev)
{
   switch (ev.type) {
   case MotionNotify: {
      std::lock_guard lk(mtx);
      alter_modifiers(ev.xmotion.state);
      push(mouse_pos_event{float(int16_t(ev.xmotion.x)), float(int16_t(ev.xmotion.y))});
      return input_result::mouse_move;
   }
   case EnterNotify: {
      std::lock_guard lk(mtx);
      push(mouse_pos_event{float(int16_t(ev.xcrossing.x)), float(int16_t(ev.xcrossing.y))});
      return input_result::mouse_move;
   }
   case LeaveNotify: {
      std::lock_guard lk(mtx);
      push(mouse_pos_event{-FLT_MAX, -FLT_MAX});
      return input_result::mouse_move;
   }
   case ButtonPress:
   case ButtonRelease: {
      std::lock_guard lk(mtx);
      return on_button(ev.xbutton, ev.type == ButtonPress);
   }
   case KeyPress:
   case KeyRelease: {
      auto libx11 = get_libx11();
      if (!libx11->IsLoaded()) {
         static bool warned = false;
         if (!warned) {
            SPDLOG_WARN("libX11 not loaded, keyboard input is ignored");
            warned = true;
         }
         return input_result::unknown;
      }

      XKeyEvent key_ev = ev.xkey;
      KeySym key = libx11->XLookupKeysym(&key_ev, 0);
      KeySym text = NoSymbol;
      char buf[32];
      libx11->XLookupString(&key_ev, buf, sizeof(buf), &text, nullptr);

      std::lock_guard lk(mtx);
      return handle_key(key, text, ev.xkey.state, ev.type == KeyPress);
   }
   case FocusIn:
   case FocusOut: {
      std::lock_guard lk(mtx);
      push(focus_event{ev.type == FocusIn});
      // ImGui drops held keys and modifiers on focus loss
      if (ev.type == FocusOut)
         current_mods = modifiers();
      return input_result::unknown;
   }
   default:
      return input_result::unknown;
   }
}

bool input_manager::collect_input(ImGuiIO& io, ImVec2 display_size)
{
   auto now = Clock::now();
   io.DisplaySize = display_size;
   io.DisplayFramebufferScale = ImVec2(1.f, 1.f);
   if (first_frame) {
      io.DeltaTime = 1.f / 60.f;
      first_frame = false;
   } else {
      float dt = std::chrono::duration<float>(now - last_frame).count();
      io.DeltaTime = std::max(dt, 1e-5f);
   }
   last_frame = now;

   std::vector<input_event> queued;
   {
      std::lock_guard lk(mtx);
      queued.swap(events);
   }

   for (auto& ev : queued) {
      std::visit([&io](auto&& e) {
         using T = std::decay_t<decltype(e)>;
         if constexpr (std::is_same_v<T, mouse_pos_event>)
            io.AddMousePosEvent(e.x, e.y);
         else if constexpr (std::is_same_v<T, mouse_button_event>)
            io.AddMouseButtonEvent(e.button, e.down);
         else if constexpr (std::is_same_v<T, wheel_event>)
            io.AddMouseWheelEvent(e.x, e.y);
         else if constexpr (std::is_same_v<T, zoom_event>)
            io.FontGlobalScale = std::clamp(io.FontGlobalScale * e.factor, 0.5f, 3.0f);
         else if constexpr (std::is_same_v<T, key_event>)
            io.AddKeyEvent(e.key, e.down);
         else if constexpr (std::is_same_v<T, char_event>)
            io.AddInputCharacter(e.c);
         else if constexpr (std::is_same_v<T, focus_event>)
            io.AddFocusEvent(e.focused);
      }, ev);
   }

   return !queued.empty();
}

bool input_manager::has_pending() const
{
   std::lock_guard lk(mtx);
   return !events.empty();
}

void input_manager::clear()
{
   std::lock_guard lk(mtx);
   events.clear();
}

}
