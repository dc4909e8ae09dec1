#pragma once
#ifndef IMOVERLAY_CLIPBOARD_H
#define IMOVERLAY_CLIPBOARD_H

#include <mutex>
#include <string>
#include <X11/Xlib.h>

namespace ImOverlay {

// X11 CLIPBOARD selection owned through the private display connection and
// an unmapped window. Falls back to an in-process buffer when disabled or
// when no display is available.
class clipboard {
public:
   explicit clipboard(bool enable);
   ~clipboard();

   clipboard(const clipboard&) = delete;
   clipboard& operator=(const clipboard&) = delete;

   void set_text(const std::string& text);
   std::string get_text();
   // Answers selection requests from other clients.
   void pump();
   bool is_x11() const { return window != None; }

private:
   void handle_event(XEvent& ev);
   void answer_request(const XSelectionRequestEvent& req);

   std::mutex mtx;
   Display* dpy = nullptr;
   Window window = None;
   Atom atom_clipboard = None;
   Atom atom_targets = None;
   Atom atom_utf8 = None;
   Atom atom_property = None;
   bool owner = false;
   std::string text;
};

}

#endif //IMOVERLAY_CLIPBOARD_H
