#include <thread>
#include <X11/Xatom.h>
#include <spdlog/spdlog.h>
#include "clipboard.h"
#include "shared_x11.h"
#include "timing.hpp"
#include "loaders/loader_x11.h"

namespace ImOverlay {

clipboard::clipboard(bool enable)
{
   if (!enable || !init_x11())
      return;

   auto libx11 = get_libx11();
   dpy = get_xdisplay();
   window = libx11->XCreateSimpleWindow(dpy, libx11->XDefaultRootWindow(dpy),
                                        0, 0, 1, 1, 0, 0, 0);
   if (window == None) {
      SPDLOG_WARN("clipboard: could not create selection window");
      dpy = nullptr;
      return;
   }

   atom_clipboard = libx11->XInternAtom(dpy, "CLIPBOARD", False);
   atom_targets = libx11->XInternAtom(dpy, "TARGETS", False);
   atom_utf8 = libx11->XInternAtom(dpy, "UTF8_STRING", False);
   atom_property = libx11->XInternAtom(dpy, "IMOVERLAY_SELECTION", False);
   libx11->XFlush(dpy);
}

clipboard::~clipboard()
{
   if (dpy && window != None) {
      auto libx11 = get_libx11();
      libx11->XDestroyWindow(dpy, window);
      libx11->XFlush(dpy);
   }
}

void clipboard::set_text(const std::string& new_text)
{
   std::lock_guard lk(mtx);
   text = new_text;
   if (!dpy)
      return;

   auto libx11 = get_libx11();
   libx11->XSetSelectionOwner(dpy, atom_clipboard, window, CurrentTime);
   owner = libx11->XGetSelectionOwner(dpy, atom_clipboard) == window;
   if (!owner)
      SPDLOG_WARN("clipboard: could not take selection ownership");
   libx11->XFlush(dpy);
}

std::string clipboard::get_text()
{
   std::lock_guard lk(mtx);
   if (!dpy || owner)
      return text;

   auto libx11 = get_libx11();
   if (libx11->XGetSelectionOwner(dpy, atom_clipboard) == None)
      return std::string();

   libx11->XConvertSelection(dpy, atom_clipboard, atom_utf8, atom_property, window, CurrentTime);
   libx11->XFlush(dpy);

   XEvent ev;
   const auto deadline = Clock::now() + 100ms;
   bool notified = false;
   while (Clock::now() < deadline) {
      if (libx11->XCheckTypedWindowEvent(dpy, window, SelectionNotify, &ev)) {
         notified = true;
         break;
      }
      std::this_thread::sleep_for(1ms);
   }

   if (!notified) {
      SPDLOG_DEBUG("clipboard: selection owner did not answer in time");
      return std::string();
   }
   if (ev.xselection.property == None)
      return std::string();

   Atom type;
   int format;
   unsigned long nitems, remaining;
   unsigned char *data = nullptr;
   std::string result;
   if (libx11->XGetWindowProperty(dpy, window, atom_property, 0, 1 << 20, True,
                                  AnyPropertyType, &type, &format, &nitems,
                                  &remaining, &data) == Success && data) {
      if (format == 8 && (type == atom_utf8 || type == XA_STRING))
         result.assign(reinterpret_cast<char*>(data), nitems);
      libx11->XFree(data);
   }
   return result;
}

void clipboard::answer_request(const XSelectionRequestEvent& req)
{
   auto libx11 = get_libx11();
   XEvent reply {};
   reply.xselection.type = SelectionNotify;
   reply.xselection.display = req.display;
   reply.xselection.requestor = req.requestor;
   reply.xselection.selection = req.selection;
   reply.xselection.target = req.target;
   reply.xselection.time = req.time;
   reply.xselection.property = None;

   // obsolete clients leave the property unset
   Atom property = req.property != None ? req.property : req.target;

   if (owner && req.selection == atom_clipboard) {
      if (req.target == atom_targets) {
         Atom targets[] = { atom_targets, atom_utf8, XA_STRING };
         libx11->XChangeProperty(dpy, req.requestor, property, XA_ATOM, 32,
                                 PropModeReplace,
                                 reinterpret_cast<unsigned char*>(targets), 3);
         reply.xselection.property = property;
      } else if (req.target == atom_utf8 || req.target == XA_STRING) {
         libx11->XChangeProperty(dpy, req.requestor, property, req.target, 8,
                                 PropModeReplace,
                                 reinterpret_cast<const unsigned char*>(text.data()),
                                 int(text.size()));
         reply.xselection.property = property;
      }
   }

   libx11->XSendEvent(dpy, req.requestor, False, NoEventMask, &reply);
}

void clipboard::handle_event(XEvent& ev)
{
   switch (ev.type) {
   case SelectionRequest:
      answer_request(ev.xselectionrequest);
      break;
   case SelectionClear:
      if (ev.xselectionclear.selection == atom_clipboard)
         owner = false;
      break;
   default:
      break;
   }
}

void clipboard::pump()
{
   std::lock_guard lk(mtx);
   if (!dpy)
      return;

   auto libx11 = get_libx11();
   while (libx11->XPending(dpy)) {
      XEvent ev;
      libx11->XNextEvent(dpy, &ev);
      handle_event(ev);
   }
   libx11->XFlush(dpy);
}

}
