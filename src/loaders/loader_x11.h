#pragma once
#ifndef IMOVERLAY_LOADER_X11_H
#define IMOVERLAY_LOADER_X11_H

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <memory>

#include <string>
#include <dlfcn.h>

// libX11 resolved at runtime so hosts that never link it still work.
class libx11_loader {
 public:
  libx11_loader();
  libx11_loader(const std::string& library_name) { Load(library_name); }
  ~libx11_loader();

  bool Load(const std::string& library_name);
  bool IsLoaded() { return loaded_; }

  decltype(&::XOpenDisplay) XOpenDisplay;
  decltype(&::XCloseDisplay) XCloseDisplay;
  decltype(&::XDefaultRootWindow) XDefaultRootWindow;
  decltype(&::XQueryKeymap) XQueryKeymap;
  decltype(&::XKeysymToKeycode) XKeysymToKeycode;
  decltype(&::XLookupString) XLookupString;
  decltype(&::XLookupKeysym) XLookupKeysym;
  decltype(&::XCreateSimpleWindow) XCreateSimpleWindow;
  decltype(&::XDestroyWindow) XDestroyWindow;
  decltype(&::XInternAtom) XInternAtom;
  decltype(&::XSetSelectionOwner) XSetSelectionOwner;
  decltype(&::XGetSelectionOwner) XGetSelectionOwner;
  decltype(&::XConvertSelection) XConvertSelection;
  decltype(&::XChangeProperty) XChangeProperty;
  decltype(&::XGetWindowProperty) XGetWindowProperty;
  decltype(&::XSendEvent) XSendEvent;
  decltype(&::XPending) XPending;
  decltype(&::XNextEvent) XNextEvent;
  decltype(&::XCheckTypedWindowEvent) XCheckTypedWindowEvent;
  decltype(&::XFlush) XFlush;
  decltype(&::XFree) XFree;

 private:
  void CleanUp(bool unload);

  void* library_ = nullptr;
  bool loaded_ = false;

  // Disallow copy constructor and assignment operator.
  libx11_loader(const libx11_loader&);
  void operator=(const libx11_loader&);
};

std::shared_ptr<libx11_loader> get_libx11();

#endif //IMOVERLAY_LOADER_X11_H
