#include "loader_x11.h"
#include <spdlog/spdlog.h>

libx11_loader::libx11_loader() : loaded_(false) {
}

libx11_loader::~libx11_loader() {
  CleanUp(loaded_);
}

bool libx11_loader::Load(const std::string& library_name) {
  if (loaded_) {
    return false;
  }

  library_ = dlopen(library_name.c_str(), RTLD_LAZY);
  if (!library_) {
    SPDLOG_ERROR("Failed to open {}: {}", library_name, dlerror());
    CleanUp(false);
    return false;
  }

  XOpenDisplay =
      reinterpret_cast<decltype(this->XOpenDisplay)>(
          dlsym(library_, "XOpenDisplay"));
  if (!XOpenDisplay) {
    SPDLOG_ERROR("{}: missing symbol XOpenDisplay", library_name);
    CleanUp(true);
    return false;
  }

  XCloseDisplay =
      reinterpret_cast<decltype(this->XCloseDisplay)>(
          dlsym(library_, "XCloseDisplay"));
  if (!XCloseDisplay) {
    SPDLOG_ERROR("{}: missing symbol XCloseDisplay", library_name);
    CleanUp(true);
    return false;
  }

  XDefaultRootWindow =
      reinterpret_cast<decltype(this->XDefaultRootWindow)>(
          dlsym(library_, "XDefaultRootWindow"));
  if (!XDefaultRootWindow) {
    SPDLOG_ERROR("{}: missing symbol XDefaultRootWindow", library_name);
    CleanUp(true);
    return false;
  }

  XQueryKeymap =
      reinterpret_cast<decltype(this->XQueryKeymap)>(
          dlsym(library_, "XQueryKeymap"));
  if (!XQueryKeymap) {
    SPDLOG_ERROR("{}: missing symbol XQueryKeymap", library_name);
    CleanUp(true);
    return false;
  }

  XKeysymToKeycode =
      reinterpret_cast<decltype(this->XKeysymToKeycode)>(
          dlsym(library_, "XKeysymToKeycode"));
  if (!XKeysymToKeycode) {
    SPDLOG_ERROR("{}: missing symbol XKeysymToKeycode", library_name);
    CleanUp(true);
    return false;
  }

  XLookupString =
      reinterpret_cast<decltype(this->XLookupString)>(
          dlsym(library_, "XLookupString"));
  if (!XLookupString) {
    SPDLOG_ERROR("{}: missing symbol XLookupString", library_name);
    CleanUp(true);
    return false;
  }

  XLookupKeysym =
      reinterpret_cast<decltype(this->XLookupKeysym)>(
          dlsym(library_, "XLookupKeysym"));
  if (!XLookupKeysym) {
    SPDLOG_ERROR("{}: missing symbol XLookupKeysym", library_name);
    CleanUp(true);
    return false;
  }

  XCreateSimpleWindow =
      reinterpret_cast<decltype(this->XCreateSimpleWindow)>(
          dlsym(library_, "XCreateSimpleWindow"));
  if (!XCreateSimpleWindow) {
    SPDLOG_ERROR("{}: missing symbol XCreateSimpleWindow", library_name);
    CleanUp(true);
    return false;
  }

  XDestroyWindow =
      reinterpret_cast<decltype(this->XDestroyWindow)>(
          dlsym(library_, "XDestroyWindow"));
  if (!XDestroyWindow) {
    SPDLOG_ERROR("{}: missing symbol XDestroyWindow", library_name);
    CleanUp(true);
    return false;
  }

  XInternAtom =
      reinterpret_cast<decltype(this->XInternAtom)>(
          dlsym(library_, "XInternAtom"));
  if (!XInternAtom) {
    SPDLOG_ERROR("{}: missing symbol XInternAtom", library_name);
    CleanUp(true);
    return false;
  }

  XSetSelectionOwner =
      reinterpret_cast<decltype(this->XSetSelectionOwner)>(
          dlsym(library_, "XSetSelectionOwner"));
  if (!XSetSelectionOwner) {
    SPDLOG_ERROR("{}: missing symbol XSetSelectionOwner", library_name);
    CleanUp(true);
    return false;
  }

  XGetSelectionOwner =
      reinterpret_cast<decltype(this->XGetSelectionOwner)>(
          dlsym(library_, "XGetSelectionOwner"));
  if (!XGetSelectionOwner) {
    SPDLOG_ERROR("{}: missing symbol XGetSelectionOwner", library_name);
    CleanUp(true);
    return false;
  }

  XConvertSelection =
      reinterpret_cast<decltype(this->XConvertSelection)>(
          dlsym(library_, "XConvertSelection"));
  if (!XConvertSelection) {
    SPDLOG_ERROR("{}: missing symbol XConvertSelection", library_name);
    CleanUp(true);
    return false;
  }

  XChangeProperty =
      reinterpret_cast<decltype(this->XChangeProperty)>(
          dlsym(library_, "XChangeProperty"));
  if (!XChangeProperty) {
    SPDLOG_ERROR("{}: missing symbol XChangeProperty", library_name);
    CleanUp(true);
    return false;
  }

  XGetWindowProperty =
      reinterpret_cast<decltype(this->XGetWindowProperty)>(
          dlsym(library_, "XGetWindowProperty"));
  if (!XGetWindowProperty) {
    SPDLOG_ERROR("{}: missing symbol XGetWindowProperty", library_name);
    CleanUp(true);
    return false;
  }

  XSendEvent =
      reinterpret_cast<decltype(this->XSendEvent)>(
          dlsym(library_, "XSendEvent"));
  if (!XSendEvent) {
    SPDLOG_ERROR("{}: missing symbol XSendEvent", library_name);
    CleanUp(true);
    return false;
  }

  XPending =
      reinterpret_cast<decltype(this->XPending)>(
          dlsym(library_, "XPending"));
  if (!XPending) {
    SPDLOG_ERROR("{}: missing symbol XPending", library_name);
    CleanUp(true);
    return false;
  }

  XNextEvent =
      reinterpret_cast<decltype(this->XNextEvent)>(
          dlsym(library_, "XNextEvent"));
  if (!XNextEvent) {
    SPDLOG_ERROR("{}: missing symbol XNextEvent", library_name);
    CleanUp(true);
    return false;
  }

  XCheckTypedWindowEvent =
      reinterpret_cast<decltype(this->XCheckTypedWindowEvent)>(
          dlsym(library_, "XCheckTypedWindowEvent"));
  if (!XCheckTypedWindowEvent) {
    SPDLOG_ERROR("{}: missing symbol XCheckTypedWindowEvent", library_name);
    CleanUp(true);
    return false;
  }

  XFlush =
      reinterpret_cast<decltype(this->XFlush)>(
          dlsym(library_, "XFlush"));
  if (!XFlush) {
    SPDLOG_ERROR("{}: missing symbol XFlush", library_name);
    CleanUp(true);
    return false;
  }

  XFree =
      reinterpret_cast<decltype(this->XFree)>(
          dlsym(library_, "XFree"));
  if (!XFree) {
    SPDLOG_ERROR("{}: missing symbol XFree", library_name);
    CleanUp(true);
    return false;
  }

  loaded_ = true;
  return true;
}

void libx11_loader::CleanUp(bool unload) {
  if (unload && library_) {
    dlclose(library_);
    library_ = NULL;
  }

  loaded_ = false;
  XOpenDisplay = NULL;
  XCloseDisplay = NULL;
  XDefaultRootWindow = NULL;
  XQueryKeymap = NULL;
  XKeysymToKeycode = NULL;
  XLookupString = NULL;
  XLookupKeysym = NULL;
  XCreateSimpleWindow = NULL;
  XDestroyWindow = NULL;
  XInternAtom = NULL;
  XSetSelectionOwner = NULL;
  XGetSelectionOwner = NULL;
  XConvertSelection = NULL;
  XChangeProperty = NULL;
  XGetWindowProperty = NULL;
  XSendEvent = NULL;
  XPending = NULL;
  XNextEvent = NULL;
  XCheckTypedWindowEvent = NULL;
  XFlush = NULL;
  XFree = NULL;
}

std::shared_ptr<libx11_loader> get_libx11()
{
  static std::shared_ptr<libx11_loader> loader =
    std::make_shared<libx11_loader>("libX11.so.6");
  return loader;
}
