#pragma once
#ifndef IMOVERLAY_GL_GL_H
#define IMOVERLAY_GL_GL_H

#define GL_GLEXT_PROTOTYPES 1
#include <GL/gl.h>
#include <GL/glext.h>
#include <vector>

namespace ImOverlay { namespace GL {

// Version and optional features of the current context, queried once per
// device object creation.
struct gl_caps {
    int version = 0; // major * 100 + minor * 10
    bool samplers = false;
    bool primitive_restart = false;
};

gl_caps query_caps();
const char* gl_err_str(GLenum e);
// Logs and clears every pending GL error. Returns true if there was any.
bool drain_gl_errors(const char* where);
// Clears and returns the pending errors without logging them.
std::vector<GLenum> take_gl_errors();

}} // namespaces

#endif //IMOVERLAY_GL_GL_H
