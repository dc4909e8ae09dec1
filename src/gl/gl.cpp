#include <spdlog/spdlog.h>
#include "gl.h"

namespace ImOverlay { namespace GL {

gl_caps query_caps()
{
    gl_caps caps;
    GLint major = 0, minor = 0;
    glGetIntegerv(GL_MAJOR_VERSION, &major);
    glGetIntegerv(GL_MINOR_VERSION, &minor);
    // GL_MAJOR_VERSION is 3.0+, older contexts leave it untouched and
    // raise GL_INVALID_ENUM
    if (major < 3) {
        take_gl_errors();
        SPDLOG_WARN("GL context older than 3.0, overlay may not render");
        major = 2;
        minor = 1;
    }

    caps.version = major * 100 + minor * 10;
    caps.samplers = caps.version >= 330;
    caps.primitive_restart = caps.version >= 310;

    const GLubyte* renderer = glGetString(GL_RENDERER);
    SPDLOG_DEBUG("GL {}.{}, renderer: {}", major, minor,
                 renderer ? reinterpret_cast<const char*>(renderer) : "unknown");
    return caps;
}

const char* gl_err_str(GLenum e) {
    switch (e) {
        case GL_NO_ERROR: return "GL_NO_ERROR";
        case GL_INVALID_ENUM: return "GL_INVALID_ENUM";
        case GL_INVALID_VALUE: return "GL_INVALID_VALUE";
        case GL_INVALID_OPERATION: return "GL_INVALID_OPERATION";
        case GL_INVALID_FRAMEBUFFER_OPERATION: return "GL_INVALID_FRAMEBUFFER_OPERATION";
        case GL_OUT_OF_MEMORY: return "GL_OUT_OF_MEMORY";
        default: return "GL_UNKNOWN_ERROR";
    }
}

std::vector<GLenum> take_gl_errors() {
    std::vector<GLenum> errors;
    for (int i = 0; i < 16; i++) {
        GLenum e = glGetError();
        if (e == GL_NO_ERROR) break;
        errors.push_back(e);
    }
    return errors;
}

bool drain_gl_errors(const char* where) {
    bool had = false;
    // a lost context can report errors forever
    for (int i = 0; i < 16; i++) {
        GLenum e = glGetError();
        if (e == GL_NO_ERROR) break;
        had = true;
        SPDLOG_ERROR("GL error at {}: 0x{:x} ({})", where, e, gl_err_str(e));
    }
    return had;
}

}} // namespaces
