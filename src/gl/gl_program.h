#pragma once
#ifndef IMOVERLAY_GL_PROGRAM_H
#define IMOVERLAY_GL_PROGRAM_H

#include <array>
#include "gl.h"

namespace ImOverlay { namespace GL {

// Returns 0 and logs the info log on failure.
GLuint compile_shader(GLenum type, const char *src);
GLuint link_program(GLuint vs, GLuint fs);

// Textured, vertex colored triangles: attributes 0/1/2 are position, uv
// and color.
class program {
public:
    bool create();
    void destroy();
    bool valid() const { return handle != 0; }
    void use(const std::array<float, 16>& proj) const;

private:
    GLuint handle = 0;
    GLint loc_tex = -1;
    GLint loc_proj = -1;
};

}} // namespaces

#endif //IMOVERLAY_GL_PROGRAM_H
