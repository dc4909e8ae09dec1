#include <string>
#include <spdlog/spdlog.h>
#include "gl_program.h"

namespace ImOverlay { namespace GL {

static const char *vs_src =
    "#version 130\n"
    "uniform mat4 ProjMtx;\n"
    "in vec2 Position;\n"
    "in vec2 UV;\n"
    "in vec4 Color;\n"
    "out vec2 Frag_UV;\n"
    "out vec4 Frag_Color;\n"
    "void main(){\n"
    "  Frag_UV = UV;\n"
    "  Frag_Color = Color;\n"
    "  gl_Position = ProjMtx * vec4(Position.xy, 0.0, 1.0);\n"
    "}\n";

static const char *fs_src =
    "#version 130\n"
    "uniform sampler2D Texture;\n"
    "in vec2 Frag_UV;\n"
    "in vec4 Frag_Color;\n"
    "out vec4 Out_Color;\n"
    "void main(){\n"
    "  Out_Color = Frag_Color * texture(Texture, Frag_UV.st);\n"
    "}\n";

GLuint compile_shader(GLenum type, const char *src) {
    GLuint s = glCreateShader(type);
    glShaderSource(s, 1, &src, NULL);
    glCompileShader(s);
    GLint ok = 0;
    glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        char log[4096];
        GLsizei n = 0;
        glGetShaderInfoLog(s, (GLsizei)sizeof(log), &n, log);
        SPDLOG_ERROR("{} shader compile failed:\n{}",
                     type == GL_VERTEX_SHADER ? "vertex" : "fragment", std::string(log, n));
        glDeleteShader(s);
        return 0;
    }
    return s;
}

GLuint link_program(GLuint vs, GLuint fs) {
    GLuint p = glCreateProgram();
    glAttachShader(p, vs);
    glAttachShader(p, fs);
    glBindAttribLocation(p, 0, "Position");
    glBindAttribLocation(p, 1, "UV");
    glBindAttribLocation(p, 2, "Color");
    glLinkProgram(p);
    glDetachShader(p, vs);
    glDetachShader(p, fs);
    GLint ok = 0;
    glGetProgramiv(p, GL_LINK_STATUS, &ok);
    if (!ok) {
        char log[4096];
        GLsizei n = 0;
        glGetProgramInfoLog(p, (GLsizei)sizeof(log), &n, log);
        SPDLOG_ERROR("program link failed:\n{}", std::string(log, n));
        glDeleteProgram(p);
        return 0;
    }
    return p;
}

bool program::create() {
    destroy();

    GLuint vs = compile_shader(GL_VERTEX_SHADER, vs_src);
    GLuint fs = compile_shader(GL_FRAGMENT_SHADER, fs_src);
    if (vs && fs)
        handle = link_program(vs, fs);
    if (vs) glDeleteShader(vs);
    if (fs) glDeleteShader(fs);

    if (!handle)
        return false;

    loc_tex = glGetUniformLocation(handle, "Texture");
    loc_proj = glGetUniformLocation(handle, "ProjMtx");
    return true;
}

void program::destroy() {
    if (handle)
        glDeleteProgram(handle);
    handle = 0;
    loc_tex = loc_proj = -1;
}

void program::use(const std::array<float, 16>& proj) const {
    glUseProgram(handle);
    glUniform1i(loc_tex, 0);
    glUniformMatrix4fv(loc_proj, 1, GL_FALSE, proj.data());
}

}} // namespaces
