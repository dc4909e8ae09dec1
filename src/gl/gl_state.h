#pragma once
#ifndef IMOVERLAY_GL_STATE_H
#define IMOVERLAY_GL_STATE_H

#include "gl.h"

namespace ImOverlay { namespace GL {

// Backs up every piece of host state the overlay touches on construction
// and puts it back on destruction.
struct GLState {
    struct state {
        GLint program = 0;
        GLint vao = 0;
        GLint arrayBuf = 0;
        GLint elemBuf = 0;
        GLint activeTex = 0;
        GLint tex2D = 0;
        GLint sampler = 0;
        GLint drawFbo = 0;
        GLint viewport[4] = {0,0,0,0};
        GLint scissorBox[4] = {0,0,0,0};

        GLboolean blend = GL_FALSE;
        GLint blendEqRGB = 0, blendEqA = 0;
        GLint blendSrcRGB = 0, blendDstRGB = 0, blendSrcA = 0, blendDstA = 0;
        GLboolean cullFace = GL_FALSE;
        GLboolean depthTest = GL_FALSE;
        GLboolean stencilTest = GL_FALSE;
        GLboolean scissorTest = GL_FALSE;
        GLboolean primitiveRestart = GL_FALSE;
        GLboolean framebufferSrgb = GL_FALSE;
        GLint polygonMode[2] = {GL_FILL, GL_FILL};
        GLboolean colorMask[4] = {GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE};

        GLint pbo = 0, align = 4, rowLen = 0;
    } saved;

    explicit GLState(const gl_caps& caps) : caps(caps) {
        saved = save_state();
    }

    ~GLState() {
        restore_state(saved);
    }

    GLState(const GLState&) = delete;
    GLState& operator=(const GLState&) = delete;

    // Overlay state: alpha blending, no cull/depth/stencil, scissor on,
    // texture unit 0, tightly packed unpacking. `framebuffer` < 0 keeps
    // the host's draw framebuffer.
    void setup(int fb_width, int fb_height, int framebuffer);

    state save_state();
    void restore_state(const state& s);

private:
    gl_caps caps;
};

}} // namespaces

#endif //IMOVERLAY_GL_STATE_H
