#include "gl_state.h"

namespace ImOverlay { namespace GL {

static void set_enabled(GLenum cap, GLboolean on)
{
    if (on) glEnable(cap);
    else glDisable(cap);
}

GLState::state GLState::save_state() {
    state s{};
    glGetIntegerv(GL_CURRENT_PROGRAM, &s.program);
    glGetIntegerv(GL_VERTEX_ARRAY_BINDING, &s.vao);
    glGetIntegerv(GL_ARRAY_BUFFER_BINDING, &s.arrayBuf);
    glGetIntegerv(GL_ELEMENT_ARRAY_BUFFER_BINDING, &s.elemBuf);
    glGetIntegerv(GL_ACTIVE_TEXTURE, &s.activeTex);
    // texture and sampler bindings are per unit, we only ever use unit 0
    glActiveTexture(GL_TEXTURE0);
    glGetIntegerv(GL_TEXTURE_BINDING_2D, &s.tex2D);
    if (caps.samplers)
        glGetIntegerv(GL_SAMPLER_BINDING, &s.sampler);
    glGetIntegerv(GL_DRAW_FRAMEBUFFER_BINDING, &s.drawFbo);
    glGetIntegerv(GL_VIEWPORT, s.viewport);
    glGetIntegerv(GL_SCISSOR_BOX, s.scissorBox);

    s.blend = glIsEnabled(GL_BLEND);
    glGetIntegerv(GL_BLEND_EQUATION_RGB, &s.blendEqRGB);
    glGetIntegerv(GL_BLEND_EQUATION_ALPHA, &s.blendEqA);
    glGetIntegerv(GL_BLEND_SRC_RGB, &s.blendSrcRGB);
    glGetIntegerv(GL_BLEND_DST_RGB, &s.blendDstRGB);
    glGetIntegerv(GL_BLEND_SRC_ALPHA, &s.blendSrcA);
    glGetIntegerv(GL_BLEND_DST_ALPHA, &s.blendDstA);

    s.cullFace = glIsEnabled(GL_CULL_FACE);
    s.depthTest = glIsEnabled(GL_DEPTH_TEST);
    s.stencilTest = glIsEnabled(GL_STENCIL_TEST);
    s.scissorTest = glIsEnabled(GL_SCISSOR_TEST);
    if (caps.primitive_restart)
        s.primitiveRestart = glIsEnabled(GL_PRIMITIVE_RESTART);
    s.framebufferSrgb = glIsEnabled(GL_FRAMEBUFFER_SRGB);
    glGetIntegerv(GL_POLYGON_MODE, s.polygonMode);
    glGetBooleanv(GL_COLOR_WRITEMASK, s.colorMask);

    glGetIntegerv(GL_PIXEL_UNPACK_BUFFER_BINDING, &s.pbo);
    glGetIntegerv(GL_UNPACK_ALIGNMENT, &s.align);
    glGetIntegerv(GL_UNPACK_ROW_LENGTH, &s.rowLen);
    return s;
}

void GLState::setup(int fb_width, int fb_height, int framebuffer) {
    if (framebuffer >= 0)
        glBindFramebuffer(GL_DRAW_FRAMEBUFFER, framebuffer);
    glViewport(0, 0, fb_width, fb_height);

    glEnable(GL_BLEND);
    glBlendEquationSeparate(GL_FUNC_ADD, GL_FUNC_ADD);
    glBlendFuncSeparate(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA, GL_ONE, GL_ONE_MINUS_SRC_ALPHA);
    glDisable(GL_CULL_FACE);
    glDisable(GL_DEPTH_TEST);
    glDisable(GL_STENCIL_TEST);
    glEnable(GL_SCISSOR_TEST);
    if (caps.primitive_restart)
        glDisable(GL_PRIMITIVE_RESTART);
    glDisable(GL_FRAMEBUFFER_SRGB);
    glPolygonMode(GL_FRONT_AND_BACK, GL_FILL);
    glColorMask(GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE);

    glActiveTexture(GL_TEXTURE0);
    if (caps.samplers)
        glBindSampler(0, 0);

    glBindBuffer(GL_PIXEL_UNPACK_BUFFER, 0);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glPixelStorei(GL_UNPACK_ROW_LENGTH, 0);
}

void GLState::restore_state(const state& s) {
    glUseProgram(s.program);
    glBindVertexArray(s.vao);
    glBindBuffer(GL_ARRAY_BUFFER, s.arrayBuf);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, s.elemBuf);
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, s.tex2D);
    if (caps.samplers)
        glBindSampler(0, s.sampler);
    glActiveTexture(s.activeTex);
    glBindFramebuffer(GL_DRAW_FRAMEBUFFER, s.drawFbo);
    glViewport(s.viewport[0], s.viewport[1], s.viewport[2], s.viewport[3]);
    glScissor(s.scissorBox[0], s.scissorBox[1], s.scissorBox[2], s.scissorBox[3]);

    glBlendEquationSeparate(s.blendEqRGB, s.blendEqA);
    glBlendFuncSeparate(s.blendSrcRGB, s.blendDstRGB, s.blendSrcA, s.blendDstA);
    set_enabled(GL_BLEND, s.blend);
    set_enabled(GL_CULL_FACE, s.cullFace);
    set_enabled(GL_DEPTH_TEST, s.depthTest);
    set_enabled(GL_STENCIL_TEST, s.stencilTest);
    set_enabled(GL_SCISSOR_TEST, s.scissorTest);
    if (caps.primitive_restart)
        set_enabled(GL_PRIMITIVE_RESTART, s.primitiveRestart);
    set_enabled(GL_FRAMEBUFFER_SRGB, s.framebufferSrgb);
    // front and back can only be set together in core profiles
    glPolygonMode(GL_FRONT_AND_BACK, s.polygonMode[0]);
    glColorMask(s.colorMask[0], s.colorMask[1], s.colorMask[2], s.colorMask[3]);

    glBindBuffer(GL_PIXEL_UNPACK_BUFFER, s.pbo);
    glPixelStorei(GL_UNPACK_ALIGNMENT, s.align);
    glPixelStorei(GL_UNPACK_ROW_LENGTH, s.rowLen);
}

}} // namespaces
