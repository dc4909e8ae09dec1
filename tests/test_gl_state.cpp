#include <stdarg.h>
#include <stddef.h>
#include <setjmp.h>
#include <stdint.h>
#include <algorithm>
extern "C" {
#include <cmocka.h>
}
#include "../src/gl/gl_state.h"
#include "gl_mock.h"

#define UNUSED(x) (void)(x)

using namespace ImOverlay::GL;

// Something a host could plausibly leave bound while drawing.
static void dirty_host_state()
{
    mock_gl_reset();
    mock_gl.program = 7;
    mock_gl.vao = 3;
    mock_gl.array_buffer = 4;
    mock_gl.element_buffer = 5;
    mock_gl.active_texture = GL_TEXTURE3;
    mock_gl.tex_binding[0] = 9;
    mock_gl.tex_binding[3] = 10;
    mock_gl.sampler_binding[0] = 2;
    mock_gl.draw_fbo = 6;
    GLint viewport[4] = {1, 2, 300, 400};
    GLint scissor[4] = {5, 6, 70, 80};
    std::copy_n(viewport, 4, mock_gl.viewport);
    std::copy_n(scissor, 4, mock_gl.scissor);
    mock_gl.blend_eq_rgb = GL_FUNC_SUBTRACT;
    mock_gl.blend_src_rgb = GL_DST_COLOR;
    mock_gl.blend_dst_a = GL_ONE;
    mock_gl.enabled[GL_CULL_FACE] = true;
    mock_gl.enabled[GL_DEPTH_TEST] = true;
    mock_gl.enabled[GL_STENCIL_TEST] = true;
    mock_gl.enabled[GL_PRIMITIVE_RESTART] = true;
    mock_gl.enabled[GL_FRAMEBUFFER_SRGB] = true;
    mock_gl.polygon_mode = GL_LINE;
    mock_gl.color_mask[3] = GL_FALSE;
    mock_gl.unpack_buffer = 11;
    mock_gl.unpack_alignment = 8;
    mock_gl.unpack_row_length = 16;
}

static void assert_host_state(const mock_gl_state& host)
{
    assert_int_equal(mock_gl.program, host.program);
    assert_int_equal(mock_gl.vao, host.vao);
    assert_int_equal(mock_gl.array_buffer, host.array_buffer);
    assert_int_equal(mock_gl.element_buffer, host.element_buffer);
    assert_int_equal(mock_gl.active_texture, host.active_texture);
    assert_memory_equal(mock_gl.tex_binding, host.tex_binding, sizeof(host.tex_binding));
    assert_int_equal(mock_gl.draw_fbo, host.draw_fbo);
    assert_memory_equal(mock_gl.viewport, host.viewport, sizeof(host.viewport));
    assert_memory_equal(mock_gl.scissor, host.scissor, sizeof(host.scissor));
    assert_int_equal(mock_gl.blend_eq_rgb, host.blend_eq_rgb);
    assert_int_equal(mock_gl.blend_eq_a, host.blend_eq_a);
    assert_int_equal(mock_gl.blend_src_rgb, host.blend_src_rgb);
    assert_int_equal(mock_gl.blend_dst_rgb, host.blend_dst_rgb);
    assert_int_equal(mock_gl.blend_src_a, host.blend_src_a);
    assert_int_equal(mock_gl.blend_dst_a, host.blend_dst_a);
    for (GLenum cap : {GL_BLEND, GL_CULL_FACE, GL_DEPTH_TEST, GL_STENCIL_TEST,
                       GL_SCISSOR_TEST, GL_FRAMEBUFFER_SRGB})
        assert_int_equal(mock_enabled(cap), host.enabled.count(cap) && host.enabled.at(cap));
    assert_int_equal(mock_gl.polygon_mode, host.polygon_mode);
    assert_memory_equal(mock_gl.color_mask, host.color_mask, sizeof(host.color_mask));
    assert_int_equal(mock_gl.unpack_buffer, host.unpack_buffer);
    assert_int_equal(mock_gl.unpack_alignment, host.unpack_alignment);
    assert_int_equal(mock_gl.unpack_row_length, host.unpack_row_length);
}

static void test_setup_and_restore(void **state) {
    UNUSED(state);
    dirty_host_state();
    const mock_gl_state host = mock_gl;

    gl_caps caps;
    caps.version = 330;
    caps.samplers = true;
    caps.primitive_restart = true;
    {
        GLState gl_state(caps);
        gl_state.setup(640, 480, -1);

        assert_true(mock_enabled(GL_BLEND));
        assert_true(mock_enabled(GL_SCISSOR_TEST));
        assert_false(mock_enabled(GL_CULL_FACE));
        assert_false(mock_enabled(GL_DEPTH_TEST));
        assert_false(mock_enabled(GL_STENCIL_TEST));
        assert_false(mock_enabled(GL_PRIMITIVE_RESTART));
        assert_false(mock_enabled(GL_FRAMEBUFFER_SRGB));
        assert_int_equal(mock_gl.blend_src_rgb, GL_SRC_ALPHA);
        assert_int_equal(mock_gl.blend_dst_rgb, GL_ONE_MINUS_SRC_ALPHA);
        assert_int_equal(mock_gl.viewport[2], 640);
        assert_int_equal(mock_gl.viewport[3], 480);
        assert_int_equal(mock_gl.draw_fbo, 6);
        assert_int_equal(mock_gl.active_texture, GL_TEXTURE0);
        assert_int_equal(mock_gl.sampler_binding[0], 0);
        assert_int_equal(mock_gl.polygon_mode, GL_FILL);
        assert_int_equal(mock_gl.color_mask[3], GL_TRUE);
        assert_int_equal(mock_gl.unpack_buffer, 0);
        assert_int_equal(mock_gl.unpack_alignment, 1);
        assert_int_equal(mock_gl.unpack_row_length, 0);

        // what drawing the overlay does
        mock_gl.program = 99;
        mock_gl.vao = 98;
        mock_gl.array_buffer = 97;
        mock_gl.element_buffer = 96;
        mock_gl.tex_binding[0] = 95;
        mock_gl.scissor[0] = 123;
    }

    assert_host_state(host);
    assert_int_equal(mock_gl.sampler_binding[0], 2);
    assert_true(mock_enabled(GL_PRIMITIVE_RESTART));
}

static void test_framebuffer_override(void **state) {
    UNUSED(state);
    dirty_host_state();
    const mock_gl_state host = mock_gl;

    gl_caps caps;
    caps.version = 330;
    caps.samplers = true;
    caps.primitive_restart = true;
    {
        GLState gl_state(caps);
        gl_state.setup(640, 480, 0);
        assert_int_equal(mock_gl.draw_fbo, 0);
    }
    assert_int_equal(mock_gl.draw_fbo, 6);
    assert_host_state(host);
}

static void test_old_context(void **state) {
    UNUSED(state);
    dirty_host_state();
    const mock_gl_state host = mock_gl;

    // 3.0: no sampler objects, no primitive restart
    gl_caps caps;
    caps.version = 300;
    {
        GLState gl_state(caps);
        gl_state.setup(640, 480, -1);
        assert_true(mock_enabled(GL_PRIMITIVE_RESTART));
    }
    assert_int_equal(mock_gl.sampler_calls, 0);
    assert_host_state(host);
}

static void test_query_caps(void **state) {
    UNUSED(state);
    mock_gl_reset();
    mock_gl.major = 3;
    mock_gl.minor = 3;
    gl_caps caps = query_caps();
    assert_int_equal(caps.version, 330);
    assert_true(caps.samplers);
    assert_true(caps.primitive_restart);

    mock_gl.minor = 0;
    caps = query_caps();
    assert_int_equal(caps.version, 300);
    assert_false(caps.samplers);
    assert_false(caps.primitive_restart);

    // 2.1 contexts do not know GL_MAJOR_VERSION
    mock_gl.major = 0;
    caps = query_caps();
    assert_int_equal(caps.version, 210);
    assert_true(mock_gl.errors.empty());
}

static void test_drain_errors(void **state) {
    UNUSED(state);
    mock_gl_reset();
    assert_false(drain_gl_errors("test"));
    mock_gl.errors = {GL_INVALID_ENUM, GL_INVALID_VALUE};
    assert_true(drain_gl_errors("test"));
    assert_true(mock_gl.errors.empty());

    // stops even if the error never clears
    mock_gl.errors.assign(40, GL_OUT_OF_MEMORY);
    assert_true(drain_gl_errors("test"));
    assert_int_equal(mock_gl.errors.size(), 24);

    mock_gl.errors = {GL_INVALID_ENUM, GL_OUT_OF_MEMORY};
    std::vector<GLenum> taken = take_gl_errors();
    assert_int_equal(taken.size(), 2);
    assert_int_equal(taken[0], GL_INVALID_ENUM);
    assert_int_equal(taken[1], GL_OUT_OF_MEMORY);
    assert_true(mock_gl.errors.empty());
    assert_true(take_gl_errors().empty());

    assert_string_equal(gl_err_str(GL_INVALID_OPERATION), "GL_INVALID_OPERATION");
    assert_string_equal(gl_err_str(0x1234), "GL_UNKNOWN_ERROR");
}

const struct CMUnitTest gl_state_tests[] = {
    cmocka_unit_test(test_setup_and_restore),
    cmocka_unit_test(test_framebuffer_override),
    cmocka_unit_test(test_old_context),
    cmocka_unit_test(test_query_caps),
    cmocka_unit_test(test_drain_errors)
};

int main(void) {
    return cmocka_run_group_tests(gl_state_tests, NULL, NULL);
}
