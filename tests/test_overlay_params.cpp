#include <stdarg.h>
#include <stddef.h>
#include <setjmp.h>
#include <stdint.h>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>
extern "C" {
#include <cmocka.h>
}
#include <xkbcommon/xkbcommon.h>
#include "../src/overlay_params.h"
#include "../src/config.h"

#define UNUSED(x) (void)(x)

using namespace ImOverlay;

static int no_config_file(void **state) {
    UNUSED(state);
    setenv("IMOVERLAY_CONFIGFILE", "/nonexistent/imoverlay.conf", 1);
    return 0;
}

static void test_defaults(void **state) {
    UNUSED(state);
    overlay_params params {};
    parse_overlay_config(&params, nullptr);

    assert_false(params.enabled[OVERLAY_PARAM_ENABLED_reactive]);
    assert_true(params.enabled[OVERLAY_PARAM_ENABLED_clipboard]);
    assert_true(params.enabled[OVERLAY_PARAM_ENABLED_ctrl_wheel_zoom]);
    assert_false(params.enabled[OVERLAY_PARAM_ENABLED_no_display]);
    assert_int_equal(params.theme, THEME_DARK);
    assert_true(params.font_file.empty());
    assert_float_equal(params.font_size, 13.f, 0.0001f);
    assert_float_equal(params.font_scale, 1.f, 0.0001f);
    assert_int_equal(params.vertex_capacity, 16384);
    assert_int_equal(params.index_capacity, 16384);
    assert_int_equal(params.gl_size_query, GL_SIZE_DRAWABLE);
    assert_int_equal(params.gl_bind_framebuffer, -1);
    assert_int_equal(params.toggle_overlay.size(), 2);
    assert_int_equal(params.toggle_overlay[0], XKB_KEY_Shift_R);
    assert_int_equal(params.toggle_overlay[1], XKB_KEY_F12);
    assert_int_equal(params.settle_frames, 3);
    assert_float_equal(params.alpha, 1.f, 0.0001f);
    assert_true(params.config_file_path.empty());
}

static void test_env_options(void **state) {
    UNUSED(state);
    overlay_params params {};
    parse_overlay_config(&params,
        "reactive,vertex_capacity=1024,gl_size_query=viewport,theme=light,"
        "alpha=0.5,font_scale=1.5,toggle_overlay=Control_L+F1,gl_bind_framebuffer=0,"
        "clipboard=0,settle_frames=0");

    assert_true(params.enabled[OVERLAY_PARAM_ENABLED_reactive]);
    assert_false(params.enabled[OVERLAY_PARAM_ENABLED_clipboard]);
    assert_int_equal(params.vertex_capacity, 1024);
    assert_int_equal(params.index_capacity, 16384);
    assert_int_equal(params.gl_size_query, GL_SIZE_VIEWPORT);
    assert_int_equal(params.theme, THEME_LIGHT);
    assert_float_equal(params.alpha, 0.5f, 0.0001f);
    assert_float_equal(params.font_scale, 1.5f, 0.0001f);
    assert_int_equal(params.gl_bind_framebuffer, 0);
    assert_int_equal(params.settle_frames, 0);
    assert_int_equal(params.toggle_overlay.size(), 2);
    assert_int_equal(params.toggle_overlay[0], XKB_KEY_Control_L);
    assert_int_equal(params.toggle_overlay[1], XKB_KEY_F1);
}

static void test_escaped_values(void **state) {
    UNUSED(state);
    overlay_params params {};
    parse_overlay_config(&params, "font_file=/tmp/a\\,b.ttf,font_size=20");
    assert_string_equal(params.font_file.c_str(), "/tmp/a,b.ttf");
    assert_float_equal(params.font_size, 20.f, 0.0001f);

    setenv("HOME", "/home/tester", 1);
    parse_overlay_config(&params, "font_file=~/fonts/mono.ttf");
    assert_string_equal(params.font_file.c_str(), "/home/tester/fonts/mono.ttf");
}

static void test_invalid_values(void **state) {
    UNUSED(state);
    overlay_params params {};
    parse_overlay_config(&params,
        "vertex_capacity=abc,index_capacity=0,alpha=7,theme=neon,font_scale=-1,"
        "font_size=-4,gl_size_query=window,bogus=1,reactive=1");

    assert_int_equal(params.vertex_capacity, 16384);
    assert_int_equal(params.index_capacity, 16384);
    assert_float_equal(params.alpha, 1.f, 0.0001f);
    assert_int_equal(params.theme, THEME_DARK);
    assert_float_equal(params.font_scale, 1.f, 0.0001f);
    assert_float_equal(params.font_size, 13.f, 0.0001f);
    assert_int_equal(params.gl_size_query, GL_SIZE_DRAWABLE);
    // unknown options do not stop the rest
    assert_true(params.enabled[OVERLAY_PARAM_ENABLED_reactive]);
}

static void test_unknown_key(void **state) {
    UNUSED(state);
    overlay_params params {};
    parse_overlay_config(&params, "toggle_overlay=Shift_L+NotAKey");
    assert_int_equal(params.toggle_overlay.size(), 1);
    assert_int_equal(params.toggle_overlay[0], XKB_KEY_Shift_L);
}

static void test_config_file(void **state) {
    UNUSED(state);
    char path[] = "/tmp/imoverlay-test-XXXXXX";
    int fd = mkstemp(path);
    assert_true(fd >= 0);
    const std::string content =
        "# imoverlay test\n"
        "reactive\n"
        "font_size = 20 # big\n"
        "clipboard=0\n"
        "\n"
        "theme=classic\n";
    assert_int_equal(write(fd, content.data(), content.size()), content.size());
    close(fd);

    setenv("IMOVERLAY_CONFIGFILE", path, 1);
    overlay_params params {};
    parse_overlay_config(&params, "font_size=18");

    assert_string_equal(params.config_file_path.c_str(), path);
    assert_true(params.enabled[OVERLAY_PARAM_ENABLED_reactive]);
    assert_false(params.enabled[OVERLAY_PARAM_ENABLED_clipboard]);
    assert_int_equal(params.theme, THEME_CLASSIC);
    // the environment wins over the file
    assert_float_equal(params.font_size, 18.f, 0.0001f);

    unlink(path);
    setenv("IMOVERLAY_CONFIGFILE", "/nonexistent/imoverlay.conf", 1);
}

static void test_config_line(void **state) {
    UNUSED(state);
    std::unordered_map<std::string, std::string> options;
    parseConfigLine("  font_size = 12 # big", options);
    parseConfigLine("no_display", options);
    parseConfigLine("# nothing here", options);
    parseConfigLine("   ", options);
    parseConfigLine("font_file = /home/me/fonts/C#Mono.ttf", options);

    assert_int_equal(options.size(), 3);
    assert_string_equal(options["font_size"].c_str(), "12");
    assert_string_equal(options["no_display"].c_str(), "1");
    assert_string_equal(options["font_file"].c_str(), "/home/me/fonts/C#Mono.ttf");
}

static void test_config_paths(void **state) {
    UNUSED(state);
    auto paths = config_file_paths();
    assert_int_equal(paths.size(), 1);
    assert_string_equal(paths[0].c_str(), "/nonexistent/imoverlay.conf");

    unsetenv("IMOVERLAY_CONFIGFILE");
    setenv("XDG_CONFIG_HOME", "/tmp/imoverlay-xdg", 1);
    paths = config_file_paths();
    assert_int_equal(paths.size(), 2);
    // the per program file comes first
    assert_string_equal(paths[0].c_str(), "/tmp/imoverlay-xdg/imoverlay/test_overlay_params.conf");
    assert_string_equal(paths[1].c_str(), "/tmp/imoverlay-xdg/imoverlay/imoverlay.conf");

    unsetenv("XDG_CONFIG_HOME");
    setenv("IMOVERLAY_CONFIGFILE", "/nonexistent/imoverlay.conf", 1);
}

static void test_strict_numbers(void **state) {
    UNUSED(state);
    overlay_params params {};
    parse_overlay_config(&params, "font_size=12px,gl_bind_framebuffer=2x,font_scale= 1.25 ");
    assert_float_equal(params.font_size, 13.f, 0.0001f);
    assert_int_equal(params.gl_bind_framebuffer, -1);
    assert_float_equal(params.font_scale, 1.25f, 0.0001f);

    // unsigned options take the whole value or keep the default
    set_param_defaults(&params);
    parse_overlay_config(&params, "vertex_capacity=16k,index_capacity=4294967297,settle_frames=2 frames");
    assert_int_equal(params.vertex_capacity, 16384);
    assert_int_equal(params.index_capacity, 16384);
    assert_int_equal(params.settle_frames, 3);

    parse_overlay_config(&params, "vertex_capacity=-5,settle_frames=-1,index_capacity=0x1000");
    assert_int_equal(params.vertex_capacity, 16384);
    assert_int_equal(params.settle_frames, 3);
    assert_int_equal(params.index_capacity, 4096);

    parse_overlay_config(&params, "vertex_capacity= 32768 ,settle_frames=0");
    assert_int_equal(params.vertex_capacity, 32768);
    assert_int_equal(params.settle_frames, 0);
}

static void test_font_hash(void **state) {
    UNUSED(state);
    overlay_params a {}, b {};
    set_param_defaults(&a);
    set_param_defaults(&b);
    assert_int_equal(a.font_params_hash, b.font_params_hash);

    b.font_size = 20.f;
    update_font_params_hash(&b);
    assert_int_not_equal(a.font_params_hash, b.font_params_hash);

    b = a;
    b.font_file = "/usr/share/fonts/TTF/DejaVuSans.ttf";
    update_font_params_hash(&b);
    assert_int_not_equal(a.font_params_hash, b.font_params_hash);
}

static void test_resolve_theme(void **state) {
    UNUSED(state);
    unsetenv("GTK_THEME");
    unsetenv("GTK_APPLICATION_PREFER_DARK_THEME");
    assert_int_equal(resolve_theme(THEME_LIGHT), THEME_LIGHT);
    assert_int_equal(resolve_theme(THEME_CLASSIC), THEME_CLASSIC);
    assert_int_equal(resolve_theme(THEME_SYSTEM), THEME_DARK);

    setenv("GTK_THEME", "Adwaita:light", 1);
    assert_int_equal(resolve_theme(THEME_SYSTEM), THEME_LIGHT);
    setenv("GTK_THEME", "Adwaita-dark", 1);
    assert_int_equal(resolve_theme(THEME_SYSTEM), THEME_DARK);

    setenv("GTK_THEME", "Breeze", 1);
    setenv("GTK_APPLICATION_PREFER_DARK_THEME", "0", 1);
    assert_int_equal(resolve_theme(THEME_SYSTEM), THEME_LIGHT);

    unsetenv("GTK_THEME");
    unsetenv("GTK_APPLICATION_PREFER_DARK_THEME");
}

const struct CMUnitTest overlay_params_tests[] = {
    cmocka_unit_test(test_defaults),
    cmocka_unit_test(test_env_options),
    cmocka_unit_test(test_escaped_values),
    cmocka_unit_test(test_invalid_values),
    cmocka_unit_test(test_unknown_key),
    cmocka_unit_test(test_config_file),
    cmocka_unit_test(test_config_line),
    cmocka_unit_test(test_config_paths),
    cmocka_unit_test(test_strict_numbers),
    cmocka_unit_test(test_font_hash),
    cmocka_unit_test(test_resolve_theme)
};

int main(void) {
    return cmocka_run_group_tests(overlay_params_tests, no_config_file, NULL);
}
