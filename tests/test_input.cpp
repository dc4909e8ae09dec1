#include <stdarg.h>
#include <stddef.h>
#include <setjmp.h>
#include <stdint.h>
#include <cfloat>
extern "C" {
#include <cmocka.h>
}
#include <X11/Xlib.h>
#include <X11/keysym.h>
#include <imgui.h>
#include "../src/input_manager.h"
#include "../src/loaders/loader_x11.h"

#define UNUSED(x) (void)(x)

using namespace ImOverlay;

static int setup_imgui(void **state) {
    UNUSED(state);
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = NULL;
    // every queued event lands in the next frame
    io.ConfigInputTrickleEventQueue = false;
    io.Fonts->AddFontDefault();
    io.Fonts->Build();
    return 0;
}

static int teardown_imgui(void **state) {
    UNUSED(state);
    ImGui::DestroyContext();
    return 0;
}

// Replays `input` into a new ImGui frame. Pair with ImGui::EndFrame().
static bool frame(input_manager& input) {
    bool any = input.collect_input(ImGui::GetIO(), ImVec2(800, 600));
    ImGui::NewFrame();
    return any;
}

static XEvent motion(int x, int y, unsigned int mods = 0) {
    XEvent ev {};
    ev.type = MotionNotify;
    ev.xmotion.x = x;
    ev.xmotion.y = y;
    ev.xmotion.state = mods;
    return ev;
}

static XEvent button(unsigned int b, bool pressed, unsigned int mods = 0) {
    XEvent ev {};
    ev.type = pressed ? ButtonPress : ButtonRelease;
    ev.xbutton.button = b;
    ev.xbutton.x = 40;
    ev.xbutton.y = 30;
    ev.xbutton.state = mods;
    return ev;
}

static void test_display_and_delta(void **state) {
    UNUSED(state);
    input_manager input;
    ImGuiIO& io = ImGui::GetIO();

    assert_false(input.has_pending());
    assert_false(frame(input));
    assert_float_equal(io.DisplaySize.x, 800.f, 0.0001f);
    assert_float_equal(io.DisplaySize.y, 600.f, 0.0001f);
    assert_float_equal(io.DeltaTime, 1.f / 60.f, 0.0001f);
    ImGui::EndFrame();

    assert_false(frame(input));
    assert_true(io.DeltaTime > 0.f);
    ImGui::EndFrame();
}

static void test_mouse_move(void **state) {
    UNUSED(state);
    input_manager input;
    ImGuiIO& io = ImGui::GetIO();

    assert_int_equal(input.process(motion(10, 20)), input_result::mouse_move);
    assert_true(input.has_pending());
    assert_true(frame(input));
    assert_false(input.has_pending());
    assert_float_equal(io.MousePos.x, 10.f, 0.0001f);
    assert_float_equal(io.MousePos.y, 20.f, 0.0001f);
    ImGui::EndFrame();

    // coordinates are signed 16 bit on the wire
    input.process(motion(-5, 70000));
    frame(input);
    assert_float_equal(io.MousePos.x, -5.f, 0.0001f);
    assert_float_equal(io.MousePos.y, float(int16_t(70000)), 0.0001f);
    ImGui::EndFrame();

    XEvent leave {};
    leave.type = LeaveNotify;
    assert_int_equal(input.process(leave), input_result::mouse_move);
    frame(input);
    assert_false(ImGui::IsMousePosValid());
    ImGui::EndFrame();
}

static void test_mouse_buttons(void **state) {
    UNUSED(state);
    input_manager input;
    ImGuiIO& io = ImGui::GetIO();

    assert_int_equal(input.process(button(Button1, true)), input_result::mouse_left);
    assert_int_equal(input.process(button(Button3, true)), input_result::mouse_right);
    assert_int_equal(input.process(button(Button2, true)), input_result::mouse_middle);
    assert_int_equal(input.process(button(8, true)), input_result::mouse_middle);
    frame(input);
    assert_true(io.MouseDown[ImGuiMouseButton_Left]);
    assert_true(io.MouseDown[ImGuiMouseButton_Right]);
    assert_true(io.MouseDown[ImGuiMouseButton_Middle]);
    assert_true(io.MouseDown[3]);
    assert_float_equal(io.MousePos.x, 40.f, 0.0001f);
    ImGui::EndFrame();

    input.process(button(Button1, false));
    input.process(button(Button3, false));
    input.process(button(Button2, false));
    input.process(button(8, false));
    frame(input);
    assert_false(io.MouseDown[ImGuiMouseButton_Left]);
    assert_false(io.MouseDown[ImGuiMouseButton_Right]);
    assert_false(io.MouseDown[ImGuiMouseButton_Middle]);
    assert_false(io.MouseDown[3]);
    ImGui::EndFrame();

    assert_int_equal(input.process(button(42, true)), input_result::unknown);
    assert_false(input.has_pending());
}

static void test_scroll(void **state) {
    UNUSED(state);
    input_manager input;
    ImGuiIO& io = ImGui::GetIO();

    assert_int_equal(input.process(button(Button4, true)), input_result::scroll);
    frame(input);
    assert_float_equal(io.MouseWheel, 1.f, 0.0001f);
    ImGui::EndFrame();

    // releases of wheel buttons carry nothing
    assert_int_equal(input.process(button(Button4, false)), input_result::scroll);
    assert_false(input.has_pending());

    input.process(button(Button5, true));
    input.process(button(Button5, true));
    frame(input);
    assert_float_equal(io.MouseWheel, -2.f, 0.0001f);
    ImGui::EndFrame();

    input.process(button(6, true));
    frame(input);
    assert_float_equal(io.MouseWheelH, 1.f, 0.0001f);
    assert_float_equal(io.MouseWheel, 0.f, 0.0001f);
    ImGui::EndFrame();
}

static void test_ctrl_wheel_zoom(void **state) {
    UNUSED(state);
    input_manager input;
    ImGuiIO& io = ImGui::GetIO();
    io.FontGlobalScale = 1.f;

    assert_int_equal(input.process(button(Button4, true, ControlMask)), input_result::zoom);
    frame(input);
    assert_float_equal(io.FontGlobalScale, 1.5f, 0.0001f);
    assert_float_equal(io.MouseWheel, 0.f, 0.0001f);
    assert_true(io.KeyCtrl);
    ImGui::EndFrame();

    input.process(button(Button4, true, ControlMask));
    input.process(button(Button4, true, ControlMask));
    frame(input);
    assert_float_equal(io.FontGlobalScale, 3.f, 0.0001f);
    ImGui::EndFrame();

    for (int i = 0; i < 4; i++)
        input.process(button(Button5, true, ControlMask));
    frame(input);
    assert_float_equal(io.FontGlobalScale, 0.5f, 0.0001f);
    ImGui::EndFrame();

    input.set_ctrl_wheel_zoom(false);
    assert_int_equal(input.process(button(Button4, true, ControlMask)), input_result::scroll);
    input.process(motion(1, 1, 0));
    frame(input);
    assert_float_equal(io.FontGlobalScale, 0.5f, 0.0001f);
    assert_float_equal(io.MouseWheel, 1.f, 0.0001f);
    assert_false(io.KeyCtrl);
    ImGui::EndFrame();
    io.FontGlobalScale = 1.f;
}

static void test_modifiers(void **state) {
    UNUSED(state);
    input_manager input;
    ImGuiIO& io = ImGui::GetIO();

    input.process(motion(5, 5, ShiftMask | Mod1Mask));
    frame(input);
    assert_true(io.KeyShift);
    assert_true(io.KeyAlt);
    assert_false(io.KeyCtrl);
    ImGui::EndFrame();

    input.process(motion(6, 6, 0));
    frame(input);
    assert_false(io.KeyShift);
    assert_false(io.KeyAlt);
    ImGui::EndFrame();

    // the modifier key itself is not in the state mask yet
    input.on_key(XK_Control_L, XK_Control_L, 0, true);
    frame(input);
    assert_true(io.KeyCtrl);
    assert_true(ImGui::IsKeyDown(ImGuiKey_LeftCtrl));
    ImGui::EndFrame();

    input.on_key(XK_Control_L, XK_Control_L, ControlMask, false);
    frame(input);
    assert_false(io.KeyCtrl);
    assert_false(ImGui::IsKeyDown(ImGuiKey_LeftCtrl));
    ImGui::EndFrame();
}

static void test_keys_and_text(void **state) {
    UNUSED(state);
    input_manager input;
    ImGuiIO& io = ImGui::GetIO();

    assert_int_equal(input.on_key(XK_a, XK_A, ShiftMask, true), input_result::key);
    frame(input);
    assert_true(ImGui::IsKeyDown(ImGuiKey_A));
    assert_int_equal(io.InputQueueCharacters.Size, 1);
    assert_int_equal(io.InputQueueCharacters[0], 'A');
    ImGui::EndFrame();

    // no text for releases and control characters
    assert_int_equal(input.on_key(XK_a, XK_a, ShiftMask, false), input_result::key);
    assert_int_equal(input.on_key(XK_Return, XK_Return, 0, true), input_result::key);
    frame(input);
    assert_false(ImGui::IsKeyDown(ImGuiKey_A));
    assert_true(ImGui::IsKeyDown(ImGuiKey_Enter));
    assert_int_equal(io.InputQueueCharacters.Size, 0);
    ImGui::EndFrame();
    input.on_key(XK_Return, XK_Return, 0, false);

    // shortcuts do not type
    input.on_key(XK_c, XK_c, ControlMask, true);
    frame(input);
    assert_true(ImGui::IsKeyDown(ImGuiKey_C));
    assert_int_equal(io.InputQueueCharacters.Size, 0);
    ImGui::EndFrame();
    input.on_key(XK_c, XK_c, 0, false);

    // keys ImGui has no name for still type
    assert_int_equal(input.on_key(XK_EuroSign, XK_EuroSign, 0, true), input_result::character);
    frame(input);
    assert_int_equal(io.InputQueueCharacters.Size, 1);
    assert_int_equal(io.InputQueueCharacters[0], 0x20ac);
    ImGui::EndFrame();

    assert_int_equal(input.on_key(0x1234567, NoSymbol, 0, true), input_result::unknown);
    frame(input);
    ImGui::EndFrame();
}

static void test_focus(void **state) {
    UNUSED(state);
    input_manager input;
    ImGuiIO& io = ImGui::GetIO();

    input.process(motion(7, 7, ControlMask));
    frame(input);
    assert_true(io.KeyCtrl);
    ImGui::EndFrame();

    XEvent ev {};
    ev.type = FocusOut;
    input.process(ev);
    frame(input);
    ImGui::EndFrame();
    frame(input);
    assert_false(io.KeyCtrl);
    ImGui::EndFrame();

    // Ctrl was forgotten with the focus, so it is sent again
    ev.type = FocusIn;
    input.process(ev);
    input.process(motion(8, 8, ControlMask));
    frame(input);
    assert_true(io.KeyCtrl);
    ImGui::EndFrame();

    input.process(motion(9, 9, 0));
    input.clear();
    assert_false(input.has_pending());
    frame(input);
    assert_true(io.KeyCtrl);
    ImGui::EndFrame();
}

static void test_keysym_mapping(void **state) {
    UNUSED(state);
    assert_int_equal(keysym_to_imgui_key(XK_z), ImGuiKey_Z);
    assert_int_equal(keysym_to_imgui_key(XK_Z), ImGuiKey_Z);
    assert_int_equal(keysym_to_imgui_key(XK_7), ImGuiKey_7);
    assert_int_equal(keysym_to_imgui_key(XK_KP_5), ImGuiKey_Keypad5);
    assert_int_equal(keysym_to_imgui_key(XK_KP_Home), ImGuiKey_Keypad7);
    assert_int_equal(keysym_to_imgui_key(XK_F1), ImGuiKey_F1);
    assert_int_equal(keysym_to_imgui_key(XK_F12), ImGuiKey_F12);
    assert_int_equal(keysym_to_imgui_key(XK_ISO_Left_Tab), ImGuiKey_Tab);
    assert_int_equal(keysym_to_imgui_key(XK_bracketleft), ImGuiKey_LeftBracket);
    assert_int_equal(keysym_to_imgui_key(XK_apostrophe), ImGuiKey_Apostrophe);
    assert_int_equal(keysym_to_imgui_key(XK_Super_R), ImGuiKey_RightSuper);
    assert_int_equal(keysym_to_imgui_key(XK_EuroSign), ImGuiKey_None);
}

static void test_x11_loader(void **state) {
    UNUSED(state);
    libx11_loader missing("libimoverlay-does-not-exist.so");
    assert_false(missing.IsLoaded());
    assert_null(missing.XOpenDisplay);
    assert_null(missing.XLookupKeysym);

    // every symbol or none
    libx11_loader x11("libX11.so.6");
    if (x11.IsLoaded()) {
        assert_non_null(x11.XOpenDisplay);
        assert_non_null(x11.XLookupKeysym);
        assert_non_null(x11.XFree);
    } else {
        assert_null(x11.XOpenDisplay);
    }
}

const struct CMUnitTest input_tests[] = {
    cmocka_unit_test(test_display_and_delta),
    cmocka_unit_test(test_mouse_move),
    cmocka_unit_test(test_mouse_buttons),
    cmocka_unit_test(test_scroll),
    cmocka_unit_test(test_ctrl_wheel_zoom),
    cmocka_unit_test(test_modifiers),
    cmocka_unit_test(test_keys_and_text),
    cmocka_unit_test(test_focus),
    cmocka_unit_test(test_keysym_mapping),
    cmocka_unit_test(test_x11_loader)
};

int main(void) {
    return cmocka_run_group_tests(input_tests, setup_imgui, teardown_imgui);
}
