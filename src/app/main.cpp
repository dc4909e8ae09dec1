#include <cmath>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#define GL_GLEXT_PROTOTYPES 1
#include <GL/gl.h>
#include <GL/glext.h>
#include <GL/glx.h>
#include <imgui.h>
#include <spdlog/spdlog.h>

#include "../overlay.h"
#include "../logging.h"
#include "../timing.hpp"

using namespace ImOverlay;

// What the host itself draws: a spinning triangle with depth testing, so a
// broken state restore shows up immediately.
struct host_scene {
    GLuint prog = 0;
    GLuint vao = 0;
    GLuint vbo = 0;
    GLint angle_loc = -1;
};

struct demo_state {
    Overlay* overlay = nullptr;
    texture_id image = 0;
    int clicks = 0;
    float speed = 1.0f;
    bool show_log = true;
    char text[256] = "type here";
    std::vector<std::string> log;
};

static GLuint host_shader(GLenum type, const char* src)
{
    GLuint s = glCreateShader(type);
    glShaderSource(s, 1, &src, NULL);
    glCompileShader(s);
    GLint ok = 0;
    glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
    if (!ok) {
        char log[1024];
        glGetShaderInfoLog(s, sizeof(log), NULL, log);
        SPDLOG_ERROR("host shader: {}", log);
    }
    return s;
}

static bool init_scene(host_scene& scene)
{
    const char* vs =
        "#version 130\n"
        "uniform float angle;\n"
        "in vec3 pos;\n"
        "in vec3 col;\n"
        "out vec3 v_col;\n"
        "void main(){\n"
        "  float c = cos(angle), s = sin(angle);\n"
        "  gl_Position = vec4(c * pos.x - s * pos.y, s * pos.x + c * pos.y, pos.z, 1.0);\n"
        "  v_col = col;\n"
        "}\n";
    const char* fs =
        "#version 130\n"
        "in vec3 v_col;\n"
        "out vec4 color;\n"
        "void main(){ color = vec4(v_col, 1.0); }\n";

    GLuint v = host_shader(GL_VERTEX_SHADER, vs);
    GLuint f = host_shader(GL_FRAGMENT_SHADER, fs);
    scene.prog = glCreateProgram();
    glAttachShader(scene.prog, v);
    glAttachShader(scene.prog, f);
    glBindAttribLocation(scene.prog, 0, "pos");
    glBindAttribLocation(scene.prog, 1, "col");
    glLinkProgram(scene.prog);
    glDeleteShader(v);
    glDeleteShader(f);
    GLint ok = 0;
    glGetProgramiv(scene.prog, GL_LINK_STATUS, &ok);
    if (!ok)
        return false;
    scene.angle_loc = glGetUniformLocation(scene.prog, "angle");

    const float verts[] = {
        -0.6f, -0.5f, 0.0f,   1.0f, 0.2f, 0.2f,
         0.6f, -0.5f, 0.0f,   0.2f, 1.0f, 0.2f,
         0.0f,  0.6f, 0.0f,   0.2f, 0.2f, 1.0f,
    };
    glGenVertexArrays(1, &scene.vao);
    glGenBuffers(1, &scene.vbo);
    glBindVertexArray(scene.vao);
    glBindBuffer(GL_ARRAY_BUFFER, scene.vbo);
    glBufferData(GL_ARRAY_BUFFER, sizeof(verts), verts, GL_STATIC_DRAW);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, 6 * sizeof(float), (void*)0);
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, 6 * sizeof(float), (void*)(3 * sizeof(float)));
    return true;
}

static void draw_scene(const host_scene& scene, int width, int height, float angle)
{
    glViewport(0, 0, width, height);
    glEnable(GL_DEPTH_TEST);
    glDisable(GL_BLEND);
    glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    glUseProgram(scene.prog);
    glUniform1f(scene.angle_loc, angle);
    glBindVertexArray(scene.vao);
    glDrawArrays(GL_TRIANGLES, 0, 3);
}

static std::vector<uint8_t> checkerboard(int size, int cell)
{
    std::vector<uint8_t> pixels(size_t(size) * size * 4);
    for (int y = 0; y < size; y++) {
        for (int x = 0; x < size; x++) {
            bool dark = ((x / cell) + (y / cell)) % 2;
            uint8_t* p = &pixels[(size_t(y) * size + x) * 4];
            p[0] = dark ? 40 : 230;
            p[1] = dark ? 40 : 180;
            p[2] = dark ? 40 : 60;
            p[3] = 255;
        }
    }
    return pixels;
}

static void draw_ui(demo_state& demo)
{
    ImGui::SetNextWindowPos(ImVec2(20, 20), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(360, 460), ImGuiCond_FirstUseEver);
    ImGui::Begin("imoverlay demo");

    ImGui::Text("%.1f FPS", ImGui::GetIO().Framerate);
    if (ImGui::Button("Click me"))
        demo.clicks++;
    ImGui::SameLine();
    ImGui::Text("clicked %d times", demo.clicks);

    ImGui::SliderFloat("speed", &demo.speed, 0.0f, 5.0f);
    ImGui::InputText("text", demo.text, sizeof(demo.text));

    ImGui::Image((ImTextureID)(intptr_t)demo.image, ImVec2(128, 128));
    if (ImGui::Button("Recolor a tile")) {
        std::vector<uint8_t> tile(16 * 16 * 4);
        for (size_t i = 0; i < tile.size(); i += 4) {
            tile[i] = rand() % 256;
            tile[i + 1] = rand() % 256;
            tile[i + 2] = rand() % 256;
            tile[i + 3] = 255;
        }
        int x = (rand() % 8) * 16, y = (rand() % 8) * 16;
        demo.overlay->update_texture(demo.image, tile, 16, 16, x, y);
        demo.log.push_back("recolored tile at " + std::to_string(x) + "," + std::to_string(y));
    }

    ImGui::Checkbox("show log", &demo.show_log);
    if (demo.show_log) {
        ImGui::BeginChild("log", ImVec2(0, 120), true);
        for (auto& line : demo.log)
            ImGui::TextUnformatted(line.c_str());
        ImGui::EndChild();
    }

    ImGui::End();
}

int main(int argc, char** argv)
{
    init_spdlog();

    bool reactive = false;
    for (int i = 1; i < argc; i++) {
        if (!strcmp(argv[i], "--reactive"))
            reactive = true;
    }

    Display* dpy = XOpenDisplay(nullptr);
    if (!dpy) {
        SPDLOG_ERROR("cannot open display");
        return 1;
    }

    int attribs[] = { GLX_RGBA, GLX_DOUBLEBUFFER, GLX_DEPTH_SIZE, 24, None };
    XVisualInfo* vi = glXChooseVisual(dpy, DefaultScreen(dpy), attribs);
    if (!vi) {
        SPDLOG_ERROR("no suitable GLX visual");
        XCloseDisplay(dpy);
        return 1;
    }

    Window root = RootWindow(dpy, vi->screen);
    XSetWindowAttributes swa {};
    swa.colormap = XCreateColormap(dpy, root, vi->visual, AllocNone);
    swa.event_mask = ExposureMask | StructureNotifyMask | KeyPressMask | KeyReleaseMask
        | ButtonPressMask | ButtonReleaseMask | PointerMotionMask
        | EnterWindowMask | LeaveWindowMask | FocusChangeMask;
    int width = 1280, height = 800;
    Window win = XCreateWindow(dpy, root, 0, 0, width, height, 0, vi->depth, InputOutput,
                               vi->visual, CWColormap | CWEventMask, &swa);
    XStoreName(dpy, win, "imoverlay demo");
    Atom wm_delete = XInternAtom(dpy, "WM_DELETE_WINDOW", False);
    XSetWMProtocols(dpy, win, &wm_delete, 1);
    XMapWindow(dpy, win);

    GLXContext ctx = glXCreateContext(dpy, vi, nullptr, True);
    XFree(vi);
    if (!ctx || !glXMakeCurrent(dpy, win, ctx)) {
        SPDLOG_ERROR("cannot create GL context");
        XDestroyWindow(dpy, win);
        XCloseDisplay(dpy);
        return 1;
    }

    host_scene scene;
    if (!init_scene(scene))
        SPDLOG_ERROR("host scene failed to build");

    {
        demo_state demo;
        Overlay overlay(win, [&demo]() { draw_ui(demo); }, reactive);
        demo.overlay = &overlay;
        demo.image = overlay.load_texture(checkerboard(128, 16), 128, 128);

        auto start = Clock::now();
        bool running = true;
        float angle = 0.f;
        while (running) {
            while (XPending(dpy)) {
                XEvent ev;
                XNextEvent(dpy, &ev);
                if (ev.type == ClientMessage && (Atom)ev.xclient.data.l[0] == wm_delete)
                    running = false;
                if (ev.type == ConfigureNotify) {
                    width = ev.xconfigure.width;
                    height = ev.xconfigure.height;
                }
                input_result res = overlay.wnd_proc(ev);
                if (res == input_result::mouse_left && !overlay.wants_input())
                    SPDLOG_TRACE("click went to the host");
            }

            auto now = Clock::now();
            angle += demo.speed * std::chrono::duration<float>(now - start).count();
            start = now;

            draw_scene(scene, width, height, angle);
            overlay.present();
            glXSwapBuffers(dpy, win);
        }
    }

    glDeleteProgram(scene.prog);
    glDeleteBuffers(1, &scene.vbo);
    glDeleteVertexArrays(1, &scene.vao);
    glXMakeCurrent(dpy, None, nullptr);
    glXDestroyContext(dpy, ctx);
    XDestroyWindow(dpy, win);
    XCloseDisplay(dpy);
    return 0;
}
