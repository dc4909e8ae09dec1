#pragma once
#ifndef IMOVERLAY_OVERLAY_H
#define IMOVERLAY_OVERLAY_H

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <string>
#include <vector>
#include <X11/Xlib.h>
#include <imgui.h>

#include "overlay_params.h"
#include "input_manager.h"
#include "keybinds.h"
#include "clipboard.h"
#include "gl/gl.h"
#include "gl/gl_mesh.h"
#include "gl/gl_program.h"
#include "gl/gl_textures.h"

namespace ImOverlay {

using GL::texture_id;

// Called between ImGui::NewFrame() and ImGui::Render() with the overlay's
// context current.
typedef std::function<void()> ui_callback;

// Dear ImGui on top of a host's OpenGL rendering into an X11 window.
//
// present() must run on the thread that has the host's GL context current,
// right before the host swaps buffers. wnd_proc() and the texture calls may
// run on any thread.
class Overlay {
public:
   // Reads IMOVERLAY_CONFIG and the config files, `reactive` overrides them.
   Overlay(Window window, ui_callback ui, bool reactive);
   Overlay(Window window, ui_callback ui, const overlay_params& params);
   // Deletes GL objects, call with the same context current as present().
   ~Overlay();

   Overlay(const Overlay&) = delete;
   Overlay& operator=(const Overlay&) = delete;

   // Before the host tears down its GL context or objects. Everything is
   // recreated on the next present().
   void pre_reset();
   void present();

   input_result wnd_proc(const XEvent& ev);
   bool wants_input() const;
   void request_repaint();

   // RGBA8 pixels, width * height * 4 bytes. The returned id can be used
   // as ImTextureID right away, the upload happens in the next present().
   texture_id load_texture(const std::vector<uint8_t>& pixels, int width, int height);
   void update_texture(texture_id id, const std::vector<uint8_t>& pixels, int width, int height);
   void update_texture(texture_id id, const std::vector<uint8_t>& pixels, int width, int height, int x, int y);
   void free_texture(texture_id id);

   void set_visible(bool visible);
   bool visible() const { return is_visible; }
   void toggle();

   void set_params(const overlay_params& params);
   const overlay_params& get_params() const { return params; }
   ImGuiContext* context() const { return imgui_ctx; }

private:
   void init(Window window);
   void apply_style();
   void build_fonts();
   bool create_device_objects();
   void destroy_device_objects();
   bool query_window_size(int& width, int& height) const;
   void check_texture_id(texture_id id) const;
   void render_meshes();

   static const char* get_clipboard_text(void* user_data);
   static void set_clipboard_text(void* user_data, const char* text);

   Window window = None;
   ui_callback ui;
   overlay_params params {};
   ImGuiContext* imgui_ctx = nullptr;

   input_manager input;
   std::unique_ptr<clipboard> clip;
   std::string clipboard_get_buffer;
   std::string copied_text;
   bool has_copied_text = false;
   keybind_state keys;

   GL::gl_caps caps;
   GL::texture_manager textures;
   GL::buffers buffers;
   GL::program program;
   bool device_ready = false;
   bool device_failed = false;
   bool should_reset = false;
   unsigned create_failures = 0;
   bool host_errors_logged = false;

   // last rebuilt frame
   std::vector<GL::gpu_vertex> vertices;
   std::vector<uint32_t> indices;
   std::vector<GL::mesh_descriptor> meshes;
   std::array<float, 16> proj {};
   int fb_width = 0, fb_height = 0;
   bool has_frame = false;

   unsigned settle_frames_left = 0;
   size_t font_params_hash = 0;
   bool fonts_dirty = true;

   std::atomic<bool> is_visible {true};
   std::atomic<bool> repaint_requested {false};
   std::atomic<bool> want_mouse {false};
   std::atomic<bool> want_keyboard {false};

   std::mutex delta_mtx;
   std::vector<GL::texture_delta> pending_set;
   std::vector<texture_id> pending_free;
   std::unordered_set<texture_id> live_textures;
   std::atomic<texture_id> next_texture_id {GL::FONT_TEXTURE_ID + 1};
};

}

#endif //IMOVERLAY_OVERLAY_H
