#include <algorithm>
#include <cstdlib>
#include <string>
#include <stdexcept>
#include <GL/glx.h>
#include <imgui.h>
#include <imgui_internal.h>
#include <spdlog/spdlog.h>

#include "overlay.h"
#include "logging.h"
#include "file_utils.h"
#include "gl/gl_state.h"

namespace ImOverlay {

// Makes `ctx` current for the scope and restores whatever the host had.
struct context_guard {
   ImGuiContext* saved;
   explicit context_guard(ImGuiContext* ctx) : saved(ImGui::GetCurrentContext()) {
      ImGui::SetCurrentContext(ctx);
   }
   ~context_guard() {
      ImGui::SetCurrentContext(saved);
   }
};

Overlay::Overlay(Window window, ui_callback ui, bool reactive)
   : ui(std::move(ui))
{
   init_spdlog();
   parse_overlay_config(&params, getenv("IMOVERLAY_CONFIG"));
   params.enabled[OVERLAY_PARAM_ENABLED_reactive] = reactive;
   init(window);
}

Overlay::Overlay(Window window, ui_callback ui, const overlay_params& params)
   : ui(std::move(ui)), params(params)
{
   init_spdlog();
   init(window);
}

void Overlay::init(Window window)
{
   if (window == None)
      throw std::invalid_argument("invalid window passed to Overlay");
   if (!ui)
      throw std::invalid_argument("Overlay needs a ui callback");

   this->window = window;
   input.set_ctrl_wheel_zoom(params.enabled[OVERLAY_PARAM_ENABLED_ctrl_wheel_zoom]);
   clip = std::make_unique<clipboard>(params.enabled[OVERLAY_PARAM_ENABLED_clipboard]);
   is_visible = !params.enabled[OVERLAY_PARAM_ENABLED_no_display];

   IMGUI_CHECKVERSION();
   ImGuiContext *saved_ctx = ImGui::GetCurrentContext();
   imgui_ctx = ImGui::CreateContext();
   ImGui::SetCurrentContext(imgui_ctx);

   ImGuiIO& io = ImGui::GetIO();
   io.IniFilename = NULL;
   io.LogFilename = NULL;
   io.BackendPlatformName = "imoverlay_x11";
   io.BackendRendererName = "imoverlay_gl3";
   io.BackendFlags |= ImGuiBackendFlags_RendererHasVtxOffset;
   io.SetClipboardTextFn = set_clipboard_text;
   io.GetClipboardTextFn = get_clipboard_text;
   io.ClipboardUserData = this;
   apply_style();

   // Restore global context or ours might clash with apps that use Dear ImGui
   ImGui::SetCurrentContext(saved_ctx);

   SPDLOG_DEBUG("overlay created for window 0x{:x} (reactive: {}, clipboard: {})",
                window, params.enabled[OVERLAY_PARAM_ENABLED_reactive], clip->is_x11());
}

Overlay::~Overlay()
{
   destroy_device_objects();
   textures.clear();
   if (imgui_ctx)
      ImGui::DestroyContext(imgui_ctx);
}

void Overlay::apply_style()
{
   switch (resolve_theme(params.theme)) {
   case THEME_LIGHT:
      ImGui::StyleColorsLight();
      break;
   case THEME_CLASSIC:
      ImGui::StyleColorsClassic();
      break;
   default:
      ImGui::StyleColorsDark();
      break;
   }
   ImGui::GetStyle().Alpha = std::clamp(params.alpha, 0.f, 1.f);
   ImGui::GetIO().FontGlobalScale = params.font_scale;
}

void Overlay::build_fonts()
{
   ImGuiIO& io = ImGui::GetIO();
   io.Fonts->Clear();

   if (!params.font_file.empty()) {
      if (file_exists(params.font_file))
         io.Fonts->AddFontFromFileTTF(params.font_file.c_str(), params.font_size);
      if (io.Fonts->Fonts.empty())
         SPDLOG_ERROR("Could not load font '{}', using the default font", params.font_file);
   }

   if (io.Fonts->Fonts.empty()) {
      ImFontConfig cfg;
      cfg.SizePixels = params.font_size;
      io.Fonts->AddFontDefault(&cfg);
   }

   unsigned char* pixels = nullptr;
   int width = 0, height = 0;
   io.Fonts->GetTexDataAsRGBA32(&pixels, &width, &height);

   GL::texture_delta delta {GL::FONT_TEXTURE_ID, width, height, std::nullopt,
                            std::vector<uint8_t>(pixels, pixels + size_t(width) * height * 4)};
   io.Fonts->SetTexID((ImTextureID)(intptr_t)GL::FONT_TEXTURE_ID);
   io.Fonts->ClearTexData();
   {
      std::lock_guard lk(delta_mtx);
      pending_set.push_back(std::move(delta));
   }

   font_params_hash = params.font_params_hash;
   fonts_dirty = false;
   SPDLOG_DEBUG("font atlas rebuilt: {}x{}", width, height);
}

bool Overlay::create_device_objects()
{
   if (!program.create()) {
      SPDLOG_ERROR("Could not build the overlay shader program, overlay disabled");
      device_failed = true;
      return false;
   }

   if (!buffers.create(params.vertex_capacity, params.index_capacity)) {
      // retried on the next frame
      if (!create_failures++)
         SPDLOG_ERROR("Could not create overlay buffers, retrying");
      program.destroy();
      return false;
   }

   if (create_failures)
      SPDLOG_INFO("Overlay buffers created after {} attempts", create_failures + 1);
   create_failures = 0;
   textures.reallocate_textures();
   device_ready = true;
   return true;
}

void Overlay::destroy_device_objects()
{
   if (!device_ready)
      return;
   program.destroy();
   buffers.destroy();
   textures.deallocate_textures();
   device_ready = false;
}

void Overlay::pre_reset()
{
   destroy_device_objects();
   should_reset = true;
   SPDLOG_DEBUG("pre_reset: GPU objects released");
}

bool Overlay::query_window_size(int& width, int& height) const
{
   GLint vp[4] {};
   switch (params.gl_size_query)
   {
      case GL_SIZE_VIEWPORT:
         glGetIntegerv (GL_VIEWPORT, vp);
         break;
      case GL_SIZE_SCISSORBOX:
         glGetIntegerv (GL_SCISSOR_BOX, vp);
         break;
      default: {
         Display* dpy = glXGetCurrentDisplay();
         GLXDrawable drawable = glXGetCurrentDrawable();
         unsigned int w = 0, h = 0;
         if (drawable && drawable != window) {
            static bool logged = false;
            if (!logged) {
               SPDLOG_DEBUG("current drawable 0x{:x} is not window 0x{:x}", drawable, window);
               logged = true;
            }
         }
         if (dpy && drawable) {
            glXQueryDrawable(dpy, drawable, GLX_WIDTH, &w);
            glXQueryDrawable(dpy, drawable, GLX_HEIGHT, &h);
         }
         // zero with llvmpipe and some wrappers
         if (w && h) {
            width = w;
            height = h;
            return true;
         }
         glGetIntegerv (GL_VIEWPORT, vp);
         break;
      }
   }
   width = vp[2];
   height = vp[3];
   return width > 0 && height > 0;
}

void Overlay::render_meshes()
{
   program.use(proj);
   buffers.bind();

   for (const auto& mesh : meshes) {
      GLuint tex = textures.get_by_id(mesh.texture);
      if (!tex)
         continue;

      glScissor(mesh.clip.x, mesh.clip.y, mesh.clip.width, mesh.clip.height);
      glBindTexture(GL_TEXTURE_2D, tex);
      glDrawElements(GL_TRIANGLES, GLsizei(mesh.indices), GL_UNSIGNED_INT,
                     (void*)(intptr_t)(mesh.idx_offset * sizeof(uint32_t)));
   }
}

void Overlay::present()
{
   if (device_failed)
      return;

   context_guard guard(imgui_ctx);
   ImGuiIO& io = ImGui::GetIO();

   if (check_keybinds(keys, params))
      toggle();
   clip->pump();

   if (!is_visible) {
      input.clear();
      want_mouse = false;
      want_keyboard = false;
      return;
   }

   int width = 0, height = 0;
   if (!query_window_size(width, height))
      return;

   // errors the host left pending are not ours, later checks only see the overlay's
   std::vector<GLenum> host_errors = GL::take_gl_errors();
   if (!host_errors.empty()) {
      if (!host_errors_logged) {
         SPDLOG_WARN("host left GL error 0x{:x} ({}) pending before present",
                     host_errors[0], GL::gl_err_str(host_errors[0]));
         host_errors_logged = true;
      } else {
         SPDLOG_TRACE("host left {} GL errors pending", host_errors.size());
      }
   }

   if (!device_ready)
      caps = GL::query_caps();

   GL::GLState state(caps);
   state.setup(width, height, params.gl_bind_framebuffer);

   bool reset = false;
   if (!device_ready) {
      if (!create_device_objects())
         return;
      reset = true;
      should_reset = false;
   }

   if (fonts_dirty || font_params_hash != params.font_params_hash)
      build_fonts();

   const bool input_pending = input.has_pending();
   const bool size_changed = width != fb_width || height != fb_height;
   bool deltas_pending;
   {
      std::lock_guard lk(delta_mtx);
      deltas_pending = !pending_set.empty() || !pending_free.empty();
   }

   bool rebuild = !params.enabled[OVERLAY_PARAM_ENABLED_reactive]
      || reset || input_pending || size_changed || deltas_pending || !has_frame;
   if (repaint_requested.exchange(false))
      rebuild = true;

   // input keeps the frame live for settle_frames more rebuilds
   if (input_pending || size_changed || reset)
      settle_frames_left = params.settle_frames;
   else if (settle_frames_left > 0) {
      settle_frames_left--;
      rebuild = true;
   }

   if (rebuild) {
      input.collect_input(io, ImVec2(float(width), float(height)));
      ImGui::NewFrame();
      try {
         ui();
      } catch (const std::exception& e) {
         SPDLOG_ERROR("ui callback threw: {}", e.what());
         ImGui::ErrorCheckEndFrameRecover(nullptr);
      } catch (...) {
         SPDLOG_ERROR("ui callback threw a non-standard exception");
         ImGui::ErrorCheckEndFrameRecover(nullptr);
      }
      ImGui::Render();
      want_mouse = io.WantCaptureMouse;
      want_keyboard = io.WantCaptureKeyboard;
   }

   std::vector<GL::texture_delta> sets;
   std::vector<texture_id> frees;
   {
      std::lock_guard lk(delta_mtx);
      sets.swap(pending_set);
      frees.swap(pending_free);
   }
   if (!sets.empty())
      textures.process_set_deltas(sets);

   if (has_copied_text) {
      clip->set_text(copied_text);
      has_copied_text = false;
   }

   if (rebuild) {
      ImDrawData* draw_data = ImGui::GetDrawData();
      if (draw_data) {
         GL::build_meshes(*draw_data, vertices, indices, meshes);
         proj = GL::projection(draw_data->DisplayPos, draw_data->DisplaySize);
      } else {
         meshes.clear();
      }
      fb_width = width;
      fb_height = height;
      has_frame = true;

      if (!meshes.empty()
          && (!buffers.upload_vertices(vertices) || !buffers.upload_indices(indices))) {
         SPDLOG_ERROR("Could not upload overlay meshes, skipping frame");
         meshes.clear();
      }
   }

   if (meshes.empty()) {
      if (!frees.empty())
         textures.process_free_deltas(frees);
      return;
   }

   render_meshes();

   if (!frees.empty())
      textures.process_free_deltas(frees);
   GL::drain_gl_errors("present");
}

input_result Overlay::wnd_proc(const XEvent& ev)
{
   return input.process(ev);
}

bool Overlay::wants_input() const
{
   return is_visible && (want_mouse || want_keyboard);
}

void Overlay::request_repaint()
{
   repaint_requested = true;
}

// delta_mtx must be held
void Overlay::check_texture_id(texture_id id) const
{
   if (id == GL::FONT_TEXTURE_ID)
      throw std::invalid_argument("the font atlas texture is managed by the overlay");
   if (!live_textures.count(id))
      throw std::invalid_argument("unknown or freed texture id " + std::to_string(id));
}

static void check_image(const std::vector<uint8_t>& pixels, int width, int height)
{
   if (width <= 0 || height <= 0)
      throw std::invalid_argument("texture size must be positive");
   if (pixels.size() != size_t(width) * height * 4)
      throw std::invalid_argument("pixel buffer does not match " + std::to_string(width)
                                  + "x" + std::to_string(height) + " RGBA8");
}

texture_id Overlay::load_texture(const std::vector<uint8_t>& pixels, int width, int height)
{
   check_image(pixels, width, height);
   texture_id id = next_texture_id++;
   std::lock_guard lk(delta_mtx);
   live_textures.insert(id);
   pending_set.push_back({id, width, height, std::nullopt, pixels});
   return id;
}

void Overlay::update_texture(texture_id id, const std::vector<uint8_t>& pixels, int width, int height)
{
   check_image(pixels, width, height);
   std::lock_guard lk(delta_mtx);
   check_texture_id(id);
   pending_set.push_back({id, width, height, std::nullopt, pixels});
}

void Overlay::update_texture(texture_id id, const std::vector<uint8_t>& pixels, int width, int height, int x, int y)
{
   check_image(pixels, width, height);
   if (x < 0 || y < 0)
      throw std::invalid_argument("texture region must not start at a negative offset");
   std::lock_guard lk(delta_mtx);
   check_texture_id(id);
   pending_set.push_back({id, width, height, GL::texture_pos{x, y}, pixels});
}

void Overlay::free_texture(texture_id id)
{
   std::lock_guard lk(delta_mtx);
   check_texture_id(id);
   live_textures.erase(id);
   pending_free.push_back(id);
}

void Overlay::set_visible(bool visible)
{
   if (is_visible.exchange(visible) == visible)
      return;
   if (visible)
      repaint_requested = true;
   SPDLOG_DEBUG("overlay {}", visible ? "shown" : "hidden");
}

void Overlay::set_params(const overlay_params& new_params)
{
   context_guard guard(imgui_ctx);
   const bool clipboard_changed = new_params.enabled[OVERLAY_PARAM_ENABLED_clipboard]
      != params.enabled[OVERLAY_PARAM_ENABLED_clipboard];

   params = new_params;
   input.set_ctrl_wheel_zoom(params.enabled[OVERLAY_PARAM_ENABLED_ctrl_wheel_zoom]);
   if (clipboard_changed)
      clip = std::make_unique<clipboard>(params.enabled[OVERLAY_PARAM_ENABLED_clipboard]);
   apply_style();
   if (font_params_hash != params.font_params_hash)
      fonts_dirty = true;
   repaint_requested = true;
}

const char* Overlay::get_clipboard_text(void* user_data)
{
   Overlay* overlay = static_cast<Overlay*>(user_data);
   if (overlay->has_copied_text)
      return overlay->copied_text.c_str();
   overlay->clipboard_get_buffer = overlay->clip->get_text();
   return overlay->clipboard_get_buffer.c_str();
}

void Overlay::toggle()
{
   bool visible = is_visible.load();
   while (!is_visible.compare_exchange_weak(visible, !visible))
      ;
   visible = !visible;
   if (visible)
      repaint_requested = true;
   SPDLOG_DEBUG("overlay {}", visible ? "shown" : "hidden");
}

void Overlay::set_clipboard_text(void* user_data, const char* text)
{
   Overlay* overlay = static_cast<Overlay*>(user_data);
   overlay->copied_text = text ? text : "";
   overlay->has_copied_text = true;
}

}
