#pragma once
#ifndef IMOVERLAY_OVERLAY_PARAMS_H
#define IMOVERLAY_OVERLAY_PARAMS_H

#include <string>
#include <vector>
#include <unordered_map>
#include <cstddef>
#include <cstdint>

#ifndef KeySym
typedef unsigned long KeySym;
#endif

#define OVERLAY_PARAMS                               \
   OVERLAY_PARAM_BOOL(reactive)                      \
   OVERLAY_PARAM_BOOL(clipboard)                     \
   OVERLAY_PARAM_BOOL(ctrl_wheel_zoom)               \
   OVERLAY_PARAM_BOOL(no_display)                    \
   OVERLAY_PARAM_CUSTOM(theme)                       \
   OVERLAY_PARAM_CUSTOM(font_file)                   \
   OVERLAY_PARAM_CUSTOM(font_size)                   \
   OVERLAY_PARAM_CUSTOM(font_scale)                  \
   OVERLAY_PARAM_CUSTOM(vertex_capacity)             \
   OVERLAY_PARAM_CUSTOM(index_capacity)              \
   OVERLAY_PARAM_CUSTOM(gl_size_query)               \
   OVERLAY_PARAM_CUSTOM(gl_bind_framebuffer)         \
   OVERLAY_PARAM_CUSTOM(toggle_overlay)              \
   OVERLAY_PARAM_CUSTOM(settle_frames)               \
   OVERLAY_PARAM_CUSTOM(alpha)                       \

namespace ImOverlay {

enum overlay_theme {
   THEME_DARK,
   THEME_LIGHT,
   THEME_CLASSIC,
   THEME_SYSTEM,
};

enum gl_size_query {
   GL_SIZE_DRAWABLE,
   GL_SIZE_VIEWPORT,
   GL_SIZE_SCISSORBOX,
};

enum overlay_param_enabled {
#define OVERLAY_PARAM_BOOL(name) OVERLAY_PARAM_ENABLED_##name,
#define OVERLAY_PARAM_CUSTOM(name)
   OVERLAY_PARAMS
#undef OVERLAY_PARAM_BOOL
#undef OVERLAY_PARAM_CUSTOM
   OVERLAY_PARAM_ENABLED_MAX
};

struct overlay_params {
   bool enabled[OVERLAY_PARAM_ENABLED_MAX];
   enum overlay_theme theme;
   std::string font_file;
   float font_size;
   float font_scale;
   unsigned vertex_capacity;
   unsigned index_capacity;
   enum gl_size_query gl_size_query;
   int gl_bind_framebuffer;
   std::vector<KeySym> toggle_overlay;
   unsigned settle_frames;
   float alpha;

   std::string config_file_path;
   std::unordered_map<std::string,std::string> options;
   size_t font_params_hash;
};

// Resets `params` to defaults, then applies the first config file found and
// finally the `env` option string (may be null).
void parse_overlay_config(struct overlay_params *params, const char *env);
void set_param_defaults(struct overlay_params *params);
// Call after changing font_file, font_size or font_scale by hand.
void update_font_params_hash(struct overlay_params *params);

// Resolves `theme=system` against the desktop environment.
enum overlay_theme resolve_theme(enum overlay_theme theme);

}

#endif //IMOVERLAY_OVERLAY_PARAMS_H
