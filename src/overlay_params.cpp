#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <functional>
#include <xkbcommon/xkbcommon.h>
#include <spdlog/spdlog.h>

#include "overlay_params.h"
#include "config.h"
#include "file_utils.h"
#include "string_utils.h"

namespace ImOverlay {

template<typename... Ts>
size_t get_hash(Ts const&... args)
{
   size_t hash = 0;
   ( (hash ^= std::hash<Ts>{}(args) << 1), ...);
   return hash;
}

void update_font_params_hash(struct overlay_params *params)
{
   params->font_params_hash = get_hash(params->font_size,
                                 params->font_file,
                                 params->font_scale);
}

static std::vector<KeySym>
parse_string_to_keysym_vec(const char *str)
{
   std::vector<KeySym> keys;
   auto keyStrings = str_tokenize(str, "+");
   for (auto& ks : keyStrings) {
      trim(ks);
      xkb_keysym_t xk = xkb_keysym_from_name(ks.c_str(), XKB_KEYSYM_CASE_INSENSITIVE);
      if (xk != XKB_KEY_NoSymbol)
         keys.push_back(xk);
      else
         SPDLOG_ERROR("Unrecognized key: '{}'", ks);
   }
   return keys;
}

#define parse_toggle_overlay parse_string_to_keysym_vec

static float
parse_float(const char *str)
{
   return ::parse_float(std::string(str));
}

#define parse_font_size(s) parse_float(s)

static float
parse_font_scale(const char *str)
{
   float scale = parse_float(str);
   if (scale <= 0.f)
      throw std::invalid_argument("font_scale must be positive");
   return scale;
}

static float
parse_alpha(const char *str)
{
   return std::clamp(parse_float(str), 0.f, 1.f);
}

static unsigned
parse_unsigned(const char *str)
{
   int val;
   if (!try_stoi(val, str) || val < 0)
      throw std::invalid_argument("not an unsigned integer");
   return val;
}

static unsigned
parse_capacity(const char *str)
{
   unsigned val = parse_unsigned(str);
   if (val == 0)
      throw std::invalid_argument("capacity must not be zero");
   return val;
}

#define parse_vertex_capacity   parse_capacity
#define parse_index_capacity    parse_capacity
#define parse_settle_frames     parse_unsigned

static signed
parse_signed(const char *str)
{
   int val;
   if (!try_stoi(val, str))
      throw std::invalid_argument("not an integer");
   return val;
}

#define parse_gl_bind_framebuffer parse_signed

static std::string
parse_path(const char *str)
{
   std::string path = trim_copy(str);
   if (path == "~" || path.rfind("~/", 0) == 0) {
      std::string home = get_home_dir();
      if (!home.empty())
         return home + path.substr(1);
   }
   return path;
}

#define parse_font_file parse_path

static enum overlay_theme
parse_theme(const char *str)
{
   std::string value = to_lower(trim_copy(str));
   if (value == "dark")
      return THEME_DARK;
   if (value == "light")
      return THEME_LIGHT;
   if (value == "classic")
      return THEME_CLASSIC;
   if (value == "system")
      return THEME_SYSTEM;
   throw std::invalid_argument("expected dark, light, classic or system");
}

static enum gl_size_query
parse_gl_size_query(const char *str)
{
   std::string value = to_lower(trim_copy(str));
   if (value == "viewport")
      return GL_SIZE_VIEWPORT;
   if (value == "scissorbox")
      return GL_SIZE_SCISSORBOX;
   if (value == "drawable")
      return GL_SIZE_DRAWABLE;
   throw std::invalid_argument("expected drawable, viewport or scissorbox");
}

enum overlay_theme resolve_theme(enum overlay_theme theme)
{
   if (theme != THEME_SYSTEM)
      return theme;

   // GTK_THEME is "Name[:variant]", e.g. "Adwaita:light" or "Adwaita-dark"
   const char *gtk_theme = getenv("GTK_THEME");
   if (gtk_theme) {
      std::string name = to_lower(gtk_theme);
      if (ends_with(name, ":light") || ends_with(name, "-light"))
         return THEME_LIGHT;
      if (ends_with(name, ":dark") || ends_with(name, "-dark"))
         return THEME_DARK;
   }

   const char *prefer_dark = getenv("GTK_APPLICATION_PREFER_DARK_THEME");
   if (prefer_dark && !strcmp(prefer_dark, "0"))
      return THEME_LIGHT;

   return THEME_DARK;
}

static bool is_delimiter(char c)
{
   return c == 0 || c == ',' || c == ':' || c == ';' || c == '=';
}

// Reads one "key[=value]" pair from `s`, returns the number of characters
// consumed. A bare key means "1". `\` escapes a delimiter inside a value.
static size_t
parse_string(const char *s, std::string& out_param, std::string& out_value)
{
   size_t i = 0;
   out_param.clear();
   out_value.clear();

   for (; !is_delimiter(*s); s++, i++)
      out_param += *s;

   if (*s == '=') {
      s++;
      i++;
      for (; !is_delimiter(*s); s++, i++) {
         if (*s == '\\' && *(s + 1) != 0 && is_delimiter(*(s + 1))) {
            s++;
            i++;
         }
         out_value += *s;
      }
   } else
      out_value = "1";

   if (*s && is_delimiter(*s)) {
      s++;
      i++;
   }

   if (*s && !i) {
      SPDLOG_ERROR("syntax error: unexpected '{0:c}' ({0:d}) while "
              "parsing a string", *s);
   }

   return i;
}

static void
set_parameters_from_options(struct overlay_params *params)
{
   for (auto& it : params->options) {
      try {
#define OVERLAY_PARAM_BOOL(name)                                 \
         if (it.first == #name) {                                \
            params->enabled[OVERLAY_PARAM_ENABLED_##name] =      \
               strtol(it.second.c_str(), NULL, 0) != 0;          \
            continue;                                            \
         }
#define OVERLAY_PARAM_CUSTOM(name)                               \
         if (it.first == #name) {                                \
            params->name = parse_##name(it.second.c_str());      \
            continue;                                            \
         }
         OVERLAY_PARAMS
#undef OVERLAY_PARAM_BOOL
#undef OVERLAY_PARAM_CUSTOM
      } catch (const std::invalid_argument& e) {
         SPDLOG_ERROR("Invalid value '{}' for option '{}': {}", it.second, it.first, e.what());
         continue;
      }
      SPDLOG_ERROR("Unknown option '{}'", it.first);
   }
}

static void
parse_overlay_env(struct overlay_params *params, const char *env)
{
   size_t num;
   std::string key, value;
   params->options.clear();
   while ((num = parse_string(env, key, value)) != 0) {
      trim(key);
      trim(value);
      env += num;
      if (key.empty())
         continue;
      params->options[key] = value;
   }
   set_parameters_from_options(params);
}

void set_param_defaults(struct overlay_params *params)
{
   params->enabled[OVERLAY_PARAM_ENABLED_reactive] = false;
   params->enabled[OVERLAY_PARAM_ENABLED_clipboard] = true;
   params->enabled[OVERLAY_PARAM_ENABLED_ctrl_wheel_zoom] = true;
   params->enabled[OVERLAY_PARAM_ENABLED_no_display] = false;
   params->theme = THEME_DARK;
   params->font_file = "";
   params->font_size = 13.f;
   params->font_scale = 1.0f;
   params->vertex_capacity = 16384;
   params->index_capacity = 16384;
   params->gl_size_query = GL_SIZE_DRAWABLE;
   params->gl_bind_framebuffer = -1;
   params->toggle_overlay = { XKB_KEY_Shift_R, XKB_KEY_F12 };
   params->settle_frames = 3;
   params->alpha = 1.0f;
   update_font_params_hash(params);
}

void
parse_overlay_config(struct overlay_params *params, const char *env)
{
   *params = {};
   set_param_defaults(params);

   if (parseConfigFile(*params))
      set_parameters_from_options(params);

   if (env)
      parse_overlay_env(params, env);

   if (params->font_size <= 0.f) {
      SPDLOG_WARN("font_size {} is not usable, falling back to 13", params->font_size);
      params->font_size = 13.f;
   }

   update_font_params_hash(params);
}

}
