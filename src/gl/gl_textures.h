#pragma once
#ifndef IMOVERLAY_GL_TEXTURES_H
#define IMOVERLAY_GL_TEXTURES_H

#include <cstdint>
#include <vector>
#include <optional>
#include <unordered_map>
#include "gl.h"

namespace ImOverlay { namespace GL {

typedef uint64_t texture_id;

// Reserved for the ImGui font atlas. User textures start after it.
constexpr texture_id FONT_TEXTURE_ID = 1;

struct texture_pos {
    int x, y;
};

// RGBA8 image data for a texture. Without `pos` the whole texture is
// replaced, with it only the region at `pos` is.
struct texture_delta {
    texture_id id;
    int width;
    int height;
    std::optional<texture_pos> pos;
    std::vector<uint8_t> pixels;
};

struct managed_texture {
    GLuint handle = 0;
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;
};

// Owns the GL textures drawn by the overlay. All GL calls expect overlay
// state to be set up (see GLState::setup).
class texture_manager {
public:
    texture_manager() = default;
    ~texture_manager();

    texture_manager(const texture_manager&) = delete;
    texture_manager& operator=(const texture_manager&) = delete;

    void process_set_deltas(const std::vector<texture_delta>& deltas);
    void process_free_deltas(const std::vector<texture_id>& deltas);

    // GL handle, or 0 for unknown and deallocated textures.
    GLuint get_by_id(texture_id id) const;
    bool contains(texture_id id) const { return textures.count(id) != 0; }
    size_t size() const { return textures.size(); }

    // Drops GPU handles but keeps CPU copies, for context loss.
    void deallocate_textures();
    void reallocate_textures();
    // Deletes everything, GPU and CPU side.
    void clear();

private:
    void create_texture(texture_id id, const texture_delta& delta);
    void update_texture(managed_texture& tex, const texture_delta& delta);
    static GLuint upload(const managed_texture& tex);

    std::unordered_map<texture_id, managed_texture> textures;
};

}} // namespaces

#endif //IMOVERLAY_GL_TEXTURES_H
