#include <cstring>
#include <spdlog/spdlog.h>
#include "gl_textures.h"

namespace ImOverlay { namespace GL {

texture_manager::~texture_manager()
{
    if (!textures.empty())
        SPDLOG_DEBUG("texture manager destroyed with {} textures", textures.size());
}

GLuint texture_manager::upload(const managed_texture& tex)
{
    GLuint handle = 0;
    glGenTextures(1, &handle);
    glBindTexture(GL_TEXTURE_2D, handle);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, tex.width, tex.height, 0,
                 GL_RGBA, GL_UNSIGNED_BYTE, tex.pixels.data());
    if (drain_gl_errors("texture upload")) {
        glDeleteTextures(1, &handle);
        return 0;
    }
    return handle;
}

void texture_manager::create_texture(texture_id id, const texture_delta& delta)
{
    managed_texture tex;
    tex.width = delta.width;
    tex.height = delta.height;
    tex.pixels = delta.pixels;
    tex.handle = upload(tex);
    SPDLOG_DEBUG("texture {}: created {}x{} (gl {})", id, tex.width, tex.height, tex.handle);
    textures[id] = std::move(tex);
}

void texture_manager::update_texture(managed_texture& tex, const texture_delta& delta)
{
    if (!delta.pos) {
        if (tex.width != delta.width || tex.height != delta.height) {
            if (tex.handle)
                glDeleteTextures(1, &tex.handle);
            tex.width = delta.width;
            tex.height = delta.height;
            tex.pixels = delta.pixels;
            tex.handle = upload(tex);
            return;
        }

        tex.pixels = delta.pixels;
        if (tex.handle) {
            glBindTexture(GL_TEXTURE_2D, tex.handle);
            glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, tex.width, tex.height,
                            GL_RGBA, GL_UNSIGNED_BYTE, tex.pixels.data());
            drain_gl_errors("texture update");
        }
        return;
    }

    const int x = delta.pos->x, y = delta.pos->y;
    const size_t row = size_t(delta.width) * 4;
    for (int r = 0; r < delta.height; r++) {
        memcpy(&tex.pixels[(size_t(y + r) * tex.width + x) * 4],
               &delta.pixels[r * row], row);
    }

    if (tex.handle) {
        glBindTexture(GL_TEXTURE_2D, tex.handle);
        glTexSubImage2D(GL_TEXTURE_2D, 0, x, y, delta.width, delta.height,
                        GL_RGBA, GL_UNSIGNED_BYTE, delta.pixels.data());
        drain_gl_errors("texture partial update");
    }
}

void texture_manager::process_set_deltas(const std::vector<texture_delta>& deltas)
{
    for (auto& delta : deltas) {
        if (delta.width <= 0 || delta.height <= 0
            || delta.pixels.size() != size_t(delta.width) * delta.height * 4) {
            SPDLOG_ERROR("texture {}: bad image {}x{} with {} bytes", delta.id,
                         delta.width, delta.height, delta.pixels.size());
            continue;
        }

        auto it = textures.find(delta.id);
        if (it == textures.end()) {
            if (delta.pos) {
                SPDLOG_ERROR("texture {}: partial update of unknown texture", delta.id);
                continue;
            }
            create_texture(delta.id, delta);
            continue;
        }

        auto& tex = it->second;
        // subtract instead of add, x + width can overflow
        if (delta.pos && (delta.pos->x < 0 || delta.pos->y < 0
            || delta.pos->x > tex.width || delta.width > tex.width - delta.pos->x
            || delta.pos->y > tex.height || delta.height > tex.height - delta.pos->y)) {
            SPDLOG_ERROR("texture {}: region {}x{} at ({}, {}) is outside {}x{}",
                         delta.id, delta.width, delta.height,
                         delta.pos->x, delta.pos->y, tex.width, tex.height);
            continue;
        }
        update_texture(tex, delta);
    }
}

void texture_manager::process_free_deltas(const std::vector<texture_id>& deltas)
{
    for (auto id : deltas) {
        auto it = textures.find(id);
        if (it == textures.end())
            continue;
        if (it->second.handle)
            glDeleteTextures(1, &it->second.handle);
        textures.erase(it);
        SPDLOG_DEBUG("texture {}: freed", id);
    }
}

GLuint texture_manager::get_by_id(texture_id id) const
{
    auto it = textures.find(id);
    if (it == textures.end())
        return 0;
    return it->second.handle;
}

void texture_manager::deallocate_textures()
{
    for (auto& [id, tex] : textures) {
        if (tex.handle) {
            glDeleteTextures(1, &tex.handle);
            tex.handle = 0;
        }
    }
}

void texture_manager::reallocate_textures()
{
    for (auto& [id, tex] : textures) {
        if (!tex.handle)
            tex.handle = upload(tex);
    }
}

void texture_manager::clear()
{
    deallocate_textures();
    textures.clear();
}

}} // namespaces
