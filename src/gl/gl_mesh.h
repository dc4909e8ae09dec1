#pragma once
#ifndef IMOVERLAY_GL_MESH_H
#define IMOVERLAY_GL_MESH_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include <imgui.h>
#include "gl.h"
#include "gl_textures.h"

namespace ImOverlay { namespace GL {

struct vertex_color {
    uint8_t r, g, b, a;
};

struct gpu_vertex {
    float pos[2];
    float uv[2];
    vertex_color color;
};

static_assert(sizeof(gpu_vertex) == 20, "gpu_vertex must stay tightly packed");

// Scissor rectangle in GL window coordinates (origin bottom-left).
struct clip_rect {
    GLint x, y;
    GLsizei width, height;
};

struct mesh_descriptor {
    size_t vertices;
    size_t indices;
    size_t vtx_offset;
    size_t idx_offset;
    clip_rect clip;
    texture_id texture;
};

vertex_color unpack_color(ImU32 col);

// Flattens ImGui draw data into one vertex and one index array. Indices are
// rebased so each mesh can be drawn straight from `idx_offset`.
void build_meshes(const ImDrawData& draw_data,
                  std::vector<gpu_vertex>& vertices,
                  std::vector<uint32_t>& indices,
                  std::vector<mesh_descriptor>& meshes);

// Column-major orthographic projection of the display rect, +y down.
std::array<float, 16> projection(ImVec2 display_pos, ImVec2 display_size);

size_t grow_capacity(size_t current, size_t needed);

// Vertex array plus its vertex and index buffers.
class buffers {
public:
    bool create(size_t vtx_capacity, size_t idx_capacity);
    void destroy();
    bool valid() const { return vao && vbo && ibo; }

    bool upload_vertices(const std::vector<gpu_vertex>& vertices);
    bool upload_indices(const std::vector<uint32_t>& indices);
    void bind() const;

    size_t vertex_capacity() const { return vtx_capacity; }
    size_t index_capacity() const { return idx_capacity; }

private:
    GLuint vao = 0;
    GLuint vbo = 0;
    GLuint ibo = 0;
    size_t vtx_capacity = 0;
    size_t idx_capacity = 0;
};

}} // namespaces

#endif //IMOVERLAY_GL_MESH_H
