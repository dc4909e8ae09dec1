#include <algorithm>
#include <spdlog/spdlog.h>
#include "gl_mesh.h"

namespace ImOverlay { namespace GL {

vertex_color unpack_color(ImU32 col)
{
    return {
        uint8_t((col >> IM_COL32_R_SHIFT) & 0xFF),
        uint8_t((col >> IM_COL32_G_SHIFT) & 0xFF),
        uint8_t((col >> IM_COL32_B_SHIFT) & 0xFF),
        uint8_t((col >> IM_COL32_A_SHIFT) & 0xFF),
    };
}

void build_meshes(const ImDrawData& draw_data,
                  std::vector<gpu_vertex>& vertices,
                  std::vector<uint32_t>& indices,
                  std::vector<mesh_descriptor>& meshes)
{
    static bool warned_callback = false;

    vertices.clear();
    indices.clear();
    meshes.clear();

    const ImVec2 clip_off = draw_data.DisplayPos;
    const ImVec2 clip_scale = draw_data.FramebufferScale;
    const float fb_width = draw_data.DisplaySize.x * clip_scale.x;
    const float fb_height = draw_data.DisplaySize.y * clip_scale.y;
    if (fb_width <= 0 || fb_height <= 0)
        return;

    for (int n = 0; n < draw_data.CmdListsCount; n++) {
        const ImDrawList* cmd_list = draw_data.CmdLists[n];
        const size_t base = vertices.size();
        const size_t list_vertices = cmd_list->VtxBuffer.Size;

        for (const ImDrawVert& v : cmd_list->VtxBuffer)
            vertices.push_back({{v.pos.x, v.pos.y}, {v.uv.x, v.uv.y}, unpack_color(v.col)});

        for (const ImDrawCmd& cmd : cmd_list->CmdBuffer) {
            if (cmd.UserCallback) {
                if (cmd.UserCallback != ImDrawCallback_ResetRenderState && !warned_callback) {
                    SPDLOG_WARN("ImDrawList user callbacks are not supported, skipping");
                    warned_callback = true;
                }
                continue;
            }

            if (cmd.ElemCount == 0 || cmd.ElemCount % 3 != 0)
                continue;
            if (cmd.VtxOffset >= list_vertices
                || size_t(cmd.IdxOffset) + cmd.ElemCount > size_t(cmd_list->IdxBuffer.Size))
                continue;

            ImVec2 clip_min((cmd.ClipRect.x - clip_off.x) * clip_scale.x, (cmd.ClipRect.y - clip_off.y) * clip_scale.y);
            ImVec2 clip_max((cmd.ClipRect.z - clip_off.x) * clip_scale.x, (cmd.ClipRect.w - clip_off.y) * clip_scale.y);
            clip_min.x = std::max(clip_min.x, 0.f);
            clip_min.y = std::max(clip_min.y, 0.f);
            clip_max.x = std::min(clip_max.x, fb_width);
            clip_max.y = std::min(clip_max.y, fb_height);
            if (clip_max.x <= clip_min.x || clip_max.y <= clip_min.y)
                continue;

            mesh_descriptor mesh;
            mesh.vertices = list_vertices - cmd.VtxOffset;
            mesh.indices = cmd.ElemCount;
            mesh.vtx_offset = base + cmd.VtxOffset;
            mesh.idx_offset = indices.size();
            mesh.texture = texture_id(intptr_t(cmd.TextureId));
            // GL's origin is bottom-left
            mesh.clip.x = GLint(clip_min.x);
            mesh.clip.y = GLint(fb_height - clip_max.y);
            mesh.clip.width = GLsizei(clip_max.x - clip_min.x);
            mesh.clip.height = GLsizei(clip_max.y - clip_min.y);

            bool in_range = true;
            for (unsigned int i = 0; i < cmd.ElemCount; i++) {
                ImDrawIdx idx = cmd_list->IdxBuffer[cmd.IdxOffset + i];
                if (idx >= mesh.vertices) {
                    in_range = false;
                    break;
                }
                indices.push_back(uint32_t(mesh.vtx_offset + idx));
            }
            if (!in_range) {
                SPDLOG_ERROR("draw command indexes past its vertex buffer, dropped");
                indices.resize(mesh.idx_offset);
                continue;
            }

            meshes.push_back(mesh);
        }
    }
}

std::array<float, 16> projection(ImVec2 display_pos, ImVec2 display_size)
{
    const float L = display_pos.x;
    const float R = display_pos.x + display_size.x;
    const float T = display_pos.y;
    const float B = display_pos.y + display_size.y;
    return {
        2.0f/(R-L),   0.0f,         0.0f,   0.0f,
        0.0f,         2.0f/(T-B),   0.0f,   0.0f,
        0.0f,         0.0f,        -1.0f,   0.0f,
        (R+L)/(L-R),  (T+B)/(B-T),  0.0f,   1.0f,
    };
}

size_t grow_capacity(size_t current, size_t needed)
{
    if (needed <= current)
        return current;
    size_t cap = 1;
    while (cap < needed)
        cap <<= 1;
    return cap;
}

bool buffers::create(size_t vtx_cap, size_t idx_cap)
{
    destroy();

    glGenVertexArrays(1, &vao);
    glGenBuffers(1, &vbo);
    glGenBuffers(1, &ibo);

    vtx_capacity = vtx_cap;
    idx_capacity = idx_cap;

    glBindVertexArray(vao);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, vtx_capacity * sizeof(gpu_vertex), nullptr, GL_STREAM_DRAW);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ibo);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, idx_capacity * sizeof(uint32_t), nullptr, GL_STREAM_DRAW);

    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(gpu_vertex), (void*)offsetof(gpu_vertex, pos));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, sizeof(gpu_vertex), (void*)offsetof(gpu_vertex, uv));
    glEnableVertexAttribArray(2);
    glVertexAttribPointer(2, 4, GL_UNSIGNED_BYTE, GL_TRUE, sizeof(gpu_vertex), (void*)offsetof(gpu_vertex, color));

    if (drain_gl_errors("buffers::create")) {
        destroy();
        return false;
    }
    SPDLOG_DEBUG("created buffers: {} vertices, {} indices", vtx_capacity, idx_capacity);
    return true;
}

void buffers::destroy()
{
    if (vao) glDeleteVertexArrays(1, &vao);
    if (vbo) glDeleteBuffers(1, &vbo);
    if (ibo) glDeleteBuffers(1, &ibo);
    vao = vbo = ibo = 0;
    vtx_capacity = idx_capacity = 0;
}

void buffers::bind() const
{
    glBindVertexArray(vao);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ibo);
}

bool buffers::upload_vertices(const std::vector<gpu_vertex>& vertices)
{
    if (!valid())
        return false;

    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    if (vertices.size() > vtx_capacity) {
        vtx_capacity = grow_capacity(vtx_capacity, vertices.size());
        SPDLOG_DEBUG("growing vertex buffer to {}", vtx_capacity);
    }
    // orphan, then fill
    glBufferData(GL_ARRAY_BUFFER, vtx_capacity * sizeof(gpu_vertex), nullptr, GL_STREAM_DRAW);
    if (!vertices.empty())
        glBufferSubData(GL_ARRAY_BUFFER, 0, vertices.size() * sizeof(gpu_vertex), vertices.data());
    return !drain_gl_errors("upload_vertices");
}

bool buffers::upload_indices(const std::vector<uint32_t>& indices)
{
    if (!valid())
        return false;

    // element buffer binding is VAO state
    glBindVertexArray(vao);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ibo);
    if (indices.size() > idx_capacity) {
        idx_capacity = grow_capacity(idx_capacity, indices.size());
        SPDLOG_DEBUG("growing index buffer to {}", idx_capacity);
    }
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, idx_capacity * sizeof(uint32_t), nullptr, GL_STREAM_DRAW);
    if (!indices.empty())
        glBufferSubData(GL_ELEMENT_ARRAY_BUFFER, 0, indices.size() * sizeof(uint32_t), indices.data());
    return !drain_gl_errors("upload_indices");
}

}} // namespaces
