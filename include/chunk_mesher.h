/**
 * @file chunk_mesher.h
 * @brief Naive per-face mesher turning a voxel grid into flat vertex arrays
 */

#pragma once

#include <array>
#include <cstddef>
#include <vector>
#include <glm/glm.hpp>
#include "block_system.h"

class VoxelGrid;

/**
 * @brief Renderable surface of a grid: 6 vertices (2 triangles) per visible face
 *
 * positions and normals hold 3 floats per vertex, uvs hold 2.
 */
struct ChunkMesh {
    std::vector<float> positions;
    std::vector<float> normals;
    std::vector<float> uvs;

    size_t vertexCount() const { return positions.size() / 3; }
    size_t faceCount() const { return vertexCount() / 6; }
    size_t triangleCount() const { return vertexCount() / 3; }
    bool empty() const { return positions.empty(); }
};

class ChunkMesher {
public:
    static constexpr float UV_EPSILON = 0.001f;

    explicit ChunkMesher(const BlockRegistry& registry);

    /**
     * @brief Meshes a grid, translating vertices by worldOffset
     *
     * A face is emitted only when the neighbouring voxel inside the same grid
     * is air; neighbours beyond the grid edge count as air. Blocks without a
     * texture (air, light sources) produce nothing.
     */
    ChunkMesh mesh(const VoxelGrid& grid, const glm::ivec3& worldOffset = glm::ivec3(0)) const;

    /**
     * @brief Atlas UVs of a tile, inset by UV_EPSILON, in corner order
     *        (u0,v0), (u1,v0), (u1,v1), (u0,v1)
     */
    static std::array<glm::vec2, 4> tileUVs(const AtlasTile& tile);

private:
    const BlockRegistry& m_registry;
};
