/**
 * @file chunk_mesher.cpp
 * @brief Per-voxel, per-face mesh emission with neighbour culling
 */

#include "chunk_mesher.h"
#include "voxel_grid.h"

namespace {

struct FaceDef {
    BlockFace face;
    int dx, dy, dz;
    // Quad corners relative to the voxel's minimum corner, counter-clockwise seen from outside
    int corners[4][3];
};

const FaceDef FACES[6] = {
    {BlockFace::NegX, -1, 0, 0, {{0, 0, 0}, {0, 0, 1}, {0, 1, 1}, {0, 1, 0}}},
    {BlockFace::PosX,  1, 0, 0, {{1, 0, 1}, {1, 0, 0}, {1, 1, 0}, {1, 1, 1}}},
    {BlockFace::NegY,  0, -1, 0, {{1, 0, 0}, {0, 0, 0}, {0, 0, 1}, {1, 0, 1}}},
    {BlockFace::PosY,  0, 1, 0, {{0, 1, 0}, {0, 1, 1}, {1, 1, 1}, {1, 1, 0}}},
    {BlockFace::NegZ,  0, 0, -1, {{1, 0, 0}, {0, 0, 0}, {0, 1, 0}, {1, 1, 0}}},
    {BlockFace::PosZ,  0, 0, 1, {{0, 0, 1}, {1, 0, 1}, {1, 1, 1}, {0, 1, 1}}},
};

// Two triangles per quad: v1 v2 v3, v1 v3 v4
const int QUAD_ORDER[6] = {0, 1, 2, 0, 2, 3};

} // namespace

ChunkMesher::ChunkMesher(const BlockRegistry& registry)
    : m_registry(registry) {
}

std::array<glm::vec2, 4> ChunkMesher::tileUVs(const AtlasTile& tile) {
    const float tiles = static_cast<float>(ATLAS_SIZE_IN_TILES);

    float u0 = tile.col / tiles + UV_EPSILON;
    float v0 = 1.0f - (tile.row + 1) / tiles + UV_EPSILON;
    float u1 = (tile.col + 1) / tiles - UV_EPSILON;
    float v1 = 1.0f - tile.row / tiles - UV_EPSILON;

    return {glm::vec2(u0, v0), glm::vec2(u1, v0), glm::vec2(u1, v1), glm::vec2(u0, v1)};
}

ChunkMesh ChunkMesher::mesh(const VoxelGrid& grid, const glm::ivec3& worldOffset) const {
    ChunkMesh result;

    for (int y = 0; y < grid.height(); y++) {
        for (int z = 0; z < grid.depth(); z++) {
            for (int x = 0; x < grid.width(); x++) {
                uint8_t block = grid.get(x, y, z);
                if (block == BlockID::AIR) {
                    continue;
                }

                const BlockDefinition& def = m_registry.get(block);
                if (!def.hasTexture) {
                    continue;
                }

                for (const FaceDef& face : FACES) {
                    if (grid.get(x + face.dx, y + face.dy, z + face.dz) != BlockID::AIR) {
                        continue;
                    }

                    std::array<glm::vec2, 4> uv = tileUVs(def.tileFor(face.face));

                    for (int corner : QUAD_ORDER) {
                        const int* c = face.corners[corner];
                        result.positions.push_back(static_cast<float>(worldOffset.x + x + c[0]));
                        result.positions.push_back(static_cast<float>(worldOffset.y + y + c[1]));
                        result.positions.push_back(static_cast<float>(worldOffset.z + z + c[2]));

                        result.normals.push_back(static_cast<float>(face.dx));
                        result.normals.push_back(static_cast<float>(face.dy));
                        result.normals.push_back(static_cast<float>(face.dz));

                        result.uvs.push_back(uv[corner].x);
                        result.uvs.push_back(uv[corner].y);
                    }
                }
            }
        }
    }

    return result;
}
