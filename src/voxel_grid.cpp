/**
 * @file voxel_grid.cpp
 * @brief Dense voxel grid storage, box fills and bounds-checked access
 */

#include "voxel_grid.h"
#include "terrain_constants.h"
#include <algorithm>

VoxelGrid::VoxelGrid(int width, int height, int depth, uint8_t fill)
    : m_width(std::max(0, width)),
      m_height(std::max(0, height)),
      m_depth(std::max(0, depth)),
      m_blocks(static_cast<size_t>(m_width) * m_height * m_depth, fill) {
}

VoxelGrid VoxelGrid::chunk() {
    using namespace TerrainGeneration;
    return VoxelGrid(CHUNK_SIZE, CHUNK_SIZE, CHUNK_SIZE);
}

bool VoxelGrid::set(int x, int y, int z, uint8_t block) {
    if (!inBounds(x, y, z)) {
        return false;
    }
    m_blocks[index(x, y, z)] = block;
    return true;
}

void VoxelGrid::fill(uint8_t block) {
    std::fill(m_blocks.begin(), m_blocks.end(), block);
}

void VoxelGrid::fillBox(int minX, int minY, int minZ, int maxX, int maxY, int maxZ, uint8_t block) {
    int x0 = std::max(minX, 0), x1 = std::min(maxX, m_width - 1);
    int y0 = std::max(minY, 0), y1 = std::min(maxY, m_height - 1);
    int z0 = std::max(minZ, 0), z1 = std::min(maxZ, m_depth - 1);

    for (int y = y0; y <= y1; y++) {
        for (int z = z0; z <= z1; z++) {
            for (int x = x0; x <= x1; x++) {
                m_blocks[index(x, y, z)] = block;
            }
        }
    }
}

size_t VoxelGrid::countSolid() const {
    return static_cast<size_t>(std::count_if(m_blocks.begin(), m_blocks.end(),
                                             [](uint8_t b) { return b != 0; }));
}
