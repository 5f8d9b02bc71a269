/**
 * @file voxel_grid.h
 * @brief Dense byte grid of block IDs used for chunks and dungeon instances
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @brief Fixed-size 3D array of block-type bytes
 *
 * Layout is `(y * depth + z) * width + x`, which is `y*E*E + z*E + x` for a
 * cubic chunk of edge E. The raw buffer is the transmission format for
 * dungeon instances.
 *
 * Reads outside the extent return air; writes outside it are dropped.
 */
class VoxelGrid {
public:
    VoxelGrid() = default;
    VoxelGrid(int width, int height, int depth, uint8_t fill = 0);

    /**
     * @brief Cubic grid with the standard chunk edge length
     */
    static VoxelGrid chunk();

    int width() const { return m_width; }
    int height() const { return m_height; }
    int depth() const { return m_depth; }
    size_t volume() const { return m_blocks.size(); }

    bool inBounds(int x, int y, int z) const {
        return x >= 0 && x < m_width && y >= 0 && y < m_height && z >= 0 && z < m_depth;
    }

    size_t index(int x, int y, int z) const {
        return (static_cast<size_t>(y) * m_depth + z) * m_width + x;
    }

    uint8_t get(int x, int y, int z) const {
        return inBounds(x, y, z) ? m_blocks[index(x, y, z)] : 0;
    }

    /**
     * @brief Writes a block; returns false (and writes nothing) out of bounds
     */
    bool set(int x, int y, int z, uint8_t block);

    bool isSolid(int x, int y, int z) const { return get(x, y, z) != 0; }

    void fill(uint8_t block);

    /**
     * @brief Fills the inclusive box [min, max], clipped to the grid
     */
    void fillBox(int minX, int minY, int minZ, int maxX, int maxY, int maxZ, uint8_t block);

    /**
     * @brief Number of non-air voxels
     */
    size_t countSolid() const;

    const std::vector<uint8_t>& data() const { return m_blocks; }
    std::vector<uint8_t>& data() { return m_blocks; }

    bool operator==(const VoxelGrid& other) const {
        return m_width == other.m_width && m_height == other.m_height &&
               m_depth == other.m_depth && m_blocks == other.m_blocks;
    }
    bool operator!=(const VoxelGrid& other) const { return !(*this == other); }

private:
    int m_width = 0;
    int m_height = 0;
    int m_depth = 0;
    std::vector<uint8_t> m_blocks;
};
