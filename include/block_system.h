/**
 * @file block_system.h
 * @brief Block type IDs and the block registry (atlas tiles, light sources)
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

// Block ID constants (stored as one byte per voxel)
namespace BlockID {
    constexpr uint8_t AIR = 0;
    constexpr uint8_t GRASS = 1;
    constexpr uint8_t STONE = 2;
    constexpr uint8_t DIRT = 3;
    constexpr uint8_t BRICK = 4;
    constexpr uint8_t COBBLESTONE = 5;
    constexpr uint8_t WOOD_PLANKS = 6;
    constexpr uint8_t ROOF_SHINGLES = 7;
    constexpr uint8_t GLASS = 8;
    constexpr uint8_t WOOD_LOG = 9;
    constexpr uint8_t SAND = 10;
    constexpr uint8_t SANDSTONE = 11;
    constexpr uint8_t OBSIDIAN = 12;
    constexpr uint8_t LAVA = 13;
    constexpr uint8_t HELLSTONE = 14;

    // Logical light sources: occupy a voxel but are never meshed
    constexpr uint8_t LAVA_LIGHT_SOURCE = 254;
    constexpr uint8_t FIREFLY_LIGHT_SOURCE = 255;
}

inline bool isAir(int blockID) { return blockID == BlockID::AIR; }
inline bool isSolid(int blockID) { return blockID != BlockID::AIR; }

constexpr int ATLAS_SIZE_IN_TILES = 16;  ///< Texture atlas is a 16x16 grid of tiles

/**
 * @brief Position of a tile in the texture atlas grid
 */
struct AtlasTile {
    int col = 0;
    int row = 0;

    bool operator==(const AtlasTile& other) const { return col == other.col && row == other.row; }
};

/**
 * @brief Face direction of a voxel, in mesher emission order
 */
enum class BlockFace : uint8_t {
    NegX = 0,
    PosX = 1,
    NegY = 2,
    PosY = 3,
    NegZ = 4,
    PosZ = 5
};

/**
 * @brief Render/physics properties of one block type
 *
 * Example YAML override:
 * @code
 * - id: 1
 *   name: grass
 *   texture:
 *     top: {x: 0, y: 0}
 *     bottom: {x: 2, y: 0}
 *     side: {x: 1, y: 0}
 * @endcode
 */
struct BlockDefinition {
    int id = -1;
    std::string name;

    bool hasTexture = false;     ///< False for air and light sources (never meshed)
    bool useCubeMap = false;     ///< True if top/bottom/side differ
    AtlasTile all;               ///< Used for every face unless useCubeMap
    AtlasTile top;
    AtlasTile bottom;
    AtlasTile side;

    bool isLightSource = false;

    /**
     * @brief Tile used for a given face
     */
    const AtlasTile& tileFor(BlockFace face) const;
};

/**
 * @brief Table of block definitions indexed by byte ID
 *
 * Built from the compiled-in defaults; a YAML file can add or override
 * entries. Lookups of unknown IDs return an untextured placeholder.
 */
class BlockRegistry {
public:
    BlockRegistry();

    /**
     * @brief Registry holding the standard block table
     */
    static BlockRegistry createDefault();

    /**
     * @brief Adds or replaces definitions from a YAML list
     * @return Number of entries applied; 0 if the file could not be read
     */
    int loadFromFile(const std::string& filepath);

    /**
     * @brief Same as loadFromFile, from YAML text
     */
    int loadFromString(const std::string& yamlText);

    void registerBlock(const BlockDefinition& definition);

    const BlockDefinition& get(int id) const;
    const BlockDefinition* findByName(const std::string& name) const;
    bool isRenderable(int id) const { return get(id).hasTexture; }
    size_t size() const;

private:
    std::array<BlockDefinition, 256> m_blocks;
    std::unordered_map<std::string, int> m_nameToId;
};
