/**
 * @file town_blueprint.h
 * @brief Rectangular town layout (roads, solid structures, houses) stamped into chunks
 *
 * The blueprint is a flat list of axis-aligned parts in world coordinates.
 * Each chunk inside the town region clips every part to its own bounds and
 * writes only the voxels it owns.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

class VoxelGrid;

enum class BlueprintKind : uint8_t {
    Road,       ///< One layer at ground level
    Structure,  ///< Solid box standing on the ground
    House       ///< Foundation, floor, hollow walls and a roof
};

/**
 * @brief Materials of a house (block IDs)
 */
struct HouseMaterials {
    uint8_t wall = 0;
    uint8_t floor = 0;
    uint8_t roof = 0;
    uint8_t foundation = 0;
};

/**
 * @brief One rectangular blueprint entry
 *
 * x/z are the minimum world corner, width spans X and depth spans Z.
 */
struct BlueprintPart {
    std::string name;
    BlueprintKind kind = BlueprintKind::Structure;
    int x = 0;
    int z = 0;
    int width = 0;
    int depth = 0;
    int height = 1;
    uint8_t material = 0;        ///< Road/structure block
    HouseMaterials house;        ///< House blocks
};

/**
 * @brief Ordered list of blueprint parts; later parts overwrite earlier ones
 */
class TownBlueprint {
public:
    TownBlueprint() = default;

    /**
     * @brief The built-in town: roads, spawn fountain, four houses, walls and gate towers
     */
    static TownBlueprint createDefault();

    /**
     * @brief Loads a blueprint from YAML, replacing the current parts
     * @return False (leaving the blueprint unchanged) if the file cannot be read
     */
    bool loadFromFile(const std::string& filepath);
    bool loadFromString(const std::string& yamlText);

    void addPart(const BlueprintPart& part) { m_parts.push_back(part); }
    const std::vector<BlueprintPart>& parts() const { return m_parts; }

    /**
     * @brief Writes every part overlapping the chunk into its grid
     *
     * @param chunkX,chunkZ Chunk coordinate of the grid
     * @param groundY Road layer; structures and houses start one above it
     * @param roadsOnly Skip structures and houses (coarse LOD)
     */
    void stamp(VoxelGrid& grid, int chunkX, int chunkZ, int groundY, bool roadsOnly) const;

private:
    std::vector<BlueprintPart> m_parts;
};

/**
 * @brief Parses a block name ("cobblestone") or numeric id; 0 if unknown
 */
uint8_t blockIdFromName(const std::string& name);
