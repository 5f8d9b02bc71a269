/**
 * @file town_blueprint.cpp
 * @brief Town layout data and per-chunk stamping
 */

#include "town_blueprint.h"
#include "block_system.h"
#include "logger.h"
#include "terrain_constants.h"
#include "voxel_grid.h"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

namespace {

BlueprintPart road(const std::string& name, int x, int z, int width, int depth) {
    BlueprintPart part;
    part.name = name;
    part.kind = BlueprintKind::Road;
    part.x = x;
    part.z = z;
    part.width = width;
    part.depth = depth;
    part.height = 1;
    part.material = BlockID::COBBLESTONE;
    return part;
}

BlueprintPart structure(const std::string& name, int x, int z, int width, int depth, int height, uint8_t material) {
    BlueprintPart part;
    part.name = name;
    part.kind = BlueprintKind::Structure;
    part.x = x;
    part.z = z;
    part.width = width;
    part.depth = depth;
    part.height = height;
    part.material = material;
    return part;
}

BlueprintPart house(const std::string& name, int x, int z, int width, int depth, int height,
                    HouseMaterials materials) {
    BlueprintPart part;
    part.name = name;
    part.kind = BlueprintKind::House;
    part.x = x;
    part.z = z;
    part.width = width;
    part.depth = depth;
    part.height = height;
    part.house = materials;
    return part;
}

BlueprintKind parseKind(const std::string& text, bool& ok) {
    ok = true;
    if (text == "road") return BlueprintKind::Road;
    if (text == "structure") return BlueprintKind::Structure;
    if (text == "house") return BlueprintKind::House;
    ok = false;
    return BlueprintKind::Structure;
}

uint8_t materialField(const YAML::Node& node, const char* key, uint8_t fallback) {
    if (!node[key]) {
        return fallback;
    }
    uint8_t id = blockIdFromName(node[key].as<std::string>());
    if (id == BlockID::AIR) {
        Logger::warning() << "TownBlueprint: unknown material '" << node[key].as<std::string>() << "'";
        return fallback;
    }
    return id;
}

std::vector<BlueprintPart> parseParts(const YAML::Node& root) {
    std::vector<BlueprintPart> parts;

    YAML::Node list = root["parts"];
    if (!list || !list.IsSequence()) {
        Logger::error() << "TownBlueprint: 'parts' must be a list";
        return parts;
    }

    for (size_t i = 0; i < list.size(); i++) {
        const YAML::Node& node = list[i];
        try {
            if (!node["kind"] || !node["x"] || !node["z"] || !node["width"] || !node["depth"]) {
                Logger::error() << "TownBlueprint: part " << i << " missing kind/x/z/width/depth";
                continue;
            }

            bool ok = false;
            BlueprintPart part;
            part.kind = parseKind(node["kind"].as<std::string>(), ok);
            if (!ok) {
                Logger::error() << "TownBlueprint: part " << i << " has unknown kind '"
                                << node["kind"].as<std::string>() << "'";
                continue;
            }

            part.name = node["name"] ? node["name"].as<std::string>() : "part_" + std::to_string(i);
            part.x = node["x"].as<int>();
            part.z = node["z"].as<int>();
            part.width = node["width"].as<int>();
            part.depth = node["depth"].as<int>();
            part.height = node["height"] ? node["height"].as<int>() : 1;
            if (part.width <= 0 || part.depth <= 0 || part.height <= 0) {
                Logger::error() << "TownBlueprint: part '" << part.name << "' has non-positive dimensions";
                continue;
            }

            part.material = materialField(node, "material", BlockID::COBBLESTONE);
            if (part.kind == BlueprintKind::House) {
                part.house.wall = materialField(node, "wall", BlockID::BRICK);
                part.house.floor = materialField(node, "floor", BlockID::WOOD_PLANKS);
                part.house.roof = materialField(node, "roof", BlockID::ROOF_SHINGLES);
                part.house.foundation = materialField(node, "foundation", BlockID::STONE);
            }
            parts.push_back(part);
        } catch (const std::exception& e) {
            Logger::error() << "TownBlueprint: part " << i << " is malformed: " << e.what();
            continue;
        }
    }
    return parts;
}

} // namespace

uint8_t blockIdFromName(const std::string& name) {
    static const std::unordered_map<std::string, uint8_t> names = {
        {"air", BlockID::AIR},
        {"grass", BlockID::GRASS},
        {"stone", BlockID::STONE},
        {"dirt", BlockID::DIRT},
        {"brick", BlockID::BRICK},
        {"cobblestone", BlockID::COBBLESTONE},
        {"wood_planks", BlockID::WOOD_PLANKS},
        {"roof_shingles", BlockID::ROOF_SHINGLES},
        {"glass", BlockID::GLASS},
        {"wood_log", BlockID::WOOD_LOG},
        {"sand", BlockID::SAND},
        {"sandstone", BlockID::SANDSTONE},
        {"obsidian", BlockID::OBSIDIAN},
        {"lava", BlockID::LAVA},
        {"hellstone", BlockID::HELLSTONE},
    };

    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = names.find(lower);
    if (it != names.end()) {
        return it->second;
    }

    if (!lower.empty() && std::all_of(lower.begin(), lower.end(), [](unsigned char c) { return std::isdigit(c); })) {
        int value = std::stoi(lower);
        if (value >= 0 && value <= 255) {
            return static_cast<uint8_t>(value);
        }
    }
    return BlockID::AIR;
}

TownBlueprint TownBlueprint::createDefault() {
    using namespace BlockID;
    TownBlueprint town;

    town.addPart(road("spawn_plaza", -24, -24, 48, 48));
    town.addPart(structure("spawn_fountain", -2, -2, 4, 4, 2, STONE));
    town.addPart(structure("spawn_pillar", -1, -1, 2, 2, 4, BRICK));
    town.addPart(road("north_south_road", -4, -60, 8, 120));
    town.addPart(road("east_west_road", -60, -4, 120, 8));

    town.addPart(house("adventurers_guild", 8, -28, 14, 18, 7, {BRICK, WOOD_PLANKS, ROOF_SHINGLES, STONE}));
    town.addPart(house("the_adamant_forge", -25, 8, 12, 10, 5, {COBBLESTONE, STONE, WOOD_PLANKS, STONE}));
    town.addPart(house("the_verdant_spire", 8, 8, 10, 10, 8, {WOOD_PLANKS, WOOD_PLANKS, ROOF_SHINGLES, COBBLESTONE}));
    town.addPart(house("town_hall", -30, -30, 12, 12, 6, {BRICK, WOOD_PLANKS, ROOF_SHINGLES, STONE}));

    town.addPart(structure("wall_north", -62, -62, 124, 2, 6, COBBLESTONE));
    town.addPart(structure("wall_west", -62, -60, 2, 120, 6, COBBLESTONE));
    town.addPart(structure("wall_east", 60, -60, 2, 120, 6, COBBLESTONE));
    town.addPart(structure("wall_south_west", -62, 60, 58, 2, 6, COBBLESTONE));
    town.addPart(structure("wall_south_east", 4, 60, 58, 2, 6, COBBLESTONE));
    town.addPart(structure("gate_tower_west", -8, 58, 4, 6, 8, COBBLESTONE));
    town.addPart(structure("gate_tower_east", 4, 58, 4, 6, 8, COBBLESTONE));

    return town;
}

bool TownBlueprint::loadFromFile(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const std::exception& e) {
        Logger::error() << "TownBlueprint: failed to load " << filepath << ": " << e.what();
        return false;
    }

    std::vector<BlueprintPart> parts = parseParts(root);
    if (parts.empty()) {
        Logger::error() << "TownBlueprint: no usable parts in " << filepath;
        return false;
    }

    m_parts = std::move(parts);
    Logger::info() << "TownBlueprint: loaded " << m_parts.size() << " parts from " << filepath;
    return true;
}

bool TownBlueprint::loadFromString(const std::string& yamlText) {
    YAML::Node root;
    try {
        root = YAML::Load(yamlText);
    } catch (const std::exception& e) {
        Logger::error() << "TownBlueprint: invalid YAML: " << e.what();
        return false;
    }

    std::vector<BlueprintPart> parts = parseParts(root);
    if (parts.empty()) {
        return false;
    }
    m_parts = std::move(parts);
    return true;
}

void TownBlueprint::stamp(VoxelGrid& grid, int chunkX, int chunkZ, int groundY, bool roadsOnly) const {
    const int size = TerrainGeneration::CHUNK_SIZE;
    const int chunkMinX = chunkX * size;
    const int chunkMinZ = chunkZ * size;
    const int baseY = groundY + 1;

    for (const BlueprintPart& part : m_parts) {
        if (roadsOnly && part.kind != BlueprintKind::Road) {
            continue;
        }

        // Clip the part rectangle to this chunk's world bounds
        int minX = std::max(part.x, chunkMinX);
        int maxX = std::min(part.x + part.width, chunkMinX + size);
        int minZ = std::max(part.z, chunkMinZ);
        int maxZ = std::min(part.z + part.depth, chunkMinZ + size);
        if (minX >= maxX || minZ >= maxZ) {
            continue;
        }

        for (int wx = minX; wx < maxX; wx++) {
            for (int wz = minZ; wz < maxZ; wz++) {
                int lx = wx - chunkMinX;
                int lz = wz - chunkMinZ;

                switch (part.kind) {
                    case BlueprintKind::Road:
                        grid.set(lx, groundY, lz, part.material);
                        break;

                    case BlueprintKind::Structure:
                        for (int j = 0; j < part.height; j++) {
                            grid.set(lx, baseY + j, lz, part.material);
                        }
                        break;

                    case BlueprintKind::House: {
                        bool perimeter = wx == part.x || wx == part.x + part.width - 1 ||
                                         wz == part.z || wz == part.z + part.depth - 1;
                        grid.set(lx, baseY - 1, lz, part.house.foundation);
                        grid.set(lx, baseY, lz, part.house.floor);
                        if (perimeter) {
                            for (int j = 1; j < part.height; j++) {
                                grid.set(lx, baseY + j, lz, part.house.wall);
                            }
                        }
                        grid.set(lx, baseY + part.height, lz, part.house.roof);
                        break;
                    }
                }
            }
        }
    }
}
