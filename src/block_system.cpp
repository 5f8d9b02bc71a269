/**
 * @file block_system.cpp
 * @brief Block registry: compiled-in block table and YAML overrides
 */

#include "block_system.h"
#include "logger.h"
#include <yaml-cpp/yaml.h>

namespace {

BlockDefinition makeBlock(int id, const std::string& name, AtlasTile tile) {
    BlockDefinition def;
    def.id = id;
    def.name = name;
    def.hasTexture = true;
    def.all = tile;
    return def;
}

BlockDefinition makeCubeBlock(int id, const std::string& name, AtlasTile top, AtlasTile bottom, AtlasTile side) {
    BlockDefinition def = makeBlock(id, name, side);
    def.useCubeMap = true;
    def.top = top;
    def.bottom = bottom;
    def.side = side;
    return def;
}

BlockDefinition makeLightSource(int id, const std::string& name) {
    BlockDefinition def;
    def.id = id;
    def.name = name;
    def.isLightSource = true;
    return def;
}

bool parseTile(const YAML::Node& node, AtlasTile& out) {
    if (!node) {
        return false;
    }
    if (node.IsSequence() && node.size() == 2) {
        out.col = node[0].as<int>();
        out.row = node[1].as<int>();
        return true;
    }
    if (node.IsMap() && node["x"] && node["y"]) {
        out.col = node["x"].as<int>();
        out.row = node["y"].as<int>();
        return true;
    }
    return false;
}

int applyBlockList(BlockRegistry& registry, const YAML::Node& root, const std::string& source) {
    YAML::Node list = root["blocks"] ? root["blocks"] : root;
    if (!list.IsSequence()) {
        Logger::error() << "BlockRegistry: expected a list of blocks in " << source;
        return 0;
    }

    int applied = 0;
    for (size_t i = 0; i < list.size(); i++) {
        const YAML::Node& entry = list[i];
        if (!entry["id"] || !entry["name"]) {
            Logger::error() << "BlockRegistry: entry " << i << " missing 'id' or 'name' in " << source;
            continue;
        }

        int id = entry["id"].as<int>();
        if (id < 0 || id > 255) {
            Logger::error() << "BlockRegistry: block id " << id << " out of byte range in " << source;
            continue;
        }

        BlockDefinition def;
        def.id = id;
        def.name = entry["name"].as<std::string>();
        def.isLightSource = entry["light_source"] ? entry["light_source"].as<bool>() : false;

        YAML::Node texture = entry["texture"];
        if (texture) {
            if (parseTile(texture["all"], def.all)) {
                def.hasTexture = true;
            }
            AtlasTile top, bottom, side;
            bool hasTop = parseTile(texture["top"], top);
            bool hasBottom = parseTile(texture["bottom"], bottom);
            bool hasSide = parseTile(texture["side"], side);
            if (hasTop || hasBottom || hasSide) {
                AtlasTile fallback = def.hasTexture ? def.all : (hasSide ? side : (hasTop ? top : bottom));
                def.top = hasTop ? top : fallback;
                def.bottom = hasBottom ? bottom : fallback;
                def.side = hasSide ? side : fallback;
                if (!def.hasTexture) {
                    def.all = def.side;
                }
                def.useCubeMap = true;
                def.hasTexture = true;
            }
        }

        registry.registerBlock(def);
        applied++;
    }
    return applied;
}

} // namespace

const AtlasTile& BlockDefinition::tileFor(BlockFace face) const {
    if (!useCubeMap) {
        return all;
    }
    switch (face) {
        case BlockFace::PosY: return top;
        case BlockFace::NegY: return bottom;
        default:              return side;
    }
}

BlockRegistry::BlockRegistry() {
    for (int i = 0; i < 256; i++) {
        m_blocks[i].id = i;
    }
    BlockDefinition air;
    air.id = BlockID::AIR;
    air.name = "air";
    registerBlock(air);
}

BlockRegistry BlockRegistry::createDefault() {
    BlockRegistry registry;
    registry.registerBlock(makeCubeBlock(BlockID::GRASS, "grass", {0, 0}, {2, 0}, {1, 0}));
    registry.registerBlock(makeBlock(BlockID::STONE, "stone", {2, 1}));
    registry.registerBlock(makeBlock(BlockID::DIRT, "dirt", {2, 0}));
    registry.registerBlock(makeBlock(BlockID::BRICK, "brick", {3, 0}));
    registry.registerBlock(makeBlock(BlockID::COBBLESTONE, "cobblestone", {0, 1}));
    registry.registerBlock(makeBlock(BlockID::WOOD_PLANKS, "wood_planks", {3, 1}));
    registry.registerBlock(makeBlock(BlockID::ROOF_SHINGLES, "roof_shingles", {0, 2}));
    registry.registerBlock(makeBlock(BlockID::GLASS, "glass", {1, 2}));
    registry.registerBlock(makeBlock(BlockID::WOOD_LOG, "wood_log", {1, 1}));
    registry.registerBlock(makeBlock(BlockID::SAND, "sand", {0, 3}));
    registry.registerBlock(makeBlock(BlockID::SANDSTONE, "sandstone", {1, 3}));
    registry.registerBlock(makeBlock(BlockID::OBSIDIAN, "obsidian", {3, 3}));
    registry.registerBlock(makeBlock(BlockID::LAVA, "lava", {2, 3}));
    registry.registerBlock(makeBlock(BlockID::HELLSTONE, "hellstone", {3, 0}));
    registry.registerBlock(makeLightSource(BlockID::LAVA_LIGHT_SOURCE, "lava_light_source"));
    registry.registerBlock(makeLightSource(BlockID::FIREFLY_LIGHT_SOURCE, "firefly_light_source"));
    return registry;
}

int BlockRegistry::loadFromFile(const std::string& filepath) {
    try {
        YAML::Node root = YAML::LoadFile(filepath);
        int applied = applyBlockList(*this, root, filepath);
        Logger::info() << "BlockRegistry: applied " << applied << " block definitions from " << filepath;
        return applied;
    } catch (const std::exception& e) {
        Logger::error() << "BlockRegistry: failed to load " << filepath << ": " << e.what();
        return 0;
    }
}

int BlockRegistry::loadFromString(const std::string& yamlText) {
    try {
        return applyBlockList(*this, YAML::Load(yamlText), "<string>");
    } catch (const std::exception& e) {
        Logger::error() << "BlockRegistry: failed to parse block YAML: " << e.what();
        return 0;
    }
}

void BlockRegistry::registerBlock(const BlockDefinition& definition) {
    if (definition.id < 0 || definition.id > 255) {
        Logger::warning() << "BlockRegistry: ignoring block '" << definition.name
                          << "' with id " << definition.id;
        return;
    }

    const BlockDefinition& previous = m_blocks[definition.id];
    if (!previous.name.empty()) {
        m_nameToId.erase(previous.name);
    }

    m_blocks[definition.id] = definition;
    if (!definition.name.empty()) {
        m_nameToId[definition.name] = definition.id;
    }
}

const BlockDefinition& BlockRegistry::get(int id) const {
    if (id < 0 || id > 255) {
        return m_blocks[BlockID::AIR];
    }
    return m_blocks[id];
}

const BlockDefinition* BlockRegistry::findByName(const std::string& name) const {
    auto it = m_nameToId.find(name);
    return it != m_nameToId.end() ? &m_blocks[it->second] : nullptr;
}

size_t BlockRegistry::size() const {
    return m_nameToId.size();
}
