/**
 * @file test_voxel_grid.cpp
 * @brief Voxel grid layout, block registry and world coordinate helpers
 */

#include "test_utils.h"
#include "block_system.h"
#include "voxel_grid.h"
#include "world.h"

namespace {

/**
 * @brief Wraps a grid as a world-space block source anchored at the origin
 */
class GridSource : public BlockSource {
public:
    explicit GridSource(const VoxelGrid& grid) : m_grid(grid) {}
    uint8_t getBlock(int x, int y, int z) const override { return m_grid.get(x, y, z); }
    int columnHeight() const override { return m_grid.height(); }

private:
    const VoxelGrid& m_grid;
};

} // namespace

// ============================================================
// VoxelGrid
// ============================================================

TEST(GridIndexLayout) {
    VoxelGrid grid = VoxelGrid::chunk();
    ASSERT_EQ(grid.volume(), static_cast<size_t>(32 * 32 * 32));
    ASSERT_EQ(grid.index(0, 0, 0), 0u);
    ASSERT_EQ(grid.index(1, 0, 0), 1u);
    ASSERT_EQ(grid.index(0, 0, 1), 32u);
    ASSERT_EQ(grid.index(0, 1, 0), 1024u);
    ASSERT_EQ(grid.index(3, 2, 5), static_cast<size_t>(2 * 1024 + 5 * 32 + 3));

    // Non-cubic grids use (y * depth + z) * width + x
    VoxelGrid dungeon(128, 32, 64);
    ASSERT_EQ(dungeon.index(1, 1, 1), static_cast<size_t>((1 * 64 + 1) * 128 + 1));
}

TEST(GridOutOfBoundsReadsAir) {
    VoxelGrid grid(4, 4, 4, BlockID::STONE);
    ASSERT_EQ(grid.get(0, 0, 0), BlockID::STONE);
    ASSERT_EQ(grid.get(-1, 0, 0), BlockID::AIR);
    ASSERT_EQ(grid.get(0, 4, 0), BlockID::AIR);
    ASSERT_EQ(grid.get(0, 0, 100), BlockID::AIR);
    ASSERT_FALSE(grid.isSolid(4, 0, 0));
}

TEST(GridOutOfBoundsWritesDropped) {
    VoxelGrid grid(4, 4, 4);
    ASSERT_FALSE(grid.set(4, 0, 0, BlockID::STONE));
    ASSERT_FALSE(grid.set(0, -1, 0, BlockID::STONE));
    ASSERT_EQ(grid.countSolid(), 0u);

    ASSERT_TRUE(grid.set(3, 3, 3, BlockID::BRICK));
    ASSERT_EQ(grid.get(3, 3, 3), BlockID::BRICK);
    ASSERT_EQ(grid.countSolid(), 1u);
}

TEST(GridFillBoxClips) {
    VoxelGrid grid(8, 8, 8);
    grid.fillBox(-4, 0, -4, 1, 0, 1, BlockID::COBBLESTONE);
    ASSERT_EQ(grid.countSolid(), 4u);
    ASSERT_EQ(grid.get(1, 0, 1), BlockID::COBBLESTONE);
    ASSERT_EQ(grid.get(2, 0, 1), BlockID::AIR);

    grid.fill(BlockID::AIR);
    ASSERT_EQ(grid.countSolid(), 0u);
}

TEST(GridEquality) {
    VoxelGrid a(4, 4, 4);
    VoxelGrid b(4, 4, 4);
    ASSERT_TRUE(a == b);
    b.set(1, 1, 1, BlockID::DIRT);
    ASSERT_TRUE(a != b);
}

// ============================================================
// BlockRegistry
// ============================================================

TEST(RegistryDefaults) {
    BlockRegistry registry = BlockRegistry::createDefault();

    ASSERT_FALSE(registry.isRenderable(BlockID::AIR));
    ASSERT_TRUE(registry.isRenderable(BlockID::STONE));
    ASSERT_FALSE(registry.isRenderable(BlockID::LAVA_LIGHT_SOURCE));
    ASSERT_FALSE(registry.isRenderable(BlockID::FIREFLY_LIGHT_SOURCE));
    ASSERT_TRUE(registry.get(BlockID::LAVA_LIGHT_SOURCE).isLightSource);

    // Grass is the only cube-mapped default
    const BlockDefinition& grass = registry.get(BlockID::GRASS);
    ASSERT_TRUE(grass.useCubeMap);
    ASSERT_TRUE(grass.tileFor(BlockFace::PosY) == (AtlasTile{0, 0}));
    ASSERT_TRUE(grass.tileFor(BlockFace::NegY) == (AtlasTile{2, 0}));
    ASSERT_TRUE(grass.tileFor(BlockFace::PosX) == (AtlasTile{1, 0}));

    const BlockDefinition& stone = registry.get(BlockID::STONE);
    ASSERT_FALSE(stone.useCubeMap);
    ASSERT_TRUE(stone.tileFor(BlockFace::PosY) == stone.tileFor(BlockFace::NegZ));
}

TEST(RegistryUnknownIdIsPlaceholder) {
    BlockRegistry registry = BlockRegistry::createDefault();
    const BlockDefinition& unknown = registry.get(200);
    ASSERT_FALSE(unknown.hasTexture);
    ASSERT_NULL(registry.findByName("unobtainium"));
    ASSERT_NOT_NULL(registry.findByName("obsidian"));
}

TEST(RegistryYamlOverride) {
    BlockRegistry registry = BlockRegistry::createDefault();
    int applied = registry.loadFromString(
        "- id: 20\n"
        "  name: marble\n"
        "  texture:\n"
        "    all: {x: 5, y: 5}\n");
    ASSERT_EQ(applied, 1);

    const BlockDefinition* marble = registry.findByName("marble");
    ASSERT_NOT_NULL(marble);
    ASSERT_EQ(marble->id, 20);
    ASSERT_TRUE(registry.isRenderable(20));
    ASSERT_TRUE(marble->all == (AtlasTile{5, 5}));
}

TEST(RegistryMissingFile) {
    BlockRegistry registry = BlockRegistry::createDefault();
    size_t before = registry.size();
    ASSERT_EQ(registry.loadFromFile("does/not/exist.yaml"), 0);
    ASSERT_EQ(registry.size(), before);
}

// ============================================================
// World coordinates
// ============================================================

TEST(ChunkCoordinateFloorDivision) {
    ASSERT_EQ(WorldCoords::toChunk(0), 0);
    ASSERT_EQ(WorldCoords::toChunk(31), 0);
    ASSERT_EQ(WorldCoords::toChunk(32), 1);
    ASSERT_EQ(WorldCoords::toChunk(-1), -1);
    ASSERT_EQ(WorldCoords::toChunk(-32), -1);
    ASSERT_EQ(WorldCoords::toChunk(-33), -2);

    ASSERT_EQ(WorldCoords::toLocal(-1), 31);
    ASSERT_EQ(WorldCoords::toLocal(33), 1);

    ChunkCoord coord = WorldCoords::chunkOf(-0.5f, 40.0f);
    ASSERT_EQ(coord.x, -1);
    ASSERT_EQ(coord.z, 1);
}

TEST(GroundHeightScan) {
    VoxelGrid grid(4, 32, 4);
    grid.fillBox(0, 0, 0, 3, 7, 3, BlockID::STONE);
    grid.set(1, 12, 1, BlockID::BRICK);
    GridSource source(grid);

    ASSERT_EQ(findGroundHeight(source, 0.5f, 0.5f), 8);
    ASSERT_EQ(findGroundHeight(source, 1.2f, 1.9f), 13);

    // Outside the grid every column is empty
    ASSERT_EQ(findGroundHeight(source, 50.0f, 50.0f), TerrainGeneration::DEFAULT_GROUND_HEIGHT);
}

int main() {
    try {
        run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "TEST FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
