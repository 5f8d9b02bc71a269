/**
 * @file world.cpp
 * @brief Ground probing over any BlockSource
 */

#include "world.h"

int findGroundHeight(const BlockSource& world, float worldX, float worldZ) {
    int x = WorldCoords::toBlock(worldX);
    int z = WorldCoords::toBlock(worldZ);

    for (int y = world.columnHeight() - 1; y >= 0; y--) {
        if (world.getBlock(x, y, z) != 0) {
            return y + 1;
        }
    }
    return TerrainGeneration::DEFAULT_GROUND_HEIGHT;
}
