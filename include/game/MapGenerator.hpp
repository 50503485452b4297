#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "game/DungeonMap.hpp"

class MapGenerator {
public:
    virtual ~MapGenerator() = default;

    virtual DungeonMap Generate(uint32_t seed) = 0;

    // Distinct walkable tiles on the last generated map.
    virtual std::vector<Coord> FindSpawnPositions(size_t count) = 0;
};
