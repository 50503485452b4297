#pragma once

#include <random>

#include "game/MapGenerator.hpp"

struct DungeonGenerationConfig {
    int width = 60;
    int height = 30;
    int maxRooms = 9;
    int minRoomSize = 4;
    int maxRoomSize = 9;
};

// Rooms joined by L-shaped corridors. Same seed, same map.
class DungeonMapGenerator : public MapGenerator {
public:
    DungeonMapGenerator() = default;
    explicit DungeonMapGenerator(const DungeonGenerationConfig& config) : config_(config) {}

    DungeonMap Generate(uint32_t seed) override;
    std::vector<Coord> FindSpawnPositions(size_t count) override;

private:
    void CarveRoom(DungeonMap& map, const Room& room);
    void CarveCorridor(DungeonMap& map, const Coord& from, const Coord& to, bool horizontalFirst);

    DungeonGenerationConfig config_;
    DungeonMap lastMap_;
};
