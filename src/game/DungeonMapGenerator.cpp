#include "game/DungeonMapGenerator.hpp"
#include "logging/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace {

bool Overlaps(const Room& a, const Room& b) {
    // One tile of wall between rooms.
    return a.x - 1 < b.x + b.width && a.x + a.width + 1 > b.x &&
           a.y - 1 < b.y + b.height && a.y + a.height + 1 > b.y;
}

} // namespace

DungeonMap DungeonMapGenerator::Generate(uint32_t seed) {
    std::mt19937 rng(seed);
    DungeonMap map(config_.width, config_.height);

    std::uniform_int_distribution<int> sizeDist(config_.minRoomSize, config_.maxRoomSize);

    const int attempts = config_.maxRooms * 4;
    for (int i = 0; i < attempts && static_cast<int>(map.GetRooms().size()) < config_.maxRooms; ++i) {
        int w = sizeDist(rng);
        int h = std::min(sizeDist(rng), config_.height - 2);
        if (w > config_.width - 2 || h < 1) {
            continue;
        }
        std::uniform_int_distribution<int> xDist(1, config_.width - w - 1);
        std::uniform_int_distribution<int> yDist(1, config_.height - h - 1);
        Room room{xDist(rng), yDist(rng), w, h};

        bool blocked = std::any_of(map.GetRooms().begin(), map.GetRooms().end(),
                                   [&room](const Room& other) { return Overlaps(room, other); });
        if (blocked) {
            continue;
        }

        CarveRoom(map, room);
        if (!map.GetRooms().empty()) {
            std::bernoulli_distribution coin(0.5);
            CarveCorridor(map, map.GetRooms().back().Center(), room.Center(), coin(rng));
        }
        map.AddRoom(room);
    }

    if (map.GetRooms().empty()) {
        // Degenerate dimensions: fall back to one room filling the interior.
        Room room{1, 1, std::max(1, config_.width - 2), std::max(1, config_.height - 2)};
        CarveRoom(map, room);
        map.AddRoom(room);
    }

    Logger::Debug("Generated {}x{} dungeon with {} rooms (seed {})",
                  config_.width, config_.height, map.GetRooms().size(), seed);

    lastMap_ = map;
    return map;
}

std::vector<Coord> DungeonMapGenerator::FindSpawnPositions(size_t count) {
    if (lastMap_.GetRooms().empty()) {
        throw std::logic_error("FindSpawnPositions called before Generate");
    }

    // Fill the first room outward from its center, then spill into the others.
    std::vector<Coord> positions;
    for (const Room& room : lastMap_.GetRooms()) {
        std::vector<Coord> tiles;
        for (int y = room.y; y < room.y + room.height; ++y) {
            for (int x = room.x; x < room.x + room.width; ++x) {
                tiles.push_back(Coord{x, y});
            }
        }
        const Coord center = room.Center();
        std::stable_sort(tiles.begin(), tiles.end(), [&center](const Coord& a, const Coord& b) {
            return GridDistance(a, center) < GridDistance(b, center);
        });
        for (const Coord& tile : tiles) {
            if (positions.size() >= count) {
                return positions;
            }
            if (lastMap_.IsWalkable(tile)) {
                positions.push_back(tile);
            }
        }
    }

    if (positions.size() < count) {
        throw std::runtime_error("Not enough floor tiles for " + std::to_string(count) + " spawns");
    }
    return positions;
}

void DungeonMapGenerator::CarveRoom(DungeonMap& map, const Room& room) {
    for (int y = room.y; y < room.y + room.height; ++y) {
        for (int x = room.x; x < room.x + room.width; ++x) {
            map.SetTile(Coord{x, y}, DungeonMap::FLOOR);
        }
    }
}

void DungeonMapGenerator::CarveCorridor(DungeonMap& map, const Coord& from, const Coord& to,
                                        bool horizontalFirst) {
    Coord corner = horizontalFirst ? Coord{to.x, from.y} : Coord{from.x, to.y};

    auto carveLine = [&map](Coord a, const Coord& b) {
        while (true) {
            map.SetTile(a, DungeonMap::FLOOR);
            if (a == b) {
                break;
            }
            if (a.x != b.x) {
                a.x += (b.x > a.x) ? 1 : -1;
            } else {
                a.y += (b.y > a.y) ? 1 : -1;
            }
        }
    };

    carveLine(from, corner);
    carveLine(corner, to);
}
