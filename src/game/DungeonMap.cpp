#include "game/DungeonMap.hpp"

DungeonMap::DungeonMap(int width, int height)
    : width_(width),
      height_(height),
      tiles_(static_cast<size_t>(width * height), WALL) {
}

bool DungeonMap::InBounds(const Coord& c) const {
    return c.x >= 0 && c.y >= 0 && c.x < width_ && c.y < height_;
}

bool DungeonMap::IsWalkable(const Coord& c) const {
    return InBounds(c) && tiles_[static_cast<size_t>(c.y * width_ + c.x)] == FLOOR;
}

void DungeonMap::SetTile(const Coord& c, char tile) {
    if (InBounds(c)) {
        tiles_[static_cast<size_t>(c.y * width_ + c.x)] = tile;
    }
}

std::vector<std::string> DungeonMap::ToRows() const {
    std::vector<std::string> rows;
    rows.reserve(static_cast<size_t>(height_));
    for (int y = 0; y < height_; ++y) {
        rows.emplace_back(tiles_.begin() + y * width_, tiles_.begin() + (y + 1) * width_);
    }
    return rows;
}
