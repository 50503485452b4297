#pragma once

#include <string>
#include <vector>

#include "game/GameEntity.hpp"

struct Room {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    Coord Center() const { return Coord{x + width / 2, y + height / 2}; }
    bool Contains(const Coord& c) const {
        return c.x >= x && c.x < x + width && c.y >= y && c.y < y + height;
    }
};

class DungeonMap {
public:
    static constexpr char WALL = '#';
    static constexpr char FLOOR = '.';

    DungeonMap() = default;
    DungeonMap(int width, int height);

    int GetWidth() const { return width_; }
    int GetHeight() const { return height_; }
    bool InBounds(const Coord& c) const;
    bool IsWalkable(const Coord& c) const;

    void SetTile(const Coord& c, char tile);

    const std::vector<Room>& GetRooms() const { return rooms_; }
    void AddRoom(const Room& room) { rooms_.push_back(room); }

    // One string per row.
    std::vector<std::string> ToRows() const;

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<char> tiles_;
    std::vector<Room> rooms_;
};
