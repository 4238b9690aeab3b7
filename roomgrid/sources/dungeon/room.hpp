#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <glm/glm.hpp>

#include "dungeon.hpp"


namespace roomgrid
{

struct GridCoord
{
  int row{};
  int col{};

  auto operator<=>(const GridCoord&) const = default;
};

enum class Direction : std::uint8_t
{
  North,
  South,
  East,
  West,
};

constexpr std::array kDirections{Direction::North, Direction::South, Direction::East, Direction::West};

constexpr std::size_t index(Direction d) { return static_cast<std::size_t>(d); }

constexpr Direction opposite(Direction d)
{
  constexpr std::array table{Direction::South, Direction::North, Direction::West, Direction::East};
  return table[index(d)];
}

// North is row + 1, east is col + 1
constexpr GridCoord step(GridCoord c, Direction d)
{
  constexpr std::array<GridCoord, 4> offsets{GridCoord{1, 0}, GridCoord{-1, 0}, GridCoord{0, 1}, GridCoord{0, -1}};
  const auto offset = offsets[index(d)];
  return {c.row + offset.row, c.col + offset.col};
}

const char* toString(Direction d);

enum class RoomCategory : std::uint8_t
{
  Start,
  Normal,
  Boss,
  Item,
};

const char* toString(RoomCategory c);

struct Exits
{
  std::array<bool, 4> open{};

  bool& operator[](Direction d) { return open[index(d)]; }
  bool operator[](Direction d) const { return open[index(d)]; }

  int count() const;
  bool any() const { return count() > 0; }

  // "NSEW" subset, "NoExits" when closed on all sides
  std::string variantName() const;

  bool operator==(const Exits&) const = default;
};

struct Room
{
  GridCoord coordinate;
  RoomCategory category{RoomCategory::Normal};
  Exits exits;

  bool cleared{false};
  bool locked{false};

  glm::ivec2 interiorSize{14, 10};
  glm::vec2 worldAnchor{};

  // Compiled from interiorSize and exits, with the door overlay on top while locked
  TileGrid tiles;

  // World position the tiles were actually written at, if realized
  std::optional<glm::vec2> realizedAnchor;

  glm::ivec2 totalSize() const { return interiorSize + 2; }
};

}
