#pragma once

#include <limits>
#include <vector>
#include <experimental/mdspan>
#include <experimental/mdarray>

#include "dungeonLayout.hpp"


namespace roomgrid
{

constexpr int INF = std::numeric_limits<int>::max();

// Door counts indexed as dists(row, col)
using Dists = std::experimental::mdarray<int, TileExtents>;

struct SearchResult
{
  std::vector<Room*> path;
  Dists dists;
  int reached{0};

  bool visited(const Room& room) const { return dists(room.coordinate.row, room.coordinate.col) != INF; }
};

// Rooms behind an open exit whose far side is open too
std::vector<Room*> successorsFor(const DungeonLayout& layout, const Room& room, bool skipBoss);

// Door-count distance from `start` to every room it reaches. With skipBoss
// the boss room is never entered.
SearchResult breadthFirst(const DungeonLayout& layout, const Room& start, bool skipBoss);

// Shortest room path, empty if `finish` is unreachable
SearchResult findRoomPath(const DungeonLayout& layout, const Room& start, const Room& finish);

}
