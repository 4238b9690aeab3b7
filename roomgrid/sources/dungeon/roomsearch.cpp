#include "roomsearch.hpp"
#include "roomFormatter.hpp"

#include <algorithm>
#include <queue>
#include <spdlog/spdlog.h>


namespace roomgrid
{

std::vector<Room*> successorsFor(const DungeonLayout& layout, const Room& room, bool skipBoss)
{
  std::vector<Room*> result;
  result.reserve(4);
  for (auto side : kDirections)
  {
    if (!layout.connected(room, side))
      continue;
    Room* successor = layout.neighbor(room, side);
    if (skipBoss && successor->category == RoomCategory::Boss)
      continue;
    result.push_back(successor);
  }
  return result;
}

static SearchResult initSearch(const DungeonLayout& layout)
{
  SearchResult result{.dists = Dists{TileExtents{layout.rows(), layout.cols()}}};
  std::fill_n(result.dists.data(), result.dists.size(), INF);
  return result;
}

static int& distOf(Dists& dists, const Room& room)
{
  return dists(room.coordinate.row, room.coordinate.col);
}

static std::vector<Room*> reconstructPath(const DungeonLayout& layout, Dists& dists, Room& start, Room& finish)
{
  std::vector<Room*> path;

  if (distOf(dists, finish) != INF)
  {
    Room* current = &finish;
    while (current != &start)
    {
      Room* best = current;
      for (auto predecessor : successorsFor(layout, *current, false))
        if (distOf(dists, *predecessor) + 1 == distOf(dists, *current))
          best = predecessor;

      if (best == current)
        break;

      path.push_back(current);
      current = best;
    }
    path.push_back(&start);
  }

  std::reverse(path.begin(), path.end());
  return path;
}

SearchResult breadthFirst(const DungeonLayout& layout, const Room& start, bool skipBoss)
{
  auto result = initSearch(layout);

  std::queue<const Room*> queue;
  queue.push(&start);
  distOf(result.dists, start) = 0;
  result.reached = 1;

  while (!queue.empty())
  {
    const Room* current = queue.front();
    queue.pop();

    const int dist = distOf(result.dists, *current);

    for (auto successor : successorsFor(layout, *current, skipBoss))
    {
      int& successorDist = distOf(result.dists, *successor);
      if (successorDist != INF)
        continue;
      successorDist = dist + 1;
      ++result.reached;
      queue.push(successor);
    }
  }

  return result;
}

SearchResult findRoomPath(const DungeonLayout& layout, const Room& start, const Room& finish)
{
  auto result = breadthFirst(layout, start, false);

  // Rooms are owned by the layout, the search only hands back its pointers
  Room* from = layout.getRoomAt(start.coordinate);
  Room* to = layout.getRoomAt(finish.coordinate);
  if (from == nullptr || to == nullptr)
    return result;

  result.path = reconstructPath(layout, result.dists, *from, *to);

  spdlog::debug("Room path {} -> {}: {} rooms", start.coordinate, finish.coordinate, result.path.size());
  return result;
}

}
