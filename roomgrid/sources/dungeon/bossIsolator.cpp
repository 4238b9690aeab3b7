#include "bossIsolator.hpp"
#include "roomFormatter.hpp"

#include <vector>
#include <spdlog/spdlog.h>


namespace roomgrid
{

static int squaredDistance(GridCoord a, GridCoord b)
{
  const int dr = a.row - b.row;
  const int dc = a.col - b.col;
  return dr * dr + dc * dc;
}

static Room* farthestFrom(const Room& start, const std::vector<Room*>& candidates)
{
  Room* best = nullptr;
  int bestDistance = -1;
  for (auto room : candidates)
  {
    const int distance = squaredDistance(start.coordinate, room->coordinate);
    if (distance > bestDistance)
    {
      bestDistance = distance;
      best = room;
    }
  }
  return best;
}

Room* chooseBossCandidate(const DungeonLayout& layout)
{
  const Room* start = layout.getStartRoom();
  if (start == nullptr)
    return nullptr;

  std::vector<Room*> border;
  std::vector<Room*> others;
  for (auto room : layout.getAllRooms())
  {
    if (room == start)
      continue;
    others.push_back(room);
    if (layout.isBorder(room->coordinate))
      border.push_back(room);
  }

  spdlog::debug("Boss candidates: {} border rooms of {}", border.size(), others.size());

  if (!border.empty())
    return farthestFrom(*start, border);

  return farthestFrom(*start, others);
}

Room* isolateBoss(DungeonLayout& layout, Rng& rng, GenerationReport& report)
{
  Room* boss = chooseBossCandidate(layout);
  if (boss == nullptr)
  {
    report.add(GenerationIssueKind::InsufficientRooms, std::nullopt, "only the start room exists, no boss room");
    return nullptr;
  }

  layout.setCategory(*boss, RoomCategory::Boss);

  std::vector<Direction> entrances;
  for (auto side : kDirections)
    if (layout.neighbor(*boss, side) != nullptr)
      entrances.push_back(side);

  if (entrances.empty())
  {
    for (auto side : kDirections)
      layout.unlink(*boss, side);
    report.add(GenerationIssueKind::BossHasNoAdjacentRoom, boss->coordinate, "boss room left without exits");
    return boss;
  }

  const Direction entrance = entrances[pickIndex(rng, entrances.size())];

  for (auto side : kDirections)
  {
    if (side == entrance)
      layout.link(*boss, side);
    else if (layout.neighbor(*boss, side) != nullptr)
      layout.seal(*boss, side);
    else
      layout.unlink(*boss, side);
  }

  spdlog::info("Boss room at {} with its entrance to the {}", boss->coordinate, entrance);
  return boss;
}

}
