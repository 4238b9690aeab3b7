#include "layoutGenerator.hpp"
#include "gridAllocator.hpp"
#include "roomFormatter.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>


namespace roomgrid
{

constexpr float kFollowNewRoomChance = 0.4f;
constexpr float kJumpToRandomRoomChance = 0.7f;

static std::vector<Room*> adjacentRooms(const DungeonLayout& layout, const Room& room)
{
  std::vector<Room*> result;
  for (auto side : kDirections)
    if (Room* other = layout.neighbor(room, side))
      result.push_back(other);
  return result;
}

// Shuffled directions are tried in turn, the first free cell wins
static Room* trySpawnConnectedRoom(DungeonLayout& layout, Room& current, std::vector<Direction> directions, Rng& rng,
  GenerationReport& report)
{
  std::shuffle(directions.begin(), directions.end(), rng);

  for (auto side : directions)
  {
    const auto coord = step(current.coordinate, side);
    auto placement = placeRoom(layout, coord, RoomCategory::Normal);
    if (!placement)
    {
      report.add(placement.error == PlacementError::OutOfBounds
          ? GenerationIssueKind::OutOfBounds : GenerationIssueKind::CellOccupied,
        coord, fmt::format("cannot grow {} from {}", side, current.coordinate));
      continue;
    }

    layout.link(current, side);
    return placement.room;
  }

  return nullptr;
}

std::vector<Direction> availableDirections(const DungeonLayout& layout, const Room& room)
{
  std::vector<Direction> result;
  for (auto side : kDirections)
  {
    const auto coord = step(room.coordinate, side);
    if (layout.inBounds(coord) && layout.availableCells().contains(coord))
      result.push_back(side);
  }
  return result;
}

void growLayout(DungeonLayout& layout, int targetFightRoomCount, Rng& rng, GenerationReport& report)
{
  const GridCoord center{layout.rows() / 2, layout.cols() / 2};
  auto startPlacement = placeRoom(layout, center, RoomCategory::Start);
  if (!startPlacement)
  {
    report.add(startPlacement.error == PlacementError::OutOfBounds
        ? GenerationIssueKind::OutOfBounds : GenerationIssueKind::CellOccupied,
      center, "cannot place the start room");
    return;
  }

  std::vector<Room*> placed{startPlacement.room};
  Room* current = startPlacement.room;

  const int maxAttempts = targetFightRoomCount * 3;
  int roomsGenerated = 0;
  int attempts = 0;

  while (roomsGenerated < targetFightRoomCount && attempts < maxAttempts)
  {
    ++attempts;

    auto directions = availableDirections(layout, *current);
    if (directions.empty())
    {
      auto neighbors = adjacentRooms(layout, *current);
      current = neighbors.empty()
        ? placed[pickIndex(rng, placed.size())]
        : neighbors[pickIndex(rng, neighbors.size())];
      continue;
    }

    Room* newRoom = trySpawnConnectedRoom(layout, *current, std::move(directions), rng, report);
    if (newRoom == nullptr)
      continue;

    placed.push_back(newRoom);
    ++roomsGenerated;

    const float p = unitRandom(rng);
    if (p < kFollowNewRoomChance)
      current = newRoom;
    else if (p < kJumpToRandomRoomChance)
      current = placed[pickIndex(rng, placed.size())];
  }

  report.placedRooms = roomsGenerated;
  report.attempts = attempts;

  if (roomsGenerated < targetFightRoomCount)
    report.add(GenerationIssueKind::ExhaustedAttempts, std::nullopt,
      fmt::format("placed {} of {} rooms in {} attempts", roomsGenerated, targetFightRoomCount, attempts));
  else
    spdlog::debug("Grew {} rooms in {} attempts", roomsGenerated, attempts);
}

Room* assignItemRoom(DungeonLayout& layout, Rng& rng)
{
  auto candidates = layout.normalRooms();
  if (candidates.empty())
  {
    spdlog::debug("No normal room left for the item room");
    return nullptr;
  }

  Room* room = candidates[pickIndex(rng, candidates.size())];
  layout.setCategory(*room, RoomCategory::Item);
  spdlog::debug("Item room at {}", room->coordinate);
  return room;
}

}
