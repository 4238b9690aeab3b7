#include "connectivityRepairer.hpp"
#include "roomsearch.hpp"
#include "roomFormatter.hpp"

#include <spdlog/spdlog.h>


namespace roomgrid
{

static std::vector<Room*> collectUnreachable(const DungeonLayout& layout, const SearchResult& search)
{
  std::vector<Room*> result;
  for (auto room : layout.getAllRooms())
    if (room->category != RoomCategory::Boss && !search.visited(*room))
      result.push_back(room);
  return result;
}

std::vector<Room*> findUnreachableRooms(const DungeonLayout& layout)
{
  const Room* start = layout.getStartRoom();
  if (start == nullptr)
    return {};
  return collectUnreachable(layout, breadthFirst(layout, *start, true));
}

static bool connectToNetwork(DungeonLayout& layout, Room& room, const SearchResult& search)
{
  for (auto side : kDirections)
  {
    const Room* other = layout.neighbor(room, side);
    if (other == nullptr || other->category == RoomCategory::Boss || !search.visited(*other))
      continue;

    if (layout.link(room, side))
    {
      spdlog::info("Connected unreachable room {} to {} through its {} exit", room.coordinate, other->coordinate, side);
      return true;
    }
  }
  return false;
}

int repairConnectivity(DungeonLayout& layout, GenerationReport& report)
{
  const Room* start = layout.getStartRoom();
  if (start == nullptr)
    return 0;

  int links = 0;
  auto search = breadthFirst(layout, *start, true);
  auto unreachable = collectUnreachable(layout, search);

  // A room may only touch other cut-off rooms until those get linked, so
  // keep going while the reachable set still grows
  while (!unreachable.empty())
  {
    int linkedThisPass = 0;
    for (auto room : unreachable)
      if (connectToNetwork(layout, *room, search))
        ++linkedThisPass;

    if (linkedThisPass == 0)
      break;

    links += linkedThisPass;
    search = breadthFirst(layout, *start, true);
    unreachable = collectUnreachable(layout, search);
  }

  for (auto room : unreachable)
    report.add(GenerationIssueKind::RepairImpossible, room->coordinate, "no reachable neighbor to connect to");

  const auto finalSearch = breadthFirst(layout, *start, true);
  int nonBoss = 0;
  for (auto room : layout.getAllRooms())
    if (room->category != RoomCategory::Boss)
      ++nonBoss;

  report.reachableRooms = finalSearch.reached;
  report.totalRooms = static_cast<int>(layout.roomCount());

  spdlog::info("Reachable from start: {}/{} non-boss rooms ({} rooms total, {} repair links)",
    finalSearch.reached, nonBoss, layout.roomCount(), links);
  return links;
}

}
