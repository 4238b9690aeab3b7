#include "roomConnector.hpp"

#include <spdlog/spdlog.h>


namespace roomgrid
{

static bool isBoss(const Room* room)
{
  return room != nullptr && room->category == RoomCategory::Boss;
}

int connectAdjacentRooms(DungeonLayout& layout, bool allPairs)
{
  int opened = 0;

  auto grid = layout.gridView();
  for (int row = 0; row < grid.extent(0); ++row)
  {
    for (int col = 0; col < grid.extent(1); ++col)
    {
      Room* room = grid(row, col);
      if (room == nullptr || isBoss(room))
        continue;
      if (!allPairs && room->category != RoomCategory::Start)
        continue;

      for (auto side : kDirections)
      {
        Room* other = layout.neighbor(*room, side);
        if (other == nullptr || isBoss(other) || layout.connected(*room, side))
          continue;
        if (layout.link(*room, side))
          ++opened;
      }
    }
  }

  spdlog::debug("Connector opened {} exit pairs", opened);
  return opened;
}

}
