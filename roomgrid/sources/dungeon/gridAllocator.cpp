#include "gridAllocator.hpp"
#include "roomFormatter.hpp"

#include <spdlog/spdlog.h>


namespace roomgrid
{

const char* toString(PlacementError error)
{
  switch (error)
  {
    case PlacementError::None: return "None";
    case PlacementError::CellOccupied: return "CellOccupied";
    case PlacementError::OutOfBounds: return "OutOfBounds";
  }
  return "Unknown";
}

DungeonLayout initializeGrid(const LayoutGeometry& geometry)
{
  spdlog::debug("Initializing {}x{} room grid", geometry.rows, geometry.cols);
  return DungeonLayout{geometry};
}

Placement placeRoom(DungeonLayout& layout, GridCoord coord, RoomCategory category)
{
  if (!layout.inBounds(coord))
    return {nullptr, PlacementError::OutOfBounds};

  if (layout.getRoomAt(coord) != nullptr)
    return {nullptr, PlacementError::CellOccupied};

  Room& room = layout.insert(coord, category);
  spdlog::debug("Placed {} room at {}", category, coord);
  return {&room, PlacementError::None};
}

}
