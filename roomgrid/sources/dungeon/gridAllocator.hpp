#pragma once

#include <cstdint>

#include "dungeonLayout.hpp"


namespace roomgrid
{

enum class PlacementError : std::uint8_t
{
  None,
  CellOccupied,
  OutOfBounds,
};

const char* toString(PlacementError error);

struct Placement
{
  Room* room{nullptr};
  PlacementError error{PlacementError::None};

  explicit operator bool() const { return room != nullptr; }
};

// Empty rows x cols grid with every cell available
DungeonLayout initializeGrid(const LayoutGeometry& geometry);

// Takes the cell out of the available pool. Never touches exits.
Placement placeRoom(DungeonLayout& layout, GridCoord coord, RoomCategory category);

}
