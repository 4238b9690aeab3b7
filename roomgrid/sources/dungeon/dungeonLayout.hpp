#pragma once

#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <experimental/mdspan>
#include <glm/glm.hpp>

#include "dungeon.hpp"
#include "room.hpp"


namespace roomgrid
{

struct Placement;

struct LayoutGeometry
{
  int rows{3};
  int cols{4};
  glm::ivec2 interiorSize{14, 10};
  // Lattice step between room anchors, in tiles
  glm::ivec2 roomSpacing{16, 12};
  // World units per tile
  float cellSize{0.4f};

  glm::vec2 worldSpacing() const { return glm::vec2{roomSpacing} * cellSize; }
  glm::vec2 anchorFor(GridCoord c) const { return glm::vec2{c.col, c.row} * worldSpacing(); }
  glm::ivec2 anchorTileFor(GridCoord c) const { return glm::ivec2{c.col, c.row} * roomSpacing; }
};

// Indexed as view(row, col), nullptr for empty cells
using RoomGridView = std::experimental::mdspan<Room* const, TileExtents>;

class DungeonLayout
{
 public:
  DungeonLayout() = default;
  explicit DungeonLayout(const LayoutGeometry& geometry);

  DungeonLayout(const DungeonLayout&) = delete;
  DungeonLayout& operator=(const DungeonLayout&) = delete;
  DungeonLayout(DungeonLayout&&) = default;
  DungeonLayout& operator=(DungeonLayout&&) = default;

  const LayoutGeometry& geometry() const { return geometry_; }
  int rows() const { return geometry_.rows; }
  int cols() const { return geometry_.cols; }

  bool inBounds(GridCoord c) const;
  bool isBorder(GridCoord c) const;

  Room* getStartRoom() const { return start_; }
  Room* getBossRoom() const { return boss_; }
  Room* getItemRoom() const { return item_; }
  Room* getRoomAt(GridCoord c) const;
  Room* neighbor(const Room& room, Direction side) const;

  // Placement order, which is the stable enumeration order of the layout
  std::vector<Room*> getAllRooms() const;
  std::vector<Room*> normalRooms() const;

  std::size_t roomCount() const { return rooms_.size(); }
  bool empty() const { return rooms_.empty(); }

  RoomGridView gridView() const { return RoomGridView(grid_.data(), geometry_.rows, geometry_.cols); }
  const std::set<GridCoord>& availableCells() const { return available_; }
  // Drops the pool of unoccupied cells once growth is over
  void finishAllocation() { available_.clear(); }

  // Both rooms have their exit toward each other open
  bool connected(const Room& room, Direction side) const;

  // Opens the exit pair between `room` and its neighbor on `side` and
  // recompiles both. Refuses empty cells and sealed edges.
  bool link(Room& room, Direction side);

  // Closes the pair for good: link() on it fails from now on
  void seal(Room& room, Direction side);
  bool isSealed(GridCoord c, Direction side) const;

  // Closes the pair without sealing it
  void unlink(Room& room, Direction side);

  // Keeps start/boss/item unique: a previous holder of the category is
  // demoted to Normal
  void setCategory(Room& room, RoomCategory category);

  // One line per occupied cell: category, exits, expected vs actual position
  std::string dump() const;

 private:
  friend Placement placeRoom(DungeonLayout& layout, GridCoord coord, RoomCategory category);

  Room& insert(GridCoord c, RoomCategory category);
  void closePair(Room& room, Direction side);
  std::size_t cellIndex(GridCoord c) const { return static_cast<std::size_t>(c.row * geometry_.cols + c.col); }

 private:
  LayoutGeometry geometry_;

  std::vector<std::unique_ptr<Room>> rooms_;
  std::vector<Room*> grid_;
  std::set<GridCoord> available_;
  std::set<std::pair<GridCoord, Direction>> sealed_;

  Room* start_{nullptr};
  Room* boss_{nullptr};
  Room* item_{nullptr};
};

}
