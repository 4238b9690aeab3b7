#include "dungeonLayout.hpp"
#include "tileCompiler.hpp"
#include "roomFormatter.hpp"
#include "../../glmFormatter.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>


namespace roomgrid
{

DungeonLayout::DungeonLayout(const LayoutGeometry& geometry)
  : geometry_{geometry}
  , grid_(static_cast<std::size_t>(geometry.rows * geometry.cols), nullptr)
{
  for (int row = 0; row < geometry.rows; ++row)
    for (int col = 0; col < geometry.cols; ++col)
      available_.insert(GridCoord{row, col});
}

bool DungeonLayout::inBounds(GridCoord c) const
{
  return c.row >= 0 && c.row < geometry_.rows && c.col >= 0 && c.col < geometry_.cols;
}

bool DungeonLayout::isBorder(GridCoord c) const
{
  return inBounds(c)
    && (c.row == 0 || c.row == geometry_.rows - 1 || c.col == 0 || c.col == geometry_.cols - 1);
}

Room* DungeonLayout::getRoomAt(GridCoord c) const
{
  if (!inBounds(c))
    return nullptr;
  return grid_[cellIndex(c)];
}

Room* DungeonLayout::neighbor(const Room& room, Direction side) const
{
  return getRoomAt(step(room.coordinate, side));
}

std::vector<Room*> DungeonLayout::getAllRooms() const
{
  std::vector<Room*> result;
  result.reserve(rooms_.size());
  for (const auto& room : rooms_)
    result.push_back(room.get());
  return result;
}

std::vector<Room*> DungeonLayout::normalRooms() const
{
  std::vector<Room*> result;
  for (const auto& room : rooms_)
    if (room->category == RoomCategory::Normal)
      result.push_back(room.get());
  return result;
}

bool DungeonLayout::connected(const Room& room, Direction side) const
{
  const Room* other = neighbor(room, side);
  return other != nullptr && room.exits[side] && other->exits[opposite(side)];
}

bool DungeonLayout::link(Room& room, Direction side)
{
  Room* other = neighbor(room, side);
  if (other == nullptr || isSealed(room.coordinate, side))
    return false;

  room.exits[side] = true;
  other->exits[opposite(side)] = true;
  recompileRoom(room);
  recompileRoom(*other);
  return true;
}

void DungeonLayout::seal(Room& room, Direction side)
{
  const auto other = step(room.coordinate, side);
  sealed_.emplace(room.coordinate, side);
  sealed_.emplace(other, opposite(side));
  closePair(room, side);
}

bool DungeonLayout::isSealed(GridCoord c, Direction side) const
{
  return sealed_.contains({c, side});
}

void DungeonLayout::unlink(Room& room, Direction side)
{
  closePair(room, side);
}

void DungeonLayout::closePair(Room& room, Direction side)
{
  room.exits[side] = false;
  recompileRoom(room);

  if (Room* other = neighbor(room, side))
  {
    other->exits[opposite(side)] = false;
    recompileRoom(*other);
  }
}

void DungeonLayout::setCategory(Room& room, RoomCategory category)
{
  auto slotFor = [this](RoomCategory c) -> Room**
    {
      switch (c)
      {
        case RoomCategory::Start: return &start_;
        case RoomCategory::Boss: return &boss_;
        case RoomCategory::Item: return &item_;
        default: return nullptr;
      }
    };

  if (auto slot = slotFor(room.category); slot && *slot == &room)
    *slot = nullptr;

  if (auto slot = slotFor(category))
  {
    if (*slot != nullptr && *slot != &room)
    {
      spdlog::warn("Room {} loses category {} to {}", (*slot)->coordinate, category, room.coordinate);
      (*slot)->category = RoomCategory::Normal;
    }
    *slot = &room;
  }

  room.category = category;
}

Room& DungeonLayout::insert(GridCoord c, RoomCategory category)
{
  auto room = std::make_unique<Room>();
  room->coordinate = c;
  room->interiorSize = geometry_.interiorSize;
  room->worldAnchor = geometry_.anchorFor(c);
  recompileRoom(*room);

  Room& result = *room;
  rooms_.push_back(std::move(room));
  grid_[cellIndex(c)] = &result;
  available_.erase(c);

  setCategory(result, category);
  return result;
}

std::string DungeonLayout::dump() const
{
  const auto spacing = geometry_.worldSpacing();

  std::string result = fmt::format("=== DUNGEON LAYOUT ({}x{}) ===\n", geometry_.rows, geometry_.cols);
  result += fmt::format("Room spacing: {:.1f} x {:.1f} world units\n", spacing.x, spacing.y);

  for (int row = 0; row < geometry_.rows; ++row)
  {
    for (int col = 0; col < geometry_.cols; ++col)
    {
      const Room* room = grid_[cellIndex({row, col})];
      if (room == nullptr)
        continue;

      const auto expected = geometry_.anchorFor(room->coordinate);
      const auto actual = room->realizedAnchor
        ? fmt::format("{}", *room->realizedAnchor)
        : std::string{"(unrealized)"};

      result += fmt::format("{} {}: Expected{} Actual{} Exits({}) {}{}\n",
        room->coordinate, room->category, expected, actual, room->exits,
        room->cleared ? "cleared" : "uncleared", room->locked ? " locked" : "");
    }
  }

  return result;
}

}
