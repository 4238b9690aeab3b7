#include "tileCompiler.hpp"
#include "dungeonUtils.hpp"


namespace roomgrid
{

std::array<glm::ivec2, 2> openingTiles(glm::ivec2 totalSize, Direction side)
{
  const glm::ivec2 mid = totalSize / 2;
  const glm::ivec2 last = totalSize - 1;

  switch (side)
  {
    case Direction::North:
      return {glm::ivec2{mid.x - 1, last.y}, glm::ivec2{mid.x, last.y}};

    case Direction::South:
      return {glm::ivec2{mid.x - 1, 0}, glm::ivec2{mid.x, 0}};

    case Direction::East:
      return {glm::ivec2{last.x, mid.y - 1}, glm::ivec2{last.x, mid.y}};

    case Direction::West:
      return {glm::ivec2{0, mid.y - 1}, glm::ivec2{0, mid.y}};
  }
  return {};
}

TileGrid compile(glm::ivec2 interiorSize, const Exits& exits)
{
  const glm::ivec2 totalSize = interiorSize + 2;

  auto result = make_tile_grid(totalSize.x, totalSize.y, Tile::Wall);
  auto view = result.view();

  for (int y = 1; y < totalSize.y - 1; ++y)
    for (int x = 1; x < totalSize.x - 1; ++x)
      view(y, x) = Tile::Floor;

  for (auto side : kDirections)
  {
    if (!exits[side])
      continue;
    for (auto p : openingTiles(totalSize, side))
      view(p.y, p.x) = Tile::Floor;
  }

  return result;
}

void overlayDoors(TileGrid& grid, const Exits& exits, DoorState state)
{
  auto view = grid.view();
  const Tile tile = state == DoorState::Locked ? Tile::Door : Tile::Floor;

  for (auto side : kDirections)
  {
    if (!exits[side])
      continue;
    for (auto p : openingTiles(grid.size, side))
      view(p.y, p.x) = tile;
  }
}

void recompileRoom(Room& room)
{
  room.tiles = compile(room.interiorSize, room.exits);
  if (room.locked)
    overlayDoors(room.tiles, room.exits, DoorState::Locked);
}

}
