#include "tileLayers.hpp"
#include "roomFormatter.hpp"
#include "../../glmFormatter.hpp"

#include <vector>
#include <spdlog/spdlog.h>


namespace roomgrid
{

std::optional<Tile> TileLayer::at(glm::ivec2 pos) const
{
  if (auto it = tiles_.find(pos); it != tiles_.end())
    return it->second;
  return std::nullopt;
}

void TileLayer::clearBlock(glm::ivec2 origin, glm::ivec2 size)
{
  for (int y = origin.y; y < origin.y + size.y; ++y)
    for (int x = origin.x; x < origin.x + size.x; ++x)
      tiles_.erase(glm::ivec2{x, y});
}

std::optional<Tile> TileLayers::tileAt(glm::ivec2 pos) const
{
  if (auto tile = collision.at(pos))
    return tile;
  return floor.at(pos);
}

void TileLayers::clear()
{
  collision.clear();
  floor.clear();
}

std::string TileLayers::render(glm::ivec2 min, glm::ivec2 max) const
{
  std::string result;
  for (int y = max.y; y >= min.y; --y)
  {
    for (int x = min.x; x <= max.x; ++x)
    {
      auto tile = tileAt({x, y});
      result += tile ? static_cast<char>(*tile) : ' ';
    }
    result += '\n';
  }
  return result;
}

RoomRealizer::RoomRealizer(TileLayers& layers, TileAssets assets, const LayoutGeometry& geometry)
  : layers_{layers}
  , assets_{std::move(assets)}
  , geometry_{geometry}
{
}

glm::ivec2 RoomRealizer::blockOrigin(const Room& room) const
{
  return geometry_.anchorTileFor(room.coordinate) - room.totalSize() / 2;
}

bool RoomRealizer::realize(Room& room)
{
  if (assets_.wall.empty() || assets_.floor.empty())
    return false;

  const auto origin = blockOrigin(room);
  const auto size = room.tiles.size;

  layers_.collision.clearBlock(origin, size);
  layers_.floor.clearBlock(origin, size);

  auto view = room.tiles.view();
  for (int y = 0; y < view.extent(0); ++y)
  {
    for (int x = 0; x < view.extent(1); ++x)
    {
      const glm::ivec2 pos = origin + glm::ivec2{x, y};
      if (view(y, x) == Tile::Floor)
        layers_.floor.set(pos, Tile::Floor);
      else
        layers_.collision.set(pos, view(y, x));
    }
  }

  room.realizedAnchor = glm::vec2{origin + room.totalSize() / 2} * geometry_.cellSize;
  spdlog::debug("Realized {} room {} at tile {}", room.category, room.coordinate, origin);
  return true;
}

void RoomRealizer::clear(Room& room)
{
  const auto origin = blockOrigin(room);
  layers_.collision.clearBlock(origin, room.totalSize());
  layers_.floor.clearBlock(origin, room.totalSize());
  room.realizedAnchor.reset();
}

void RoomRealizer::lock(Room& room)
{
  room.locked = true;
  overlayDoors(room.tiles, room.exits, DoorState::Locked);
  writeOpenings(room, DoorState::Locked);
}

void RoomRealizer::unlock(Room& room)
{
  room.locked = false;
  overlayDoors(room.tiles, room.exits, DoorState::Open);
  writeOpenings(room, DoorState::Open);
}

void RoomRealizer::writeOpenings(const Room& room, DoorState state)
{
  if (!room.realizedAnchor)
    return;

  if (state == DoorState::Locked && assets_.door.empty())
  {
    spdlog::warn("No door tile asset, doors of room {} stay undrawn", room.coordinate);
    return;
  }

  const auto origin = blockOrigin(room);
  for (auto side : kDirections)
  {
    if (!room.exits[side])
      continue;
    for (auto p : openingTiles(room.totalSize(), side))
    {
      const auto pos = origin + p;
      if (state == DoorState::Locked)
      {
        layers_.floor.erase(pos);
        layers_.collision.set(pos, Tile::Door);
      }
      else
      {
        layers_.collision.erase(pos);
        layers_.floor.set(pos, Tile::Floor);
      }
    }
  }
}

}
