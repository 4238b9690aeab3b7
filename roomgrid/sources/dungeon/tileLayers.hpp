#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <glm/glm.hpp>
#include <glm/gtx/hash.hpp>

#include "dungeon.hpp"
#include "dungeonLayout.hpp"
#include "room.hpp"
#include "tileCompiler.hpp"


namespace roomgrid
{

// Names of the tile assets a realized room is drawn with; an empty name
// means the asset is missing
struct TileAssets
{
  std::string wall{"wall"};
  std::string floor{"floor"};
  std::string door{"door"};
};

// Sparse world-space tile layer keyed by tile coordinate
class TileLayer
{
 public:
  void set(glm::ivec2 pos, Tile tile) { tiles_[pos] = tile; }
  void erase(glm::ivec2 pos) { tiles_.erase(pos); }
  std::optional<Tile> at(glm::ivec2 pos) const;

  void clearBlock(glm::ivec2 origin, glm::ivec2 size);
  void clear() { tiles_.clear(); }

  std::size_t size() const { return tiles_.size(); }
  bool empty() const { return tiles_.empty(); }

  const std::unordered_map<glm::ivec2, Tile>& tiles() const { return tiles_; }

 private:
  std::unordered_map<glm::ivec2, Tile> tiles_;
};

// The layers every room of a floor draws into. Collision holds Wall and
// Door tiles, floor holds Floor tiles.
struct TileLayers
{
  TileLayer collision;
  TileLayer floor;

  // Collision wins over floor
  std::optional<Tile> tileAt(glm::ivec2 pos) const;

  bool empty() const { return collision.empty() && floor.empty(); }
  void clear();

  // ASCII rendering of [min, max], north up, ' ' for empty tiles
  std::string render(glm::ivec2 min, glm::ivec2 max) const;
};

// Writes rooms into shared tile layers. The layers are injected and
// outlive the realizer.
class RoomRealizer
{
 public:
  RoomRealizer(TileLayers& layers, TileAssets assets, const LayoutGeometry& geometry);

  const TileAssets& assets() const { return assets_; }
  TileLayers& layers() { return layers_; }

  // Bottom-left tile of the room's block in world tile coordinates
  glm::ivec2 blockOrigin(const Room& room) const;

  // Replaces the room's block with room.tiles. Returns false and writes
  // nothing when the wall or floor asset is missing.
  bool realize(Room& room);

  // Empties the room's block on both layers
  void clear(Room& room);

  // Door tiles over every true exit; exits themselves stay untouched
  void lock(Room& room);
  void unlock(Room& room);

 private:
  void writeOpenings(const Room& room, DoorState state);

 private:
  TileLayers& layers_;
  TileAssets assets_;
  LayoutGeometry geometry_;
};

}
