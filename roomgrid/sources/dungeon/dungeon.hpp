#pragma once

#include <span>
#include <vector>
#include <experimental/mdspan>
#include <glm/glm.hpp>


namespace roomgrid
{

enum Tile : char
{
  Wall = '#',
  Floor = '.',
  Door = '+'
};

using TileExtents = std::experimental::extents<int, std::dynamic_extent, std::dynamic_extent>;
using TileView = std::experimental::mdspan<Tile, TileExtents>;
using ConstTileView = std::experimental::mdspan<const Tile, TileExtents>;

// Indexed as view(y, x); y grows northwards
struct TileGrid
{
  glm::ivec2 size{};
  std::vector<Tile> data;

  TileView view() { return TileView(data.data(), size.y, size.x); }
  ConstTileView view() const { return ConstTileView(data.data(), size.y, size.x); }

  Tile at(glm::ivec2 p) const { return data[p.y * size.x + p.x]; }

  bool operator==(const TileGrid&) const = default;
};

}
