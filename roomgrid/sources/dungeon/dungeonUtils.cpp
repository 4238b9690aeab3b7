#include "dungeonUtils.hpp"
#include <vector>


namespace roomgrid
{

TileGrid make_tile_grid(int width, int height, Tile fill)
{
  return TileGrid
    {
      .size = {width, height},
      .data = std::vector<Tile>(width * height, fill),
    };
}

}
