#pragma once

#include "dungeon.hpp"


namespace roomgrid
{

TileGrid make_tile_grid(int width, int height, Tile fill);

};
