#pragma once

#include <array>
#include <cstdint>
#include <glm/glm.hpp>

#include "dungeon.hpp"
#include "room.hpp"


namespace roomgrid
{

enum class DoorState : std::uint8_t
{
  Open,
  Locked,
};

// Wall ring around a Floor interior, with a 2 tile opening carved at the
// middle of every side that has an exit. Pure in (interiorSize, exits).
TileGrid compile(glm::ivec2 interiorSize, const Exits& exits);

// The two border tiles an exit on `side` occupies, in room-local (x, y)
std::array<glm::ivec2, 2> openingTiles(glm::ivec2 totalSize, Direction side);

// Writes Door (Locked) or Floor (Open) over the openings of every true exit.
// Walls of closed sides are never touched.
void overlayDoors(TileGrid& grid, const Exits& exits, DoorState state);

// Re-derives room.tiles after its exits changed, keeping doors shut if locked
void recompileRoom(Room& room);

}
