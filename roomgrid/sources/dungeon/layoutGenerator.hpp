#pragma once

#include <vector>

#include "dungeonLayout.hpp"
#include "generationReport.hpp"
#include "random.hpp"


namespace roomgrid
{

// Directions whose neighbor cell is in bounds and still unoccupied
std::vector<Direction> availableDirections(const DungeonLayout& layout, const Room& room);

// Places Start at the center cell, then random-walks up to
// targetFightRoomCount Normal rooms onto the grid, each one linked to the
// room it grew from. Gives up after 3 * targetFightRoomCount attempts and
// keeps whatever was placed.
void growLayout(DungeonLayout& layout, int targetFightRoomCount, Rng& rng, GenerationReport& report);

// Turns one uniformly chosen Normal room into the Item room
Room* assignItemRoom(DungeonLayout& layout, Rng& rng);

}
