#pragma once

#include "dungeonLayout.hpp"


namespace roomgrid
{

// Opens exits between grid-adjacent occupied rooms. Start always gets an
// exit toward each occupied neighbor; with allPairs every other adjacent
// pair is linked too. Boss exits and sealed edges are left alone.
// Returns the number of exit pairs that were newly opened.
int connectAdjacentRooms(DungeonLayout& layout, bool allPairs);

}
