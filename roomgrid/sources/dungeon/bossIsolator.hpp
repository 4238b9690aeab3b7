#pragma once

#include "dungeonLayout.hpp"
#include "generationReport.hpp"
#include "random.hpp"


namespace roomgrid
{

// Border room farthest from Start (first one in placement order on ties),
// else the farthest non-start room anywhere, else nullptr
Room* chooseBossCandidate(const DungeonLayout& layout);

// Converts the candidate to Boss and leaves it a single entrance picked at
// random among its occupied neighbors. Every other neighbor's exit toward
// the boss is sealed so no later pass reopens it.
Room* isolateBoss(DungeonLayout& layout, Rng& rng, GenerationReport& report);

}
