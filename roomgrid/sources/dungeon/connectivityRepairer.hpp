#pragma once

#include <vector>

#include "dungeonLayout.hpp"
#include "generationReport.hpp"


namespace roomgrid
{

// Non-boss rooms the start room cannot walk to
std::vector<Room*> findUnreachableRooms(const DungeonLayout& layout);

// Links every unreachable Normal/Item room to a reachable neighbor until no
// further progress is possible. Rooms that stay cut off are reported as
// RepairImpossible. Returns the number of links added.
int repairConnectivity(DungeonLayout& layout, GenerationReport& report);

}
