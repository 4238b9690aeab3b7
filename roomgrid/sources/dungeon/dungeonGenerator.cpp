#include "dungeonGenerator.hpp"
#include "bossIsolator.hpp"
#include "connectivityRepairer.hpp"
#include "gridAllocator.hpp"
#include "layoutGenerator.hpp"
#include "random.hpp"
#include "roomConnector.hpp"
#include "roomFormatter.hpp"

#include <random>
#include <fmt/format.h>
#include <spdlog/spdlog.h>


namespace roomgrid
{

DungeonGenerator::DungeonGenerator(GeneratorConfig config, RoomRealizer& realizer)
  : config_{std::move(config)}
  , realizer_{realizer}
{
}

GenerationResult DungeonGenerator::generate(std::optional<std::uint32_t> seed)
{
  GenerationResult result{.layout = initializeGrid(config_.geometry)};
  result.seed = seed.value_or(std::random_device{}());

  Rng rng(result.seed);
  auto& layout = result.layout;
  auto& report = result.report;

  spdlog::debug("Generating {}x{} layout with seed {}", layout.rows(), layout.cols(), result.seed);

  growLayout(layout, config_.targetFightRoomCount, rng, report);
  layout.finishAllocation();
  isolateBoss(layout, rng, report);

  if (config_.placeItemRoom)
    assignItemRoom(layout, rng);

  const int connected = connectAdjacentRooms(layout, config_.connectAllAdjacent);
  spdlog::debug("Connector opened {} exit pairs", connected);

  if (config_.repairConnectivity)
    repairConnectivity(layout, report);

  for (auto room : layout.getAllRooms())
    if (!realizer_.realize(*room))
      report.add(GenerationIssueKind::MissingTileAsset, room->coordinate,
        fmt::format("wall '{}' / floor '{}' asset missing, room left unrealized",
          realizer_.assets().wall, realizer_.assets().floor));

  spdlog::info("Generated {} rooms (seed {}, {} issues)", layout.roomCount(), result.seed, report.issues.size());
  return result;
}

void DungeonGenerator::clear(DungeonLayout& layout)
{
  for (auto room : layout.getAllRooms())
    realizer_.clear(*room);
  spdlog::debug("Cleared {} rooms from the tile layers", layout.roomCount());
}

}
