#pragma once

#include <cstdint>
#include <optional>

#include "config.hpp"
#include "dungeonLayout.hpp"
#include "generationReport.hpp"
#include "tileLayers.hpp"


namespace roomgrid
{

struct GenerationResult
{
  DungeonLayout layout;
  GenerationReport report;
  // The seed actually used, so a random floor can be replayed
  std::uint32_t seed{0};
};

// Runs the whole pipeline for one floor: allocate, grow, isolate the boss,
// pick the item room, connect, repair, realize. Problems end up in the
// report, never as exceptions.
class DungeonGenerator
{
 public:
  DungeonGenerator(GeneratorConfig config, RoomRealizer& realizer);

  const GeneratorConfig& config() const { return config_; }

  GenerationResult generate(std::optional<std::uint32_t> seed = std::nullopt);

  // Removes every room of `layout` from the tile layers
  void clear(DungeonLayout& layout);

 private:
  GeneratorConfig config_;
  RoomRealizer& realizer_;
};

}
