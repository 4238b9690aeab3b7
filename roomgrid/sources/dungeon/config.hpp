#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "dungeonLayout.hpp"
#include "tileLayers.hpp"


namespace roomgrid
{

struct GeneratorConfig
{
  LayoutGeometry geometry;

  int targetFightRoomCount{6};
  // Absent means a fresh random seed for every floor
  std::optional<std::uint32_t> seed;

  bool placeItemRoom{true};
  bool connectAllAdjacent{true};
  bool repairConnectivity{true};

  int maxFloors{10};
  int wavesPerRoom{1};

  TileAssets tiles;
  std::string logLevel{"info"};
};

class ConfigError : public std::runtime_error
{
 public:
  using std::runtime_error::runtime_error;
};

// Throws ConfigError on sizes that cannot produce a layout or on rooms that
// would overlap on the tile lattice
void validateConfig(const GeneratorConfig& config);

// Keys missing from the document keep their defaults
GeneratorConfig parseConfig(const std::string& text);
GeneratorConfig loadConfig(const std::filesystem::path& path);

std::string emitConfig(const GeneratorConfig& config);
void saveConfig(const GeneratorConfig& config, const std::filesystem::path& path);

void applyLogLevel(const GeneratorConfig& config);

// Floor 1 when nothing was saved yet
int loadFloorProgress(const std::filesystem::path& path);
void saveFloorProgress(const std::filesystem::path& path, int floor);

}
