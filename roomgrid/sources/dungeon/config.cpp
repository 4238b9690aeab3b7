#include "config.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>


namespace roomgrid
{

constexpr std::array kLogLevels{"trace", "debug", "info", "warn", "error", "off"};

static glm::ivec2 readPair(const YAML::Node& node, const char* key)
{
  if (!node.IsSequence() || node.size() != 2)
    throw ConfigError(fmt::format("'{}' must be a [x, y] pair", key));
  return {node[0].as<int>(), node[1].as<int>()};
}

template <class T>
static void read(const YAML::Node& root, const char* key, T& out)
{
  if (auto node = root[key])
    out = node.as<T>();
}

static GeneratorConfig fromNode(const YAML::Node& root)
{
  GeneratorConfig config;
  if (!root || root.IsNull())
    return config;
  if (!root.IsMap())
    throw ConfigError("configuration root must be a map");

  read(root, "rows", config.geometry.rows);
  read(root, "cols", config.geometry.cols);
  read(root, "cellSize", config.geometry.cellSize);
  if (auto node = root["interiorSize"])
  {
    config.geometry.interiorSize = readPair(node, "interiorSize");
    // Spacing follows the footprint unless given explicitly
    config.geometry.roomSpacing = config.geometry.interiorSize + 2;
  }
  if (auto node = root["roomSpacing"])
    config.geometry.roomSpacing = readPair(node, "roomSpacing");

  read(root, "targetFightRoomCount", config.targetFightRoomCount);
  if (auto node = root["seed"]; node && !node.IsNull())
    config.seed = node.as<std::uint32_t>();

  read(root, "placeItemRoom", config.placeItemRoom);
  read(root, "connectAllAdjacent", config.connectAllAdjacent);
  read(root, "repairConnectivity", config.repairConnectivity);
  read(root, "maxFloors", config.maxFloors);
  read(root, "wavesPerRoom", config.wavesPerRoom);
  read(root, "logLevel", config.logLevel);

  if (auto tiles = root["tiles"])
  {
    read(tiles, "wall", config.tiles.wall);
    read(tiles, "floor", config.tiles.floor);
    read(tiles, "door", config.tiles.door);
  }

  return config;
}

void validateConfig(const GeneratorConfig& config)
{
  const auto& g = config.geometry;

  if (g.rows <= 0 || g.cols <= 0)
    throw ConfigError(fmt::format("grid must be at least 1x1, got {}x{}", g.rows, g.cols));
  if (g.interiorSize.x < 2 || g.interiorSize.y < 2)
    throw ConfigError(fmt::format("room interior must be at least 2x2, got {}x{}", g.interiorSize.x, g.interiorSize.y));
  if (g.roomSpacing.x < g.interiorSize.x + 2 || g.roomSpacing.y < g.interiorSize.y + 2)
    throw ConfigError(fmt::format("room spacing {}x{} is smaller than the {}x{} room footprint",
      g.roomSpacing.x, g.roomSpacing.y, g.interiorSize.x + 2, g.interiorSize.y + 2));
  if (g.cellSize <= 0.f)
    throw ConfigError(fmt::format("cellSize must be positive, got {}", g.cellSize));
  if (config.targetFightRoomCount < 0)
    throw ConfigError(fmt::format("targetFightRoomCount must not be negative, got {}", config.targetFightRoomCount));
  if (config.maxFloors < 1)
    throw ConfigError(fmt::format("maxFloors must be at least 1, got {}", config.maxFloors));
  if (config.wavesPerRoom < 1)
    throw ConfigError(fmt::format("wavesPerRoom must be at least 1, got {}", config.wavesPerRoom));
  if (std::find(kLogLevels.begin(), kLogLevels.end(), config.logLevel) == kLogLevels.end())
    throw ConfigError(fmt::format("unknown logLevel '{}'", config.logLevel));
}

GeneratorConfig parseConfig(const std::string& text)
{
  GeneratorConfig config;
  try
  {
    config = fromNode(YAML::Load(text));
  }
  catch (const YAML::Exception& e)
  {
    throw ConfigError(fmt::format("invalid configuration: {}", e.what()));
  }

  validateConfig(config);
  return config;
}

GeneratorConfig loadConfig(const std::filesystem::path& path)
{
  std::ifstream in(path);
  if (!in)
    throw ConfigError(fmt::format("cannot open configuration '{}'", path.string()));

  const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  auto config = parseConfig(text);
  spdlog::info("Loaded configuration from {}", path.string());
  return config;
}

std::string emitConfig(const GeneratorConfig& config)
{
  const auto& g = config.geometry;

  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "rows" << YAML::Value << g.rows;
  out << YAML::Key << "cols" << YAML::Value << g.cols;
  out << YAML::Key << "interiorSize" << YAML::Value
      << YAML::Flow << YAML::BeginSeq << g.interiorSize.x << g.interiorSize.y << YAML::EndSeq;
  out << YAML::Key << "roomSpacing" << YAML::Value
      << YAML::Flow << YAML::BeginSeq << g.roomSpacing.x << g.roomSpacing.y << YAML::EndSeq;
  out << YAML::Key << "cellSize" << YAML::Value << g.cellSize;
  out << YAML::Key << "targetFightRoomCount" << YAML::Value << config.targetFightRoomCount;
  if (config.seed)
    out << YAML::Key << "seed" << YAML::Value << *config.seed;
  out << YAML::Key << "placeItemRoom" << YAML::Value << config.placeItemRoom;
  out << YAML::Key << "connectAllAdjacent" << YAML::Value << config.connectAllAdjacent;
  out << YAML::Key << "repairConnectivity" << YAML::Value << config.repairConnectivity;
  out << YAML::Key << "maxFloors" << YAML::Value << config.maxFloors;
  out << YAML::Key << "wavesPerRoom" << YAML::Value << config.wavesPerRoom;
  out << YAML::Key << "tiles" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "wall" << YAML::Value << config.tiles.wall;
  out << YAML::Key << "floor" << YAML::Value << config.tiles.floor;
  out << YAML::Key << "door" << YAML::Value << config.tiles.door;
  out << YAML::EndMap;
  out << YAML::Key << "logLevel" << YAML::Value << config.logLevel;
  out << YAML::EndMap;

  return out.c_str();
}

void saveConfig(const GeneratorConfig& config, const std::filesystem::path& path)
{
  std::ofstream out(path);
  if (!out)
    throw ConfigError(fmt::format("cannot write configuration '{}'", path.string()));
  out << emitConfig(config) << '\n';
}

void applyLogLevel(const GeneratorConfig& config)
{
  spdlog::set_level(spdlog::level::from_str(config.logLevel));
}

int loadFloorProgress(const std::filesystem::path& path)
{
  if (!std::filesystem::exists(path))
    return 1;

  try
  {
    const auto root = YAML::LoadFile(path.string());
    const int floor = root["floor"].as<int>(1);
    if (floor < 1)
      throw ConfigError(fmt::format("saved floor {} in '{}' is not a floor", floor, path.string()));
    return floor;
  }
  catch (const YAML::Exception& e)
  {
    throw ConfigError(fmt::format("cannot read floor progress '{}': {}", path.string(), e.what()));
  }
}

void saveFloorProgress(const std::filesystem::path& path, int floor)
{
  YAML::Emitter out;
  out << YAML::BeginMap << YAML::Key << "floor" << YAML::Value << floor << YAML::EndMap;

  std::ofstream file(path);
  if (!file)
    throw ConfigError(fmt::format("cannot write floor progress '{}'", path.string()));
  file << out.c_str() << '\n';
}

}
