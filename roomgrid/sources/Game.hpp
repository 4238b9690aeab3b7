#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>

#include <glm/glm.hpp>
#include <function2/function2.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "dungeon/config.hpp"
#include "dungeon/dungeonGenerator.hpp"
#include "dungeon/encounterDirector.hpp"
#include "dungeon/roomFormatter.hpp"
#include "dungeon/roomsearch.hpp"
#include "dungeon/tileLayers.hpp"
#include "glmFormatter.hpp"


// Floor manager. Owns the tile layers and the live layout of the current
// floor, and turns text commands into generator and encounter calls.
// Derived provides present(std::string) for output.
template<class Derived>
class Game
{
 public:
  Game(roomgrid::GeneratorConfig config, std::filesystem::path progressPath)
    : config_{std::move(config)}
    , progressPath_{std::move(progressPath)}
    , realizer_{layers_, config_.tiles, config_.geometry}
    , generator_{config_, realizer_}
    , director_{realizer_, config_.wavesPerRoom}
  {
    director_.onPlayerEntered = [this](roomgrid::Room& room)
      {
        self().present(fmt::format("entered {} room {} ({})", room.category, room.coordinate, room.exits.variantName()));
      };
    director_.onSpawnWave = [this](roomgrid::Room& room, int wave)
      {
        self().present(fmt::format("wave {} spawned in {}", wave, room.coordinate));
      };
    director_.onRoomCleared = [this](roomgrid::Room& room)
      {
        self().present(fmt::format("room {} cleared", room.coordinate));
        if (room.category == roomgrid::RoomCategory::Boss)
          self().present(fmt::format("floor {} complete", floor_));
      };
  }

  Game(const Game&) = delete;
  Game& operator=(const Game&) = delete;

  int floor() const { return floor_; }
  bool hasLayout() const { return current_.has_value(); }
  const roomgrid::DungeonLayout& layout() const { return current_->layout; }
  const roomgrid::GenerationReport& report() const { return current_->report; }
  const roomgrid::TileLayers& layers() const { return layers_; }
  roomgrid::EncounterDirector& director() { return director_; }

  std::optional<std::uint32_t> floorSeed() const
  {
    if (!config_.seed)
      return std::nullopt;
    return *config_.seed + static_cast<std::uint32_t>(floor_);
  }

  // Tears down the previous floor first
  void regenerate(std::optional<std::uint32_t> seed)
  {
    clearLayout();
    current_.emplace(generator_.generate(seed));
    director_.attach(current_->layout);
  }

  void regenerate() { regenerate(floorSeed()); }

  void clearLayout()
  {
    if (!current_)
      return;
    director_.detach();
    generator_.clear(current_->layout);
    current_.reset();
  }

  bool isFloorComplete() const
  {
    if (!current_)
      return false;
    const auto boss = current_->layout.getBossRoom();
    return boss != nullptr && boss->cleared;
  }

  // False once the last floor is done
  bool nextFloor()
  {
    if (floor_ >= config_.maxFloors)
    {
      self().present(fmt::format("floor {} was the last one, game complete", floor_));
      return false;
    }

    if (!isFloorComplete())
      spdlog::warn("Leaving floor {} before its boss is cleared", floor_);

    ++floor_;
    regenerate();
    return true;
  }

  // Replays the previous floor from its own seed
  bool previousFloor()
  {
    if (floor_ <= 1)
    {
      self().present("already on the first floor");
      return false;
    }

    --floor_;
    regenerate();
    return true;
  }

  // False when the session should end
  bool command(const std::string& line)
  {
    std::istringstream in(line);
    std::string name;
    if (!(in >> name))
      return true;

    if (name == "quit")
      return false;

    if (name == "generate")
    {
      std::uint32_t seed = 0;
      regenerate(in >> seed ? std::optional{seed} : floorSeed());
      self().present(fmt::format("floor {} generated with seed {}{}", floor_, current_->seed, issueSuffix()));
    }
    else if (name == "regenerate")
    {
      regenerate();
      self().present(fmt::format("floor {} regenerated with seed {}{}", floor_, current_->seed, issueSuffix()));
    }
    else if (name == "clear")
    {
      clearLayout();
      self().present("layout cleared");
    }
    else if (name == "next")
    {
      if (nextFloor())
        self().present(fmt::format("now on floor {}", floor_));
    }
    else if (name == "prev")
    {
      if (previousFloor())
        self().present(fmt::format("now on floor {}", floor_));
    }
    else if (name == "save")
    {
      tryPersist([&] { roomgrid::saveFloorProgress(progressPath_, floor_); });
    }
    else if (name == "load")
    {
      tryPersist([&]
        {
          floor_ = roomgrid::loadFloorProgress(progressPath_);
          regenerate();
          self().present(fmt::format("resumed floor {}", floor_));
        });
    }
    else if (!current_)
    {
      self().present("no layout, run 'generate' first");
    }
    else if (name == "dump")
    {
      self().present(current_->layout.dump());
    }
    else if (name == "map")
    {
      self().present(renderMap());
    }
    else if (name == "report")
    {
      presentReport();
    }
    else if (name == "enter" || name == "path")
    {
      roomgrid::GridCoord coord;
      if (!(in >> coord.row >> coord.col))
      {
        self().present(fmt::format("usage: {} ROW COL", name));
        return true;
      }

      auto room = current_->layout.getRoomAt(coord);
      if (room == nullptr)
      {
        self().present(fmt::format("no room at {}", coord));
        return true;
      }

      if (name == "enter")
        director_.playerEntered(*room);
      else
        showPath(*room);
    }
    else if (name == "exit")
    {
      if (auto room = director_.currentRoom())
        director_.playerExited(*room);
    }
    else if (name == "tick")
    {
      director_.tick();
    }
    else if (name == "hostiles")
    {
      int count = 0;
      auto room = director_.currentRoom();
      if (!(in >> count) || room == nullptr)
      {
        self().present("usage: hostiles COUNT, from inside a room");
        return true;
      }
      director_.reportHostiles(*room, count);
      self().present(fmt::format("room {} is {}", room->coordinate, director_.state(*room)));
    }
    else
    {
      self().present(fmt::format("unknown command '{}'", name));
    }

    return true;
  }

 private:
  Derived& self() { return *static_cast<Derived*>(this); }
  const Derived& self() const { return *static_cast<const Derived*>(this); }

  void tryPersist(fu2::unique_function<void()> action)
  {
    try
    {
      action();
    }
    catch (const roomgrid::ConfigError& e)
    {
      spdlog::error("{}", e.what());
    }
  }

  std::string issueSuffix() const
  {
    const auto count = report().issues.size();
    return count > 0 ? fmt::format(", {} issues (see 'report')", count) : std::string{};
  }

  void presentReport()
  {
    const auto& generation = report();
    self().present(fmt::format("{} rooms placed in {} attempts, {}/{} reachable, {} issues",
      generation.placedRooms, generation.attempts, generation.reachableRooms, generation.totalRooms, generation.issues.size()));

    for (const auto& issue : generation.issues)
    {
      if (issue.coordinate)
        self().present(fmt::format("{} at {}: {}", roomgrid::toString(issue.kind), *issue.coordinate, issue.message));
      else
        self().present(fmt::format("{}: {}", roomgrid::toString(issue.kind), issue.message));
    }
  }

  void showPath(const roomgrid::Room& finish)
  {
    const auto& layout = current_->layout;
    const roomgrid::Room* start = director_.currentRoom();
    if (start == nullptr)
      start = layout.getStartRoom();
    if (start == nullptr)
    {
      self().present("layout has no start room");
      return;
    }

    auto result = roomgrid::findRoomPath(layout, *start, finish);
    if (result.path.empty())
    {
      self().present(fmt::format("{} cannot reach {}", start->coordinate, finish.coordinate));
      return;
    }

    std::string line;
    for (auto room : result.path)
      line += fmt::format("{}{}", line.empty() ? "" : " -> ", room->coordinate);
    self().present(line);
  }

  std::string renderMap() const
  {
    const auto& geometry = config_.geometry;
    const auto total = geometry.interiorSize + 2;
    const glm::ivec2 min = -total / 2;
    const glm::ivec2 max = geometry.anchorTileFor({geometry.rows - 1, geometry.cols - 1}) - total / 2 + total - 1;
    spdlog::debug("Rendering tiles {} to {}", min, max);
    return layers_.render(min, max);
  }

 private:
  roomgrid::GeneratorConfig config_;
  std::filesystem::path progressPath_;

  roomgrid::TileLayers layers_;
  roomgrid::RoomRealizer realizer_;
  roomgrid::DungeonGenerator generator_;
  roomgrid::EncounterDirector director_;

  int floor_{1};
  std::optional<roomgrid::GenerationResult> current_;
};
