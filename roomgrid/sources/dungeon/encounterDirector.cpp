#include "encounterDirector.hpp"
#include "roomFormatter.hpp"

#include <array>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>


namespace roomgrid
{

const char* toString(EncounterState s)
{
  switch (s)
  {
    case EncounterState::Idle: return "Idle";
    case EncounterState::Locking: return "Locking";
    case EncounterState::SpawningWave: return "SpawningWave";
    case EncounterState::AwaitingClear: return "AwaitingClear";
    case EncounterState::Unlocked: return "Unlocked";
  }
  return "?";
}

const CategoryPolicy& policyFor(RoomCategory category)
{
  static const std::array<CategoryPolicy, 4> table{
    CategoryPolicy{.locksOnEntry = false, .waves = 0, .clearedOnEntry = false, .clearedAtPublish = true},  // Start
    CategoryPolicy{.locksOnEntry = true, .waves = 0, .clearedOnEntry = false, .clearedAtPublish = false},  // Normal
    CategoryPolicy{.locksOnEntry = true, .waves = 1, .clearedOnEntry = false, .clearedAtPublish = false},  // Boss
    CategoryPolicy{.locksOnEntry = false, .waves = 0, .clearedOnEntry = true, .clearedAtPublish = false},  // Item
  };
  return table[static_cast<std::size_t>(category)];
}

EncounterDirector::EncounterDirector(RoomRealizer& realizer, int wavesPerRoom)
  : realizer_{realizer}
  , wavesPerRoom_{wavesPerRoom}
{
}

void EncounterDirector::attach(DungeonLayout& layout)
{
  if (layout_ != nullptr)
    detach();

  layout_ = &layout;
  current_ = nullptr;
  encounters_.clear();

  for (auto room : layout.getAllRooms())
  {
    const auto& policy = policyFor(room->category);
    Encounter encounter{.totalWaves = policy.waves > 0 ? policy.waves : wavesPerRoom_};
    if (policy.clearedAtPublish)
    {
      room->cleared = true;
      encounter.state = EncounterState::Unlocked;
    }
    encounters_.emplace(room->coordinate, encounter);
  }

  spdlog::debug("Encounter director attached to {} rooms", encounters_.size());
}

void EncounterDirector::detach()
{
  if (layout_ == nullptr)
    return;

  if (onTeardown)
    onTeardown();

  layout_ = nullptr;
  current_ = nullptr;
  encounters_.clear();
}

void EncounterDirector::playerEntered(Room& room)
{
  auto encounter = find(room);
  if (encounter == nullptr || current_ == &room)
    return;

  if (current_ != nullptr)
    playerExited(*current_);

  current_ = &room;
  spdlog::info("Player entered {} room {}", room.category, room.coordinate);
  if (onPlayerEntered)
    onPlayerEntered(room);

  const auto& policy = policyFor(room.category);
  if (policy.clearedOnEntry)
  {
    markCleared(room);
    return;
  }

  if (policy.locksOnEntry && !room.cleared && encounter->state == EncounterState::Idle)
  {
    realizer_.lock(room);
    encounter->state = EncounterState::Locking;
  }
}

void EncounterDirector::playerExited(Room& room)
{
  if (current_ != &room)
    return;

  current_ = nullptr;
  spdlog::debug("Player left room {}", room.coordinate);
  if (onPlayerExited)
    onPlayerExited(room);
}

void EncounterDirector::tick()
{
  std::vector<std::pair<Room*, int>> spawned;
  for (auto& [coord, encounter] : encounters_)
  {
    if (encounter.state == EncounterState::Locking)
    {
      encounter.state = EncounterState::SpawningWave;
      continue;
    }

    if (encounter.state != EncounterState::SpawningWave)
      continue;

    ++encounter.wave;
    encounter.state = EncounterState::AwaitingClear;
    spdlog::info("Room {} spawning wave {}/{}", coord, encounter.wave, encounter.totalWaves);
    spawned.emplace_back(layout_->getRoomAt(coord), encounter.wave);
  }

  // Subscribers may detach or attach another floor from the callback
  const DungeonLayout* layout = layout_;
  for (auto [room, wave] : spawned)
  {
    if (layout_ != layout || !onSpawnWave)
      break;
    onSpawnWave(*room, wave);
  }
}

void EncounterDirector::reportHostiles(Room& room, int count)
{
  auto encounter = find(room);
  if (encounter == nullptr || encounter->state != EncounterState::AwaitingClear || count > 0)
    return;

  if (encounter->wave < encounter->totalWaves)
  {
    encounter->state = EncounterState::SpawningWave;
    return;
  }

  markCleared(room);
}

void EncounterDirector::markCleared(Room& room)
{
  auto encounter = find(room);
  if (encounter == nullptr || room.cleared)
    return;

  room.cleared = true;
  if (room.locked)
    realizer_.unlock(room);
  encounter->state = EncounterState::Unlocked;

  spdlog::info("{} room {} cleared", room.category, room.coordinate);
  if (onRoomCleared)
    onRoomCleared(room);
}

EncounterState EncounterDirector::state(const Room& room) const
{
  auto encounter = find(room);
  return encounter != nullptr ? encounter->state : EncounterState::Idle;
}

int EncounterDirector::wave(const Room& room) const
{
  auto encounter = find(room);
  return encounter != nullptr ? encounter->wave : 0;
}

EncounterDirector::Encounter* EncounterDirector::find(const Room& room)
{
  if (layout_ == nullptr || layout_->getRoomAt(room.coordinate) != &room)
    return nullptr;
  auto it = encounters_.find(room.coordinate);
  return it != encounters_.end() ? &it->second : nullptr;
}

const EncounterDirector::Encounter* EncounterDirector::find(const Room& room) const
{
  if (layout_ == nullptr || layout_->getRoomAt(room.coordinate) != &room)
    return nullptr;
  auto it = encounters_.find(room.coordinate);
  return it != encounters_.end() ? &it->second : nullptr;
}

}
