#pragma once

#include <cstdint>
#include <map>
#include <function2/function2.hpp>

#include "dungeonLayout.hpp"
#include "room.hpp"
#include "tileLayers.hpp"


namespace roomgrid
{

enum class EncounterState : std::uint8_t
{
  Idle,
  Locking,
  SpawningWave,
  AwaitingClear,
  Unlocked,
};

const char* toString(EncounterState s);

struct CategoryPolicy
{
  bool locksOnEntry;
  // 0 means the configured waves per room
  int waves;
  bool clearedOnEntry;
  bool clearedAtPublish;
};

const CategoryPolicy& policyFor(RoomCategory category);

// Drives the Idle -> Locking -> SpawningWave -> AwaitingClear -> Unlocked
// cycle of every room of one floor. Spawning itself belongs to whoever
// subscribes to onSpawnWave; it reports back through reportHostiles.
class EncounterDirector
{
 public:
  using RoomCallback = fu2::unique_function<void(Room&)>;
  using WaveCallback = fu2::unique_function<void(Room&, int)>;
  using TeardownCallback = fu2::unique_function<void()>;

  EncounterDirector(RoomRealizer& realizer, int wavesPerRoom);

  // Start the floor: Start is cleared right away, everything else Idle
  void attach(DungeonLayout& layout);
  // Fires onTeardown and forgets the floor
  void detach();
  bool attached() const { return layout_ != nullptr; }

  void playerEntered(Room& room);
  void playerExited(Room& room);

  // Advances every room that is waiting on a discrete step
  void tick();

  void reportHostiles(Room& room, int count);

  // No-op on a room that is already cleared
  void markCleared(Room& room);

  EncounterState state(const Room& room) const;
  int wave(const Room& room) const;
  Room* currentRoom() const { return current_; }
  bool playerInRoom(const Room& room) const { return current_ == &room; }

 public:
  RoomCallback onPlayerEntered;
  RoomCallback onPlayerExited;
  RoomCallback onRoomCleared;
  // Receives the 1-based wave number
  WaveCallback onSpawnWave;
  TeardownCallback onTeardown;

 private:
  struct Encounter
  {
    EncounterState state{EncounterState::Idle};
    int wave{0};
    int totalWaves{0};
  };

  Encounter* find(const Room& room);
  const Encounter* find(const Room& room) const;

 private:
  RoomRealizer& realizer_;
  int wavesPerRoom_;

  DungeonLayout* layout_{nullptr};
  Room* current_{nullptr};
  std::map<GridCoord, Encounter> encounters_;
};

}
