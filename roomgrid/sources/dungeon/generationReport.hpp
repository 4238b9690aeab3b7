#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "room.hpp"


namespace roomgrid
{

enum class GenerationIssueKind : std::uint8_t
{
  CellOccupied,
  OutOfBounds,
  ExhaustedAttempts,
  InsufficientRooms,
  BossHasNoAdjacentRoom,
  RepairImpossible,
  MissingTileAsset,
};

const char* toString(GenerationIssueKind kind);

struct GenerationIssue
{
  GenerationIssueKind kind;
  std::optional<GridCoord> coordinate;
  std::string message;
};

// Everything a generation pass downgraded to a warning, plus the numbers the
// final reachability check reports.
struct GenerationReport
{
  std::vector<GenerationIssue> issues;

  int placedRooms{0};
  int attempts{0};
  int reachableRooms{0};
  int totalRooms{0};

  // Logs at warn level and records the issue
  void add(GenerationIssueKind kind, std::optional<GridCoord> coordinate, std::string message);

  bool has(GenerationIssueKind kind) const;
  int count(GenerationIssueKind kind) const;
};

}
