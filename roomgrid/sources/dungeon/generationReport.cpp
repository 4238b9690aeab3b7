#include "generationReport.hpp"
#include "roomFormatter.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>


namespace roomgrid
{

const char* toString(GenerationIssueKind kind)
{
  switch (kind)
  {
    case GenerationIssueKind::CellOccupied: return "CellOccupied";
    case GenerationIssueKind::OutOfBounds: return "OutOfBounds";
    case GenerationIssueKind::ExhaustedAttempts: return "ExhaustedAttempts";
    case GenerationIssueKind::InsufficientRooms: return "InsufficientRooms";
    case GenerationIssueKind::BossHasNoAdjacentRoom: return "BossHasNoAdjacentRoom";
    case GenerationIssueKind::RepairImpossible: return "RepairImpossible";
    case GenerationIssueKind::MissingTileAsset: return "MissingTileAsset";
  }
  return "Unknown";
}

void GenerationReport::add(GenerationIssueKind kind, std::optional<GridCoord> coordinate, std::string message)
{
  if (coordinate)
    spdlog::warn("{} at {}: {}", toString(kind), *coordinate, message);
  else
    spdlog::warn("{}: {}", toString(kind), message);

  issues.push_back(GenerationIssue{kind, coordinate, std::move(message)});
}

bool GenerationReport::has(GenerationIssueKind kind) const
{
  return count(kind) > 0;
}

int GenerationReport::count(GenerationIssueKind kind) const
{
  return static_cast<int>(std::count_if(issues.begin(), issues.end(),
    [kind](const GenerationIssue& issue) { return issue.kind == kind; }));
}

}
