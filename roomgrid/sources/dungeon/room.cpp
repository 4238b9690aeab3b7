#include "room.hpp"

#include <algorithm>


namespace roomgrid
{

const char* toString(Direction d)
{
  switch (d)
  {
    case Direction::North: return "north";
    case Direction::South: return "south";
    case Direction::East: return "east";
    case Direction::West: return "west";
  }
  return "unknown";
}

const char* toString(RoomCategory c)
{
  switch (c)
  {
    case RoomCategory::Start: return "START";
    case RoomCategory::Normal: return "FIGHT";
    case RoomCategory::Boss: return "BOSS";
    case RoomCategory::Item: return "ITEM";
  }
  return "UNKNOWN";
}

int Exits::count() const
{
  return static_cast<int>(std::count(open.begin(), open.end(), true));
}

std::string Exits::variantName() const
{
  constexpr std::array letters{'N', 'S', 'E', 'W'};

  std::string result;
  for (auto d : kDirections)
    if ((*this)[d])
      result += letters[index(d)];

  return result.empty() ? "NoExits" : result;
}

}
