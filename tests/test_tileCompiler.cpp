#include <gtest/gtest.h>

#include "dungeon/tileCompiler.hpp"

using namespace roomgrid;


namespace
{

Exits exitsOf(std::initializer_list<Direction> sides)
{
  Exits exits;
  for (auto side : sides)
    exits[side] = true;
  return exits;
}

int count_tiles(ConstTileView view, Tile tile)
{
  int result = 0;
  for (int y = 0; y < view.extent(0); ++y)
    for (int x = 0; x < view.extent(1); ++x)
      if (view(y, x) == tile)
        ++result;
  return result;
}

}

TEST(TileCompilerTest, ClosedRoomIsWallRingAroundFloor)
{
  const auto grid = compile({14, 10}, Exits{});
  const auto view = grid.view();

  ASSERT_EQ(grid.size, glm::ivec2(16, 12));
  EXPECT_EQ(count_tiles(view, Tile::Wall), 2 * (16 + 12) - 4);
  EXPECT_EQ(count_tiles(view, Tile::Floor), 14 * 10);
  EXPECT_EQ(count_tiles(view, Tile::Door), 0);

  EXPECT_EQ(grid.at({0, 0}), Tile::Wall);
  EXPECT_EQ(grid.at({15, 11}), Tile::Wall);
  EXPECT_EQ(grid.at({1, 1}), Tile::Floor);
}

TEST(TileCompilerTest, NorthAndWestOpeningsOnStandardRoom)
{
  const auto grid = compile({14, 10}, exitsOf({Direction::North, Direction::West}));

  for (int x = 0; x < 16; ++x)
    EXPECT_EQ(grid.at({x, 11}), x == 7 || x == 8 ? Tile::Floor : Tile::Wall) << "x = " << x;

  for (int y = 0; y < 12; ++y)
    EXPECT_EQ(grid.at({0, y}), y == 5 || y == 6 ? Tile::Floor : Tile::Wall) << "y = " << y;

  // Closed sides stay solid
  for (int x = 0; x < 16; ++x)
    EXPECT_EQ(grid.at({x, 0}), Tile::Wall);
  for (int y = 0; y < 12; ++y)
    EXPECT_EQ(grid.at({15, y}), Tile::Wall);
}

TEST(TileCompilerTest, OpeningTilesSitAtTheMiddleOfEachSide)
{
  const glm::ivec2 total{16, 12};
  EXPECT_EQ(openingTiles(total, Direction::North)[0], glm::ivec2(7, 11));
  EXPECT_EQ(openingTiles(total, Direction::South)[1], glm::ivec2(8, 0));
  EXPECT_EQ(openingTiles(total, Direction::East)[0], glm::ivec2(15, 5));
  EXPECT_EQ(openingTiles(total, Direction::West)[1], glm::ivec2(0, 6));
}

TEST(TileCompilerTest, CompilationIsIdempotent)
{
  const auto exits = exitsOf({Direction::South, Direction::East});
  const auto first = compile({14, 10}, exits);
  EXPECT_EQ(compile({14, 10}, exits), first);

  Room room;
  room.exits = exits;
  recompileRoom(room);
  recompileRoom(room);
  EXPECT_EQ(room.tiles, first);
}

TEST(TileCompilerTest, LockThenUnlockRestoresTiles)
{
  const auto exits = exitsOf({Direction::North, Direction::South, Direction::East});
  const auto original = compile({14, 10}, exits);

  auto grid = original;
  overlayDoors(grid, exits, DoorState::Locked);
  EXPECT_EQ(count_tiles(grid.view(), Tile::Door), 6);
  EXPECT_EQ(grid.at({7, 11}), Tile::Door);
  EXPECT_EQ(grid.at({15, 6}), Tile::Door);
  // West has no exit, so no door
  EXPECT_EQ(grid.at({0, 5}), Tile::Wall);

  overlayDoors(grid, exits, DoorState::Open);
  EXPECT_EQ(grid, original);
}

TEST(TileCompilerTest, RecompileKeepsDoorsOfLockedRoom)
{
  Room room;
  room.exits[Direction::East] = true;
  room.locked = true;
  recompileRoom(room);

  EXPECT_EQ(room.tiles.at({15, 5}), Tile::Door);
  EXPECT_EQ(room.tiles.at({15, 6}), Tile::Door);
  EXPECT_TRUE(room.exits[Direction::East]);
}

TEST(TileCompilerTest, SmallestInterior)
{
  const auto grid = compile({2, 2}, exitsOf({Direction::North, Direction::East}));
  ASSERT_EQ(grid.size, glm::ivec2(4, 4));
  EXPECT_EQ(grid.at({1, 3}), Tile::Floor);
  EXPECT_EQ(grid.at({2, 3}), Tile::Floor);
  EXPECT_EQ(grid.at({3, 1}), Tile::Floor);
  EXPECT_EQ(grid.at({3, 2}), Tile::Floor);
  EXPECT_EQ(grid.at({0, 0}), Tile::Wall);
}
