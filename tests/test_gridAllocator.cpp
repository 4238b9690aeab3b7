#include <gtest/gtest.h>

#include "dungeon/gridAllocator.hpp"
#include "testLayouts.hpp"

using namespace roomgrid;


TEST(GridAllocatorTest, FreshGridHasEveryCellAvailable)
{
  auto layout = initializeGrid(test::geometry(3, 4));
  EXPECT_EQ(layout.availableCells().size(), 12u);
  EXPECT_TRUE(layout.empty());
  EXPECT_EQ(layout.getStartRoom(), nullptr);
  EXPECT_EQ(layout.getRoomAt({1, 1}), nullptr);
}

TEST(GridAllocatorTest, PlacementTakesTheCellOnly)
{
  auto layout = initializeGrid(test::geometry(3, 4));
  auto placement = placeRoom(layout, {2, 3}, RoomCategory::Normal);

  ASSERT_TRUE(placement);
  EXPECT_EQ(placement.error, PlacementError::None);
  EXPECT_EQ(layout.getRoomAt({2, 3}), placement.room);
  EXPECT_FALSE(layout.availableCells().contains({2, 3}));
  EXPECT_EQ(layout.availableCells().size(), 11u);
  EXPECT_FALSE(placement.room->exits.any());
  EXPECT_FLOAT_EQ(placement.room->worldAnchor.x, 3 * 16 * 0.4f);
  EXPECT_FLOAT_EQ(placement.room->worldAnchor.y, 2 * 12 * 0.4f);
}

TEST(GridAllocatorTest, OccupiedCellIsRejected)
{
  auto layout = initializeGrid(test::geometry(3, 4));
  ASSERT_TRUE(placeRoom(layout, {0, 0}, RoomCategory::Normal));

  auto placement = placeRoom(layout, {0, 0}, RoomCategory::Normal);
  EXPECT_FALSE(placement);
  EXPECT_EQ(placement.error, PlacementError::CellOccupied);
  EXPECT_EQ(layout.roomCount(), 1u);
}

TEST(GridAllocatorTest, OutOfBoundsIsRejected)
{
  auto layout = initializeGrid(test::geometry(3, 4));
  for (GridCoord c : {GridCoord{-1, 0}, GridCoord{0, -1}, GridCoord{3, 0}, GridCoord{0, 4}})
  {
    auto placement = placeRoom(layout, c, RoomCategory::Normal);
    EXPECT_FALSE(placement);
    EXPECT_EQ(placement.error, PlacementError::OutOfBounds);
  }
  EXPECT_TRUE(layout.empty());
  EXPECT_STREQ(toString(PlacementError::OutOfBounds), "OutOfBounds");
}

TEST(GridAllocatorTest, DistinguishedCategoriesStayUnique)
{
  auto layout = initializeGrid(test::geometry(3, 4));
  Room& first = test::place(layout, {0, 0}, RoomCategory::Start);
  Room& second = test::place(layout, {0, 1}, RoomCategory::Start);

  EXPECT_EQ(layout.getStartRoom(), &second);
  EXPECT_EQ(first.category, RoomCategory::Normal);

  layout.setCategory(first, RoomCategory::Item);
  EXPECT_EQ(layout.getItemRoom(), &first);
  layout.setCategory(first, RoomCategory::Normal);
  EXPECT_EQ(layout.getItemRoom(), nullptr);
  EXPECT_EQ(layout.normalRooms().size(), 1u);
}

TEST(DungeonLayoutTest, LinkAndSeal)
{
  auto layout = initializeGrid(test::geometry(3, 4));
  Room& a = test::place(layout, {1, 1});
  Room& b = test::place(layout, {1, 2});

  EXPECT_FALSE(layout.link(a, Direction::North));
  ASSERT_TRUE(layout.link(a, Direction::East));
  EXPECT_TRUE(layout.connected(a, Direction::East));
  EXPECT_TRUE(layout.connected(b, Direction::West));
  EXPECT_EQ(b.tiles.at({0, 5}), Tile::Floor);

  layout.unlink(b, Direction::West);
  EXPECT_FALSE(a.exits[Direction::East]);
  EXPECT_TRUE(layout.link(a, Direction::East));

  layout.seal(b, Direction::West);
  EXPECT_TRUE(layout.isSealed(a.coordinate, Direction::East));
  EXPECT_FALSE(a.exits[Direction::East]);
  EXPECT_FALSE(layout.link(a, Direction::East));
  EXPECT_EQ(a.tiles.at({15, 5}), Tile::Wall);
}

TEST(DungeonLayoutTest, DumpListsEveryRoom)
{
  auto layout = initializeGrid(test::geometry(3, 4));
  test::place(layout, {1, 2}, RoomCategory::Start);
  test::place(layout, {0, 3}, RoomCategory::Boss);

  const auto dump = layout.dump();
  EXPECT_NE(dump.find("=== DUNGEON LAYOUT (3x4) ==="), std::string::npos);
  EXPECT_NE(dump.find("[1,2] START"), std::string::npos);
  EXPECT_NE(dump.find("[0,3] BOSS"), std::string::npos);
  EXPECT_NE(dump.find("(unrealized)"), std::string::npos);
}
