#include <gtest/gtest.h>

#include "dungeon/connectivityRepairer.hpp"
#include "testLayouts.hpp"

using namespace roomgrid;


TEST(ConnectivityRepairerTest, UnreachableRoomIsDetectedAndLinked)
{
  auto layout = initializeGrid(test::geometry(3, 4));
  Room& start = test::place(layout, {1, 2}, RoomCategory::Start);
  Room& west = test::place(layout, {1, 1});
  Room& stray = test::place(layout, {2, 1});
  layout.link(start, Direction::West);

  auto unreachable = findUnreachableRooms(layout);
  ASSERT_EQ(unreachable.size(), 1u);
  EXPECT_EQ(unreachable.front(), &stray);

  GenerationReport report;
  EXPECT_EQ(repairConnectivity(layout, report), 1);
  EXPECT_TRUE(layout.connected(stray, Direction::South));
  EXPECT_TRUE(west.exits[Direction::North]);
  EXPECT_TRUE(findUnreachableRooms(layout).empty());
  EXPECT_TRUE(report.issues.empty());
  EXPECT_EQ(report.reachableRooms, 3);
  EXPECT_EQ(report.totalRooms, 3);
}

TEST(ConnectivityRepairerTest, CutOffClusterIsLinkedRoomByRoom)
{
  auto layout = initializeGrid(test::geometry(3, 4));
  Room& start = test::place(layout, {1, 2}, RoomCategory::Start);
  test::place(layout, {1, 1});
  Room& near = test::place(layout, {2, 1});
  Room& far = test::place(layout, {2, 0});
  layout.link(start, Direction::West);

  GenerationReport report;
  EXPECT_EQ(repairConnectivity(layout, report), 2);
  EXPECT_TRUE(layout.connected(near, Direction::South));
  EXPECT_TRUE(layout.connected(far, Direction::East));
  EXPECT_EQ(report.reachableRooms, 4);
}

TEST(ConnectivityRepairerTest, RoomBehindTheBossCannotBeRepaired)
{
  auto layout = initializeGrid(test::geometry(3, 4));
  Room& start = test::place(layout, {1, 2}, RoomCategory::Start);
  Room& boss = test::place(layout, {0, 2}, RoomCategory::Boss);
  Room& hidden = test::place(layout, {0, 1});
  layout.link(start, Direction::South);
  layout.link(boss, Direction::West);

  GenerationReport report;
  EXPECT_EQ(repairConnectivity(layout, report), 0);
  ASSERT_EQ(report.count(GenerationIssueKind::RepairImpossible), 1);
  EXPECT_EQ(report.issues.front().coordinate, hidden.coordinate);
  EXPECT_EQ(report.reachableRooms, 1);
  EXPECT_EQ(report.totalRooms, 3);
}

TEST(ConnectivityRepairerTest, NothingToDoOnConnectedLayout)
{
  auto layout = initializeGrid(test::geometry(3, 4));
  Room& start = test::place(layout, {1, 2}, RoomCategory::Start);
  test::place(layout, {1, 3});
  layout.link(start, Direction::East);

  GenerationReport report;
  EXPECT_EQ(repairConnectivity(layout, report), 0);
  EXPECT_TRUE(report.issues.empty());
  EXPECT_EQ(report.reachableRooms, 2);
}
