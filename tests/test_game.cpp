#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "Game.hpp"

using namespace roomgrid;
using ::testing::Contains;
using ::testing::HasSubstr;


namespace
{

class ConsoleGame : public Game<ConsoleGame>
{
 public:
  ConsoleGame(GeneratorConfig config, std::filesystem::path progressPath)
    : Game{std::move(config), std::move(progressPath)}
  {
  }

  void present(const std::string& text) { output.push_back(text); }

  std::vector<std::string> output;
};

GeneratorConfig seededConfig(int maxFloors = 10)
{
  GeneratorConfig config;
  config.seed = 42;
  config.maxFloors = maxFloors;
  return config;
}

std::filesystem::path progressPath()
{
  return std::filesystem::temp_directory_path() / "roomgrid_game_progress.yaml";
}

}

TEST(GameTest, GenerateUsesPerFloorSeed)
{
  ConsoleGame game(seededConfig(), progressPath());
  EXPECT_FALSE(game.hasLayout());

  EXPECT_TRUE(game.command("generate"));
  ASSERT_TRUE(game.hasLayout());
  EXPECT_THAT(game.output, Contains(HasSubstr("floor 1 generated with seed 43")));
  EXPECT_FALSE(game.layers().empty());

  EXPECT_TRUE(game.command("generate 7"));
  EXPECT_THAT(game.output.back(), HasSubstr("seed 7"));
}

TEST(GameTest, CommandsNeedALayout)
{
  ConsoleGame game(seededConfig(), progressPath());
  game.command("dump");
  EXPECT_EQ(game.output.back(), "no layout, run 'generate' first");

  game.command("dance");
  EXPECT_EQ(game.output.back(), "no layout, run 'generate' first");

  game.command("generate");
  game.command("dance");
  EXPECT_EQ(game.output.back(), "unknown command 'dance'");

  EXPECT_TRUE(game.command(""));
  EXPECT_FALSE(game.command("quit"));
}

TEST(GameTest, DumpMapAndPath)
{
  ConsoleGame game(seededConfig(), progressPath());
  game.command("generate");

  game.command("dump");
  EXPECT_THAT(game.output.back(), HasSubstr("=== DUNGEON LAYOUT (3x4) ==="));

  game.command("map");
  EXPECT_THAT(game.output.back(), HasSubstr("#"));

  game.command("path 1 2");
  EXPECT_EQ(game.output.back(), "[1,2]");

  game.command("path 9 9");
  EXPECT_EQ(game.output.back(), "no room at [9,9]");

  game.command("enter x");
  EXPECT_EQ(game.output.back(), "usage: enter ROW COL");
}

TEST(GameTest, ClearingTheBossCompletesTheFloor)
{
  ConsoleGame game(seededConfig(), progressPath());
  game.command("generate");

  const Room* boss = game.layout().getBossRoom();
  ASSERT_NE(boss, nullptr);
  EXPECT_FALSE(game.isFloorComplete());

  game.command(fmt::format("enter {} {}", boss->coordinate.row, boss->coordinate.col));
  EXPECT_TRUE(boss->locked);
  game.command("tick");
  game.command("tick");
  game.command("hostiles 0");

  EXPECT_TRUE(game.isFloorComplete());
  EXPECT_FALSE(boss->locked);
  EXPECT_THAT(game.output, Contains("floor 1 complete"));

  game.command("next");
  EXPECT_EQ(game.floor(), 2);
  EXPECT_FALSE(game.isFloorComplete());
  EXPECT_EQ(game.output.back(), "now on floor 2");
}

TEST(GameTest, ReportListsWhatGenerationDowngraded)
{
  auto config = seededConfig();
  config.geometry.rows = 1;
  config.geometry.cols = 1;
  ConsoleGame game(config, progressPath());

  game.command("report");
  EXPECT_EQ(game.output.back(), "no layout, run 'generate' first");

  game.command("generate");
  EXPECT_THAT(game.output.back(), HasSubstr("issues (see 'report')"));
  EXPECT_TRUE(game.report().has(GenerationIssueKind::ExhaustedAttempts));

  const auto before = game.output.size();
  game.command("report");
  ASSERT_EQ(game.output.size(), before + 1 + game.report().issues.size());
  EXPECT_THAT(game.output[before], HasSubstr("0 rooms placed"));
  EXPECT_THAT(game.output, Contains(HasSubstr("ExhaustedAttempts: placed 0 of")));
  EXPECT_THAT(game.output, Contains(HasSubstr("InsufficientRooms")));
}

TEST(GameTest, PreviousFloorReplaysItsSeed)
{
  ConsoleGame game(seededConfig(), progressPath());
  game.command("prev");
  EXPECT_EQ(game.output.back(), "already on the first floor");
  EXPECT_EQ(game.floor(), 1);

  game.command("generate");
  const auto firstDump = game.layout().dump();
  game.command("next");
  EXPECT_EQ(game.floor(), 2);

  game.command("prev");
  EXPECT_EQ(game.floor(), 1);
  EXPECT_EQ(game.output.back(), "now on floor 1");
  EXPECT_EQ(game.layout().dump(), firstDump);
  EXPECT_EQ(game.floorSeed(), std::optional<std::uint32_t>{43});
}

TEST(GameTest, LastFloorEndsTheGame)
{
  ConsoleGame game(seededConfig(2), progressPath());
  game.command("generate");

  EXPECT_TRUE(game.nextFloor());
  EXPECT_FALSE(game.nextFloor());
  EXPECT_EQ(game.floor(), 2);
  EXPECT_EQ(game.output.back(), "floor 2 was the last one, game complete");
}

TEST(GameTest, ClearTearsDownTiles)
{
  ConsoleGame game(seededConfig(), progressPath());
  game.command("generate");
  game.command("clear");

  EXPECT_FALSE(game.hasLayout());
  EXPECT_TRUE(game.layers().empty());
  EXPECT_EQ(game.output.back(), "layout cleared");
}

TEST(GameTest, FloorProgressSurvivesASession)
{
  std::filesystem::remove(progressPath());
  {
    ConsoleGame game(seededConfig(), progressPath());
    game.command("generate");
    game.command("next");
    game.command("next");
    game.command("save");
  }

  ConsoleGame game(seededConfig(), progressPath());
  game.command("load");
  EXPECT_EQ(game.floor(), 3);
  EXPECT_TRUE(game.hasLayout());
  EXPECT_EQ(game.output.back(), "resumed floor 3");

  std::filesystem::remove(progressPath());
}
