#pragma once

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "Game.hpp"
#include "dungeon/config.hpp"


// Headless debug console: one command per stdin line, results on stdout
class Application
  : public Game<Application>
{
public:
  Application(int argc, char** argv)
    : Game{loadConfigOrDefault(argc, argv), progressPathFor(argc, argv)}
  {
  }

  void present(const std::string& text)
  {
    fmt::print("{}\n", text);
    std::fflush(stdout);
  }

  int run()
  {
    std::string line;
    while (!exit_ && std::getline(std::cin, line))
      if (!Game::command(line))
        close();

    Game::clearLayout();
    return 0;
  }

  void close()
  {
    exit_ = true;
  }

private:
  static roomgrid::GeneratorConfig loadConfigOrDefault(int argc, char** argv)
  {
    const std::filesystem::path path = argc > 1 ? argv[1] : ROOMGRID_DEFAULT_CONFIG;
    try
    {
      auto config = roomgrid::loadConfig(path);
      roomgrid::applyLogLevel(config);
      return config;
    }
    catch (const roomgrid::ConfigError& e)
    {
      spdlog::error("{}, falling back to defaults", e.what());
      return {};
    }
  }

  static std::filesystem::path progressPathFor(int argc, char** argv)
  {
    return argc > 2 ? argv[2] : "roomgrid_progress.yaml";
  }

private:
  bool exit_ = false;
};
