#pragma once

#include <cstdint>
#include <fmt/format.h>

#include "room.hpp"


namespace roomgrid
{

enum class EncounterState : std::uint8_t;
const char* toString(EncounterState s);

}


template <>
struct fmt::formatter<roomgrid::GridCoord>
{
  constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin())
  {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const roomgrid::GridCoord& c, FormatContext& ctx) const -> decltype(ctx.out())
  {
    return fmt::format_to(ctx.out(), "[{},{}]", c.row, c.col);
  }
};

template <>
struct fmt::formatter<roomgrid::Direction> : fmt::formatter<fmt::string_view>
{
  template <typename FormatContext>
  auto format(roomgrid::Direction d, FormatContext& ctx) const -> decltype(ctx.out())
  {
    return fmt::formatter<fmt::string_view>::format(roomgrid::toString(d), ctx);
  }
};

template <>
struct fmt::formatter<roomgrid::RoomCategory> : fmt::formatter<fmt::string_view>
{
  template <typename FormatContext>
  auto format(roomgrid::RoomCategory c, FormatContext& ctx) const -> decltype(ctx.out())
  {
    return fmt::formatter<fmt::string_view>::format(roomgrid::toString(c), ctx);
  }
};

template <>
struct fmt::formatter<roomgrid::Exits>
{
  constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin())
  {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const roomgrid::Exits& e, FormatContext& ctx) const -> decltype(ctx.out())
  {
    using roomgrid::Direction;
    return fmt::format_to(ctx.out(), "N:{} S:{} E:{} W:{}",
      e[Direction::North], e[Direction::South], e[Direction::East], e[Direction::West]);
  }
};

template <>
struct fmt::formatter<roomgrid::EncounterState> : fmt::formatter<fmt::string_view>
{
  template <typename FormatContext>
  auto format(roomgrid::EncounterState s, FormatContext& ctx) const -> decltype(ctx.out())
  {
    return fmt::formatter<fmt::string_view>::format(roomgrid::toString(s), ctx);
  }
};
