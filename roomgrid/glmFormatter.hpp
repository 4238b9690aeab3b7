#pragma once

#include <fmt/format.h>
#include <glm/glm.hpp>


// "{}" prints one decimal, "{:3}" prints three
template <>
struct fmt::formatter<glm::vec2>
{
  int precision = 1;

  constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin())
  {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && *it >= '0' && *it <= '9') precision = *it++ - '0';

    if (it != end && *it != '}') throw format_error("invalid format");

    return it;
  }

  template <typename FormatContext>
  auto format(const glm::vec2& p, FormatContext& ctx) const -> decltype(ctx.out())
  {
    return fmt::format_to(ctx.out(), "({:.{}f}, {:.{}f})", p.x, precision, p.y, precision);
  }
};

template <>
struct fmt::formatter<glm::ivec2>
{
  constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin())
  {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const glm::ivec2& p, FormatContext& ctx) const -> decltype(ctx.out())
  {
    return fmt::format_to(ctx.out(), "({}, {})", p.x, p.y);
  }
};
