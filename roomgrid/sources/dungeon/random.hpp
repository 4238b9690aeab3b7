#pragma once

#include <cstddef>
#include <cstdint>
#include <random>


namespace roomgrid
{

// The one engine every random choice of a generation pass is drawn from
using Rng = std::mt19937;

inline std::size_t pickIndex(Rng& rng, std::size_t count)
{
  std::uniform_int_distribution<std::size_t> distr(0, count - 1);
  return distr(rng);
}

inline float unitRandom(Rng& rng)
{
  std::uniform_real_distribution<float> distr(0.f, 1.f);
  return distr(rng);
}

}
