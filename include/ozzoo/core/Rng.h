#pragma once
// include/ozzoo/core/Rng.h
//
// Seeded PCG32 (XSH-RR) used for every random decision in the simulation.
// One generator per zoo, so a seed replays the same history.

#include <cstddef>
#include <cstdint>

namespace ozzoo::rng {

using Seed = std::uint64_t;

// splitmix64 finaliser; spreads small seeds such as 1, 2, 3 across the state.
[[nodiscard]] constexpr std::uint64_t Mix64(std::uint64_t x) noexcept
{
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

class Pcg32
{
public:
    explicit Pcg32(Seed seed = 0, Seed stream = 0) noexcept { reseed(seed, stream); }

    void reseed(Seed seed, Seed stream = 0) noexcept
    {
        m_state = 0;
        m_inc = (Mix64(stream) << 1u) | 1u;
        step();
        m_state += Mix64(seed);
        step();
    }

    [[nodiscard]] std::uint32_t nextU32() noexcept { return step(); }

    // [0, 1) with 53 bits of precision.
    [[nodiscard]] double unit() noexcept
    {
        const std::uint64_t hi = nextU32();
        const std::uint64_t lo = nextU32();
        return static_cast<double>(((hi << 32) | lo) >> 11) * (1.0 / 9007199254740992.0);
    }

    // [lo, hi)
    [[nodiscard]] double uniform(double lo, double hi) noexcept { return lo + (hi - lo) * unit(); }
    [[nodiscard]] float uniformf(float lo, float hi) noexcept { return static_cast<float>(uniform(lo, hi)); }

    [[nodiscard]] bool chance(double p) noexcept { return unit() < p; }

    // Unbiased pick from [0, n); returns 0 for an empty range.
    [[nodiscard]] std::size_t index(std::size_t n) noexcept
    {
        const auto bound = static_cast<std::uint32_t>(n);
        if (bound == 0)
            return 0;
        const std::uint32_t threshold = static_cast<std::uint32_t>(-bound) % bound;
        for (;;)
        {
            const std::uint32_t r = nextU32();
            if (r >= threshold)
                return r % bound;
        }
    }

private:
    std::uint32_t step() noexcept
    {
        const std::uint64_t old = m_state;
        m_state = old * 6364136223846793005ull + m_inc;
        const auto xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        const auto rot = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((0u - rot) & 31u));
    }

    std::uint64_t m_state = 0;
    std::uint64_t m_inc = 1;
};

} // namespace ozzoo::rng
