#pragma once
// include/ozzoo/sim/VisitorModel.h

#include "ozzoo/core/Rng.h"
#include "ozzoo/sim/Enclosure.h"
#include "ozzoo/sim/Tuning.h"

#include <entt/entt.hpp>

#include <vector>

namespace ozzoo {

// Daily summary; individual visitors are not kept.
struct VisitorDay
{
    float  attractiveness = 0.0f;   // 0..100
    int    count = 0;
    double ticketRevenue = 0.0;
    double concessionRevenue = 0.0;

    [[nodiscard]] double total() const noexcept { return ticketRevenue + concessionRevenue; }
};

// 0.5 * average cleanliness + 0.5 * species diversity, both on a 0..100 scale.
[[nodiscard]] float AttractivenessScore(const std::vector<Enclosure>& enclosures,
                                        const entt::registry& reg);

[[nodiscard]] VisitorDay SimulateVisitors(float attractiveness, const Tuning& t, rng::Pcg32& rng);

} // namespace ozzoo
