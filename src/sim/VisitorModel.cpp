#include "ozzoo/sim/VisitorModel.h"

#include <algorithm>
#include <bitset>
#include <cmath>

namespace ozzoo {

float AttractivenessScore(const std::vector<Enclosure>& enclosures, const entt::registry& reg)
{
    if (enclosures.empty())
        return 0.0f;

    float cleanSum = 0.0f;
    std::bitset<kSpeciesCount> seen;
    for (const Enclosure& enc : enclosures)
    {
        cleanSum += enc.cleanliness();
        for (const AnimalId a : enc.animals())
        {
            if (reg.valid(a))
                seen.set(static_cast<std::size_t>(reg.get<AnimalInfo>(a).species));
        }
    }

    const float avgClean  = cleanSum / static_cast<float>(enclosures.size());
    const float diversity = 100.0f * static_cast<float>(seen.count()) / static_cast<float>(kSpeciesCount);
    return std::clamp(0.5f * avgClean + 0.5f * diversity, 0.0f, 100.0f);
}

VisitorDay SimulateVisitors(float attractiveness, const Tuning& t, rng::Pcg32& rng)
{
    VisitorDay day{};
    day.attractiveness = std::clamp(attractiveness, 0.0f, 100.0f);

    const float share  = day.attractiveness / 100.0f;
    const float base   = static_cast<float>(t.minVisitors) +
                         static_cast<float>(t.maxVisitors - t.minVisitors) * share;
    const float jitter = rng.uniformf(t.visitorJitterMin, t.visitorJitterMax);
    day.count = std::max(0, static_cast<int>(std::lround(base * jitter)));

    day.ticketRevenue = static_cast<double>(day.count) * t.ticketPrice;
    for (int i = 0; i < day.count; ++i)
        day.concessionRevenue += rng.uniform(t.concessionSpendMin, t.concessionSpendMax) * share;

    return day;
}

} // namespace ozzoo
