#pragma once
// include/ozzoo/sim/AnimalSystem.h
//
// Per-day animal transition plus the feeding/medicine effects shared by the
// daily keeper round and the player's actions.

#include "ozzoo/core/Rng.h"
#include "ozzoo/sim/Components.h"
#include "ozzoo/sim/Enclosure.h"
#include "ozzoo/sim/Inventory.h"
#include "ozzoo/sim/Tuning.h"

#include <entt/entt.hpp>

#include <vector>

namespace ozzoo {

// Tracks whether the health observer already fired for the current dip.
struct HealthWatch
{
    bool critical = false;
};

struct FeedOutcome
{
    bool  accepted = false;
    float hungerRelief = 0.0f;
};

FeedOutcome ApplyFood(Vitals& v, Species species, FoodType food, float nutritionFactor,
                      const Tuning& t) noexcept;

void ApplyMedicine(Vitals& v, const Medicine& medicine) noexcept;

struct AnimalDayResult
{
    std::vector<AnimalId> deliveries;   // mothers whose gestation completed today
    int                   fedFromStock = 0;
    int                   unfed = 0;
};

class AnimalSystem
{
public:
    AnimalDayResult updateDay(entt::registry& reg,
                              const std::vector<Enclosure>& enclosures,
                              Inventory& inventory,
                              const Tuning& t,
                              rng::Pcg32& rng) const;

private:
    bool keeperFeed(Vitals& v, Species species, Inventory& inventory, const Tuning& t) const;
    [[nodiscard]] bool hasCompany(const entt::registry& reg, const Enclosure& enc,
                                  AnimalId self, Species species) const;
};

} // namespace ozzoo
