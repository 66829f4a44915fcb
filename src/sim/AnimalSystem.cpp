#include "ozzoo/sim/AnimalSystem.h"
#include "ozzoo/core/Profiling.h"

#include <algorithm>

namespace ozzoo {

FeedOutcome ApplyFood(Vitals& v, Species species, FoodType food, float nutritionFactor,
                      const Tuning& t) noexcept
{
    FeedOutcome out{};
    if (!AcceptsFood(species, food))
    {
        // Picked at it, sulked.
        v.hunger    = ClampLevel(v.hunger - t.refusedHungerRelief);
        v.happiness = ClampLevel(v.happiness - t.refusedHappinessLoss);
        out.accepted = false;
        out.hungerRelief = t.refusedHungerRelief;
        return out;
    }

    const float n = GetFoodInfo(food).nutrition * nutritionFactor;
    v.hunger    = ClampLevel(v.hunger - n);
    v.happiness = ClampLevel(v.happiness + std::min(t.fedHappinessCap, n * t.fedHappinessFactor));
    v.health    = ClampLevel(v.health + std::min(t.fedHealthCap, n * t.fedHealthFactor));
    out.accepted = true;
    out.hungerRelief = n;
    return out;
}

void ApplyMedicine(Vitals& v, const Medicine& medicine) noexcept
{
    v.health = ClampLevel(v.health + medicine.healing);
}

AnimalDayResult AnimalSystem::updateDay(entt::registry& reg,
                                        const std::vector<Enclosure>& enclosures,
                                        Inventory& inventory,
                                        const Tuning& t,
                                        rng::Pcg32& rng) const
{
    OZZOO_TRACY_ZONE("AnimalSystem::updateDay");

    AnimalDayResult out{};

    for (const Enclosure& enc : enclosures)
    {
        for (const AnimalId e : enc.animals())
        {
            if (!reg.valid(e))
                continue;

            const AnimalInfo& info = reg.get<AnimalInfo>(e);
            auto& v     = reg.get<Vitals>(e);
            auto& age   = reg.get<Age>(e);
            auto& preg  = reg.get<Pregnancy>(e);
            const SpeciesTraits& traits = GetTraits(info.species);

            if (v.health <= 0.0f)
                continue;   // already dead, waiting to be reaped

            if (t.autoFeed)
            {
                if (keeperFeed(v, info.species, inventory, t))
                {
                    ++out.fedFromStock;
                }
                else
                {
                    v.hunger = ClampLevel(v.hunger + t.unfedHungerPenalty);
                    ++out.unfed;
                }
            }

            ++age.days;
            v.hunger = ClampLevel(v.hunger + rng.uniformf(t.hungerPerDayMin, t.hungerPerDayMax));

            if (v.hunger > t.hungryThreshold)
                v.happiness = ClampLevel(v.happiness - (v.hunger - t.hungryThreshold) * t.hungryHappinessFactor);

            if (v.hunger > t.starvingThreshold)
                v.health = ClampLevel(v.health - (v.hunger - t.starvingThreshold) * t.starvingHealthFactor);
            else if (v.hunger < t.wellFedThreshold && v.happiness > t.contentHappiness)
                v.health = ClampLevel(v.health + t.wellFedHealthRegen);

            if (!hasCompany(reg, enc, e, info.species))
                v.happiness = ClampLevel(v.happiness - t.lonelyHappinessLoss);

            if (age.years() > static_cast<float>(traits.maxAgeYears))
                v.health = ClampLevel(v.health - t.oldAgeHealthLoss);

            if (preg.active)
            {
                ++preg.days;
                if (preg.days >= traits.gestationDays)
                {
                    preg = Pregnancy{};
                    out.deliveries.push_back(e);
                }
            }
        }
    }

    return out;
}

bool AnimalSystem::keeperFeed(Vitals& v, Species species, Inventory& inventory,
                              const Tuning& t) const
{
    for (const FoodType f : kAllFoodTypes)
    {
        if (!AcceptsFood(species, f))
            continue;
        if (inventory.take(f))
        {
            ApplyFood(v, species, f, t.autoFeedFactor, t);
            return true;
        }
    }
    return false;
}

bool AnimalSystem::hasCompany(const entt::registry& reg, const Enclosure& enc,
                              AnimalId self, Species species) const
{
    return std::any_of(enc.animals().begin(), enc.animals().end(), [&](AnimalId other) {
        return other != self && reg.valid(other) &&
               reg.get<AnimalInfo>(other).species == species;
    });
}

} // namespace ozzoo
