#pragma once
// include/ozzoo/sim/AnimalFactory.h

#include "ozzoo/core/Rng.h"
#include "ozzoo/sim/Components.h"
#include "ozzoo/sim/ZooError.h"

#include <entt/entt.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ozzoo {

struct AnimalSpawn
{
    std::string        name;           // empty: "<Species>-<serial>"
    int                ageDays = 0;
    std::optional<Sex> sex;            // empty: coin flip
    float              health = 100.0f;
    float              hunger = 0.0f;
    float              happiness = 100.0f;
};

// Creates animal entities with the full component set. Housing is left
// unassigned; placing the animal is the caller's job.
class AnimalFactory
{
public:
    AnimalFactory(entt::registry& registry, rng::Pcg32& rng) noexcept
        : m_registry(registry), m_rng(rng) {}

    AnimalId create(Species species, const AnimalSpawn& spawn = {});
    [[nodiscard]] Result<AnimalId> create(std::string_view speciesName, const AnimalSpawn& spawn = {});

    [[nodiscard]] std::uint32_t nextSerial() const noexcept { return m_nextSerial; }

private:
    entt::registry& m_registry;
    rng::Pcg32&     m_rng;
    std::uint32_t   m_nextSerial = 1;
};

} // namespace ozzoo
