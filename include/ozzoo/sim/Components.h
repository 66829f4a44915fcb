#pragma once
// include/ozzoo/sim/Components.h
//
// ECS components describing an animal. An animal is an entity carrying
// AnimalInfo + Vitals + Age; Pregnancy and Housing are always present too so
// systems can iterate a single view.

#include "ozzoo/sim/Species.h"

#include <entt/entt.hpp>

#include <cstdint>
#include <string>

namespace ozzoo {

using AnimalId    = entt::entity;
using EnclosureId = std::uint32_t;

inline constexpr EnclosureId kNoEnclosure = ~EnclosureId{0};

struct AnimalInfo
{
    std::uint32_t serial = 0;   // stable, human-facing number
    std::string   name;
    Species       species = Species::Koala;
    Sex           sex = Sex::Female;
};

// All three levels live in [0,100].
struct Vitals
{
    float hunger    = 0.0f;
    float health    = 100.0f;
    float happiness = 100.0f;
};

struct Age
{
    int days = 0;

    [[nodiscard]] float years() const noexcept { return static_cast<float>(days) / 365.0f; }
};

struct Pregnancy
{
    bool active = false;
    int  days   = 0;
};

struct Housing
{
    EnclosureId enclosure = kNoEnclosure;
};

[[nodiscard]] inline float ClampLevel(float v) noexcept
{
    if (!(v > 0.0f)) return 0.0f;   // also maps NaN to 0
    if (v > 100.0f) return 100.0f;
    return v;
}

} // namespace ozzoo
