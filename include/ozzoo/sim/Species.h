#pragma once
// include/ozzoo/sim/Species.h
//
// Species catalog. Every species shares the same transition logic; the
// per-species differences live in the traits table below.

#include "ozzoo/sim/Food.h"
#include "ozzoo/sim/ZooError.h"

#include <array>
#include <cstdint>
#include <string_view>

namespace ozzoo {

enum class Species : std::uint8_t
{
    Koala = 0,
    Kangaroo,
    WedgeTailedEagle,
    Count
};

inline constexpr std::size_t kSpeciesCount = static_cast<std::size_t>(Species::Count);

inline constexpr std::array<Species, kSpeciesCount> kAllSpecies = {
    Species::Koala, Species::Kangaroo, Species::WedgeTailedEagle,
};

enum class AnimalClass : std::uint8_t
{
    Mammal = 0,
    Marsupial,
    Bird,
};

enum class Sex : std::uint8_t
{
    Male = 0,
    Female,
};

enum class Habitat : std::uint8_t
{
    Forest = 0,
    Grassland,
    Aviary,
};

struct SpeciesTraits
{
    Species          species;
    std::string_view name;          // display name
    AnimalClass      animalClass;
    FoodMask         diet;
    int              gestationDays;
    int              maxAgeYears;
    double           price;
    std::string_view sound;
};

[[nodiscard]] const SpeciesTraits& GetTraits(Species s) noexcept;
[[nodiscard]] std::string_view SpeciesName(Species s) noexcept;
[[nodiscard]] const char* AnimalClassName(AnimalClass c) noexcept;
[[nodiscard]] const char* SexName(Sex s) noexcept;
[[nodiscard]] const char* HabitatName(Habitat h) noexcept;

[[nodiscard]] bool AcceptsFood(Species s, FoodType f) noexcept;

// Mammals (marsupials included) cannot live in the aviary; birds may live anywhere.
[[nodiscard]] bool HabitatAccepts(Habitat h, Species s) noexcept;

// Lenient lookup: "koala", "Kangaroo", "wedge-tailed eagle", "eagle", "wedge".
[[nodiscard]] Result<Species> ParseSpecies(std::string_view text);
[[nodiscard]] Result<Habitat> ParseHabitat(std::string_view text);

} // namespace ozzoo
