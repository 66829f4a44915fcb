#include "ozzoo/sim/Species.h"
#include "ozzoo/util/Text.h"

#include <string>

namespace ozzoo {

namespace {

constexpr std::array<SpeciesTraits, kSpeciesCount> kSpeciesTable = {{
    { Species::Koala, "Koala", AnimalClass::Marsupial,
      FoodBit(FoodType::Eucalyptus),
      34, 18, 400.0, "munch munch" },
    { Species::Kangaroo, "Kangaroo", AnimalClass::Marsupial,
      static_cast<FoodMask>(FoodBit(FoodType::HerbivoreFood) | FoodBit(FoodType::GeneralFood)),
      30, 18, 350.0, "chortle" },
    { Species::WedgeTailedEagle, "Wedge-tailed Eagle", AnimalClass::Bird,
      FoodBit(FoodType::MeatyFood),
      20, 15, 500.0, "screech" },
}};

} // namespace

const SpeciesTraits& GetTraits(Species s) noexcept
{
    const auto i = static_cast<std::size_t>(s);
    return kSpeciesTable[i < kSpeciesTable.size() ? i : 0];
}

std::string_view SpeciesName(Species s) noexcept
{
    return GetTraits(s).name;
}

const char* AnimalClassName(AnimalClass c) noexcept
{
    switch (c)
    {
    case AnimalClass::Mammal:    return "Mammal";
    case AnimalClass::Marsupial: return "Marsupial";
    case AnimalClass::Bird:      return "Bird";
    }
    return "?";
}

const char* SexName(Sex s) noexcept
{
    return s == Sex::Male ? "M" : "F";
}

const char* HabitatName(Habitat h) noexcept
{
    switch (h)
    {
    case Habitat::Forest:    return "forest";
    case Habitat::Grassland: return "grassland";
    case Habitat::Aviary:    return "aviary";
    }
    return "?";
}

bool AcceptsFood(Species s, FoodType f) noexcept
{
    return (GetTraits(s).diet & FoodBit(f)) != 0;
}

bool HabitatAccepts(Habitat h, Species s) noexcept
{
    if (h != Habitat::Aviary)
        return true;
    return GetTraits(s).animalClass == AnimalClass::Bird;
}

Result<Species> ParseSpecies(std::string_view text)
{
    const std::string key = util::NormalizeKey(text);
    if (key.find("koala") != std::string::npos)
        return Species::Koala;
    if (key.find("kangaroo") != std::string::npos)
        return Species::Kangaroo;
    if (key.find("eagle") != std::string::npos || key.find("wedge") != std::string::npos)
        return Species::WedgeTailedEagle;

    return Fail(ZooError::Code::InvalidAction, "Unknown species '" + std::string(text) + "'");
}

Result<Habitat> ParseHabitat(std::string_view text)
{
    const std::string key = util::NormalizeKey(text);
    if (key == "forest")    return Habitat::Forest;
    if (key == "grassland") return Habitat::Grassland;
    if (key == "aviary")    return Habitat::Aviary;
    return Fail(ZooError::Code::InvalidAction, "Unknown habitat '" + std::string(text) + "'");
}

} // namespace ozzoo
