#include <doctest/doctest.h>

#include "ozzoo/sim/Food.h"
#include "ozzoo/sim/Species.h"

using namespace ozzoo;

TEST_CASE("Species: lenient name parsing")
{
    CHECK(ParseSpecies("koala").value() == Species::Koala);
    CHECK(ParseSpecies("KANGAROO").value() == Species::Kangaroo);
    CHECK(ParseSpecies("Wedge-tailed Eagle").value() == Species::WedgeTailedEagle);
    CHECK(ParseSpecies("eagle").value() == Species::WedgeTailedEagle);

    const auto r = ParseSpecies("dingo");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ZooError::Code::InvalidAction);
}

TEST_CASE("Species: diets")
{
    CHECK(AcceptsFood(Species::Koala, FoodType::Eucalyptus));
    CHECK_FALSE(AcceptsFood(Species::Koala, FoodType::GeneralFood));

    CHECK(AcceptsFood(Species::Kangaroo, FoodType::HerbivoreFood));
    CHECK(AcceptsFood(Species::Kangaroo, FoodType::GeneralFood));
    CHECK_FALSE(AcceptsFood(Species::Kangaroo, FoodType::MeatyFood));

    CHECK(AcceptsFood(Species::WedgeTailedEagle, FoodType::MeatyFood));
    CHECK_FALSE(AcceptsFood(Species::WedgeTailedEagle, FoodType::Seeds));
}

TEST_CASE("Species: traits table")
{
    const SpeciesTraits& koala = GetTraits(Species::Koala);
    CHECK(koala.name == "Koala");
    CHECK(koala.animalClass == AnimalClass::Marsupial);
    CHECK(koala.gestationDays == 34);
    CHECK(koala.price == doctest::Approx(400.0));

    CHECK(GetTraits(Species::WedgeTailedEagle).animalClass == AnimalClass::Bird);
    CHECK(SpeciesName(Species::Kangaroo) == "Kangaroo");
}

TEST_CASE("Species: habitat rules")
{
    CHECK(HabitatAccepts(Habitat::Aviary, Species::WedgeTailedEagle));
    CHECK_FALSE(HabitatAccepts(Habitat::Aviary, Species::Koala));
    CHECK_FALSE(HabitatAccepts(Habitat::Aviary, Species::Kangaroo));
    CHECK(HabitatAccepts(Habitat::Grassland, Species::Koala));

    CHECK(ParseHabitat("Aviary").value() == Habitat::Aviary);
    CHECK_FALSE(ParseHabitat("ocean").has_value());
}

TEST_CASE("Food: keys parse case-insensitively with '-' or ' ' separators")
{
    CHECK(ParseFoodType("eucalyptus").value() == FoodType::Eucalyptus);
    CHECK(ParseFoodType("Meaty Food").value() == FoodType::MeatyFood);
    CHECK(ParseFoodType("herbivore-food").value() == FoodType::HerbivoreFood);
    CHECK(ParseFoodType("GENERAL_FOOD").value() == FoodType::GeneralFood);

    const auto r = ParseFoodType("pizza");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ZooError::Code::InvalidAction);

    for (const FoodType f : kAllFoodTypes)
    {
        CHECK(ParseFoodType(FoodKey(f)).value() == f);
        CHECK(GetFoodInfo(f).unitPrice > 0.0);
    }
}
