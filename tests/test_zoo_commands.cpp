// tests/test_zoo_commands.cpp
//
// Player commands on the Zoo. Every failing command must leave the zoo
// exactly as it was.

#include <doctest/doctest.h>

#include "ozzoo/sim/Zoo.h"
#include "test_support/ZooFixtures.h"

using namespace ozzoo;
using namespace ozzoo::test;

TEST_CASE("Zoo: starter content")
{
    ZooSetup setup{};
    setup.tuning = QuietTuning();
    Zoo zoo(setup);

    CHECK(zoo.day() == 1);
    CHECK(zoo.ledger().balance() == doctest::Approx(2000.0));
    REQUIRE(zoo.enclosures().size() == 3);
    CHECK(zoo.enclosures()[2].habitat() == Habitat::Aviary);
    CHECK(zoo.animalCount() == 4);
    CHECK(zoo.inventory().units(FoodType::Eucalyptus) == 20);
    CHECK(zoo.inventory().medicine == 5);

    const auto kiki = zoo.findAnimal("kiki");
    REQUIRE(kiki.has_value());
    CHECK(zoo.registry().get<AnimalInfo>(*kiki).species == Species::Koala);
    CHECK(zoo.describe(*kiki) == "Kiki (Koala #1)");
    CHECK(zoo.findAnimal("4").has_value());
    CHECK_FALSE(zoo.findAnimal("Nobody").has_value());
}

TEST_CASE("Zoo: buying more than the balance allows changes nothing")
{
    Zoo zoo(EmptySetup(100.0));

    const auto r = zoo.buyFood(FoodType::Eucalyptus, 50);   // 50 * 3.0
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ZooError::Code::InsufficientFunds);
    CHECK(zoo.ledger().balance() == doctest::Approx(100.0));
    CHECK(zoo.inventory().units(FoodType::Eucalyptus) == 0);
    CHECK(zoo.ledger().history().empty());
}

TEST_CASE("Zoo: buying food and medicine")
{
    Zoo zoo(EmptySetup(100.0));

    REQUIRE(zoo.buyFood(FoodType::Seeds, 10).has_value());
    CHECK(zoo.inventory().units(FoodType::Seeds) == 10);
    CHECK(zoo.ledger().balance() == doctest::Approx(85.0));

    REQUIRE(zoo.buyMedicine(2).has_value());
    CHECK(zoo.inventory().medicine == 2);
    CHECK(zoo.ledger().balance() == doctest::Approx(25.0));

    CHECK(zoo.buyFood(FoodType::Seeds, 0).error().code == ZooError::Code::InvalidAction);
    CHECK(zoo.buyMedicine(-3).error().code == ZooError::Code::InvalidAction);
}

TEST_CASE("Zoo: a full enclosure rejects another purchase")
{
    Zoo zoo(EmptySetup());
    const EnclosureId pen = zoo.addEnclosure("Pen", Habitat::Grassland, 2);

    REQUIRE(zoo.buyAnimal(Species::Kangaroo, pen).has_value());
    REQUIRE(zoo.buyAnimal(Species::Kangaroo, pen).has_value());
    const double balance = zoo.ledger().balance();

    const auto r = zoo.buyAnimal(Species::Kangaroo, pen);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ZooError::Code::CapacityExceeded);
    CHECK(zoo.enclosure(pen)->size() == 2);
    CHECK(zoo.animalCount() == 2);
    CHECK(zoo.ledger().balance() == doctest::Approx(balance));
}

TEST_CASE("Zoo: buying an animal checks habitat, funds and enclosure id")
{
    Zoo zoo(EmptySetup(450.0));
    const EnclosureId aviary = zoo.addEnclosure("Aviary", Habitat::Aviary, 6);
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4);

    CHECK(zoo.buyAnimal(Species::Koala, aviary).error().code == ZooError::Code::SpeciesIncompatibility);
    CHECK(zoo.buyAnimal(Species::WedgeTailedEagle, forest).error().code ==
          ZooError::Code::InsufficientFunds);
    CHECK(zoo.buyAnimal(Species::Koala, 7).error().code == ZooError::Code::InvalidAction);
    CHECK(zoo.buyAnimal("dingo", forest).error().code == ZooError::Code::InvalidAction);
    CHECK(zoo.animalCount() == 0);
    CHECK(zoo.ledger().balance() == doctest::Approx(450.0));

    const auto koala = zoo.buyAnimal("koala", forest);
    REQUIRE(koala.has_value());
    CHECK(zoo.ledger().balance() == doctest::Approx(50.0));
    CHECK(zoo.registry().get<Housing>(*koala).enclosure == forest);
    CHECK(zoo.enclosure(forest)->contains(*koala));
}

TEST_CASE("Zoo: feeding with an empty inventory buys a single ration")
{
    Zoo zoo(EmptySetup(100.0));
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4);
    const AnimalId kiki = Place(zoo, Species::Koala, forest, Spawn("Kiki", Sex::Female, 100.0f, 60.0f));

    const auto fed = zoo.feed(kiki, FoodType::Eucalyptus);
    REQUIRE(fed.has_value());
    CHECK(fed->accepted);
    CHECK(zoo.ledger().balance() == doctest::Approx(97.0));
    CHECK(zoo.inventory().units(FoodType::Eucalyptus) == 0);
    CHECK(VitalsOf(zoo, kiki).hunger == doctest::Approx(30.0f));
}

TEST_CASE("Zoo: feeding from stock costs nothing")
{
    Zoo zoo(EmptySetup(100.0));
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4);
    const AnimalId kiki = Place(zoo, Species::Koala, forest, Spawn("Kiki", Sex::Female, 100.0f, 60.0f));
    zoo.inventory().units(FoodType::Eucalyptus) = 2;

    REQUIRE(zoo.feed(kiki, FoodType::Eucalyptus).has_value());
    CHECK(zoo.inventory().units(FoodType::Eucalyptus) == 1);
    CHECK(zoo.ledger().balance() == doctest::Approx(100.0));
}

TEST_CASE("Zoo: wrong food is refused but still consumed")
{
    Zoo zoo(EmptySetup(100.0));
    const EnclosureId grass = zoo.addEnclosure("Grassland", Habitat::Grassland, 4);
    const AnimalId joey = Place(zoo, Species::Kangaroo, grass, Spawn("Joey", Sex::Male, 100.0f, 60.0f, 80.0f));
    zoo.inventory().units(FoodType::MeatyFood) = 1;

    const auto fed = zoo.feed(joey, FoodType::MeatyFood);
    REQUIRE(fed.has_value());
    CHECK_FALSE(fed->accepted);
    CHECK(zoo.inventory().units(FoodType::MeatyFood) == 0);
    CHECK(VitalsOf(zoo, joey).hunger == doctest::Approx(55.0f));
    CHECK(VitalsOf(zoo, joey).happiness == doctest::Approx(75.0f));
}

TEST_CASE("Zoo: feeding without stock or money fails cleanly")
{
    Zoo zoo(EmptySetup(1.0));
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4);
    const AnimalId kiki = Place(zoo, Species::Koala, forest, Spawn("Kiki", Sex::Female, 100.0f, 60.0f));

    const auto fed = zoo.feed(kiki, FoodType::Eucalyptus);
    REQUIRE_FALSE(fed.has_value());
    CHECK(fed.error().code == ZooError::Code::InsufficientFunds);
    CHECK(VitalsOf(zoo, kiki).hunger == doctest::Approx(60.0f));
    CHECK(zoo.ledger().balance() == doctest::Approx(1.0));
}

TEST_CASE("Zoo: medicine uses stock first, then buys a dose")
{
    Zoo zoo(EmptySetup(100.0));
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4);
    const AnimalId kiki = Place(zoo, Species::Koala, forest, Spawn("Kiki", Sex::Female, 40.0f));
    zoo.inventory().medicine = 1;

    REQUIRE(zoo.giveMedicine(kiki).has_value());
    CHECK(VitalsOf(zoo, kiki).health == doctest::Approx(55.0f));
    CHECK(zoo.inventory().medicine == 0);
    CHECK(zoo.ledger().balance() == doctest::Approx(100.0));

    REQUIRE(zoo.giveMedicine(kiki).has_value());
    CHECK(VitalsOf(zoo, kiki).health == doctest::Approx(70.0f));
    CHECK(zoo.ledger().balance() == doctest::Approx(70.0));
}

TEST_CASE("Zoo: breeding across species creates nothing")
{
    Zoo zoo(EmptySetup());
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 6);
    const AnimalId kiki = Place(zoo, Species::Koala, forest, Spawn("Kiki", Sex::Female));
    const AnimalId joey = Place(zoo, Species::Kangaroo, forest, Spawn("Joey", Sex::Male));

    const auto r = zoo.breed(kiki, joey);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ZooError::Code::SpeciesIncompatibility);
    CHECK(zoo.animalCount() == 2);
    CHECK_FALSE(zoo.registry().get<Pregnancy>(kiki).active);
}

TEST_CASE("Zoo: breeding preconditions")
{
    Zoo zoo(EmptySetup());
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 3);
    const EnclosureId other = zoo.addEnclosure("Other Forest", Habitat::Forest, 6);

    const AnimalId kiki = Place(zoo, Species::Koala, forest, Spawn("Kiki", Sex::Female));
    const AnimalId koko = Place(zoo, Species::Koala, forest, Spawn("Koko", Sex::Male));
    const AnimalId kara = Place(zoo, Species::Koala, forest, Spawn("Kara", Sex::Female));
    const AnimalId kit = Place(zoo, Species::Koala, other, Spawn("Kit", Sex::Male));
    const AnimalId frail = Place(zoo, Species::Koala, other, Spawn("Frail", Sex::Female, 40.0f));

    CHECK(zoo.breed(kiki, kiki).error().code == ZooError::Code::InvalidAction);
    CHECK(zoo.breed(kiki, kara).error().code == ZooError::Code::SpeciesIncompatibility);   // same sex
    CHECK(zoo.breed(kiki, kit).error().code == ZooError::Code::InvalidAction);             // apart
    CHECK(zoo.breed(kit, frail).error().code == ZooError::Code::InvalidAction);            // unfit
    CHECK(zoo.breed(kiki, koko).error().code == ZooError::Code::CapacityExceeded);         // 3/3

    CHECK(zoo.animalCount() == 5);
}

TEST_CASE("Zoo: conception odds follow the pair's happiness, not their health")
{
    // Healthy but only just content: (50 + 50) / 200 is a coin flip.
    int conceived = 0;
    constexpr int kTrials = 40;
    for (int i = 0; i < kTrials; ++i)
    {
        Zoo zoo(EmptySetup(10000.0, 500 + static_cast<rng::Seed>(i)));
        const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4);
        const AnimalId kiki = Place(zoo, Species::Koala, forest, Spawn("Kiki", Sex::Female, 100.0f, 0.0f, 50.0f));
        const AnimalId koko = Place(zoo, Species::Koala, forest, Spawn("Koko", Sex::Male, 100.0f, 0.0f, 50.0f));

        const auto bred = zoo.breed(kiki, koko);
        REQUIRE(bred.has_value());
        if (bred->conceived)
        {
            ++conceived;
            CHECK(zoo.registry().get<Pregnancy>(kiki).active);
        }
        else
        {
            CHECK_FALSE(zoo.registry().get<Pregnancy>(kiki).active);
        }
    }
    CHECK(conceived > 0);
    CHECK(conceived < kTrials);
}

TEST_CASE("Zoo: healthy pair conceives and the baby arrives after gestation")
{
    Zoo zoo(EmptySetup());
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4);
    const AnimalId kiki = Place(zoo, Species::Koala, forest, Spawn("Kiki", Sex::Female));
    const AnimalId koko = Place(zoo, Species::Koala, forest, Spawn("Koko", Sex::Male));
    REQUIRE(zoo.buyFood(FoodType::Eucalyptus, 150).has_value());

    // Chance is (100 + 100) / 200: always.
    const auto bred = zoo.breed(koko, kiki);
    REQUIRE(bred.has_value());
    CHECK(bred->conceived);
    CHECK(bred->mother == kiki);
    CHECK(zoo.registry().get<Pregnancy>(kiki).active);

    // A second attempt while expecting is refused.
    CHECK(zoo.breed(kiki, koko).error().code == ZooError::Code::InvalidAction);

    const int gestation = GetTraits(Species::Koala).gestationDays;
    for (int d = 0; d < gestation; ++d)
        zoo.runDay();

    CHECK(zoo.animalCount() == 3);
    CHECK(zoo.enclosure(forest)->size() == 3);
    CHECK(zoo.healthMonitor().birthsSeen() == 1);
    CHECK_FALSE(zoo.registry().get<Pregnancy>(kiki).active);

    int births = 0;
    for (const DayReport& day : zoo.dayHistory())
        births += day.births;
    CHECK(births == 1);
}

TEST_CASE("Zoo: selling credits part of the price and removes the animal")
{
    Zoo zoo(EmptySetup(0.0));
    const EnclosureId aviary = zoo.addEnclosure("Aviary", Habitat::Aviary, 6);
    const AnimalId aerie = Place(zoo, Species::WedgeTailedEagle, aviary, Spawn("Aerie", Sex::Female));

    REQUIRE(zoo.sellAnimal(aerie).has_value());
    CHECK(zoo.ledger().balance() == doctest::Approx(250.0));
    CHECK(zoo.animalCount() == 0);
    CHECK(zoo.enclosure(aviary)->size() == 0);
    CHECK_FALSE(zoo.registry().valid(aerie));
    CHECK(zoo.healthMonitor().deathsSeen() == 0);

    CHECK(zoo.sellAnimal(aerie).error().code == ZooError::Code::InvalidAction);
}

TEST_CASE("Zoo: moving animals between enclosures")
{
    Zoo zoo(EmptySetup());
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4);
    const EnclosureId grass = zoo.addEnclosure("Grassland", Habitat::Grassland, 1);
    const EnclosureId aviary = zoo.addEnclosure("Aviary", Habitat::Aviary, 6);
    const AnimalId kiki = Place(zoo, Species::Koala, forest, Spawn("Kiki", Sex::Female));
    const AnimalId koko = Place(zoo, Species::Koala, forest, Spawn("Koko", Sex::Male));

    CHECK(zoo.moveAnimal(kiki, aviary).error().code == ZooError::Code::SpeciesIncompatibility);
    CHECK(zoo.moveAnimal(kiki, forest).error().code == ZooError::Code::InvalidAction);

    REQUIRE(zoo.moveAnimal(kiki, grass).has_value());
    CHECK(zoo.registry().get<Housing>(kiki).enclosure == grass);
    CHECK(zoo.enclosure(forest)->size() == 1);
    CHECK(zoo.enclosure(grass)->contains(kiki));

    CHECK(zoo.moveAnimal(koko, grass).error().code == ZooError::Code::CapacityExceeded);
    CHECK(zoo.registry().get<Housing>(koko).enclosure == forest);
    CHECK(zoo.enclosure(forest)->contains(koko));
}

TEST_CASE("Zoo: cleaning and upgrading that cannot be paid leave the enclosure alone")
{
    Zoo zoo(EmptySetup(5.0));
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4, 50.0f);

    CHECK(zoo.clean(forest).error().code == ZooError::Code::InsufficientFunds);
    CHECK(zoo.upgrade(forest).error().code == ZooError::Code::InsufficientFunds);

    const Enclosure* enc = zoo.enclosure(forest);
    CHECK(enc->cleanliness() == doctest::Approx(50.0f));
    CHECK(enc->capacity() == 4);
    CHECK(enc->upgradeLevel() == 1);
    CHECK(zoo.ledger().balance() == doctest::Approx(5.0));

    CHECK(zoo.clean(99).error().code == ZooError::Code::InvalidAction);
}

TEST_CASE("Zoo: cleaning and upgrading")
{
    Zoo zoo(EmptySetup(1000.0));
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4, 50.0f);
    const AnimalId kiki = Place(zoo, Species::Koala, forest, Spawn("Kiki", Sex::Female, 100.0f, 0.0f, 70.0f));

    REQUIRE(zoo.clean(forest).has_value());
    CHECK(zoo.enclosure(forest)->cleanliness() == doctest::Approx(100.0f));
    CHECK(zoo.ledger().balance() == doctest::Approx(970.0));   // 20 * 1.5

    REQUIRE(zoo.upgrade(forest).has_value());
    CHECK(zoo.enclosure(forest)->capacity() == 6);
    CHECK(zoo.enclosure(forest)->upgradeLevel() == 2);
    CHECK(VitalsOf(zoo, kiki).happiness == doctest::Approx(75.0f));
    CHECK(zoo.ledger().balance() == doctest::Approx(770.0));
}
