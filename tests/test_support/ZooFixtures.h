#pragma once
// tests/test_support/ZooFixtures.h
//
// Small builders shared by the simulation tests. Zoos built here start empty
// and have random incidents switched off so outcomes only depend on the seed.

#include "ozzoo/sim/Zoo.h"

#include <optional>
#include <string>

namespace ozzoo::test {

[[nodiscard]] inline Tuning QuietTuning()
{
    Tuning t{};
    t.heatwaveChance = 0.0;
    t.donationChance = 0.0;
    t.escapeChance = 0.0;
    return t;
}

[[nodiscard]] inline ZooSetup EmptySetup(double balance = 10000.0, rng::Seed seed = 1234)
{
    ZooSetup s{};
    s.name = "Test Zoo";
    s.startingBalance = balance;
    s.seed = seed;
    s.starterContent = false;
    s.tuning = QuietTuning();
    return s;
}

[[nodiscard]] inline AnimalSpawn Spawn(std::string name, Sex sex, float health = 100.0f,
                                       float hunger = 0.0f, float happiness = 100.0f)
{
    AnimalSpawn s{};
    s.name = std::move(name);
    s.sex = sex;
    s.health = health;
    s.hunger = hunger;
    s.happiness = happiness;
    s.ageDays = 2 * 365;
    return s;
}

// Places an animal for free; the test fails loudly if placement is rejected.
[[nodiscard]] inline AnimalId Place(Zoo& zoo, Species species, EnclosureId enc, const AnimalSpawn& spawn)
{
    auto placed = zoo.placeNewAnimal(species, enc, spawn);
    return placed ? *placed : AnimalId{ entt::null };
}

[[nodiscard]] inline const Vitals& VitalsOf(const Zoo& zoo, AnimalId a)
{
    return zoo.registry().get<Vitals>(a);
}

} // namespace ozzoo::test
