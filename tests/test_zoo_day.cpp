// tests/test_zoo_day.cpp
//
// The daily tick as a whole: ordering, settlement, death handling and the
// health observer.

#include <doctest/doctest.h>

#include "ozzoo/sim/DayClock.h"
#include "ozzoo/sim/Zoo.h"
#include "test_support/ZooFixtures.h"

#include <string>
#include <utility>

using namespace ozzoo;
using namespace ozzoo::test;

TEST_CASE("Zoo day: ten ticks on an empty zoo advance ten days")
{
    Zoo zoo(EmptySetup());
    DayClock clock;

    for (int i = 0; i < 10; ++i)
        REQUIRE(clock.advance([&] { zoo.runDay(); }));

    CHECK(zoo.day() == 11);
    CHECK(zoo.dayHistory().size() == 10);
    CHECK(zoo.dayHistory().front().day == 1);
    CHECK(zoo.dayHistory().back().day == 10);
    CHECK(zoo.animalCount() == 0);
    CHECK_FALSE(zoo.dayInProgress());
}

TEST_CASE("Zoo day: settlement charges upkeep and records the closing balance")
{
    Tuning t = QuietTuning();
    t.minVisitors = 0;
    t.maxVisitors = 0;

    ZooSetup setup = EmptySetup(500.0);
    setup.tuning = t;
    Zoo zoo(setup);
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4);
    Place(zoo, Species::Koala, forest, Spawn("Kiki", Sex::Female));

    const DayReport day = zoo.runDay();
    CHECK(day.visitors.count == 0);
    CHECK(day.expenses == doctest::Approx(14.0));   // 4 per animal + 10 per enclosure
    CHECK(day.income == doctest::Approx(0.0));
    CHECK(day.openingBalance == doctest::Approx(500.0));
    CHECK(day.closingBalance == doctest::Approx(486.0));
    CHECK(zoo.ledger().balance() == doctest::Approx(486.0));

    REQUIRE_FALSE(zoo.ledger().history().empty());
    CHECK(zoo.ledger().history().back().forced);
    CHECK(zoo.ledger().history().back().day == 1);
}

TEST_CASE("Zoo day: upkeep may push the zoo into debt")
{
    Tuning t = QuietTuning();
    t.minVisitors = 0;
    t.maxVisitors = 0;

    ZooSetup setup = EmptySetup(5.0);
    setup.tuning = t;
    Zoo zoo(setup);
    zoo.addEnclosure("Forest", Habitat::Forest, 4);

    zoo.runDay();
    CHECK(zoo.ledger().balance() == doctest::Approx(-5.0));

    bool warned = false;
    for (const auto& e : zoo.notifications().log())
        warned = warned || (e.severity == util::NotifySeverity::Warning &&
                            e.text.find("debt") != std::string::npos);
    CHECK(warned);
}

TEST_CASE("Zoo day: visitors pay tickets")
{
    Zoo zoo(EmptySetup(0.0));
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4);
    Place(zoo, Species::Koala, forest, Spawn("Kiki", Sex::Female));

    const DayReport day = zoo.runDay();
    CHECK(day.visitors.count >= 5);
    CHECK(day.visitors.ticketRevenue == doctest::Approx(25.0 * day.visitors.count));
    CHECK(day.income == doctest::Approx(day.visitors.total()));
}

TEST_CASE("Zoo day: dead animals are removed and stay removed")
{
    ZooSetup setup = EmptySetup();
    setup.tuning.autoFeed = false;
    Zoo zoo(setup);
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4);
    const AnimalId doomed = Place(zoo, Species::Koala, forest, Spawn("Doomed", Sex::Female, 1.0f, 100.0f));
    REQUIRE(zoo.registry().valid(doomed));

    const DayReport day = zoo.runDay();
    CHECK(day.deaths == 1);
    CHECK(zoo.animalCount() == 0);
    CHECK_FALSE(zoo.registry().valid(doomed));
    CHECK(zoo.enclosure(forest)->size() == 0);
    CHECK_FALSE(zoo.findAnimal("Doomed").has_value());
    CHECK(zoo.healthMonitor().deathsSeen() == 1);

    zoo.runDay();
    CHECK(zoo.animalCount() == 0);
    CHECK(zoo.healthMonitor().deathsSeen() == 1);
    CHECK(zoo.dayHistory().back().deaths == 0);

    bool reported = false;
    for (const auto& e : zoo.notifications().log())
        reported = reported || (e.severity == util::NotifySeverity::Error &&
                                e.text.find("Doomed the Koala has died (starvation)") != std::string::npos);
    CHECK(reported);
}

TEST_CASE("Zoo day: critical health is reported once per dip")
{
    ZooSetup setup = EmptySetup();
    setup.tuning.autoFeed = false;
    setup.tuning.hungerPerDayMin = 0.0f;
    setup.tuning.hungerPerDayMax = 0.0f;
    Zoo zoo(setup);
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4);
    const AnimalId sick = Place(zoo, Species::Koala, forest, Spawn("Sick", Sex::Female, 20.0f));
    Place(zoo, Species::Koala, forest, Spawn("Buddy", Sex::Male));

    zoo.runDay();
    CHECK(zoo.healthMonitor().criticalAlerts() == 1);
    zoo.runDay();
    CHECK(zoo.healthMonitor().criticalAlerts() == 1);

    // Recover above the threshold, then dip again.
    zoo.registry().get<Vitals>(sick).health = 90.0f;
    zoo.runDay();
    zoo.registry().get<Vitals>(sick).health = 10.0f;
    zoo.runDay();
    CHECK(zoo.healthMonitor().criticalAlerts() == 2);
}

TEST_CASE("Zoo day: dirty enclosures hurt their animals")
{
    ZooSetup setup = EmptySetup();
    setup.tuning.autoFeed = false;
    setup.tuning.hungerPerDayMin = 0.0f;
    setup.tuning.hungerPerDayMax = 0.0f;
    Zoo zoo(setup);
    const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4, 10.0f);
    const AnimalId a = Place(zoo, Species::Koala, forest, Spawn("A", Sex::Female, 50.0f, 0.0f, 50.0f));
    Place(zoo, Species::Koala, forest, Spawn("B", Sex::Male, 50.0f, 0.0f, 50.0f));

    zoo.runDay();
    CHECK(zoo.enclosure(forest)->cleanliness() == doctest::Approx(7.0f));
    CHECK(VitalsOf(zoo, a).happiness == doctest::Approx(49.0f));
    CHECK(VitalsOf(zoo, a).health == doctest::Approx(49.7f));
}

TEST_CASE("Zoo day: same seed, same history")
{
    ZooSetup setup{};
    setup.seed = 777;
    Zoo first(setup);
    Zoo second(setup);

    for (int i = 0; i < 15; ++i)
    {
        first.runDay();
        second.runDay();
    }

    CHECK(first.ledger().balance() == doctest::Approx(second.ledger().balance()));
    CHECK(first.animalCount() == second.animalCount());
    for (std::size_t i = 0; i < first.dayHistory().size(); ++i)
    {
        CHECK(first.dayHistory()[i].visitors.count == second.dayHistory()[i].visitors.count);
        CHECK(first.dayHistory()[i].event == second.dayHistory()[i].event);
    }
}

TEST_CASE("Zoo day: the day report collects the day's messages")
{
    ZooSetup setup{};
    setup.tuning = QuietTuning();
    Zoo zoo(setup);

    const DayReport day = zoo.runDay();
    CHECK_FALSE(day.lines.empty());
    REQUIRE(zoo.lastDay() != nullptr);
    CHECK(zoo.lastDay()->day == 1);
}

namespace {

// Every living animal's levels after a tick; returns how many were checked.
int CheckLevelsInRange(const Zoo& zoo)
{
    int checked = 0;
    auto view = zoo.registry().view<const AnimalInfo, const Vitals>();
    for (auto [e, info, v] : view.each())
    {
        INFO("day " << zoo.day() << ", " << info.name);
        CHECK(v.health >= 0.0f);
        CHECK(v.health <= 100.0f);
        CHECK(v.hunger >= 0.0f);
        CHECK(v.hunger <= 100.0f);
        CHECK(v.happiness >= 0.0f);
        CHECK(v.happiness <= 100.0f);
        ++checked;
    }
    return checked;
}

} // namespace

TEST_CASE("Zoo day: animal levels stay within 0..100 over long runs")
{
    SUBCASE("starter zoo with random incidents")
    {
        ZooSetup setup{};
        setup.seed = 77;
        Zoo zoo(setup);
        for (int d = 0; d < 300; ++d)
        {
            zoo.runDay();
            CheckLevelsInRange(zoo);
        }
    }

    SUBCASE("a heatwave every day")
    {
        Tuning t = QuietTuning();
        t.heatwaveChance = 1.0;
        ZooSetup setup{};
        setup.seed = 78;
        setup.tuning = t;
        Zoo zoo(setup);
        for (int d = 0; d < 200; ++d)
        {
            const DayReport day = zoo.runDay();
            CHECK(day.event == ZooEventKind::Heatwave);
            CheckLevelsInRange(zoo);
        }
    }

    SUBCASE("starving animals with no stock")
    {
        Zoo zoo(EmptySetup());
        const EnclosureId forest = zoo.addEnclosure("Forest", Habitat::Forest, 4);
        Place(zoo, Species::Koala, forest, Spawn("Kiki", Sex::Female, 100.0f, 90.0f, 5.0f));
        Place(zoo, Species::Koala, forest, Spawn("Koko", Sex::Male));
        for (int d = 0; d < 200; ++d)
        {
            zoo.runDay();
            CheckLevelsInRange(zoo);
        }
        CHECK(zoo.animalCount() == 0);
    }
}

TEST_CASE("Zoo day: a returned day report outlives later ticks")
{
    Zoo zoo(EmptySetup());
    const DayReport first = zoo.runDay();
    for (int d = 0; d < 64; ++d)
        zoo.runDay();

    CHECK(first.day == 1);
    CHECK(zoo.dayHistory().front().day == 1);
    CHECK(zoo.dayHistory().back().day == 65);
}

TEST_CASE("Zoo day: critical-health messages keep long names whole")
{
    std::string received;
    HealthMonitor monitor([&](std::string text, util::NotifySeverity, util::NotifyTarget) {
        received = std::move(text);
    });

    const std::string name(200, 'k');
    monitor.onCritical(evt::HealthCritical{ entt::null, name, 12.4f });

    CHECK(monitor.criticalAlerts() == 1);
    CHECK(received == name + " is in critical condition (health 12). Consider medicine.");
}
