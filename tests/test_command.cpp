// tests/test_command.cpp
//
// Command line parsing and the dispatcher boundary shared by the console and
// the GUI.

#include <doctest/doctest.h>

#include "ozzoo/app/Command.h"
#include "ozzoo/app/CommandDispatcher.h"
#include "test_support/ZooFixtures.h"

#include <chrono>
#include <filesystem>
#include <string>

using namespace ozzoo;
using namespace ozzoo::app;

namespace {

struct DispatchHarness
{
    explicit DispatchHarness(const ZooSetup& setup) : zoo(setup)
    {
        dispatcher.setOutput([this](const std::string& text) { output += text; });
    }

    Zoo               zoo;
    DayClock          clock;
    CommandDispatcher dispatcher{ zoo, clock };
    std::string       output;
};

ZooSetup QuietStarter()
{
    ZooSetup setup{};
    setup.tuning = test::QuietTuning();
    return setup;
}

bool LogMentions(const Zoo& zoo, const std::string& needle)
{
    for (const auto& e : zoo.notifications().log())
    {
        if (e.text.find(needle) != std::string::npos)
            return true;
    }
    return false;
}

} // namespace

TEST_CASE("ParseCommand: verbs, aliases and arguments")
{
    auto adv = ParseCommand("advance");
    REQUIRE(adv.has_value());
    CHECK(adv->kind == CommandKind::Advance);
    CHECK(adv->count == 1);

    auto next = ParseCommand("  NEXT   7 ");
    REQUIRE(next.has_value());
    CHECK(next->kind == CommandKind::Advance);
    CHECK(next->count == 7);

    auto feed = ParseCommand("feed Kiki Eucalyptus");
    REQUIRE(feed.has_value());
    CHECK(feed->kind == CommandKind::Feed);
    CHECK(feed->animal == "Kiki");
    CHECK(feed->food == FoodType::Eucalyptus);

    auto buy = ParseCommand("buy-animal kangaroo #2");
    REQUIRE(buy.has_value());
    CHECK(buy->kind == CommandKind::BuyAnimal);
    CHECK(buy->species == Species::Kangaroo);
    CHECK(buy->enclosure == 1);

    auto food = ParseCommand("buy_food seeds 25");
    REQUIRE(food.has_value());
    CHECK(food->kind == CommandKind::BuyFood);
    CHECK(food->food == FoodType::Seeds);
    CHECK(food->count == 25);

    auto treat = ParseCommand("treat 3");
    REQUIRE(treat.has_value());
    CHECK(treat->kind == CommandKind::Medicine);
    CHECK(treat->animal == "3");

    auto breed = ParseCommand("breed Kiki Koko");
    REQUIRE(breed.has_value());
    CHECK(breed->otherAnimal == "Koko");

    auto report = ParseCommand("report PDF out/zoo.pdf");
    REQUIRE(report.has_value());
    CHECK(report->format == report::ReportFormat::Pdf);
    CHECK(report->path == "out/zoo.pdf");

    auto autoOn = ParseCommand("auto ON");
    REQUIRE(autoOn.has_value());
    CHECK(autoOn->on);

    auto clean = ParseCommand("upgrade 3");
    REQUIRE(clean.has_value());
    CHECK(clean->kind == CommandKind::Upgrade);
    CHECK(clean->enclosure == 2);
}

TEST_CASE("ParseCommand: malformed lines are rejected with a usage hint")
{
    const auto expectInvalid = [](std::string_view line) {
        auto cmd = ParseCommand(line);
        REQUIRE_FALSE(cmd.has_value());
        CHECK(cmd.error().code == ZooError::Code::InvalidAction);
        return cmd.error().message;
    };

    CHECK(expectInvalid("feed Kiki").find("Usage: feed") != std::string::npos);
    CHECK(expectInvalid("advance 0").find("between 1 and") != std::string::npos);
    CHECK(expectInvalid("advance many").find("many") != std::string::npos);
    CHECK(expectInvalid("buy-food pizza 2").find("pizza") != std::string::npos);
    CHECK(expectInvalid("buy-animal dragon 1").find("dragon") != std::string::npos);
    CHECK(expectInvalid("clean #0").find("enclosure number") != std::string::npos);
    CHECK(expectInvalid("auto maybe").find("auto on|off") != std::string::npos);
    CHECK(expectInvalid("report html").find("html") != std::string::npos);
    CHECK(expectInvalid("dance").find("Unknown command 'dance'") != std::string::npos);
    expectInvalid("   ");
}

TEST_CASE("Dispatcher: advance runs days through the clock")
{
    DispatchHarness h(test::EmptySetup());

    REQUIRE(h.dispatcher.executeLine("advance 3").has_value());
    CHECK(h.zoo.day() == 4);
    CHECK(h.clock.ticksRun() == 3);
    CHECK(h.clock.state() == ClockState::Idle);

    REQUIRE(h.dispatcher.advanceDay().has_value());
    CHECK(h.zoo.day() == 5);
}

TEST_CASE("Dispatcher: a day cannot be started from inside a running day")
{
    DispatchHarness h(test::EmptySetup());
    Status nested{};

    REQUIRE(h.clock.advance([&] { nested = h.dispatcher.advanceDay(); }));
    REQUIRE_FALSE(nested.has_value());
    CHECK(nested.error().code == ZooError::Code::InvalidAction);
    CHECK(h.zoo.day() == 1);
}

TEST_CASE("Dispatcher: actions resolve animals by name or id")
{
    DispatchHarness h(QuietStarter());

    REQUIRE(h.dispatcher.executeLine("buy-food seeds 10").has_value());
    CHECK(h.zoo.inventory().units(FoodType::Seeds) == 30);
    CHECK(h.zoo.ledger().balance() == doctest::Approx(1985.0));

    REQUIRE(h.dispatcher.executeLine("feed kiki eucalyptus").has_value());
    CHECK(h.zoo.inventory().units(FoodType::Eucalyptus) == 19);

    REQUIRE(h.dispatcher.executeLine("medicine 1").has_value());
    CHECK(h.zoo.inventory().medicine == 4);

    REQUIRE(h.dispatcher.executeLine("sell Joey").has_value());
    CHECK_FALSE(h.zoo.findAnimal("Joey").has_value());
    CHECK(h.zoo.animalCount() == 3);
}

TEST_CASE("Dispatcher: failures are returned and shown in the event log")
{
    DispatchHarness h(QuietStarter());

    auto missing = h.dispatcher.executeLine("medicine Nobody");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ZooError::Code::InvalidAction);
    CHECK(LogMentions(h.zoo, "medicine failed"));
    CHECK(LogMentions(h.zoo, "Nobody"));

    auto unknown = h.dispatcher.executeLine("juggle");
    REQUIRE_FALSE(unknown.has_value());
    CHECK(LogMentions(h.zoo, "Command failed"));

    const double before = h.zoo.ledger().balance();
    auto full = h.dispatcher.executeLine("buy-animal koala 1");   // forest holds 4, two already there
    REQUIRE(full.has_value());
    REQUIRE(h.dispatcher.executeLine("buy-animal koala 1").has_value());
    auto over = h.dispatcher.executeLine("buy-animal koala 1");
    REQUIRE_FALSE(over.has_value());
    CHECK(over.error().code == ZooError::Code::CapacityExceeded);
    CHECK(h.zoo.ledger().balance() == doctest::Approx(before - 800.0));
}

TEST_CASE("Dispatcher: help and text reports go to the output callback")
{
    DispatchHarness h(QuietStarter());

    REQUIRE(h.dispatcher.executeLine("help").has_value());
    CHECK(h.output.find("buy-animal") != std::string::npos);

    h.output.clear();
    REQUIRE(h.dispatcher.executeLine("report text").has_value());
    CHECK(h.output.find("OzZoo - Daily Report") != std::string::npos);
    CHECK(h.output.find("Kiki") != std::string::npos);
}

TEST_CASE("Dispatcher: reports with a path are written to disk")
{
    DispatchHarness h(QuietStarter());

    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / ("ozzoo_cmd_report_" + std::to_string(stamp));
    const std::filesystem::path file = dir / "zoo.pdf";

    REQUIRE(h.dispatcher.executeLine("report pdf " + file.string()).has_value());
    CHECK(std::filesystem::exists(file));
    CHECK(std::filesystem::file_size(file) > 0);
    CHECK(LogMentions(h.zoo, "Report saved"));

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST_CASE("Dispatcher: auto on and off drive the clock")
{
    DispatchHarness h(test::EmptySetup());

    REQUIRE(h.dispatcher.executeLine("auto on").has_value());
    CHECK(h.clock.state() == ClockState::AutoWaiting);

    REQUIRE(h.dispatcher.executeLine("auto off").has_value());
    CHECK(h.clock.state() == ClockState::Paused);

    REQUIRE(h.dispatcher.executeLine("auto on").has_value());
    CHECK(h.clock.autoMode());
}

TEST_CASE("Dispatcher: auto is refused where nothing drives the clock")
{
    DispatchHarness h(test::EmptySetup());
    h.dispatcher.setAutoModeAvailable(false);

    auto refused = h.dispatcher.executeLine("auto on");
    REQUIRE_FALSE(refused.has_value());
    CHECK(refused.error().code == ZooError::Code::InvalidAction);
    CHECK(h.clock.state() == ClockState::Idle);
    CHECK_FALSE(h.clock.autoMode());
    CHECK(LogMentions(h.zoo, "only available in the GUI"));

    REQUIRE(h.dispatcher.executeLine("advance 2").has_value());
    CHECK(h.zoo.day() == 3);
}
