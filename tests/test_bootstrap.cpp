// tests/test_bootstrap.cpp
//
// Startup glue shared by both front ends: --days and --report/--out.

#include <doctest/doctest.h>

#include "ozzoo/app/Bootstrap.h"
#include "test_support/ZooFixtures.h"

#include <vector>

using namespace ozzoo;
using namespace ozzoo::app;

TEST_CASE("Bootstrap: no --report means no report request")
{
    CommandLineArgs args{};
    auto none = ResolveReportRequest(args);
    REQUIRE(none.has_value());
    CHECK_FALSE(none->has_value());

    args.outPath = "ignored.txt";
    auto outOnly = ResolveReportRequest(args);
    REQUIRE(outOnly.has_value());
    CHECK_FALSE(outOnly->has_value());
}

TEST_CASE("Bootstrap: --report and --out resolve to a format and destination")
{
    CommandLineArgs args{};
    args.report = "PDF";
    args.outPath = "zoo.pdf";

    auto req = ResolveReportRequest(args);
    REQUIRE(req.has_value());
    REQUIRE(req->has_value());
    CHECK((*req)->format == report::ReportFormat::Pdf);
    REQUIRE((*req)->out.has_value());
    CHECK(*(*req)->out == std::filesystem::path("zoo.pdf"));

    args.report = "text";
    args.outPath.reset();
    req = ResolveReportRequest(args);
    REQUIRE(req.has_value());
    REQUIRE(req->has_value());
    CHECK((*req)->format == report::ReportFormat::Text);
    CHECK_FALSE((*req)->out.has_value());

    args.report = "docx";
    req = ResolveReportRequest(args);
    REQUIRE_FALSE(req.has_value());
    CHECK(req.error().code == ZooError::Code::InvalidAction);
}

TEST_CASE("Bootstrap: --days advances the zoo before the session starts")
{
    Zoo zoo(test::EmptySetup());
    DayClock clock;
    CommandDispatcher dispatcher(zoo, clock);

    CommandLineArgs args{};
    args.days = 30;

    std::vector<int> closed;
    REQUIRE(AdvanceStartupDays(dispatcher, args, [&](const Zoo& z) { closed.push_back(z.lastDay()->day); })
                .has_value());
    CHECK(zoo.day() == 31);
    REQUIRE(closed.size() == 30);
    CHECK(closed.front() == 1);
    CHECK(closed.back() == 30);

    // No callback and no --days are both fine.
    args.days.reset();
    REQUIRE(AdvanceStartupDays(dispatcher, args).has_value());
    CHECK(zoo.day() == 31);

    args.days = -2;
    auto bad = AdvanceStartupDays(dispatcher, args);
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code == ZooError::Code::InvalidAction);
    CHECK(zoo.day() == 31);
}
