#include <doctest/doctest.h>

#include "ozzoo/sim/FinanceLedger.h"

#include <limits>

using namespace ozzoo;

TEST_CASE("FinanceLedger: debit above balance fails and changes nothing")
{
    FinanceLedger ledger(100.0);

    const auto r = ledger.debit(150.0, "Enclosure upgrade");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ZooError::Code::InsufficientFunds);
    CHECK(ledger.balance() == doctest::Approx(100.0));
    CHECK(ledger.history().empty());
}

TEST_CASE("FinanceLedger: credit and debit are recorded with the current day")
{
    FinanceLedger ledger(500.0);
    ledger.setDay(3);

    REQUIRE(ledger.credit(120.0, "Tickets").has_value());
    REQUIRE(ledger.debit(70.0, "Seeds").has_value());
    ledger.setDay(4);
    REQUIRE(ledger.debit(10.0, "Medicine").has_value());

    CHECK(ledger.balance() == doctest::Approx(540.0));
    REQUIRE(ledger.history().size() == 3);
    CHECK(ledger.history()[0].day == 3);
    CHECK(ledger.history()[0].amount == doctest::Approx(120.0));
    CHECK(ledger.history()[1].amount == doctest::Approx(-70.0));
    CHECK(ledger.history()[2].day == 4);

    CHECK(ledger.incomeOn(3) == doctest::Approx(120.0));
    CHECK(ledger.expensesOn(3) == doctest::Approx(70.0));
    CHECK(ledger.expensesOn(4) == doctest::Approx(10.0));
    CHECK(ledger.incomeOn(4) == doctest::Approx(0.0));
}

TEST_CASE("FinanceLedger: debit of the exact balance succeeds")
{
    FinanceLedger ledger(42.5);
    REQUIRE(ledger.debit(42.5, "Everything").has_value());
    CHECK(ledger.balance() == doctest::Approx(0.0));
}

TEST_CASE("FinanceLedger: mandatory charges may take the balance negative")
{
    FinanceLedger ledger(50.0);

    REQUIRE(ledger.charge(200.0, "Heatwave cooling").has_value());
    CHECK(ledger.balance() == doctest::Approx(-150.0));
    REQUIRE(ledger.history().size() == 1);
    CHECK(ledger.history()[0].forced);

    // Voluntary spending is still refused while in debt.
    const auto r = ledger.debit(1.0, "Seeds");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code == ZooError::Code::InsufficientFunds);
}

TEST_CASE("FinanceLedger: negative or non-finite amounts are invalid")
{
    FinanceLedger ledger(100.0);

    CHECK(ledger.credit(-5.0, "Oops").error().code == ZooError::Code::InvalidAction);
    CHECK(ledger.debit(-5.0, "Oops").error().code == ZooError::Code::InvalidAction);
    CHECK(ledger.charge(std::numeric_limits<double>::quiet_NaN(), "NaN").error().code == ZooError::Code::InvalidAction);
    CHECK(ledger.balance() == doctest::Approx(100.0));
    CHECK(ledger.history().empty());
}

TEST_CASE("FinanceLedger: overdraft policy allows debits into debt")
{
    FinanceLedger ledger(10.0, OverdraftPolicy::Allow);
    CHECK(ledger.canAfford(1000.0));
    REQUIRE(ledger.debit(30.0, "Meat").has_value());
    CHECK(ledger.balance() == doctest::Approx(-20.0));
    CHECK_FALSE(ledger.history()[0].forced);
}
