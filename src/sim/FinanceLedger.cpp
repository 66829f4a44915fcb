#include "ozzoo/sim/FinanceLedger.h"

#include <cmath>
#include <format>
#include <utility>

namespace ozzoo {

namespace {

[[nodiscard]] Status ValidateAmount(double amount, const std::string& reason)
{
    if (!std::isfinite(amount) || amount < 0.0)
    {
        return Fail(ZooError::Code::InvalidAction,
                    "Invalid amount for '" + reason + "'");
    }
    return {};
}

[[nodiscard]] std::string Money(double v)
{
    return std::format("${:.2f}", v);
}

} // namespace

FinanceLedger::FinanceLedger(double openingBalance, OverdraftPolicy policy) noexcept
    : m_balance(openingBalance), m_policy(policy)
{
}

Status FinanceLedger::credit(double amount, std::string reason)
{
    if (auto ok = ValidateAmount(amount, reason); !ok)
        return ok;

    m_balance += amount;
    record(amount, std::move(reason), false);
    return {};
}

Status FinanceLedger::debit(double amount, std::string reason)
{
    if (auto ok = ValidateAmount(amount, reason); !ok)
        return ok;

    if (!canAfford(amount))
    {
        return Fail(ZooError::Code::InsufficientFunds,
                    "Not enough money for " + reason + ": need " + Money(amount) +
                    ", have " + Money(m_balance));
    }

    m_balance -= amount;
    record(-amount, std::move(reason), false);
    return {};
}

Status FinanceLedger::charge(double amount, std::string reason)
{
    if (auto ok = ValidateAmount(amount, reason); !ok)
        return ok;

    m_balance -= amount;
    record(-amount, std::move(reason), true);
    return {};
}

bool FinanceLedger::canAfford(double amount) const noexcept
{
    if (m_policy == OverdraftPolicy::Allow)
        return true;
    return amount <= m_balance;
}

double FinanceLedger::incomeOn(int day) const noexcept
{
    double sum = 0.0;
    for (const Transaction& t : m_history)
    {
        if (t.day == day && t.amount > 0.0)
            sum += t.amount;
    }
    return sum;
}

double FinanceLedger::expensesOn(int day) const noexcept
{
    double sum = 0.0;
    for (const Transaction& t : m_history)
    {
        if (t.day == day && t.amount < 0.0)
            sum -= t.amount;
    }
    return sum;
}

void FinanceLedger::record(double signedAmount, std::string reason, bool forced)
{
    Transaction t{};
    t.day = m_day;
    t.amount = signedAmount;
    t.reason = std::move(reason);
    t.forced = forced;
    m_history.push_back(std::move(t));
}

} // namespace ozzoo
