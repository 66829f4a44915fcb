#pragma once
// include/ozzoo/sim/FinanceLedger.h
//
// The zoo's single account. Every purchase and every income path goes
// through one FinanceLedger instance owned by the Zoo.

#include "ozzoo/sim/ZooError.h"

#include <cstdint>
#include <string>
#include <vector>

namespace ozzoo {

enum class OverdraftPolicy : std::uint8_t
{
    Deny = 0,   // debit() rejects amounts above the balance
    Allow,      // debit() may take the balance negative
};

struct Transaction
{
    int         day = 0;
    double      amount = 0.0;    // > 0 income, < 0 expense
    std::string reason;
    bool        forced = false;  // recorded through charge()
};

class FinanceLedger
{
public:
    explicit FinanceLedger(double openingBalance = 0.0,
                           OverdraftPolicy policy = OverdraftPolicy::Deny) noexcept;

    [[nodiscard]] Status credit(double amount, std::string reason);

    // Fails with InsufficientFunds when amount > balance (unless the policy
    // allows overdraft). The balance is untouched on failure.
    [[nodiscard]] Status debit(double amount, std::string reason);

    // Mandatory expense: always recorded, may take the balance negative.
    [[nodiscard]] Status charge(double amount, std::string reason);

    [[nodiscard]] bool canAfford(double amount) const noexcept;

    [[nodiscard]] double balance() const noexcept { return m_balance; }
    [[nodiscard]] OverdraftPolicy policy() const noexcept { return m_policy; }
    [[nodiscard]] const std::vector<Transaction>& history() const noexcept { return m_history; }

    [[nodiscard]] double incomeOn(int day) const noexcept;
    [[nodiscard]] double expensesOn(int day) const noexcept;   // positive number

    // Day stamped on transactions recorded from now on.
    void setDay(int day) noexcept { m_day = day; }
    [[nodiscard]] int day() const noexcept { return m_day; }

private:
    void record(double signedAmount, std::string reason, bool forced);

    double                   m_balance = 0.0;
    OverdraftPolicy          m_policy = OverdraftPolicy::Deny;
    int                      m_day = 1;
    std::vector<Transaction> m_history;
};

} // namespace ozzoo
