#pragma once
// include/ozzoo/app/CommandDispatcher.h
//
// The command boundary. Every player action from the console or the GUI goes
// through here: errors are logged, shown in the in-game log and returned,
// never thrown.

#include "ozzoo/app/Command.h"
#include "ozzoo/sim/DayClock.h"
#include "ozzoo/sim/Zoo.h"

#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace ozzoo::app {

class CommandDispatcher
{
public:
    // Receives text meant for the player (help, text reports without a path).
    using OutputFn = std::function<void(const std::string&)>;

    CommandDispatcher(Zoo& zoo, DayClock& clock) noexcept : m_zoo(zoo), m_clock(clock) {}

    void setOutput(OutputFn fn) { m_output = std::move(fn); }

    // Front ends that never feed the clock real time (the console) turn this
    // off so "auto on" is refused instead of silently doing nothing.
    void setAutoModeAvailable(bool available) noexcept { m_autoAvailable = available; }
    [[nodiscard]] bool autoModeAvailable() const noexcept { return m_autoAvailable; }

    Status execute(const Command& cmd);
    Status executeLine(std::string_view line);

    // One day through the clock; rejected while a day is running.
    Status advanceDay();

    [[nodiscard]] Zoo& zoo() noexcept { return m_zoo; }
    [[nodiscard]] DayClock& clock() noexcept { return m_clock; }

private:
    [[nodiscard]] Result<AnimalId> resolveAnimal(const std::string& ref) const;
    Status run(const Command& cmd);
    Status report(const Command& cmd);
    void emit(const std::string& text);
    void reportFailure(std::string_view what, const ZooError& err);

    Zoo&      m_zoo;
    DayClock& m_clock;
    OutputFn  m_output;
    bool      m_autoAvailable = true;
};

} // namespace ozzoo::app
