#pragma once
// include/ozzoo/sim/DayClock.h
//
// Drives day ticks from the UI frame loop. Manual advances run immediately;
// auto mode accumulates real time and fires a tick every interval.
//
//   Idle --advance--> RunningDay --> Idle
//   Idle --start--> AutoWaiting --interval--> RunningDay --> AutoWaiting
//   AutoWaiting --pause--> Paused --start--> AutoWaiting (accumulator kept)

#include <cstdint>
#include <functional>

namespace ozzoo {

enum class ClockState : std::uint8_t
{
    Idle = 0,
    AutoWaiting,
    RunningDay,
    Paused,
};

[[nodiscard]] const char* ClockStateName(ClockState s) noexcept;

struct DayClockConfig
{
    double intervalSeconds  = 2.5;
    double maxFrameSeconds  = 0.25;  // clamp large frame gaps (alt-tab, breakpoints)
    int    maxTicksPerFrame = 2;
};

class DayClock
{
public:
    using TickFn = std::function<void()>;

    explicit DayClock(const DayClockConfig& cfg = {}) noexcept;

    void startAuto() noexcept;
    void pause() noexcept;
    void stop() noexcept;   // back to Idle, accumulator cleared

    // Runs one tick now unless a tick is already running. Returns false when rejected.
    bool advance(const TickFn& tick);

    // Feed a frame delta; returns how many ticks ran.
    int update(double dtSeconds, const TickFn& tick);

    [[nodiscard]] ClockState state() const noexcept { return m_state; }
    [[nodiscard]] bool autoMode() const noexcept
    {
        return m_state == ClockState::AutoWaiting ||
               (m_state == ClockState::RunningDay && m_resumeState == ClockState::AutoWaiting);
    }
    [[nodiscard]] double accumulated() const noexcept { return m_accumulator; }
    [[nodiscard]] double interval() const noexcept { return m_cfg.intervalSeconds; }
    void setInterval(double seconds) noexcept;
    [[nodiscard]] std::uint64_t ticksRun() const noexcept { return m_ticks; }

private:
    bool runTick(const TickFn& tick);

    DayClockConfig m_cfg{};
    ClockState     m_state = ClockState::Idle;
    ClockState     m_resumeState = ClockState::Idle;
    double         m_accumulator = 0.0;
    std::uint64_t  m_ticks = 0;
};

} // namespace ozzoo
