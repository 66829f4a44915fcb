#include "ozzoo/sim/DayClock.h"

#include <algorithm>
#include <cmath>

namespace ozzoo {

const char* ClockStateName(ClockState s) noexcept
{
    switch (s)
    {
    case ClockState::Idle:        return "Idle";
    case ClockState::AutoWaiting: return "Auto";
    case ClockState::RunningDay:  return "Running";
    case ClockState::Paused:      return "Paused";
    }
    return "?";
}

DayClock::DayClock(const DayClockConfig& cfg) noexcept
    : m_cfg(cfg)
{
    setInterval(cfg.intervalSeconds);
    m_cfg.maxTicksPerFrame = std::max(1, m_cfg.maxTicksPerFrame);
}

void DayClock::setInterval(double seconds) noexcept
{
    m_cfg.intervalSeconds = (seconds > 0.0) ? seconds : 2.5;
}

void DayClock::startAuto() noexcept
{
    if (m_state == ClockState::RunningDay)
    {
        m_resumeState = ClockState::AutoWaiting;
        return;
    }
    if (m_state == ClockState::Idle)
        m_accumulator = 0.0;
    m_state = ClockState::AutoWaiting;
}

void DayClock::pause() noexcept
{
    if (m_state == ClockState::RunningDay)
    {
        if (m_resumeState == ClockState::AutoWaiting)
            m_resumeState = ClockState::Paused;
        return;
    }
    if (m_state == ClockState::AutoWaiting)
        m_state = ClockState::Paused;
}

void DayClock::stop() noexcept
{
    m_accumulator = 0.0;
    if (m_state == ClockState::RunningDay)
    {
        m_resumeState = ClockState::Idle;
        return;
    }
    m_state = ClockState::Idle;
}

bool DayClock::runTick(const TickFn& tick)
{
    if (m_state == ClockState::RunningDay)
        return false;   // a day is already being simulated

    m_resumeState = m_state;
    m_state = ClockState::RunningDay;

    struct Restore
    {
        DayClock& clock;
        ~Restore() { clock.m_state = clock.m_resumeState; }
    } restore{ *this };

    ++m_ticks;
    if (tick)
        tick();
    return true;
}

bool DayClock::advance(const TickFn& tick)
{
    return runTick(tick);
}

int DayClock::update(double dtSeconds, const TickFn& tick)
{
    if (m_state != ClockState::AutoWaiting)
        return 0;
    if (!(dtSeconds > 0.0))
        return 0;

    m_accumulator += std::min(dtSeconds, m_cfg.maxFrameSeconds);

    int ran = 0;
    while (m_accumulator >= m_cfg.intervalSeconds && ran < m_cfg.maxTicksPerFrame)
    {
        m_accumulator -= m_cfg.intervalSeconds;
        if (!runTick(tick))
            break;
        ++ran;
        if (m_state != ClockState::AutoWaiting)
            break;   // tick paused or stopped the clock
    }

    // Drop backlog we refused to run so a long stall does not replay later.
    if (m_accumulator >= m_cfg.intervalSeconds)
        m_accumulator = std::fmod(m_accumulator, m_cfg.intervalSeconds);

    return ran;
}

} // namespace ozzoo
