#include "ozzoo/sim/HealthMonitor.h"

#include <format>
#include <string>

namespace ozzoo {

void HealthMonitor::onCritical(const evt::HealthCritical& e)
{
    ++m_criticalAlerts;
    if (m_reporter)
        m_reporter(std::format("{} is in critical condition (health {:.0f}). Consider medicine.", e.name, e.health),
                   util::NotifySeverity::Warning, util::NotifyTarget::None());
}

void HealthMonitor::onDied(const evt::AnimalDied& e)
{
    ++m_deaths;
    if (m_reporter)
        m_reporter(e.name + " the " + std::string(SpeciesName(e.species)) + " has died (" + e.cause + ").",
                   util::NotifySeverity::Error, util::NotifyTarget::None());
}

// The zoo reports births by name; only the tally is kept here.
void HealthMonitor::onBorn(const evt::AnimalBorn&)
{
    ++m_births;
}

} // namespace ozzoo
