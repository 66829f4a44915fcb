#pragma once
// include/ozzoo/sim/HealthMonitor.h
//
// Observer for animal health. Subscribed to the zoo dispatcher; turns
// critical-health, death and birth events into player-facing messages.

#include "ozzoo/sim/Events.h"
#include "ozzoo/util/NotificationLog.h"

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace ozzoo {

class HealthMonitor
{
public:
    using Reporter = std::function<void(std::string, util::NotifySeverity, util::NotifyTarget)>;

    explicit HealthMonitor(Reporter reporter) : m_reporter(std::move(reporter)) {}

    void onCritical(const evt::HealthCritical& e);
    void onDied(const evt::AnimalDied& e);
    void onBorn(const evt::AnimalBorn& e);

    [[nodiscard]] std::size_t criticalAlerts() const noexcept { return m_criticalAlerts; }
    [[nodiscard]] std::size_t deathsSeen() const noexcept { return m_deaths; }
    [[nodiscard]] std::size_t birthsSeen() const noexcept { return m_births; }

private:
    Reporter    m_reporter;
    std::size_t m_criticalAlerts = 0;
    std::size_t m_deaths = 0;
    std::size_t m_births = 0;
};

} // namespace ozzoo
