#pragma once
// include/ozzoo/ui/ZooPanels.h
//
// Dear ImGui windows for the zoo. Every button builds an app::Command and
// hands it to the dispatcher; the panels never mutate the zoo directly.

#include "ozzoo/app/CommandDispatcher.h"

#include <cstdint>
#include <string>

namespace ozzoo::ui {

class ZooPanels
{
public:
    explicit ZooPanels(app::CommandDispatcher& dispatcher) noexcept : m_dispatcher(dispatcher) {}

    void draw();

    // Status line shown under the toolbar (last command result).
    [[nodiscard]] const std::string& status() const noexcept { return m_status; }

private:
    void drawToolbar();
    void drawEnclosures();
    void drawAnimals();
    void drawAnimalActions();
    void drawShop();
    void drawEventLog();
    void drawToasts();
    void drawReportConsole();

    void submit(const app::Command& cmd);

    app::CommandDispatcher& m_dispatcher;

    std::uint32_t m_selectedSerial = 0;   // 0 = none
    std::uint32_t m_breedPartnerSerial = 0;
    int           m_feedFood = 0;
    int           m_moveTarget = 0;

    int m_shopFood = 0;
    int m_shopFoodQty = 10;
    int m_shopMedicineQty = 1;
    int m_shopSpecies = 0;
    int m_shopEnclosure = 0;

    bool        m_showReport = false;
    std::string m_reportText;
    std::string m_status;
    bool        m_statusIsError = false;
};

} // namespace ozzoo::ui
