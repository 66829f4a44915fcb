#include "ozzoo/ui/ZooPanels.h"

#include <imgui.h>

#include <algorithm>
#include <cstdio>
#include <string>

namespace ozzoo::ui {

namespace {

[[nodiscard]] ImVec4 SeverityColor(util::NotifySeverity s) noexcept
{
    switch (s)
    {
    case util::NotifySeverity::Info:    return ImVec4(0.85f, 0.90f, 0.85f, 1.0f);
    case util::NotifySeverity::Warning: return ImVec4(1.00f, 0.80f, 0.30f, 1.0f);
    case util::NotifySeverity::Error:   return ImVec4(1.00f, 0.40f, 0.35f, 1.0f);
    }
    return ImVec4(1, 1, 1, 1);
}

[[nodiscard]] ImVec4 LevelColor(float value, bool highIsBad) noexcept
{
    const float v = highIsBad ? 100.0f - value : value;
    if (v < 30.0f) return ImVec4(1.00f, 0.40f, 0.35f, 1.0f);
    if (v < 60.0f) return ImVec4(1.00f, 0.80f, 0.30f, 1.0f);
    return ImVec4(0.55f, 0.90f, 0.55f, 1.0f);
}

void LevelCell(float value, bool highIsBad)
{
    ImGui::TextColored(LevelColor(value, highIsBad), "%5.1f", static_cast<double>(value));
}

} // namespace

void ZooPanels::submit(const app::Command& cmd)
{
    if (auto ok = m_dispatcher.execute(cmd); !ok)
    {
        m_status = ok.error().message;
        m_statusIsError = true;
    }
    else
    {
        m_status = std::string(app::CommandName(cmd.kind)) + ": ok";
        m_statusIsError = false;
    }
}

void ZooPanels::draw()
{
    drawToolbar();
    drawEnclosures();
    drawAnimals();
    drawAnimalActions();
    drawShop();
    drawEventLog();
    drawToasts();
    drawReportConsole();
}

void ZooPanels::drawToolbar()
{
    Zoo& zoo = m_dispatcher.zoo();
    DayClock& clock = m_dispatcher.clock();

    ImGui::SetNextWindowPos({ 10, 10 }, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize({ 720, 110 }, ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Zoo"))
    {
        const double balance = zoo.ledger().balance();
        ImGui::Text("%s  |  Day %d", zoo.name().c_str(), zoo.day());
        ImGui::SameLine();
        ImGui::TextColored(balance < 0.0 ? ImVec4(1.0f, 0.4f, 0.35f, 1.0f) : ImVec4(0.55f, 0.9f, 0.55f, 1.0f),
                           "  Balance $%.2f", balance);
        ImGui::SameLine();
        ImGui::Text("  Animals %zu", zoo.animalCount());

        if (const DayReport* last = zoo.lastDay())
        {
            ImGui::TextDisabled("Yesterday: %d visitors, %s, income $%.2f, expenses $%.2f", last->visitors.count,
                                ZooEventName(last->event), last->income, last->expenses);
        }

        app::Command cmd{};
        if (ImGui::Button("Advance day"))
        {
            cmd.kind = app::CommandKind::Advance;
            cmd.count = 1;
            submit(cmd);
        }
        ImGui::SameLine();

        bool autoOn = clock.autoMode();
        if (ImGui::Checkbox("Auto", &autoOn))
        {
            cmd.kind = app::CommandKind::Auto;
            cmd.on = autoOn;
            submit(cmd);
        }
        ImGui::SameLine();
        if (autoOn)
        {
            const float progress = static_cast<float>(clock.accumulated() / clock.interval());
            ImGui::ProgressBar(std::clamp(progress, 0.0f, 1.0f), ImVec2(120, 0), ClockStateName(clock.state()));
        }
        else
        {
            ImGui::TextDisabled("%s", ClockStateName(clock.state()));
        }

        ImGui::SameLine();
        if (ImGui::Button("Text report"))
        {
            m_reportText = report::RenderTextReport(zoo);
            m_showReport = true;
        }
        ImGui::SameLine();
        if (ImGui::Button("Export PDF"))
        {
            cmd.kind = app::CommandKind::Report;
            cmd.format = report::ReportFormat::Pdf;
            submit(cmd);
        }

        if (!m_status.empty())
        {
            ImGui::TextColored(m_statusIsError ? ImVec4(1.0f, 0.5f, 0.4f, 1.0f) : ImVec4(0.7f, 0.8f, 0.7f, 1.0f),
                               "%s", m_status.c_str());
        }
    }
    ImGui::End();
}

void ZooPanels::drawEnclosures()
{
    Zoo& zoo = m_dispatcher.zoo();

    ImGui::SetNextWindowPos({ 10, 130 }, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize({ 720, 170 }, ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Enclosures"))
    {
        const ImGuiTableFlags flags = ImGuiTableFlags_RowBg | ImGuiTableFlags_Borders | ImGuiTableFlags_SizingFixedFit;
        if (ImGui::BeginTable("enclosures_table", 7, flags))
        {
            ImGui::TableSetupColumn("#");
            ImGui::TableSetupColumn("Name");
            ImGui::TableSetupColumn("Habitat");
            ImGui::TableSetupColumn("Animals");
            ImGui::TableSetupColumn("Clean");
            ImGui::TableSetupColumn("Level");
            ImGui::TableSetupColumn("Actions");
            ImGui::TableHeadersRow();

            for (const Enclosure& enc : zoo.enclosures())
            {
                ImGui::PushID(static_cast<int>(enc.id()));
                ImGui::TableNextRow();

                ImGui::TableNextColumn();
                ImGui::Text("%u", enc.id() + 1);
                ImGui::TableNextColumn();
                ImGui::TextUnformatted(enc.name().c_str());
                ImGui::TableNextColumn();
                ImGui::TextUnformatted(HabitatName(enc.habitat()));
                ImGui::TableNextColumn();
                ImGui::Text("%zu/%d", enc.size(), enc.capacity());
                ImGui::TableNextColumn();
                LevelCell(enc.cleanliness(), false);
                ImGui::TableNextColumn();
                ImGui::Text("%d", enc.upgradeLevel());

                ImGui::TableNextColumn();
                app::Command cmd{};
                cmd.enclosure = enc.id();

                char label[48];
                std::snprintf(label, sizeof(label), "Clean ($%.0f)", enc.cleaningCost(zoo.tuning()));
                if (ImGui::SmallButton(label))
                {
                    cmd.kind = app::CommandKind::Clean;
                    submit(cmd);
                }
                ImGui::SameLine();
                std::snprintf(label, sizeof(label), "Upgrade ($%.0f)", enc.upgradeCost(zoo.tuning()));
                if (ImGui::SmallButton(label))
                {
                    cmd.kind = app::CommandKind::Upgrade;
                    submit(cmd);
                }

                ImGui::PopID();
            }
            ImGui::EndTable();
        }
        if (zoo.enclosures().empty())
            ImGui::TextDisabled("No enclosures.");
    }
    ImGui::End();
}

void ZooPanels::drawAnimals()
{
    Zoo& zoo = m_dispatcher.zoo();
    const entt::registry& reg = zoo.registry();

    ImGui::SetNextWindowPos({ 10, 310 }, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize({ 720, 260 }, ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Animals"))
    {
        const ImGuiTableFlags flags = ImGuiTableFlags_RowBg | ImGuiTableFlags_Borders | ImGuiTableFlags_SizingFixedFit
                                    | ImGuiTableFlags_ScrollY;
        if (ImGui::BeginTable("animals_table", 9, flags))
        {
            ImGui::TableSetupScrollFreeze(0, 1);
            ImGui::TableSetupColumn("Id");
            ImGui::TableSetupColumn("Name");
            ImGui::TableSetupColumn("Species");
            ImGui::TableSetupColumn("Sex");
            ImGui::TableSetupColumn("Age");
            ImGui::TableSetupColumn("Hunger");
            ImGui::TableSetupColumn("Health");
            ImGui::TableSetupColumn("Happy");
            ImGui::TableSetupColumn("Enclosure");
            ImGui::TableHeadersRow();

            for (const AnimalId a : zoo.animals())
            {
                const AnimalInfo& info = reg.get<AnimalInfo>(a);
                const Vitals& v = reg.get<Vitals>(a);
                const Enclosure* enc = zoo.enclosure(reg.get<Housing>(a).enclosure);

                ImGui::TableNextRow();
                ImGui::TableNextColumn();
                char idLabel[16];
                std::snprintf(idLabel, sizeof(idLabel), "%u", info.serial);
                if (ImGui::Selectable(idLabel, info.serial == m_selectedSerial, ImGuiSelectableFlags_SpanAllColumns))
                    m_selectedSerial = info.serial;

                ImGui::TableNextColumn();
                ImGui::TextUnformatted(info.name.c_str());
                if (reg.get<Pregnancy>(a).active)
                {
                    ImGui::SameLine();
                    ImGui::TextDisabled("(expecting)");
                }
                ImGui::TableNextColumn();
                ImGui::Text("%.*s", static_cast<int>(SpeciesName(info.species).size()), SpeciesName(info.species).data());
                ImGui::TableNextColumn();
                ImGui::TextUnformatted(SexName(info.sex));
                ImGui::TableNextColumn();
                ImGui::Text("%.1f", static_cast<double>(reg.get<Age>(a).years()));
                ImGui::TableNextColumn();
                LevelCell(v.hunger, true);
                ImGui::TableNextColumn();
                LevelCell(v.health, false);
                ImGui::TableNextColumn();
                LevelCell(v.happiness, false);
                ImGui::TableNextColumn();
                ImGui::TextUnformatted(enc ? enc->name().c_str() : "-");
            }
            ImGui::EndTable();
        }
    }
    ImGui::End();
}

void ZooPanels::drawAnimalActions()
{
    Zoo& zoo = m_dispatcher.zoo();
    const entt::registry& reg = zoo.registry();

    ImGui::SetNextWindowPos({ 740, 10 }, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize({ 330, 260 }, ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Selected animal"))
    {
        const auto selected = m_selectedSerial ? zoo.findAnimal(std::to_string(m_selectedSerial)) : std::nullopt;
        if (!selected)
        {
            m_selectedSerial = 0;
            ImGui::TextDisabled("Select an animal in the Animals table.");
            ImGui::End();
            return;
        }

        const AnimalInfo& info = reg.get<AnimalInfo>(*selected);
        ImGui::Text("%s", zoo.describe(*selected).c_str());
        ImGui::Separator();

        app::Command cmd{};
        cmd.animal = std::to_string(info.serial);

        // Feed
        const char* preview = FoodKey(kAllFoodTypes[static_cast<std::size_t>(m_feedFood)]).data();
        ImGui::SetNextItemWidth(160);
        if (ImGui::BeginCombo("##food", preview))
        {
            for (int i = 0; i < static_cast<int>(kFoodTypeCount); ++i)
            {
                const FoodType f = kAllFoodTypes[static_cast<std::size_t>(i)];
                char label[64];
                std::snprintf(label, sizeof(label), "%s (%d in stock)", FoodKey(f).data(), zoo.inventory().units(f));
                if (ImGui::Selectable(label, i == m_feedFood))
                    m_feedFood = i;
            }
            ImGui::EndCombo();
        }
        ImGui::SameLine();
        if (ImGui::Button("Feed"))
        {
            cmd.kind = app::CommandKind::Feed;
            cmd.food = kAllFoodTypes[static_cast<std::size_t>(m_feedFood)];
            submit(cmd);
        }

        char medLabel[48];
        std::snprintf(medLabel, sizeof(medLabel), "Give medicine (%d left)", zoo.inventory().medicine);
        if (ImGui::Button(medLabel))
        {
            cmd.kind = app::CommandKind::Medicine;
            submit(cmd);
        }

        // Breed: partners are limited to the same enclosure.
        ImGui::Separator();
        const EnclosureId home = reg.get<Housing>(*selected).enclosure;
        std::string partnerPreview = "(partner)";
        if (m_breedPartnerSerial)
        {
            if (auto partner = zoo.findAnimal(std::to_string(m_breedPartnerSerial)))
                partnerPreview = zoo.describe(*partner);
            else
                m_breedPartnerSerial = 0;
        }
        ImGui::SetNextItemWidth(200);
        if (ImGui::BeginCombo("##partner", partnerPreview.c_str()))
        {
            if (const Enclosure* enc = zoo.enclosure(home))
            {
                for (const AnimalId other : enc->animals())
                {
                    if (other == *selected)
                        continue;
                    const AnimalInfo& oi = reg.get<AnimalInfo>(other);
                    if (ImGui::Selectable(zoo.describe(other).c_str(), oi.serial == m_breedPartnerSerial))
                        m_breedPartnerSerial = oi.serial;
                }
            }
            ImGui::EndCombo();
        }
        ImGui::SameLine();
        ImGui::BeginDisabled(m_breedPartnerSerial == 0);
        if (ImGui::Button("Breed"))
        {
            cmd.kind = app::CommandKind::Breed;
            cmd.otherAnimal = std::to_string(m_breedPartnerSerial);
            submit(cmd);
        }
        ImGui::EndDisabled();

        // Move
        ImGui::Separator();
        const auto& enclosures = zoo.enclosures();
        if (!enclosures.empty())
        {
            m_moveTarget = std::clamp(m_moveTarget, 0, static_cast<int>(enclosures.size()) - 1);
            ImGui::SetNextItemWidth(200);
            if (ImGui::BeginCombo("##move", enclosures[static_cast<std::size_t>(m_moveTarget)].name().c_str()))
            {
                for (const Enclosure& enc : enclosures)
                {
                    if (ImGui::Selectable(enc.name().c_str(), static_cast<int>(enc.id()) == m_moveTarget))
                        m_moveTarget = static_cast<int>(enc.id());
                }
                ImGui::EndCombo();
            }
            ImGui::SameLine();
            if (ImGui::Button("Move"))
            {
                cmd.kind = app::CommandKind::Move;
                cmd.enclosure = static_cast<EnclosureId>(m_moveTarget);
                submit(cmd);
            }
        }

        ImGui::Separator();
        char sellLabel[48];
        std::snprintf(sellLabel, sizeof(sellLabel), "Sell for $%.0f",
                      GetTraits(info.species).price * zoo.tuning().saleFraction);
        if (ImGui::Button(sellLabel))
        {
            cmd.kind = app::CommandKind::Sell;
            submit(cmd);
        }
    }
    ImGui::End();
}

void ZooPanels::drawShop()
{
    Zoo& zoo = m_dispatcher.zoo();

    ImGui::SetNextWindowPos({ 740, 280 }, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize({ 330, 290 }, ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Shop"))
    {
        app::Command cmd{};

        ImGui::SeparatorText("Food");
        const FoodType food = kAllFoodTypes[static_cast<std::size_t>(m_shopFood)];
        ImGui::SetNextItemWidth(160);
        if (ImGui::BeginCombo("##shopfood", FoodKey(food).data()))
        {
            for (int i = 0; i < static_cast<int>(kFoodTypeCount); ++i)
            {
                const FoodInfo& fi = GetFoodInfo(kAllFoodTypes[static_cast<std::size_t>(i)]);
                char label[64];
                std::snprintf(label, sizeof(label), "%s ($%.2f)", fi.key.data(), fi.unitPrice);
                if (ImGui::Selectable(label, i == m_shopFood))
                    m_shopFood = i;
            }
            ImGui::EndCombo();
        }
        ImGui::SameLine();
        ImGui::SetNextItemWidth(80);
        ImGui::InputInt("##foodqty", &m_shopFoodQty);
        m_shopFoodQty = std::clamp(m_shopFoodQty, 1, 999);
        ImGui::SameLine();
        if (ImGui::Button("Buy##food"))
        {
            cmd.kind = app::CommandKind::BuyFood;
            cmd.food = food;
            cmd.count = m_shopFoodQty;
            submit(cmd);
        }

        ImGui::SeparatorText("Medicine");
        ImGui::SetNextItemWidth(80);
        ImGui::InputInt("##medqty", &m_shopMedicineQty);
        m_shopMedicineQty = std::clamp(m_shopMedicineQty, 1, 99);
        ImGui::SameLine();
        ImGui::Text("x $%.0f", Medicine{}.unitPrice);
        ImGui::SameLine();
        if (ImGui::Button("Buy##med"))
        {
            cmd.kind = app::CommandKind::BuyMedicine;
            cmd.count = m_shopMedicineQty;
            submit(cmd);
        }

        ImGui::SeparatorText("Animals");
        const Species species = kAllSpecies[static_cast<std::size_t>(m_shopSpecies)];
        const std::string speciesLabel = std::string(SpeciesName(species));
        ImGui::SetNextItemWidth(180);
        if (ImGui::BeginCombo("##species", speciesLabel.c_str()))
        {
            for (int i = 0; i < static_cast<int>(kSpeciesCount); ++i)
            {
                const SpeciesTraits& t = GetTraits(kAllSpecies[static_cast<std::size_t>(i)]);
                char label[64];
                std::snprintf(label, sizeof(label), "%.*s ($%.0f)", static_cast<int>(t.name.size()), t.name.data(),
                              t.price);
                if (ImGui::Selectable(label, i == m_shopSpecies))
                    m_shopSpecies = i;
            }
            ImGui::EndCombo();
        }

        const auto& enclosures = zoo.enclosures();
        if (enclosures.empty())
        {
            ImGui::TextDisabled("No enclosure to place animals in.");
        }
        else
        {
            m_shopEnclosure = std::clamp(m_shopEnclosure, 0, static_cast<int>(enclosures.size()) - 1);
            ImGui::SetNextItemWidth(180);
            if (ImGui::BeginCombo("##target", enclosures[static_cast<std::size_t>(m_shopEnclosure)].name().c_str()))
            {
                for (const Enclosure& enc : enclosures)
                {
                    if (ImGui::Selectable(enc.name().c_str(), static_cast<int>(enc.id()) == m_shopEnclosure))
                        m_shopEnclosure = static_cast<int>(enc.id());
                }
                ImGui::EndCombo();
            }
            ImGui::SameLine();
            if (ImGui::Button("Buy##animal"))
            {
                cmd.kind = app::CommandKind::BuyAnimal;
                cmd.species = species;
                cmd.enclosure = static_cast<EnclosureId>(m_shopEnclosure);
                submit(cmd);
            }
        }
    }
    ImGui::End();
}

void ZooPanels::drawEventLog()
{
    const auto& log = m_dispatcher.zoo().notifications().log();

    ImGui::SetNextWindowPos({ 10, 580 }, ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize({ 1060, 200 }, ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Event log"))
    {
        if (ImGui::BeginChild("log_scroll"))
        {
            for (const auto& e : log)
            {
                ImGui::TextDisabled("Day %3d", e.day);
                ImGui::SameLine();
                ImGui::TextColored(SeverityColor(e.severity), "%s", e.text.c_str());
                if (e.target.kind == util::NotifyTarget::Kind::Animal && ImGui::IsItemClicked())
                    m_selectedSerial = e.target.id;
            }
            if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY())
                ImGui::SetScrollHereY(1.0f);
        }
        ImGui::EndChild();
    }
    ImGui::End();
}

void ZooPanels::drawToasts()
{
    const auto& toasts = m_dispatcher.zoo().notifications().toasts();
    if (toasts.empty())
        return;

    const ImGuiViewport* vp = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x + vp->WorkSize.x - 12.0f, vp->WorkPos.y + 12.0f),
                            ImGuiCond_Always, ImVec2(1.0f, 0.0f));
    ImGui::SetNextWindowBgAlpha(0.80f);
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize
                                 | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoFocusOnAppearing
                                 | ImGuiWindowFlags_NoNav | ImGuiWindowFlags_NoMove;
    if (ImGui::Begin("##toasts", nullptr, flags))
    {
        for (const auto& t : toasts)
            ImGui::TextColored(SeverityColor(t.entry.severity), "%s", t.entry.text.c_str());
    }
    ImGui::End();
}

void ZooPanels::drawReportConsole()
{
    if (!m_showReport)
        return;

    ImGui::SetNextWindowSize({ 640, 520 }, ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Report", &m_showReport))
    {
        if (ImGui::Button("Refresh"))
            m_reportText = report::RenderTextReport(m_dispatcher.zoo());
        ImGui::SameLine();
        if (ImGui::Button("Save as text"))
        {
            app::Command cmd{};
            cmd.kind = app::CommandKind::Report;
            cmd.format = report::ReportFormat::Text;
            cmd.path = report::DefaultReportPath(m_dispatcher.zoo(), report::ReportFormat::Text).string();
            submit(cmd);
        }
        ImGui::Separator();
        if (ImGui::BeginChild("report_text", ImVec2(0, 0), false, ImGuiWindowFlags_HorizontalScrollbar))
            ImGui::TextUnformatted(m_reportText.c_str());
        ImGui::EndChild();
    }
    ImGui::End();
}

} // namespace ozzoo::ui
