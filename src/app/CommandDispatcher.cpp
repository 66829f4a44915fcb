#include "ozzoo/app/CommandDispatcher.h"

#include <spdlog/spdlog.h>

#include <format>

namespace ozzoo::app {

Result<AnimalId> CommandDispatcher::resolveAnimal(const std::string& ref) const
{
    if (const auto found = m_zoo.findAnimal(ref))
        return *found;
    return Fail(ZooError::Code::InvalidAction, std::format("No living animal called '{}'", ref));
}

void CommandDispatcher::emit(const std::string& text)
{
    if (m_output)
        m_output(text);
    else
        spdlog::info("{}", text);
}

void CommandDispatcher::reportFailure(std::string_view what, const ZooError& err)
{
    spdlog::warn("{} failed [{}]: {}", what, ZooErrorCodeName(err.code), err.message);
    m_zoo.notifications().push(std::format("{} failed: {}", what, err.message),
                               util::NotifySeverity::Warning, m_zoo.day(), 4.0f);
}

Status CommandDispatcher::advanceDay()
{
    if (!m_clock.advance([this] { m_zoo.runDay(); }))
        return Fail(ZooError::Code::InvalidAction, "A day is already being simulated");
    return {};
}

Status CommandDispatcher::executeLine(std::string_view line)
{
    auto cmd = ParseCommand(line);
    if (!cmd)
    {
        reportFailure("Command", cmd.error());
        return std::unexpected(cmd.error());
    }
    return execute(*cmd);
}

Status CommandDispatcher::execute(const Command& cmd)
{
    Status result = run(cmd);
    if (!result)
        reportFailure(CommandName(cmd.kind), result.error());
    return result;
}

Status CommandDispatcher::run(const Command& cmd)
{
    switch (cmd.kind)
    {
    case CommandKind::Advance:
        for (int i = 0; i < cmd.count; ++i)
        {
            if (auto ok = advanceDay(); !ok)
                return ok;
        }
        return {};

    case CommandKind::Feed:
    {
        auto animal = resolveAnimal(cmd.animal);
        if (!animal)
            return std::unexpected(animal.error());
        auto fed = m_zoo.feed(*animal, cmd.food);
        if (!fed)
            return std::unexpected(fed.error());
        return {};
    }

    case CommandKind::Medicine:
    {
        auto animal = resolveAnimal(cmd.animal);
        if (!animal)
            return std::unexpected(animal.error());
        return m_zoo.giveMedicine(*animal);
    }

    case CommandKind::Breed:
    {
        auto a = resolveAnimal(cmd.animal);
        if (!a)
            return std::unexpected(a.error());
        auto b = resolveAnimal(cmd.otherAnimal);
        if (!b)
            return std::unexpected(b.error());
        auto bred = m_zoo.breed(*a, *b);
        if (!bred)
            return std::unexpected(bred.error());
        return {};
    }

    case CommandKind::BuyFood:
        return m_zoo.buyFood(cmd.food, cmd.count);

    case CommandKind::BuyMedicine:
        return m_zoo.buyMedicine(cmd.count);

    case CommandKind::BuyAnimal:
    {
        auto bought = m_zoo.buyAnimal(cmd.species, cmd.enclosure);
        if (!bought)
            return std::unexpected(bought.error());
        return {};
    }

    case CommandKind::Sell:
    {
        auto animal = resolveAnimal(cmd.animal);
        if (!animal)
            return std::unexpected(animal.error());
        return m_zoo.sellAnimal(*animal);
    }

    case CommandKind::Move:
    {
        auto animal = resolveAnimal(cmd.animal);
        if (!animal)
            return std::unexpected(animal.error());
        return m_zoo.moveAnimal(*animal, cmd.enclosure);
    }

    case CommandKind::Clean:
        return m_zoo.clean(cmd.enclosure);

    case CommandKind::Upgrade:
        return m_zoo.upgrade(cmd.enclosure);

    case CommandKind::Report:
        return report(cmd);

    case CommandKind::Auto:
        if (!m_autoAvailable)
            return Fail(ZooError::Code::InvalidAction, "Auto mode is only available in the GUI; use 'advance <n>'");
        if (cmd.on)
            m_clock.startAuto();
        else
            m_clock.pause();
        spdlog::info("Auto mode {} (clock {})", cmd.on ? "on" : "off", ClockStateName(m_clock.state()));
        return {};

    case CommandKind::Help:
        emit(CommandHelpText());
        return {};
    }

    return Fail(ZooError::Code::InvalidAction, "Unhandled command");
}

Status CommandDispatcher::report(const Command& cmd)
{
    // A text report with no destination goes straight to the player.
    if (cmd.format == report::ReportFormat::Text && cmd.path.empty() && m_output)
    {
        emit(report::RenderTextReport(m_zoo));
        return {};
    }

    const std::filesystem::path path =
        cmd.path.empty() ? report::DefaultReportPath(m_zoo, cmd.format) : std::filesystem::path(cmd.path);

    if (auto ok = report::WriteReport(m_zoo, cmd.format, path); !ok)
        return ok;

    m_zoo.notifications().push(std::format("Report saved to {}", path.string()), util::NotifySeverity::Info,
                               m_zoo.day(), 3.0f);
    return {};
}

} // namespace ozzoo::app
