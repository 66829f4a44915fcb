#include "ozzoo/report/ZooReport.h"
#include "ozzoo/report/PdfWriter.h"
#include "ozzoo/util/Text.h"

#include <spdlog/spdlog.h>

#include <format>
#include <fstream>
#include <system_error>

namespace ozzoo::report {

namespace {

constexpr const char* kRule = "------------------------------------------------------------------------";

void Section(std::vector<std::string>& out, std::string_view title)
{
    out.emplace_back();
    out.emplace_back(title);
    out.emplace_back(kRule);
}

} // namespace

Result<ReportFormat> ParseReportFormat(std::string_view text)
{
    const std::string key = util::NormalizeKey(text);
    if (key == "text" || key == "txt")
        return ReportFormat::Text;
    if (key == "pdf")
        return ReportFormat::Pdf;
    return Fail(ZooError::Code::InvalidAction, std::format("Unknown report format '{}' (text|pdf)", text));
}

const char* ReportExtension(ReportFormat f) noexcept
{
    return f == ReportFormat::Pdf ? ".pdf" : ".txt";
}

std::vector<std::string> BuildReportLines(const Zoo& zoo, const ReportOptions& opts)
{
    std::vector<std::string> out;
    const entt::registry& reg = zoo.registry();

    out.push_back(std::format("{} - Daily Report", zoo.name()));
    out.push_back(kRule);
    out.push_back(std::format("Day:      {}", zoo.day()));
    out.push_back(std::format("Balance:  ${:.2f}", zoo.ledger().balance()));
    out.push_back(std::format("Animals:  {}", zoo.animalCount()));

    if (const DayReport* last = zoo.lastDay())
    {
        out.push_back(std::format("Last day: #{} - {} visitors, event: {}, income ${:.2f}, expenses ${:.2f}",
                                  last->day, last->visitors.count, ZooEventName(last->event),
                                  last->income, last->expenses));
        const auto& log = zoo.notifications();
        out.push_back(std::format("Alerts:   {} warnings, {} errors on day {}",
                                  log.countOn(last->day, util::NotifySeverity::Warning),
                                  log.countOn(last->day, util::NotifySeverity::Error), last->day));
    }

    Section(out, "Enclosures");
    if (zoo.enclosures().empty())
        out.emplace_back("(none)");
    for (const Enclosure& enc : zoo.enclosures())
    {
        out.push_back(std::format("#{} {:<22} {:<9} {}/{}  clean {:5.1f}%  level {}", enc.id() + 1,
                                  enc.name(), HabitatName(enc.habitat()), enc.size(), enc.capacity(),
                                  enc.cleanliness(), enc.upgradeLevel()));
    }

    Section(out, "Animals");
    const std::vector<AnimalId> roster = zoo.animals();
    if (roster.empty())
        out.emplace_back("(none)");
    else
        out.push_back(std::format("{:>4} {:<12} {:<18} {:<6} {:>5} {:>6} {:>6} {:>6}  {}", "id", "name",
                                  "species", "sex", "age", "hunger", "health", "happy", "enclosure"));
    for (const AnimalId a : roster)
    {
        const AnimalInfo& info = reg.get<AnimalInfo>(a);
        const Vitals& v = reg.get<Vitals>(a);
        const Age& age = reg.get<Age>(a);
        const Pregnancy& preg = reg.get<Pregnancy>(a);
        const Enclosure* enc = zoo.enclosure(reg.get<Housing>(a).enclosure);

        out.push_back(std::format("{:>4} {:<12} {:<18} {:<6} {:>5.1f} {:>6.1f} {:>6.1f} {:>6.1f}  {}{}",
                                  info.serial, info.name, SpeciesName(info.species), SexName(info.sex),
                                  age.years(), v.hunger, v.health, v.happiness,
                                  enc ? enc->name() : std::string("-"),
                                  preg.active ? " (pregnant)" : ""));
    }

    Section(out, "Inventory");
    for (const FoodType f : kAllFoodTypes)
        out.push_back(std::format("{:<16} {:>5}", FoodKey(f), zoo.inventory().units(f)));
    out.push_back(std::format("{:<16} {:>5}", Medicine{}.name, zoo.inventory().medicine));

    Section(out, "Recent transactions");
    const auto& history = zoo.ledger().history();
    const std::size_t txStart =
        history.size() > opts.recentTransactions ? history.size() - opts.recentTransactions : 0;
    if (history.empty())
        out.emplace_back("(none)");
    for (std::size_t i = txStart; i < history.size(); ++i)
    {
        const Transaction& tx = history[i];
        out.push_back(std::format("day {:>3}  {:>+10.2f}  {}{}", tx.day, tx.amount, tx.reason,
                                  tx.forced ? " [mandatory]" : ""));
    }

    Section(out, "Recent events");
    const auto events = zoo.notifications().recent(opts.recentEvents);
    if (events.empty())
        out.emplace_back("(none)");
    for (const auto& e : events)
        out.push_back(std::format("day {:>3}  {:<5} {}", e.day, util::NotifySeverityName(e.severity), e.text));

    return out;
}

std::string RenderTextReport(const Zoo& zoo, const ReportOptions& opts)
{
    std::string text;
    for (const std::string& line : BuildReportLines(zoo, opts))
    {
        text += line;
        text += '\n';
    }
    return text;
}

std::string RenderPdfReport(const Zoo& zoo, const ReportOptions& opts)
{
    PdfWriter pdf;
    pdf.setTitle(std::format("{} report, day {}", zoo.name(), zoo.day()));
    for (const std::string& line : BuildReportLines(zoo, opts))
        pdf.addLine(line);
    return pdf.build();
}

std::filesystem::path DefaultReportPath(const Zoo& zoo, ReportFormat format)
{
    return std::format("ozzoo_report_day{:03}{}", zoo.day(), ReportExtension(format));
}

Status WriteReport(const Zoo& zoo, ReportFormat format, const std::filesystem::path& path,
                   const ReportOptions& opts)
{
    const std::string payload =
        format == ReportFormat::Pdf ? RenderPdfReport(zoo, opts) : RenderTextReport(zoo, opts);

    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return Fail(ZooError::Code::IoError, std::format("Cannot open {} for writing", path.string()));

    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    out.flush();
    if (!out)
        return Fail(ZooError::Code::IoError, std::format("Failed while writing {}", path.string()));

    spdlog::info("Report written to {} ({} bytes)", path.string(), payload.size());
    return {};
}

} // namespace ozzoo::report
