#pragma once
// include/ozzoo/report/ZooReport.h
//
// Snapshot report of a zoo: day, balance, enclosures, roster, inventory,
// recent transactions and the recent event log.

#include "ozzoo/sim/Zoo.h"
#include "ozzoo/sim/ZooError.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ozzoo::report {

enum class ReportFormat : std::uint8_t
{
    Text = 0,
    Pdf,
};

[[nodiscard]] Result<ReportFormat> ParseReportFormat(std::string_view text);
[[nodiscard]] const char* ReportExtension(ReportFormat f) noexcept;

struct ReportOptions
{
    std::size_t recentTransactions = 15;
    std::size_t recentEvents = 15;
};

// Plain lines shared by both renderers.
[[nodiscard]] std::vector<std::string> BuildReportLines(const Zoo& zoo, const ReportOptions& opts = {});

[[nodiscard]] std::string RenderTextReport(const Zoo& zoo, const ReportOptions& opts = {});
[[nodiscard]] std::string RenderPdfReport(const Zoo& zoo, const ReportOptions& opts = {});

// "ozzoo_report_day012.txt"
[[nodiscard]] std::filesystem::path DefaultReportPath(const Zoo& zoo, ReportFormat format);

// Fails with IoError when the file cannot be written.
[[nodiscard]] Status WriteReport(const Zoo& zoo, ReportFormat format, const std::filesystem::path& path,
                                 const ReportOptions& opts = {});

} // namespace ozzoo::report
