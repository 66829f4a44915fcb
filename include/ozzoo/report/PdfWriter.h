#pragma once
// include/ozzoo/report/PdfWriter.h
//
// Minimal PDF 1.4 emitter: monospaced text pages, one built-in font
// (Courier), no compression. Enough for tabular reports.

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ozzoo::report {

struct PdfPageSetup
{
    float width      = 595.0f;   // A4 in points
    float height     = 842.0f;
    float margin     = 48.0f;
    float fontSize   = 9.0f;
    float leading    = 11.5f;
};

class PdfWriter
{
public:
    explicit PdfWriter(const PdfPageSetup& setup = {});

    void setTitle(std::string title) { m_title = std::move(title); }

    // Appends a line, starting a new page when the current one is full.
    void addLine(std::string_view text);
    void pageBreak();

    [[nodiscard]] std::size_t pageCount() const noexcept { return m_pages.size(); }
    [[nodiscard]] std::size_t linesPerPage() const noexcept { return m_linesPerPage; }

    // Serializes the whole document (header, objects, xref, trailer).
    [[nodiscard]] std::string build() const;

    // Escapes '(', ')' and '\' and replaces non-printable bytes with '?'.
    [[nodiscard]] static std::string EscapeText(std::string_view text);

private:
    [[nodiscard]] std::string pageContent(const std::vector<std::string>& lines) const;

    PdfPageSetup                          m_setup;
    std::size_t                           m_linesPerPage = 1;
    std::string                           m_title;
    std::vector<std::vector<std::string>> m_pages;
};

} // namespace ozzoo::report
