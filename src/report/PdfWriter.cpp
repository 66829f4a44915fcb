#include "ozzoo/report/PdfWriter.h"

#include <cstdio>
#include <string>
#include <utility>

namespace ozzoo::report {

namespace {

std::string Fixed(float v)
{
    char buf[32]{};
    std::snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(v));
    return buf;
}

} // namespace

PdfWriter::PdfWriter(const PdfPageSetup& setup)
    : m_setup(setup)
{
    const float usable = m_setup.height - 2.0f * m_setup.margin;
    if (m_setup.leading > 0.0f && usable > m_setup.leading)
        m_linesPerPage = static_cast<std::size_t>(usable / m_setup.leading);
    m_pages.emplace_back();
}

void PdfWriter::addLine(std::string_view text)
{
    if (m_pages.back().size() >= m_linesPerPage)
        m_pages.emplace_back();
    m_pages.back().emplace_back(text);
}

void PdfWriter::pageBreak()
{
    if (!m_pages.back().empty())
        m_pages.emplace_back();
}

std::string PdfWriter::EscapeText(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (const char c : text)
    {
        const auto u = static_cast<unsigned char>(c);
        if (c == '(' || c == ')' || c == '\\')
        {
            out.push_back('\\');
            out.push_back(c);
        }
        else if (u < 0x20 || u > 0x7E)
        {
            out.push_back('?');
        }
        else
        {
            out.push_back(c);
        }
    }
    return out;
}

std::string PdfWriter::pageContent(const std::vector<std::string>& lines) const
{
    std::string s;
    s += "BT\n/F1 " + Fixed(m_setup.fontSize) + " Tf\n";
    s += Fixed(m_setup.leading) + " TL\n";
    s += Fixed(m_setup.margin) + " " + Fixed(m_setup.height - m_setup.margin) + " Td\n";
    for (const std::string& line : lines)
        s += "(" + EscapeText(line) + ") '\n";
    s += "ET\n";
    return s;
}

std::string PdfWriter::build() const
{
    // Object layout:
    //   1 catalog, 2 page tree, 3 font, 4 info,
    //   then per page: page object, content stream.
    const std::size_t pageCount = m_pages.size();
    const std::size_t objectCount = 4 + 2 * pageCount;

    std::string out = "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";
    std::vector<std::size_t> offsets(objectCount + 1, 0);

    const auto beginObject = [&](std::size_t id) {
        offsets[id] = out.size();
        out += std::to_string(id) + " 0 obj\n";
    };
    const auto endObject = [&] { out += "endobj\n"; };

    beginObject(1);
    out += "<< /Type /Catalog /Pages 2 0 R >>\n";
    endObject();

    beginObject(2);
    out += "<< /Type /Pages /Kids [";
    for (std::size_t p = 0; p < pageCount; ++p)
        out += std::to_string(5 + 2 * p) + " 0 R ";
    out += "] /Count " + std::to_string(pageCount) + " >>\n";
    endObject();

    beginObject(3);
    out += "<< /Type /Font /Subtype /Type1 /BaseFont /Courier /Encoding /WinAnsiEncoding >>\n";
    endObject();

    beginObject(4);
    out += "<< /Title (" + EscapeText(m_title) + ") /Producer (OzZoo) >>\n";
    endObject();

    for (std::size_t p = 0; p < pageCount; ++p)
    {
        const std::size_t pageId = 5 + 2 * p;
        const std::size_t contentId = pageId + 1;
        const std::string content = pageContent(m_pages[p]);

        beginObject(pageId);
        out += "<< /Type /Page /Parent 2 0 R /MediaBox [0 0 " + Fixed(m_setup.width) + " " +
               Fixed(m_setup.height) + "] /Resources << /Font << /F1 3 0 R >> >> /Contents " +
               std::to_string(contentId) + " 0 R >>\n";
        endObject();

        beginObject(contentId);
        out += "<< /Length " + std::to_string(content.size()) + " >>\nstream\n";
        out += content;
        out += "endstream\n";
        endObject();
    }

    const std::size_t xrefOffset = out.size();
    out += "xref\n0 " + std::to_string(objectCount + 1) + "\n";
    out += "0000000000 65535 f \n";
    for (std::size_t id = 1; id <= objectCount; ++id)
    {
        char entry[24]{};
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offsets[id]);
        out += entry;
    }

    out += "trailer\n<< /Size " + std::to_string(objectCount + 1) + " /Root 1 0 R /Info 4 0 R >>\n";
    out += "startxref\n" + std::to_string(xrefOffset) + "\n%%EOF\n";
    return out;
}

} // namespace ozzoo::report
