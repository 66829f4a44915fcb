#pragma once
// include/ozzoo/util/Text.h

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ozzoo::util {

[[nodiscard]] inline std::string_view Trim(std::string_view s) noexcept
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

[[nodiscard]] inline std::string ToLower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Lower-case, trimmed, with '-' and ' ' folded to '_' ("Meaty Food" -> "meaty_food").
[[nodiscard]] inline std::string NormalizeKey(std::string_view s)
{
    std::string out = ToLower(Trim(s));
    std::replace(out.begin(), out.end(), '-', '_');
    std::replace(out.begin(), out.end(), ' ', '_');
    return out;
}

[[nodiscard]] inline std::vector<std::string_view> SplitWords(std::string_view s)
{
    std::vector<std::string_view> words;
    std::size_t i = 0;
    while (i < s.size())
    {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
            ++i;
        const std::size_t start = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i])))
            ++i;
        if (i > start)
            words.push_back(s.substr(start, i - start));
    }
    return words;
}

[[nodiscard]] inline std::optional<int> ParseInt(std::string_view sv) noexcept
{
    sv = Trim(sv);
    if (!sv.empty() && sv.front() == '+')
        sv.remove_prefix(1);
    int v = 0;
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(sv.data(), end, v);
    if (sv.empty() || ec != std::errc{} || ptr != end)
        return std::nullopt;
    return v;
}

} // namespace ozzoo::util
