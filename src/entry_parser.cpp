#include "rebootto/entry_parser.hpp"
#include "rebootto/log.hpp"

#include <charconv>
#include <string>
#include <vector>

namespace rebootto {

namespace {

// Value used when BootCurrent/BootNext is present but unparseable.
// FIXME: this probably should leave the annotation unset instead.
constexpr std::uint16_t kUnparseableAnnotation = 1;

std::vector<std::string> split_lines(std::string_view raw) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= raw.size()) {
        std::size_t end = raw.find('\n', start);
        if (end == std::string_view::npos) end = raw.size();

        std::string_view line = raw.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);

        start = end + 1;
    }
    return lines;
}

bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

// "<Key>:<whitespace><value>", Key being letters only. Equivalent to
// ^([a-zA-Z]+):\s+(.*)$, linear in the line length.
bool match_annotation(std::string_view line, std::string_view& key, std::string_view& value) {
    std::size_t i = 0;
    while (i < line.size() && is_alpha(line[i])) ++i;
    if (i == 0 || i >= line.size() || line[i] != ':') return false;

    std::size_t j = i + 1;
    while (j < line.size() && is_space(line[j])) ++j;
    if (j == i + 1) return false;

    key = line.substr(0, i);
    value = line.substr(j);
    return true;
}

// "Boot0003* <name>\t...": optional letters, digits, '*', whitespace, then the
// name up to the first tab. Same matches as ^[a-zA-Z]*([0-9]+)\*\s+(.*?)\t.*$
bool match_entry(std::string_view line, std::string_view& digits, std::string_view& name) {
    std::size_t i = 0;
    while (i < line.size() && is_alpha(line[i])) ++i;

    const std::size_t d = i;
    while (i < line.size() && is_digit(line[i])) ++i;
    if (i == d || i >= line.size() || line[i] != '*') return false;

    const std::size_t ws = i + 1;
    std::size_t start = ws;
    while (start < line.size() && is_space(line[start])) ++start;
    if (start == ws) return false;

    std::size_t tab = line.find('\t', start);
    if (tab == std::string_view::npos) {
        // Only the whitespace run has a tab: the name is empty and the
        // separator is the last tab of the run.
        tab = line.rfind('\t', start - 1);
        if (tab == std::string_view::npos || tab <= ws) return false;
        start = tab;
    }

    digits = line.substr(d, i - d);
    name = line.substr(start, tab - start);
    return true;
}

} // namespace

std::optional<std::uint16_t> parse_u16(std::string_view s) {
    // One leading '+' is allowed, a lone sign is not.
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
        if (s.empty() || !is_digit(s.front())) return std::nullopt;
    }
    if (s.empty()) return std::nullopt;

    std::uint16_t value = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, value, 10);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

BootCatalog EntryParser::parse(std::string_view raw) const {
    BootCatalog catalog;
    const auto lines = split_lines(raw);

    for (const auto& line : lines) {
        std::string_view key;
        std::string_view value;
        if (!match_annotation(line, key, value)) continue;

        if (key == "BootCurrent") {
            catalog.current = parse_u16(value).value_or(kUnparseableAnnotation);
        } else if (key == "BootNext") {
            catalog.next = parse_u16(value).value_or(kUnparseableAnnotation);
        }
    }

    for (const auto& line : lines) {
        std::string_view digits;
        std::string_view name;
        if (!match_entry(line, digits, name)) continue;

        auto id = parse_u16(digits);
        if (!id) {
            Logger::verbose("Skipping boot entry with invalid id: %.*s",
                            static_cast<int>(digits.size()), digits.data());
            continue;
        }
        catalog.entries.push_back({*id, std::string(name)});
    }

    Logger::verbose("Parsed %zu boot entries", catalog.entries.size());
    return catalog;
}

} // namespace rebootto
