#include "rebootto/entry_matcher.hpp"
#include "rebootto/entry_parser.hpp"

#include <algorithm>

namespace rebootto {

std::optional<BootEntry> lookup(const BootCatalog& catalog, std::string_view query) {
    const auto& entries = catalog.entries;

    if (auto id = parse_u16(query)) {
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&](const BootEntry& e) { return e.id == *id; });
        if (it == entries.end()) return std::nullopt;
        return *it;
    }

    auto it = std::find_if(entries.begin(), entries.end(), [&](const BootEntry& e) {
        return std::string_view(e.name).starts_with(query);
    });
    if (it == entries.end()) return std::nullopt;
    return *it;
}

} // namespace rebootto
