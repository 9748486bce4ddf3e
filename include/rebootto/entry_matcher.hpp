#pragma once
#include "rebootto/types.hpp"

#include <optional>
#include <string_view>

namespace rebootto {

/**
 * Resolves a DEST specifier against a catalog.
 * - A query that is a full uint16 matches the first entry with that id only.
 * - Anything else matches the first entry whose name starts with the query
 *   (case-sensitive).
 */
std::optional<BootEntry> lookup(const BootCatalog& catalog, std::string_view query);

} // namespace rebootto
