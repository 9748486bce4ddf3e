#pragma once
#include "rebootto/types.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace rebootto {

/**
 * Parses a full decimal uint16 ("0007" -> 7, "+7" -> 7). Anything else,
 * including an empty string, a '-' sign or an out of range value, yields
 * nullopt.
 */
std::optional<std::uint16_t> parse_u16(std::string_view s);

/**
 * EntryParser
 *
 * Turns efibootmgr listing text into a BootCatalog. Two independent passes
 * over the lines:
 * - "BootCurrent: <v>" / "BootNext: <v>" annotations. A value that is not a
 *   uint16 becomes 1.
 * - "Boot0003* name\t..." entries. Lines whose id overflows are skipped.
 *
 * Never throws on malformed input; it just finds less.
 */
class EntryParser {
public:
    BootCatalog parse(std::string_view raw) const;
};

} // namespace rebootto
