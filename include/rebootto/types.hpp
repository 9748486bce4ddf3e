#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace rebootto {

struct BootEntry {
    std::uint16_t id = 0;
    std::string name;

    bool operator==(const BootEntry&) const = default;
};

struct BootCatalog {
    std::vector<BootEntry> entries;       // in order of appearance
    std::optional<std::uint16_t> current; // BootCurrent, may dangle
    std::optional<std::uint16_t> next;    // BootNext, may dangle

    // Row labels for the selection list: "nxt: ", "cur: " or five spaces,
    // followed by the entry name. BootNext wins over BootCurrent.
    std::vector<std::string> labels() const;

    // "<id> \t <name>" per entry.
    void print_list(std::ostream& out) const;
};

struct NoAction {
    bool operator==(const NoAction&) const = default;
};

struct RebootTo {
    BootEntry entry;
    bool operator==(const RebootTo&) const = default;
};

struct SetNext {
    BootEntry entry;
    bool operator==(const SetNext&) const = default;
};

using ChosenAction = std::variant<NoAction, RebootTo, SetNext>;

enum class KeyKind { Press, Repeat, Release };
enum class KeyCode { Char, Up, Down, Home, End, Enter, Esc, Other };

struct KeyEvent {
    KeyKind kind = KeyKind::Press;
    KeyCode code = KeyCode::Other;
    char ch = 0;       // valid when code == KeyCode::Char
    bool ctrl = false;
};

struct Config {
    std::string efibootmgr = "efibootmgr";
    std::string bootnext_flag = "--bootnext";
    std::vector<std::string> reboot_command{"shutdown", "-r", "now"};
    int poll_interval_ms = 16;
    std::string title = " Boot entries ";
};

} // namespace rebootto
