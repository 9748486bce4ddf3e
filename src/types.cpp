#include "rebootto/types.hpp"

namespace rebootto {

std::vector<std::string> BootCatalog::labels() const {
    std::vector<std::string> out;
    out.reserve(entries.size());

    for (const auto& e : entries) {
        std::string prefix = "     ";
        if (next && *next == e.id) {
            prefix = "nxt: ";
        } else if (current && *current == e.id) {
            prefix = "cur: ";
        }
        out.push_back(prefix + e.name);
    }
    return out;
}

void BootCatalog::print_list(std::ostream& out) const {
    for (const auto& e : entries) {
        out << e.id << " \t " << e.name << "\n";
    }
}

} // namespace rebootto
