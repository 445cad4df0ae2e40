/// @file report.cpp
/// @brief Report rendering for stockpile_inventory module

#include <stockpile/inventory/report.hpp>

#include <spdlog/fmt/fmt.h>

#include <ostream>

namespace stockpile_inventory {

void render_processing_log(std::ostream& os, const std::vector<LoggedInventory>& logged) {
    os << "Processing Log:\n";
    for (const auto& entry : logged) {
        for (const auto& line : entry.log) {
            os << line.to_string() << '\n';
        }
    }
}

void render_item_list(std::ostream& os, const Catalog& catalog) {
    os << "Item List:\n";
    for (const auto& item : catalog) {
        os << fmt::format("  {:>2} {}\n", item.id.value, item.name);
    }
}

void render_storage_summary(std::ostream& os, const std::vector<LoggedInventory>& logged) {
    os << "Storage Summary:\n";
    for (const auto& entry : logged) {
        os << entry.inventory << '\n';
    }
}

void render_report(std::ostream& os, const Catalog& catalog, const std::vector<LoggedInventory>& logged) {
    render_processing_log(os, logged);
    os << '\n';
    render_item_list(os, catalog);
    os << '\n';
    render_storage_summary(os, logged);
}

} // namespace stockpile_inventory
