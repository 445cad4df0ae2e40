/// @file report.hpp
/// @brief Text report of a processing run

#pragma once

#include "fwd.hpp"
#include "items.hpp"
#include "requests.hpp"

#include <iosfwd>
#include <vector>

namespace stockpile_inventory {

/// @brief "Processing Log:" followed by every audit entry, inventory by inventory
void render_processing_log(std::ostream& os, const std::vector<LoggedInventory>& logged);

/// @brief "Item List:" followed by the catalog in file order
void render_item_list(std::ostream& os, const Catalog& catalog);

/// @brief "Storage Summary:" followed by the final state of each inventory
void render_storage_summary(std::ostream& os, const std::vector<LoggedInventory>& logged);

/// @brief All three sections, separated by blank lines
void render_report(std::ostream& os, const Catalog& catalog, const std::vector<LoggedInventory>& logged);

} // namespace stockpile_inventory
