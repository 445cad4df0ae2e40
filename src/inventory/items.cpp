/// @file items.cpp
/// @brief Item catalog implementation for stockpile_inventory module

#include <stockpile/inventory/items.hpp>

#include <algorithm>
#include <unordered_map>

namespace stockpile_inventory {

// =============================================================================
// Catalog Implementation
// =============================================================================

Catalog::Catalog(std::vector<Item> items)
    : m_items(std::move(items)) {
}

const Item* Catalog::find(ItemId id) const {
    auto it = std::find_if(m_items.begin(), m_items.end(),
        [id](const Item& item) { return item.id == id; });
    return it != m_items.end() ? &*it : nullptr;
}

std::size_t Catalog::duplicate_id_count() const {
    std::unordered_map<ItemId, std::size_t> counts;
    for (const auto& item : m_items) {
        ++counts[item.id];
    }
    return static_cast<std::size_t>(std::count_if(counts.begin(), counts.end(),
        [](const auto& entry) { return entry.second > 1; }));
}

} // namespace stockpile_inventory
