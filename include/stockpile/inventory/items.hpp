/// @file items.hpp
/// @brief Items, the item catalog and item stacks for stockpile_inventory module

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stockpile_inventory {

// =============================================================================
// Item
// =============================================================================

/// @brief A known item: identifier plus display name
struct Item {
    ItemId id;
    std::string name;

    bool operator==(const Item&) const = default;
};

// =============================================================================
// Catalog
// =============================================================================

/// @brief Ordered, read-only registry of every known item.
///
/// Identifiers are not required to be unique. Lookups scan in insertion order
/// and return the first match, so a duplicate id later in the file is shadowed.
/// Items are never moved after construction; ItemStack and Inventory keep raw
/// pointers into the catalog, which must outlive them.
class Catalog {
public:
    Catalog() = default;
    explicit Catalog(std::vector<Item> items);

    /// @brief First item with the given id, or nullptr
    const Item* find(ItemId id) const;

    /// @brief Check if an item with the id exists
    bool contains(ItemId id) const { return find(id) != nullptr; }

    /// @brief Number of ids that occur more than once
    std::size_t duplicate_id_count() const;

    std::size_t size() const { return m_items.size(); }
    bool empty() const { return m_items.empty(); }

    const Item& operator[](std::size_t index) const { return m_items[index]; }
    const std::vector<Item>& items() const { return m_items; }

    auto begin() const { return m_items.begin(); }
    auto end() const { return m_items.end(); }

private:
    std::vector<Item> m_items;
};

// =============================================================================
// ItemStack
// =============================================================================

/// @brief A quantity of one catalog item, stored or discarded as a unit
struct ItemStack {
    const Item* item{nullptr};
    std::uint32_t quantity{0};

    ItemStack() = default;
    ItemStack(const Item& source, std::uint32_t count) : item(&source), quantity(count) {}

    const Item& get_item() const { return *item; }
    ItemId id() const { return item->id; }
    const std::string& name() const { return item->name; }
};

} // namespace stockpile_inventory
