/// @file inventory.hpp
/// @brief Capacity-bounded inventory for stockpile_inventory module

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "items.hpp"

#include <stockpile/core/error.hpp>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace stockpile_inventory {

// =============================================================================
// Size Policies
// =============================================================================

/// @brief Stack size equals its quantity
SizePolicy quantity_size_policy();

/// @brief Every stack occupies one unit, so capacity counts stacks
SizePolicy stack_size_policy();

/// @brief Look up a built-in policy by name ("quantity" or "stack")
stockpile_core::Result<SizePolicy> size_policy_from_name(const std::string& name);

// =============================================================================
// StoredStack
// =============================================================================

/// @brief Accepted stacks of one item, merged
struct StoredStack {
    const Item* item{nullptr};
    std::uint64_t quantity{0};
    std::int64_t size{0};       ///< Capacity units charged for this item
};

// =============================================================================
// Inventory
// =============================================================================

/// @brief Container with a fixed capacity that accepts whole stacks only.
///
/// Occupancy is the sum of the sizes of every accepted stack and never exceeds
/// the capacity. Nothing is ever removed, so occupancy only grows.
class Inventory {
public:
    explicit Inventory(std::int64_t capacity, SizePolicy size_policy = quantity_size_policy());

    // Capacity
    std::int64_t capacity() const { return m_capacity; }
    std::int64_t occupancy() const { return m_occupancy; }
    std::int64_t available() const { return m_capacity > m_occupancy ? m_capacity - m_occupancy : 0; }
    bool full() const { return m_occupancy >= m_capacity; }
    bool empty() const { return m_stacks.empty(); }

    // Contents
    const std::vector<StoredStack>& stacks() const { return m_stacks; }
    std::size_t stack_count() const { return m_stacks.size(); }
    std::uint64_t quantity_of(ItemId id) const;

    /// @brief Capacity units `stack` would occupy
    std::int64_t size_of(const ItemStack& stack) const;

    /// @brief Check if `stack` would be accepted right now
    bool can_fit(const ItemStack& stack) const;

    /// @brief Store the whole stack if it fits.
    /// @return true when stored; false leaves the inventory untouched
    bool add_items(const ItemStack& stack);

    /// @brief Store the whole stack charging a size already computed with size_of.
    /// A negative size is rejected.
    bool store(const ItemStack& stack, std::int64_t size);

private:
    std::int64_t m_capacity;
    std::int64_t m_occupancy{0};
    SizePolicy m_size_policy;
    std::vector<StoredStack> m_stacks;
};

std::ostream& operator<<(std::ostream& os, const Inventory& inventory);

} // namespace stockpile_inventory
