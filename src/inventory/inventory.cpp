/// @file inventory.cpp
/// @brief Capacity enforcement for stockpile_inventory module

#include <stockpile/inventory/inventory.hpp>

#include <stockpile/core/log.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <ostream>

namespace stockpile_inventory {

// =============================================================================
// Size Policies
// =============================================================================

SizePolicy quantity_size_policy() {
    return [](const Item&, std::uint32_t quantity) -> std::int64_t {
        return static_cast<std::int64_t>(quantity);
    };
}

SizePolicy stack_size_policy() {
    return [](const Item&, std::uint32_t) -> std::int64_t {
        return 1;
    };
}

stockpile_core::Result<SizePolicy> size_policy_from_name(const std::string& name) {
    if (name == "quantity") {
        return stockpile_core::Ok(quantity_size_policy());
    }
    if (name == "stack") {
        return stockpile_core::Ok(stack_size_policy());
    }
    return stockpile_core::Err<SizePolicy>(
        stockpile_core::ConfigError::unknown_option("stack.size_policy", name));
}

// =============================================================================
// Inventory Implementation
// =============================================================================

Inventory::Inventory(std::int64_t capacity, SizePolicy size_policy)
    : m_capacity(capacity)
    , m_size_policy(size_policy ? std::move(size_policy) : quantity_size_policy()) {
}

std::uint64_t Inventory::quantity_of(ItemId id) const {
    auto it = std::find_if(m_stacks.begin(), m_stacks.end(),
        [id](const StoredStack& stored) { return stored.item->id == id; });
    return it != m_stacks.end() ? it->quantity : 0;
}

std::int64_t Inventory::size_of(const ItemStack& stack) const {
    if (!stack.item) {
        return 0;
    }
    return m_size_policy(*stack.item, stack.quantity);
}

bool Inventory::can_fit(const ItemStack& stack) const {
    if (!stack.item) {
        return false;
    }

    std::int64_t incoming = size_of(stack);
    if (incoming < 0) {
        return false;
    }

    // occupancy <= capacity whenever capacity >= 0, and 0 otherwise,
    // so the subtraction cannot overflow
    return incoming <= m_capacity - m_occupancy;
}

bool Inventory::add_items(const ItemStack& stack) {
    if (!stack.item) {
        return false;
    }
    return store(stack, size_of(stack));
}

bool Inventory::store(const ItemStack& stack, std::int64_t size) {
    if (!stack.item) {
        return false;
    }

    if (size < 0) {
        stockpile_core::inventory_logger()->warn(
            "Size policy returned {} for '{}', stack rejected", size, stack.name());
        return false;
    }

    if (size > m_capacity - m_occupancy) {
        return false;
    }

    m_occupancy += size;

    auto it = std::find_if(m_stacks.begin(), m_stacks.end(),
        [&stack](const StoredStack& stored) { return stored.item->id == stack.id(); });
    if (it != m_stacks.end()) {
        it->quantity += stack.quantity;
        it->size += size;
    } else {
        m_stacks.push_back(StoredStack{stack.item, stack.quantity, size});
    }

    return true;
}

std::ostream& operator<<(std::ostream& os, const Inventory& inventory) {
    os << fmt::format(" -Used {:>2} of {:>2}\n", inventory.occupancy(), inventory.capacity());
    for (const auto& stored : inventory.stacks()) {
        os << fmt::format("  ({:>2}) {}\n", stored.quantity, stored.item->name);
    }
    return os;
}

} // namespace stockpile_inventory
