/// @file fwd.hpp
/// @brief Forward declarations for stockpile_inventory module

#pragma once

#include <cstdint>
#include <functional>

namespace stockpile_inventory {

// =============================================================================
// Handle Types
// =============================================================================

/// @brief Identifier of a catalog item as written in the input files
struct ItemId {
    std::uint32_t value{0};
    bool operator==(const ItemId&) const = default;
    bool operator!=(const ItemId&) const = default;
};

// =============================================================================
// Forward Declarations - Items
// =============================================================================

struct Item;
struct ItemStack;
class Catalog;

// =============================================================================
// Forward Declarations - Requests
// =============================================================================

struct InventoryMarker;
struct StackRequest;
struct OtherLine;
struct ResolvedRequest;

// =============================================================================
// Forward Declarations - Storage
// =============================================================================

struct StoredStack;
class Inventory;
struct AuditEntry;
class AuditLog;
struct LoggedInventory;
struct ProcessOptions;

} // namespace stockpile_inventory

// =============================================================================
// Hash Specializations
// =============================================================================

namespace std {

template<>
struct hash<stockpile_inventory::ItemId> {
    std::size_t operator()(const stockpile_inventory::ItemId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.value);
    }
};

} // namespace std
