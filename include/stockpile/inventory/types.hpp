/// @file types.hpp
/// @brief Core types and enumerations for stockpile_inventory module

#pragma once

#include "fwd.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>

namespace stockpile_inventory {

// =============================================================================
// Classified Input Lines
// =============================================================================

/// @brief Starts a new inventory with the given capacity
struct InventoryMarker {
    std::int64_t capacity{0};
    bool operator==(const InventoryMarker&) const = default;
};

/// @brief Asks to store `quantity` units of item `item_id` as one stack
struct StackRequest {
    ItemId item_id;
    std::uint32_t quantity{0};
    bool operator==(const StackRequest&) const = default;
};

/// @brief Any line that is neither a marker nor a stack request
struct OtherLine {
    std::string text;
    bool operator==(const OtherLine&) const = default;
};

/// @brief One line of the inventories file, tagged by kind. Order is significant.
using ClassifiedLine = std::variant<InventoryMarker, StackRequest, OtherLine>;

inline bool is_marker(const ClassifiedLine& line) {
    return std::holds_alternative<InventoryMarker>(line);
}

// =============================================================================
// Storage Outcomes
// =============================================================================

/// @brief Result of offering one stack to an inventory
enum class StoreOutcome : std::uint8_t {
    Stored,         ///< Whole stack accepted
    Discarded,      ///< Stack did not fit, inventory unchanged
    Unresolved      ///< Item id unknown to the catalog (only when reporting is enabled)
};

inline std::string_view outcome_label(StoreOutcome outcome) {
    switch (outcome) {
        case StoreOutcome::Stored: return "Stored";
        case StoreOutcome::Discarded: return "Discarded";
        case StoreOutcome::Unresolved: return "Unresolved";
    }
    return "Unknown";
}

// =============================================================================
// Callbacks
// =============================================================================

/// @brief Capacity units occupied by `quantity` units of an item
using SizePolicy = std::function<std::int64_t(const Item&, std::uint32_t quantity)>;

} // namespace stockpile_inventory
