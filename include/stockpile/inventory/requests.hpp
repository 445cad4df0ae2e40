/// @file requests.hpp
/// @brief Request processing pipeline for stockpile_inventory module
///
/// Turns the classified lines of an inventories file into filled inventories:
/// segment at markers, allocate one inventory per marker, resolve stack
/// requests against the catalog, then offer each stack to its inventory and
/// record the outcome.

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "items.hpp"
#include "inventory.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace stockpile_inventory {

/// @brief Contiguous run of lines between two markers
using Segment = std::span<const ClassifiedLine>;

// =============================================================================
// Segmenter / Allocator / Resolver
// =============================================================================

/// @brief Split at every marker, excluding the markers themselves.
///
/// The first segment is everything before the first marker (the preamble).
/// With N markers the result always has N + 1 segments.
std::vector<Segment> segment_requests(std::span<const ClassifiedLine> lines);

/// @brief One inventory per marker, in marker order
std::vector<Inventory> allocate_inventories(std::span<const ClassifiedLine> lines,
                                            const SizePolicy& size_policy = quantity_size_policy());

/// @brief A stack request together with its catalog match, if any
struct ResolvedRequest {
    StackRequest request;
    std::optional<ItemStack> stack;

    bool resolved() const { return stack.has_value(); }
};

/// @brief Every stack request of a segment, in order, resolved or not
std::vector<ResolvedRequest> resolve_requests(const Catalog& catalog, Segment segment);

/// @brief Stacks for the requests whose item id is in the catalog; others are dropped
std::vector<ItemStack> resolve_stacks(const Catalog& catalog, Segment segment);

// =============================================================================
// Audit Log
// =============================================================================

/// @brief Outcome of one stack decision
struct AuditEntry {
    StoreOutcome outcome{StoreOutcome::Stored};
    std::int64_t size{0};
    std::string item_name;

    /// @brief Fixed-width line, e.g. "Stored    ( 3) Torch"
    std::string to_string() const;
};

/// @brief Ordered record of every decision made for one inventory
class AuditLog {
public:
    /// @brief Offer `stack` to `inventory` and record what happened.
    /// The size policy runs once; the logged size is the size charged.
    /// @return true when the stack was stored
    bool record(Inventory& inventory, const ItemStack& stack);

    /// @brief Record a request whose item id is not in the catalog
    void record_unresolved(const StackRequest& request);

    const std::vector<AuditEntry>& entries() const { return m_entries; }
    std::size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    std::size_t count(StoreOutcome outcome) const;

    /// @brief Entries rendered with AuditEntry::to_string
    std::vector<std::string> lines() const;

    auto begin() const { return m_entries.begin(); }
    auto end() const { return m_entries.end(); }

private:
    std::vector<AuditEntry> m_entries;
};

// =============================================================================
// Orchestrator
// =============================================================================

/// @brief An inventory after processing, with the log of how it was filled
struct LoggedInventory {
    AuditLog log;
    Inventory inventory;
};

/// @brief Knobs for process_inventory_requests
struct ProcessOptions {
    SizePolicy size_policy = quantity_size_policy();
    bool report_unresolved{false};  ///< Emit "Unresolved" entries instead of dropping silently
};

/// @brief Run the whole pipeline. Output has exactly one entry per marker, in marker order.
std::vector<LoggedInventory> process_inventory_requests(std::span<const ClassifiedLine> lines,
                                                        const Catalog& catalog,
                                                        const ProcessOptions& options = {});

} // namespace stockpile_inventory
