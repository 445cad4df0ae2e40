/// @file requests.cpp
/// @brief Request processing pipeline implementation for stockpile_inventory module

#include <stockpile/inventory/requests.hpp>

#include <stockpile/core/log.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace stockpile_inventory {

// =============================================================================
// Segmenter
// =============================================================================

std::vector<Segment> segment_requests(std::span<const ClassifiedLine> lines) {
    std::vector<Segment> segments;

    std::size_t start = 0;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (is_marker(lines[i])) {
            segments.push_back(lines.subspan(start, i - start));
            start = i + 1;
        }
    }
    segments.push_back(lines.subspan(start));

    return segments;
}

// =============================================================================
// Allocator
// =============================================================================

std::vector<Inventory> allocate_inventories(std::span<const ClassifiedLine> lines,
                                            const SizePolicy& size_policy) {
    std::vector<Inventory> inventories;
    for (const auto& line : lines) {
        if (const auto* marker = std::get_if<InventoryMarker>(&line)) {
            inventories.emplace_back(marker->capacity, size_policy);
        }
    }
    return inventories;
}

// =============================================================================
// Resolver
// =============================================================================

std::vector<ResolvedRequest> resolve_requests(const Catalog& catalog, Segment segment) {
    std::vector<ResolvedRequest> resolved;
    for (const auto& line : segment) {
        const auto* request = std::get_if<StackRequest>(&line);
        if (!request) {
            continue;
        }

        ResolvedRequest entry{*request, std::nullopt};
        if (const Item* item = catalog.find(request->item_id)) {
            entry.stack = ItemStack(*item, request->quantity);
        }
        resolved.push_back(std::move(entry));
    }
    return resolved;
}

std::vector<ItemStack> resolve_stacks(const Catalog& catalog, Segment segment) {
    std::vector<ItemStack> stacks;
    for (const auto& entry : resolve_requests(catalog, segment)) {
        if (entry.stack) {
            stacks.push_back(*entry.stack);
        } else {
            stockpile_core::inventory_logger()->debug(
                "Dropping request for unknown item id {} (quantity {})",
                entry.request.item_id.value, entry.request.quantity);
        }
    }
    return stacks;
}

// =============================================================================
// Audit Log
// =============================================================================

std::string AuditEntry::to_string() const {
    return fmt::format("{:<9} ({:>2}) {}", outcome_label(outcome), size, item_name);
}

bool AuditLog::record(Inventory& inventory, const ItemStack& stack) {
    std::int64_t size = inventory.size_of(stack);
    bool stored = inventory.store(stack, size);

    m_entries.push_back(AuditEntry{
        stored ? StoreOutcome::Stored : StoreOutcome::Discarded,
        size,
        stack.name()});

    stockpile_core::inventory_logger()->trace("{} -> occupancy {}/{}",
        m_entries.back().to_string(), inventory.occupancy(), inventory.capacity());

    return stored;
}

void AuditLog::record_unresolved(const StackRequest& request) {
    m_entries.push_back(AuditEntry{
        StoreOutcome::Unresolved,
        static_cast<std::int64_t>(request.quantity),
        fmt::format("#{}", request.item_id.value)});
}

std::size_t AuditLog::count(StoreOutcome outcome) const {
    return static_cast<std::size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [outcome](const AuditEntry& entry) { return entry.outcome == outcome; }));
}

std::vector<std::string> AuditLog::lines() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        result.push_back(entry.to_string());
    }
    return result;
}

// =============================================================================
// Orchestrator
// =============================================================================

std::vector<LoggedInventory> process_inventory_requests(std::span<const ClassifiedLine> lines,
                                                        const Catalog& catalog,
                                                        const ProcessOptions& options) {
    auto logger = stockpile_core::inventory_logger();

    std::vector<Segment> segments = segment_requests(lines);
    std::vector<Inventory> inventories = allocate_inventories(lines, options.size_policy);

    // Drop the preamble, then pair positionally, truncating to the shorter side
    std::span<const Segment> payload = std::span<const Segment>(segments).subspan(1);
    std::size_t pair_count = std::min(inventories.size(), payload.size());

    logger->debug("Processing {} lines: {} inventories, {} preamble lines ignored",
        lines.size(), inventories.size(), segments.front().size());

    std::vector<LoggedInventory> logged;
    logged.reserve(pair_count);

    for (std::size_t i = 0; i < pair_count; ++i) {
        Inventory& inventory = inventories[i];
        AuditLog log;

        if (options.report_unresolved) {
            for (const auto& entry : resolve_requests(catalog, payload[i])) {
                if (entry.stack) {
                    log.record(inventory, *entry.stack);
                } else {
                    log.record_unresolved(entry.request);
                }
            }
        } else {
            for (const auto& stack : resolve_stacks(catalog, payload[i])) {
                log.record(inventory, stack);
            }
        }

        logger->debug("Inventory {}: {} stored, {} discarded, occupancy {}/{}",
            i + 1, log.count(StoreOutcome::Stored), log.count(StoreOutcome::Discarded),
            inventory.occupancy(), inventory.capacity());

        logged.push_back(LoggedInventory{std::move(log), std::move(inventory)});
    }

    return logged;
}

} // namespace stockpile_inventory
