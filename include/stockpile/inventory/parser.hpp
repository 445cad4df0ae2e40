/// @file parser.hpp
/// @brief Readers for the item catalog and inventories files
///
/// Items file: one `<id> <name>` per line. Blank lines and lines starting
/// with '#' are skipped; anything else that does not match is an error.
///
/// Inventories file: `# <capacity>` starts an inventory, `- <id> <quantity>`
/// requests a stack, every other line is kept as OtherLine.

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "items.hpp"

#include <stockpile/core/error.hpp>

#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stockpile_inventory::parser {

/// @brief Parse one catalog line, nullopt if it is not `<id> <name>`
std::optional<Item> parse_item_line(std::string_view line);

/// @brief Classify one inventories line
ClassifiedLine classify_line(std::string_view line);

/// @brief Read a whole catalog
stockpile_core::Result<Catalog> read_items(std::istream& in);

/// @brief Read and classify every line of an inventories file
stockpile_core::Result<std::vector<ClassifiedLine>> read_inventory_lines(std::istream& in);

/// @brief Open `path` and hand the stream to `reader`.
///
/// Errors coming back from the reader get the path attached as context.
template<typename Reader>
auto read_from_file(const std::filesystem::path& path, Reader&& reader)
    -> decltype(reader(std::declval<std::istream&>()))
{
    using ResultType = decltype(reader(std::declval<std::istream&>()));

    std::ifstream in(path);
    if (!in) {
        return ResultType(stockpile_core::Error(stockpile_core::InputError::open_failed(path.string())));
    }

    auto result = reader(in);
    if (result.is_err()) {
        result.error().with_context("path", path.string());
    }
    return result;
}

} // namespace stockpile_inventory::parser
