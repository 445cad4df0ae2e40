/// @file parser.cpp
/// @brief Catalog and inventories file readers for stockpile_inventory module

#include <stockpile/inventory/parser.hpp>

#include <stockpile/core/log.hpp>

#include <charconv>
#include <regex>

namespace stockpile_inventory::parser {

namespace {

const std::regex& item_pattern() {
    static const std::regex pattern(R"(^\s*(\d+)\s+(\S.*?)\s*$)");
    return pattern;
}

const std::regex& marker_pattern() {
    static const std::regex pattern(R"(^\s*#\s*(-?\d+)\s*$)");
    return pattern;
}

const std::regex& stack_pattern() {
    static const std::regex pattern(R"(^\s*-\s*(\d+)\s+(\d+)\s*$)");
    return pattern;
}

/// Convert a regex capture to an integer, nullopt on overflow
template<typename T>
std::optional<T> to_number(const std::ssub_match& match) {
    const std::string text = match.str();
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

bool is_blank_or_comment(std::string_view line) {
    auto first = line.find_first_not_of(" \t\r");
    return first == std::string_view::npos || line[first] == '#';
}

std::string strip_cr(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

} // anonymous namespace

std::optional<Item> parse_item_line(std::string_view line) {
    const std::string text(line);
    std::smatch match;
    if (!std::regex_match(text, match, item_pattern())) {
        return std::nullopt;
    }

    auto id = to_number<std::uint32_t>(match[1]);
    if (!id) {
        return std::nullopt;
    }

    return Item{ItemId{*id}, match[2].str()};
}

ClassifiedLine classify_line(std::string_view line) {
    const std::string text(line);
    std::smatch match;

    if (std::regex_match(text, match, marker_pattern())) {
        if (auto capacity = to_number<std::int64_t>(match[1])) {
            return InventoryMarker{*capacity};
        }
    } else if (std::regex_match(text, match, stack_pattern())) {
        auto id = to_number<std::uint32_t>(match[1]);
        auto quantity = to_number<std::uint32_t>(match[2]);
        if (id && quantity) {
            return StackRequest{ItemId{*id}, *quantity};
        }
    }

    return OtherLine{text};
}

stockpile_core::Result<Catalog> read_items(std::istream& in) {
    std::vector<Item> items;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        line = strip_cr(std::move(line));
        if (is_blank_or_comment(line)) {
            continue;
        }

        auto item = parse_item_line(line);
        if (!item) {
            return stockpile_core::Err<Catalog>(stockpile_core::InputError::malformed_line(line_no, line));
        }
        items.push_back(std::move(*item));
    }

    if (in.bad()) {
        return stockpile_core::Err<Catalog>(stockpile_core::InputError::read_failed());
    }

    Catalog catalog(std::move(items));
    if (auto duplicates = catalog.duplicate_id_count(); duplicates > 0) {
        stockpile_core::inventory_logger()->warn(
            "Catalog has {} duplicated item id(s); lookups use the first occurrence", duplicates);
    }
    return stockpile_core::Ok(std::move(catalog));
}

stockpile_core::Result<std::vector<ClassifiedLine>> read_inventory_lines(std::istream& in) {
    std::vector<ClassifiedLine> lines;
    std::string line;

    while (std::getline(in, line)) {
        lines.push_back(classify_line(strip_cr(std::move(line))));
    }

    if (in.bad()) {
        return stockpile_core::Err<std::vector<ClassifiedLine>>(
            stockpile_core::InputError::read_failed());
    }

    return stockpile_core::Ok(std::move(lines));
}

} // namespace stockpile_inventory::parser
