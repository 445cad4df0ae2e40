// stockpile_inventory capacity engine tests

#include <catch2/catch_test_macros.hpp>
#include <stockpile/inventory/inventory.hpp>

#include <limits>
#include <sstream>

using namespace stockpile_inventory;

namespace {

Catalog make_catalog() {
    return Catalog({{ItemId{1}, "Torch"}, {ItemId{2}, "Rope"}, {ItemId{3}, "Arrow"}});
}

} // namespace

TEST_CASE("Inventory construction", "[inventory][capacity]") {
    Inventory inventory(10);

    REQUIRE(inventory.capacity() == 10);
    REQUIRE(inventory.occupancy() == 0);
    REQUIRE(inventory.available() == 10);
    REQUIRE(inventory.empty());
    REQUIRE_FALSE(inventory.full());
}

TEST_CASE("Inventory add_items", "[inventory][capacity]") {
    Catalog catalog = make_catalog();
    Inventory inventory(5);

    SECTION("stack that fits is stored") {
        REQUIRE(inventory.add_items(ItemStack(catalog[0], 3)));
        REQUIRE(inventory.occupancy() == 3);
        REQUIRE(inventory.stack_count() == 1);
        REQUIRE(inventory.quantity_of(ItemId{1}) == 3);
    }

    SECTION("exact fit is stored") {
        REQUIRE(inventory.add_items(ItemStack(catalog[0], 5)));
        REQUIRE(inventory.occupancy() == 5);
        REQUIRE(inventory.full());
        REQUIRE(inventory.available() == 0);
    }

    SECTION("stack that does not fit leaves inventory untouched") {
        REQUIRE(inventory.add_items(ItemStack(catalog[0], 3)));
        REQUIRE_FALSE(inventory.add_items(ItemStack(catalog[1], 3)));
        REQUIRE(inventory.occupancy() == 3);
        REQUIRE(inventory.stack_count() == 1);
        REQUIRE(inventory.quantity_of(ItemId{2}) == 0);
    }

    SECTION("a later smaller stack can still fit") {
        REQUIRE(inventory.add_items(ItemStack(catalog[0], 3)));
        REQUIRE_FALSE(inventory.add_items(ItemStack(catalog[1], 4)));
        REQUIRE(inventory.add_items(ItemStack(catalog[2], 2)));
        REQUIRE(inventory.occupancy() == 5);
    }

    SECTION("stacks are never split") {
        REQUIRE_FALSE(inventory.add_items(ItemStack(catalog[0], 6)));
        REQUIRE(inventory.empty());
        REQUIRE(inventory.occupancy() == 0);
    }

    SECTION("zero quantity always fits") {
        REQUIRE(inventory.add_items(ItemStack(catalog[0], 5)));
        REQUIRE(inventory.add_items(ItemStack(catalog[1], 0)));
        REQUIRE(inventory.occupancy() == 5);
    }

    SECTION("same item is merged") {
        REQUIRE(inventory.add_items(ItemStack(catalog[0], 2)));
        REQUIRE(inventory.add_items(ItemStack(catalog[0], 2)));
        REQUIRE(inventory.stack_count() == 1);
        REQUIRE(inventory.quantity_of(ItemId{1}) == 4);
        REQUIRE(inventory.stacks()[0].size == 4);
    }

    SECTION("empty stack is rejected") {
        REQUIRE_FALSE(inventory.add_items(ItemStack{}));
        REQUIRE_FALSE(inventory.can_fit(ItemStack{}));
    }
}

TEST_CASE("Inventory occupancy never exceeds capacity", "[inventory][capacity]") {
    Catalog catalog = make_catalog();
    Inventory inventory(17);

    for (std::uint32_t quantity : {4u, 9u, 1u, 7u, 3u, 12u, 2u, 5u}) {
        std::int64_t before = inventory.occupancy();
        bool fits = inventory.can_fit(ItemStack(catalog[0], quantity));
        bool stored = inventory.add_items(ItemStack(catalog[0], quantity));

        REQUIRE(fits == stored);
        REQUIRE(inventory.occupancy() <= inventory.capacity());
        REQUIRE(inventory.occupancy() == before + (stored ? quantity : 0));
    }
}

TEST_CASE("Inventory capacity edge cases", "[inventory][capacity]") {
    Catalog catalog = make_catalog();

    SECTION("zero capacity only takes empty stacks") {
        Inventory inventory(0);
        REQUIRE_FALSE(inventory.add_items(ItemStack(catalog[0], 1)));
        REQUIRE(inventory.add_items(ItemStack(catalog[0], 0)));
        REQUIRE(inventory.occupancy() == 0);
    }

    SECTION("negative capacity accepts nothing") {
        Inventory inventory(-3);
        REQUIRE_FALSE(inventory.add_items(ItemStack(catalog[0], 0)));
        REQUIRE_FALSE(inventory.add_items(ItemStack(catalog[0], 1)));
        REQUIRE(inventory.available() == 0);
        REQUIRE(inventory.empty());
    }

    SECTION("extreme capacities do not overflow") {
        Inventory huge(std::numeric_limits<std::int64_t>::max());
        REQUIRE(huge.add_items(ItemStack(catalog[0], std::numeric_limits<std::uint32_t>::max())));

        Inventory tiny(std::numeric_limits<std::int64_t>::min());
        REQUIRE_FALSE(tiny.add_items(ItemStack(catalog[0], 1)));
    }
}

TEST_CASE("Size policies", "[inventory][capacity]") {
    Catalog catalog = make_catalog();

    SECTION("stack policy counts stacks") {
        Inventory inventory(2, stack_size_policy());
        REQUIRE(inventory.add_items(ItemStack(catalog[0], 50)));
        REQUIRE(inventory.add_items(ItemStack(catalog[1], 50)));
        REQUIRE_FALSE(inventory.add_items(ItemStack(catalog[2], 1)));
        REQUIRE(inventory.occupancy() == 2);
    }

    SECTION("custom policy") {
        SizePolicy weighted = [](const Item& item, std::uint32_t quantity) -> std::int64_t {
            return item.id == ItemId{2} ? 2 * static_cast<std::int64_t>(quantity) : quantity;
        };
        Inventory inventory(10, weighted);
        REQUIRE(inventory.size_of(ItemStack(catalog[1], 3)) == 6);
        REQUIRE(inventory.add_items(ItemStack(catalog[1], 3)));
        REQUIRE_FALSE(inventory.add_items(ItemStack(catalog[1], 3)));
        REQUIRE(inventory.add_items(ItemStack(catalog[0], 4)));
        REQUIRE(inventory.occupancy() == 10);
    }

    SECTION("negative size is rejected") {
        SizePolicy broken = [](const Item&, std::uint32_t) -> std::int64_t { return -1; };
        Inventory inventory(10, broken);
        REQUIRE_FALSE(inventory.can_fit(ItemStack(catalog[0], 1)));
        REQUIRE_FALSE(inventory.add_items(ItemStack(catalog[0], 1)));
        REQUIRE(inventory.occupancy() == 0);
    }

    SECTION("empty policy falls back to quantity") {
        Inventory inventory(10, SizePolicy{});
        REQUIRE(inventory.size_of(ItemStack(catalog[0], 4)) == 4);
    }

    SECTION("lookup by name") {
        REQUIRE(size_policy_from_name("quantity").is_ok());
        REQUIRE(size_policy_from_name("stack").is_ok());

        auto result = size_policy_from_name("weight");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == stockpile_core::ErrorCode::ValidationError);
    }
}

TEST_CASE("Inventory display", "[inventory][capacity]") {
    Catalog catalog = make_catalog();
    Inventory inventory(10);
    REQUIRE(inventory.add_items(ItemStack(catalog[0], 3)));
    REQUIRE(inventory.add_items(ItemStack(catalog[1], 4)));

    std::ostringstream out;
    out << inventory;
    REQUIRE(out.str() == " -Used  7 of 10\n  ( 3) Torch\n  ( 4) Rope\n");
}

TEST_CASE("Inventory store charges the given size", "[inventory][capacity]") {
    Catalog catalog = make_catalog();
    Inventory inventory(5);

    REQUIRE(inventory.store(ItemStack(catalog[0], 10), 2));
    REQUIRE(inventory.occupancy() == 2);
    REQUIRE(inventory.quantity_of(ItemId{1}) == 10);
    REQUIRE_FALSE(inventory.store(ItemStack(catalog[1], 1), 4));
    REQUIRE_FALSE(inventory.store(ItemStack(catalog[1], 1), -1));
    REQUIRE(inventory.occupancy() == 2);
}
