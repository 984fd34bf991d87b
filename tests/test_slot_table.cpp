#include <catch2/catch_test_macros.hpp>

#include "slot_table.hpp"

#include <string>

TEST_CASE("SlotTable", "[slots]") {
    SlotTable table(4);

    SECTION("StartsEmpty") {
        REQUIRE(table.size() == 4);
        REQUIRE(table.occupied() == 0);
        for (size_t i = 0; i < table.size(); i++) {
            REQUIRE_FALSE(table.occupant(i).has_value());
        }
    }

    SECTION("AssignFillsFirstEmptySlot") {
        REQUIRE(table.assign("a") == 0u);
        REQUIRE(table.assign("b") == 1u);
        REQUIRE(table.release("a") == 0u);
        REQUIRE(table.assign("c") == 0u);
        REQUIRE(table.occupant(0) == "c");
        REQUIRE(table.occupant(1) == "b");
    }

    SECTION("AssignWhenFullReturnsNullopt") {
        for (int i = 0; i < 4; i++) {
            REQUIRE(table.assign("w" + std::to_string(i)).has_value());
        }
        SlotTable before = table;
        REQUIRE_FALSE(table.assign("overflow").has_value());
        REQUIRE(table == before);
    }

    SECTION("AssignSameIdentityKeepsSingleSlot") {
        REQUIRE(table.assign("a") == 0u);
        REQUIRE(table.assign("a") == 0u);
        REQUIRE(table.occupied() == 1);
    }

    SECTION("ReleaseUnknownLeavesTableUnchanged") {
        table.assign("a");
        table.assign("b");
        SlotTable before = table;
        REQUIRE_FALSE(table.release("zzz").has_value());
        REQUIRE(table == before);
    }

    SECTION("AssignThenReleaseRestoresPriorState") {
        table.assign("a");
        table.assign("b");
        table.release("a");
        SlotTable before = table;

        auto slot = table.assign("c");
        REQUIRE(slot == 0u);
        REQUIRE(table.release("c") == slot);
        REQUIRE(table == before);
    }

    SECTION("OccupantOutOfRange") {
        REQUIRE_FALSE(table.occupant(4).has_value());
        REQUIRE_FALSE(table.occupant(100).has_value());
    }

    SECTION("IdentityNeverInTwoSlots") {
        // Interleaved assign/release over a small identity pool
        const char* ids[] = {"a", "b", "c", "d", "e"};
        for (int round = 0; round < 50; round++) {
            std::string id = ids[(round * 7) % 5];
            if (round % 3 == 0) table.release(id);
            else table.assign(id);

            for (const char* candidate : ids) {
                int count = 0;
                for (size_t i = 0; i < table.size(); i++) {
                    if (table.occupant(i) == candidate) count++;
                }
                REQUIRE(count <= 1);
            }
        }
    }
}
