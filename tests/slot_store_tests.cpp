#include "rowscan/storage/scan_errors.hpp"
#include "rowscan/storage/slot_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <vector>

using namespace rowscan::storage;

namespace {

std::unique_ptr<Row> make_row(std::uint8_t tag)
{
    return std::make_unique<Row>(std::vector<std::byte>{std::byte{tag}});
}

SlotIndex slot_of(const Row& row)
{
    REQUIRE(row.slot().has_value());
    return *row.slot();
}

}  // namespace

TEST_CASE("SlotStore appends rows to fresh slots in order")
{
    SlotStore store;

    auto& first = store.add(make_row(1U));
    auto& second = store.add(make_row(2U));

    CHECK(slot_of(first) == SlotIndex{0U});
    CHECK(slot_of(second) == SlotIndex{1U});
    CHECK(first.token() != kUnassignedRowToken);
    CHECK(first.token() != second.token());
    CHECK(store.row_count() == 2U);
    CHECK(store.size() == 2U);
    CHECK_FALSE(store.free_list_head().has_value());
}

TEST_CASE("SlotStore reuses the most recently freed slot")
{
    SlotStore store;
    auto& r1 = store.add(make_row(1U));
    (void)store.add(make_row(2U));
    const auto r1_slot = slot_of(r1);

    std::unique_ptr<Row> detached;
    REQUIRE_FALSE(store.remove(r1_slot, detached));
    REQUIRE(detached);
    CHECK_FALSE(detached->slot().has_value());
    REQUIRE(store.free_list_head().has_value());
    CHECK(*store.free_list_head() == SlotIndex{0U});

    auto& r3 = store.add(make_row(3U));
    CHECK(slot_of(r3) == SlotIndex{0U});
    CHECK(store.size() == 2U);
    CHECK(store.row_count() == 2U);
    CHECK(store.free_slot_count() == 0U);
}

TEST_CASE("SlotStore re-adding a detached row keeps its token")
{
    SlotStore store;
    (void)store.add(make_row(1U));
    auto& row = store.add(make_row(2U));
    const auto token = row.token();

    std::unique_ptr<Row> detached;
    REQUIRE_FALSE(store.remove(slot_of(row), detached));
    auto& again = store.add(std::move(detached));

    CHECK(again.token() == token);
    CHECK(slot_of(again) == SlotIndex{1U});
}

TEST_CASE("SlotStore refuses a second row with a stored token")
{
    SlotStore store{SlotStore::Config{true}};
    auto& row = store.add(make_row(1U));
    const auto token = row.token();
    CHECK(store.holds(token));

    auto copy = std::make_unique<Row>(row);
    copy->set_slot(std::nullopt);
    CHECK_THROWS_AS(store.add(std::move(copy)), std::invalid_argument);
    CHECK(store.row_count() == 1U);

    std::unique_ptr<Row> detached;
    REQUIRE_FALSE(store.remove(slot_of(row), detached));
    CHECK_FALSE(store.holds(token));
    (void)store.retire(std::move(detached));
    CHECK(store.holds(token));
    CHECK(store.release_retired(token));
    CHECK_FALSE(store.holds(token));
}

TEST_CASE("SlotStore collapses to empty when the last row leaves a single-version store")
{
    SlotStore store;
    auto& row = store.add(make_row(1U));

    std::unique_ptr<Row> detached;
    REQUIRE_FALSE(store.remove(slot_of(row), detached));

    CHECK(store.size() == 0U);
    CHECK(store.row_count() == 0U);
    CHECK(store.free_slot_count() == 0U);
    CHECK_FALSE(store.free_list_head().has_value());

    auto& next = store.add(make_row(2U));
    CHECK(slot_of(next) == SlotIndex{0U});
}

TEST_CASE("SlotStore keeps the arena when the last row leaves a multi-version store")
{
    SlotStore store{SlotStore::Config{true}};
    auto& row = store.add(make_row(1U));

    std::unique_ptr<Row> detached;
    REQUIRE_FALSE(store.remove(slot_of(row), detached));

    CHECK(store.size() == 1U);
    CHECK(store.row_count() == 0U);
    CHECK(store.free_slot_count() == 1U);
    REQUIRE(store.free_list_head().has_value());
    CHECK(*store.free_list_head() == SlotIndex{0U});
}

TEST_CASE("SlotStore reports missing and free slots")
{
    SlotStore store;
    (void)store.add(make_row(1U));
    auto& second = store.add(make_row(2U));
    const auto second_slot = slot_of(second);

    std::unique_ptr<Row> detached;
    CHECK(store.remove(SlotIndex{7U}, detached) == make_error_code(ScanErrc::SlotNotFound));
    CHECK_FALSE(detached);

    REQUIRE_FALSE(store.remove(second_slot, detached));
    std::unique_ptr<Row> again;
    CHECK(store.remove(second_slot, again) == make_error_code(ScanErrc::SlotNotOccupied));
    CHECK(store.row_count() == 1U);
    CHECK(store.get(second_slot) == nullptr);
    CHECK(store.get(SlotIndex{99U}) == nullptr);
}

TEST_CASE("SlotStore free list stays acyclic under random churn")
{
    SlotStore store{SlotStore::Config{true}};
    std::mt19937 rng{1234U};
    std::vector<SlotIndex> occupied;

    for (int step = 0; step < 2000; ++step) {
        const bool insert = occupied.empty() || (rng() % 3U) != 0U;
        if (insert) {
            occupied.push_back(slot_of(store.add(make_row(static_cast<std::uint8_t>(step)))));
        } else {
            const auto pick = rng() % occupied.size();
            std::unique_ptr<Row> detached;
            REQUIRE_FALSE(store.remove(occupied[pick], detached));
            occupied.erase(occupied.begin() + static_cast<std::ptrdiff_t>(pick));
        }

        const auto chain = store.free_list();
        REQUIRE(chain.size() == store.free_slot_count());
        std::set<std::uint64_t> seen;
        for (const auto slot : chain) {
            REQUIRE(slot.value < store.size());
            REQUIRE(seen.insert(slot.value).second);
            REQUIRE(store.get(slot) == nullptr);
        }
        REQUIRE(store.row_count() + store.free_slot_count() == store.size());
    }
}

TEST_CASE("SlotStore next_occupied_after walks occupied slots in ascending order")
{
    SlotStore store{SlotStore::Config{true}};
    std::vector<SlotIndex> slots;
    for (std::uint8_t i = 0U; i < 6U; ++i) {
        slots.push_back(slot_of(store.add(make_row(i))));
    }
    std::unique_ptr<Row> detached;
    REQUIRE_FALSE(store.remove(slots[1], detached));
    REQUIRE_FALSE(store.remove(slots[4], detached));

    std::vector<std::uint64_t> visited;
    std::optional<SlotIndex> position;
    while (const auto* row = store.next_occupied_after(position)) {
        position = row->slot();
        visited.push_back(position->value);
    }

    CHECK(visited == std::vector<std::uint64_t>{0U, 2U, 3U, 5U});
}

TEST_CASE("SlotStore retired rows survive until restored or released")
{
    SlotStore store{SlotStore::Config{true}};
    auto& row = store.add(make_row(1U));
    const auto token = row.token();

    std::unique_ptr<Row> detached;
    REQUIRE_FALSE(store.remove(slot_of(row), detached));
    auto& retired = store.retire(std::move(detached));
    CHECK(retired.token() == token);
    CHECK(store.retired_count() == 1U);
    CHECK(store.find_retired(token) == &retired);

    auto restored = store.restore(token);
    REQUIRE(restored);
    CHECK(store.retired_count() == 0U);
    CHECK(store.restore(token) == nullptr);

    auto& back = store.add(std::move(restored));
    CHECK(back.token() == token);
    CHECK(slot_of(back) == SlotIndex{0U});

    REQUIRE_FALSE(store.remove(slot_of(back), detached));
    (void)store.retire(std::move(detached));
    CHECK(store.release_retired(token));
    CHECK_FALSE(store.release_retired(token));
    CHECK(store.find_retired(token) == nullptr);
}

TEST_CASE("SlotStore truncate clears slots, free list and retired rows")
{
    SlotStore store{SlotStore::Config{true}};
    auto& first = store.add(make_row(1U));
    (void)store.add(make_row(2U));

    std::unique_ptr<Row> detached;
    REQUIRE_FALSE(store.remove(slot_of(first), detached));
    (void)store.retire(std::move(detached));

    store.truncate();

    CHECK(store.size() == 0U);
    CHECK(store.row_count() == 0U);
    CHECK(store.free_slot_count() == 0U);
    CHECK(store.retired_count() == 0U);
    CHECK(store.free_list().empty());

    std::size_t visited = 0U;
    store.for_each_occupied([&](const Row&) { ++visited; });
    CHECK(visited == 0U);
}
