#include "rowscan/storage/scan_errors.hpp"
#include "rowscan/storage/slot_store.hpp"
#include "rowscan/txn/multi_version_tracker.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <memory>
#include <system_error>
#include <vector>

using rowscan::storage::Row;
using rowscan::storage::ScanErrc;
using rowscan::storage::SlotStore;
using namespace rowscan::txn;

namespace {

std::uint64_t visible(const MultiVersionTracker& tracker, SessionId session, std::uint64_t committed)
{
    std::uint64_t count = 0U;
    REQUIRE_FALSE(tracker.visible_row_count(session, committed, count));
    return count;
}

}  // namespace

TEST_CASE("MultiVersionTracker toggles rows in and out of the delta set")
{
    SlotStore store{SlotStore::Config{true}};
    auto& row = store.add(std::make_unique<Row>());
    MultiVersionTracker tracker;

    CHECK(tracker.toggle_delta(row) == DeltaToggle::Inserted);
    CHECK(tracker.contains(row.token()));
    CHECK(tracker.find(row.token()) == &row);
    CHECK(tracker.delta_size() == 1U);

    CHECK(tracker.toggle_delta(row) == DeltaToggle::Cancelled);
    CHECK_FALSE(tracker.contains(row.token()));
    CHECK(tracker.find(row.token()) == nullptr);
    CHECK(tracker.delta_size() == 0U);
}

TEST_CASE("MultiVersionTracker uncommitted insert is visible only to its session")
{
    SlotStore store{SlotStore::Config{true}};
    MultiVersionTracker tracker;
    constexpr SessionId s1 = 1U;
    constexpr SessionId s2 = 2U;

    // Ten committed rows, then S1 inserts one more without committing.
    const std::uint64_t committed = 10U;
    auto& row = store.add(std::make_unique<Row>());
    REQUIRE_FALSE(tracker.on_add(row, s1));

    const auto stored = committed + 1U;
    CHECK(visible(tracker, s1, stored) == committed + 1U);
    CHECK(visible(tracker, s2, stored) == committed);
    CHECK(tracker.adjustment(s1) == 1);
    CHECK(tracker.total_drift() == 1);

    REQUIRE_FALSE(tracker.on_commit(row, UndoOperation::Insert, s1));
    CHECK(visible(tracker, s1, stored) == committed + 1U);
    CHECK(visible(tracker, s2, stored) == committed + 1U);
    CHECK(tracker.delta_size() == 0U);
    CHECK(tracker.total_drift() == 0);
}

TEST_CASE("MultiVersionTracker uncommitted delete is hidden only from its session")
{
    SlotStore store{SlotStore::Config{true}};
    MultiVersionTracker tracker;
    constexpr SessionId s1 = 1U;
    constexpr SessionId s2 = 2U;

    auto& row = store.add(std::make_unique<Row>());
    const std::uint64_t after_remove = 4U;
    REQUIRE_FALSE(tracker.on_remove(row, s2));
    CHECK(row.deleted());

    CHECK(visible(tracker, s2, after_remove) == after_remove);
    CHECK(visible(tracker, s1, after_remove) == after_remove + 1U);

    REQUIRE_FALSE(tracker.on_commit(row, UndoOperation::Delete, s2));
    CHECK(visible(tracker, s1, after_remove) == after_remove);
    CHECK(visible(tracker, s2, after_remove) == after_remove);
    CHECK(tracker.delta_size() == 0U);
}

TEST_CASE("MultiVersionTracker insert followed by delete in one session cancels out")
{
    SlotStore store{SlotStore::Config{true}};
    MultiVersionTracker tracker;
    constexpr SessionId s1 = 1U;

    auto& row = store.add(std::make_unique<Row>());
    REQUIRE_FALSE(tracker.on_add(row, s1));
    REQUIRE_FALSE(tracker.on_remove(row, s1));

    CHECK(tracker.delta_size() == 0U);
    CHECK(tracker.adjustment(s1) == 0);
    CHECK(tracker.total_drift() == 0);

    REQUIRE_FALSE(tracker.on_commit(row, UndoOperation::Insert, s1));
    REQUIRE_FALSE(tracker.on_commit(row, UndoOperation::Delete, s1));
    CHECK(tracker.adjustment(s1) == 0);
    CHECK(tracker.total_drift() == 0);
}

TEST_CASE("MultiVersionTracker refuses adjustments that overflow")
{
    MultiVersionTracker tracker;
    constexpr SessionId s1 = 1U;

    REQUIRE_FALSE(tracker.adjust(s1, std::numeric_limits<std::int64_t>::max()));
    CHECK(tracker.validate_adjust(s1, 1) == ScanErrc::CountOverflow);
    CHECK(tracker.adjust(s1, 1) == ScanErrc::CountOverflow);
    CHECK(tracker.adjustment(s1) == std::numeric_limits<std::int64_t>::max());
    CHECK(tracker.total_drift() == std::numeric_limits<std::int64_t>::max());

    SlotStore store{SlotStore::Config{true}};
    auto& row = store.add(std::make_unique<Row>());
    CHECK(tracker.on_add(row, s1) == ScanErrc::CountOverflow);
    CHECK_FALSE(tracker.contains(row.token()));
}

TEST_CASE("MultiVersionTracker reports negative visible counts as overflow")
{
    MultiVersionTracker tracker;
    REQUIRE_FALSE(tracker.adjust(2U, 5));

    std::uint64_t count = 0U;
    CHECK(tracker.visible_row_count(1U, 3U, count) == ScanErrc::CountOverflow);
    CHECK(tracker.visible_row_count(2U, 3U, count) == std::error_code{});
    CHECK(count == 3U);
}

TEST_CASE("MultiVersionTracker truncate forgets every session")
{
    SlotStore store{SlotStore::Config{true}};
    MultiVersionTracker tracker;

    for (SessionId session = 1U; session <= 3U; ++session) {
        auto& row = store.add(std::make_unique<Row>());
        REQUIRE_FALSE(tracker.on_add(row, session));
    }
    CHECK(tracker.session_count() == 3U);
    CHECK(tracker.delta_size() == 3U);

    std::vector<Row*> members;
    for (auto* row : tracker.delta()) {
        members.push_back(row);
    }
    CHECK(members.size() == 3U);

    tracker.truncate();
    CHECK(tracker.delta_size() == 0U);
    CHECK(tracker.session_count() == 0U);
    CHECK(tracker.total_drift() == 0);
    for (SessionId session = 1U; session <= 3U; ++session) {
        CHECK(tracker.adjustment(session) == 0);
        CHECK(visible(tracker, session, 0U) == 0U);
    }
}
