#include "rowscan/storage/scan_collaborators.hpp"
#include "rowscan/storage/scan_index.hpp"
#include "rowscan/storage/scan_index_telemetry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <iterator>
#include <map>
#include <optional>
#include <random>
#include <vector>

using namespace rowscan::storage;
using rowscan::txn::SessionId;
using rowscan::txn::UndoOperation;

namespace {

constexpr SessionId kSession1 = 1U;
constexpr SessionId kSession2 = 2U;

struct CursorHarness final {
    explicit CursorHarness(bool multi_version)
        : database{multi_version}
        , index{make_config()}
    {
    }

    ScanIndex::Config make_config()
    {
        ScanIndex::Config config{};
        config.database = &database;
        config.table = &table;
        config.telemetry = &telemetry;
        return config;
    }

    Row add(SessionId session, std::uint8_t tag)
    {
        return index.add(session, Row{std::vector<std::byte>{std::byte{tag}}});
    }

    void commit_insert(const Row& row)
    {
        index.commit(UndoOperation::Insert, row);
        index.complete_commit(row);
    }

    std::vector<Row> scan(SessionId session)
    {
        std::vector<Row> rows;
        auto cursor = index.find(session);
        Row row;
        while (cursor->next(row)) {
            rows.push_back(row);
        }
        return rows;
    }

    ScanDatabaseStub database;
    ScanTableStub table{};
    ScanIndexTelemetry telemetry{};
    ScanIndex index;
};

std::vector<std::uint64_t> slots_of(const std::vector<Row>& rows)
{
    std::vector<std::uint64_t> slots;
    for (const auto& row : rows) {
        slots.push_back(row.slot() ? row.slot()->value : UINT64_MAX);
    }
    return slots;
}

}  // namespace

TEST_CASE("ScanCursor on an empty index is exhausted immediately")
{
    CursorHarness harness{false};
    auto cursor = harness.index.open_cursor(kSession1);
    CHECK(cursor->state() == ScanCursor::State::NotStarted);
    CHECK(cursor->session() == kSession1);

    Row row;
    CHECK_FALSE(cursor->next(row));
    CHECK(cursor->state() == ScanCursor::State::Exhausted);
    CHECK_FALSE(cursor->next(row));
}

TEST_CASE("ScanCursor yields every occupied slot once in ascending order")
{
    CursorHarness harness{false};
    std::vector<Row> rows;
    for (std::uint8_t i = 0U; i < 8U; ++i) {
        rows.push_back(harness.add(kSession1, i));
    }
    (void)harness.index.remove(kSession1, rows[0]);
    (void)harness.index.remove(kSession1, rows[5]);
    (void)harness.index.remove(kSession1, rows[7]);

    const auto scanned = harness.scan(kSession1);
    CHECK(slots_of(scanned) == std::vector<std::uint64_t>{1U, 2U, 3U, 4U, 6U});
    CHECK(scanned.size() == harness.index.row_count(kSession1));
    CHECK(scanned[0].payload()[0] == std::byte{1U});
}

TEST_CASE("ScanCursor tracks its position and tolerates removals behind and ahead")
{
    CursorHarness harness{false};
    std::vector<Row> rows;
    for (std::uint8_t i = 0U; i < 4U; ++i) {
        rows.push_back(harness.add(kSession1, i));
    }

    auto cursor = harness.index.open_cursor(kSession1);
    Row row;
    REQUIRE(cursor->next(row));
    CHECK(cursor->state() == ScanCursor::State::Positioned);
    CHECK(cursor->position() == SlotIndex{0U});

    (void)harness.index.remove(kSession1, rows[0]);
    (void)harness.index.remove(kSession1, rows[2]);

    REQUIRE(cursor->next(row));
    CHECK(row.slot() == SlotIndex{1U});
    REQUIRE(cursor->next(row));
    CHECK(row.slot() == SlotIndex{3U});
    CHECK_FALSE(cursor->next(row));
    CHECK(cursor->state() == ScanCursor::State::Exhausted);
}

TEST_CASE("ScanCursor hides other sessions' uncommitted inserts")
{
    CursorHarness harness{true};
    const auto committed = harness.add(kSession1, 1U);
    harness.commit_insert(committed);
    const auto pending = harness.add(kSession1, 2U);

    const auto own = harness.scan(kSession1);
    const auto other = harness.scan(kSession2);

    CHECK(own.size() == 2U);
    REQUIRE(other.size() == 1U);
    CHECK(other.front().token() == committed.token());
    CHECK(own.size() == harness.index.row_count(kSession1));
    CHECK(other.size() == harness.index.row_count(kSession2));
    (void)pending;
}

TEST_CASE("ScanCursor yields rows another session deleted without committing")
{
    CursorHarness harness{true};
    const auto r1 = harness.add(kSession1, 1U);
    const auto r2 = harness.add(kSession1, 2U);
    harness.commit_insert(r1);
    harness.commit_insert(r2);

    (void)harness.index.remove(kSession2, r2);

    const auto other = harness.scan(kSession1);
    REQUIRE(other.size() == 2U);
    // Rows pending deletion come first, ahead of the slot walk.
    CHECK(other.front().token() == r2.token());
    CHECK(other.front().deleted());
    CHECK_FALSE(other.front().slot().has_value());
    CHECK(other.back().token() == r1.token());

    const auto own = harness.scan(kSession2);
    REQUIRE(own.size() == 1U);
    CHECK(own.front().token() == r1.token());

    const auto snapshot = harness.telemetry.snapshot();
    CHECK(snapshot.cursors_opened == 2U);
    CHECK(snapshot.cursor_rows_visible == 3U);
    CHECK(snapshot.cursor_rows_read == 4U);
}

TEST_CASE("ScanCursor row count matches row_count for random multi-session workloads")
{
    struct Record final {
        UndoOperation operation = UndoOperation::Insert;
        Row handle{};
    };

    CursorHarness harness{true};
    auto& index = harness.index;
    constexpr SessionId kSessions = 4U;
    std::map<SessionId, std::vector<Record>> logs;
    std::mt19937 rng{20240611U};

    const auto check_all_sessions = [&] {
        for (SessionId session = 1U; session <= kSessions; ++session) {
            CAPTURE(session);
            REQUIRE(harness.scan(session).size() == index.row_count(session));
        }
    };

    for (int step = 0; step < 600; ++step) {
        CAPTURE(step);
        const SessionId session = 1U + static_cast<SessionId>(rng() % kSessions);
        auto& log = logs[session];
        const auto action = rng() % 100U;

        if (action < 45U) {
            log.push_back(Record{UndoOperation::Insert, harness.add(session, static_cast<std::uint8_t>(step))});
        } else if (action < 70U) {
            std::vector<Row> candidates;
            for (const auto& row : harness.scan(session)) {
                if (row.slot()) {
                    candidates.push_back(row);
                }
            }
            if (candidates.empty()) {
                continue;
            }
            const auto& victim = candidates[rng() % candidates.size()];
            (void)index.remove(session, victim);
            log.push_back(Record{UndoOperation::Delete, victim});
        } else if (action < 85U) {
            for (const auto& record : log) {
                index.commit(record.operation, record.handle);
            }
            for (const auto& record : log) {
                index.complete_commit(record.handle);
            }
            log.clear();
        } else {
            for (auto it = log.rbegin(); it != log.rend(); ++it) {
                const auto restored = index.rollback(session, it->operation, it->handle);
                if (!restored) {
                    continue;
                }
                for (auto earlier = std::next(it); earlier != log.rend(); ++earlier) {
                    if (earlier->handle.token() == restored->token()) {
                        earlier->handle = *restored;
                    }
                }
            }
            log.clear();
        }

        check_all_sessions();
    }

    for (auto& [session, log] : logs) {
        (void)session;
        for (const auto& record : log) {
            index.commit(record.operation, record.handle);
        }
        for (const auto& record : log) {
            index.complete_commit(record.handle);
        }
        log.clear();
    }

    check_all_sessions();
    CHECK(index.delta_size() == 0U);
    CHECK(index.retired_count() == 0U);
    const auto committed = index.row_count(1U);
    for (SessionId session = 2U; session <= kSessions; ++session) {
        CHECK(index.row_count(session) == committed);
    }
}
