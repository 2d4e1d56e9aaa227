#include "rowscan/tools/scan_log_formatter.hpp"

#include "rowscan/storage/scan_errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using rowscan::storage::ScanErrc;
using rowscan::storage::ScanIndexEvent;
using rowscan::storage::ScanIndexEventKind;
using rowscan::storage::SlotIndex;

TEST_CASE("Scan event log renders a successful add as one JSON object")
{
    ScanIndexEvent event{};
    event.kind = ScanIndexEventKind::Add;
    event.index_name = "ORDERS_DATA";
    event.session = 3U;
    event.slot = SlotIndex{12U};
    event.token = 99U;
    event.row_count = 13U;
    event.delta_size = 1U;
    event.timestamp = std::chrono::system_clock::time_point{std::chrono::seconds{1700000000} + std::chrono::microseconds{42}};

    const auto json = rowscan::tools::format_scan_event_log_json(event);

    CHECK(json.front() == '{');
    CHECK(json.back() == '}');
    CHECK(json.find('\n') == std::string::npos);
    CHECK(json.find("\"event\":\"add\"") != std::string::npos);
    CHECK(json.find("\"index\":\"ORDERS_DATA\"") != std::string::npos);
    CHECK(json.find("\"session\":3") != std::string::npos);
    CHECK(json.find("\"slot\":12") != std::string::npos);
    CHECK(json.find("\"token\":99") != std::string::npos);
    CHECK(json.find("\"row_count\":13") != std::string::npos);
    CHECK(json.find("\"delta_size\":1") != std::string::npos);
    CHECK(json.find("\"error\":null") != std::string::npos);
    CHECK(json.find("\"context\"") == std::string::npos);
    CHECK(json.find("\"timestamp\":\"2023-11-14T22:13:20.000042Z\"") != std::string::npos);
}

TEST_CASE("Scan event log renders failures with the error category")
{
    ScanIndexEvent event{};
    event.kind = ScanIndexEventKind::Failure;
    event.index_name = "T\"1_DATA";
    event.error = make_error_code(ScanErrc::SlotNotFound);
    event.context = "ScanIndex::remove";

    const auto json = rowscan::tools::format_scan_event_log_json(event);

    CHECK(json.find("\"event\":\"failure\"") != std::string::npos);
    CHECK(json.find("\"index\":\"T\\\"1_DATA\"") != std::string::npos);
    CHECK(json.find("\"slot\":null") != std::string::npos);
    CHECK(json.find("\"category\":\"rowscan.scan\"") != std::string::npos);
    CHECK(json.find("\"message\":\"row not found while deleting\"") != std::string::npos);
    CHECK(json.find("\"context\":\"ScanIndex::remove\"") != std::string::npos);
    CHECK(json.find("\"timestamp\":null") != std::string::npos);
}

TEST_CASE("Scan event log escapes control characters in index names")
{
    ScanIndexEvent event{};
    event.kind = ScanIndexEventKind::Truncate;
    event.index_name = "A\nB\\C";

    const auto json = rowscan::tools::format_scan_event_log_json(event);

    CHECK(json.find('\n') == std::string::npos);
    CHECK(json.find("\"index\":\"A\\u000AB\\\\C\"") != std::string::npos);
}

TEST_CASE("Scan event kinds have stable names")
{
    using rowscan::storage::to_string;
    CHECK(to_string(ScanIndexEventKind::StoreReset) == "store_reset");
    CHECK(to_string(ScanIndexEventKind::CompleteCommit) == "complete_commit");
    CHECK(to_string(ScanIndexEventKind::RollbackInsert) == "rollback_insert");
    CHECK(to_string(ScanIndexEventKind::RollbackDelete) == "rollback_delete");
    CHECK(to_string(ScanIndexEventKind::CursorOpened) == "cursor_opened");
}
