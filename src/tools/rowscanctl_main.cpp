#include "rowscan/storage/scan_collaborators.hpp"
#include "rowscan/storage/scan_index.hpp"
#include "rowscan/storage/scan_index_telemetry.hpp"
#include "rowscan/storage/storage_metrics.hpp"
#include "rowscan/storage/storage_telemetry_registry.hpp"
#include "rowscan/tools/scan_log_formatter.hpp"

#include <CLI/CLI.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

using rowscan::storage::Row;
using rowscan::storage::RowToken;
using rowscan::storage::ScanIndex;
using rowscan::storage::ScanIndexTelemetry;
using rowscan::storage::ScanIndexTelemetrySnapshot;
using rowscan::storage::StorageTelemetryRegistry;
using rowscan::txn::SessionId;
using rowscan::txn::UndoOperation;

namespace {

struct WorkloadOptions final {
    std::size_t operations = 1000U;
    std::size_t sessions = 4U;
    bool multi_version = false;
    std::uint32_t seed = 42U;
    std::string format = "text";
    bool metrics = false;
    std::string log_path{};
};

struct UndoEntry final {
    UndoOperation operation = UndoOperation::Insert;
    Row handle{};
    // Single-version indexes hand removed rows back; the undo log keeps them for rollback.
    std::optional<Row> detached{};
};

struct SessionReport final {
    SessionId session = rowscan::txn::kNoSession;
    std::uint64_t row_count = 0U;
    std::uint64_t cursor_rows = 0U;
    std::size_t pending_records = 0U;
};

struct WorkloadReport final {
    std::size_t operations = 0U;
    std::size_t adds = 0U;
    std::size_t removes = 0U;
    std::size_t commits = 0U;
    std::size_t rollbacks = 0U;
    std::size_t mismatches = 0U;
    std::vector<SessionReport> sessions{};
    std::uint64_t final_row_count = 0U;
    std::size_t final_delta_size = 0U;
    std::size_t final_retired = 0U;
    std::size_t slot_count = 0U;
    std::vector<rowscan::storage::SlotIndex> free_list{};
    ScanIndexTelemetrySnapshot telemetry{};
};

class EventLog final {
public:
    explicit EventLog(const std::string& path)
    {
        if (path.empty()) {
            return;
        }
        enabled_ = true;
        if (path == "-") {
            return;
        }
        file_.open(path, std::ios::out | std::ios::trunc);
        if (!file_.is_open()) {
            throw std::runtime_error("failed to open log file: " + path);
        }
    }

    [[nodiscard]] rowscan::storage::ScanIndexEventLogger logger()
    {
        if (!enabled_) {
            return {};
        }
        return [this](const rowscan::storage::ScanIndexEvent& event) {
            std::ostream& target = file_.is_open() ? static_cast<std::ostream&>(file_) : std::cerr;
            target << rowscan::tools::format_scan_event_log_json(event) << '\n';
        };
    }

private:
    bool enabled_ = false;
    std::ofstream file_{};
};

std::uint64_t count_cursor_rows(ScanIndex& index, SessionId session)
{
    auto cursor = index.open_cursor(session);
    Row row;
    std::uint64_t count = 0U;
    while (cursor->next(row)) {
        ++count;
    }
    return count;
}

std::size_t verify_sessions(ScanIndex& index, const std::vector<SessionId>& sessions)
{
    std::size_t mismatches = 0U;
    for (const auto session : sessions) {
        if (index.row_count(session) != count_cursor_rows(index, session)) {
            ++mismatches;
        }
    }
    return mismatches;
}

// Rows the session may delete: stored rows it can see and that no other session has
// pending changes on.
std::vector<Row> removable_rows(ScanIndex& index,
                                SessionId session,
                                const std::unordered_map<RowToken, SessionId>& pending_inserts)
{
    std::vector<Row> rows;
    auto cursor = index.open_cursor(session);
    Row row;
    while (cursor->next(row)) {
        if (!row.slot() || row.deleted()) {
            continue;
        }
        if (const auto it = pending_inserts.find(row.token()); it != pending_inserts.end() && it->second != session) {
            continue;
        }
        rows.push_back(row);
    }
    return rows;
}

void commit_session(ScanIndex& index,
                    std::vector<UndoEntry>& log,
                    std::unordered_map<RowToken, SessionId>& pending_inserts)
{
    for (const auto& entry : log) {
        index.commit(entry.operation, entry.handle);
    }
    for (const auto& entry : log) {
        index.complete_commit(entry.handle);
        pending_inserts.erase(entry.handle.token());
    }
    log.clear();
}

void rollback_session(ScanIndex& index,
                      SessionId session,
                      std::vector<UndoEntry>& log,
                      std::unordered_map<RowToken, SessionId>& pending_inserts)
{
    for (auto it = log.rbegin(); it != log.rend(); ++it) {
        std::optional<Row> restored;
        if (it->operation == UndoOperation::Delete && it->detached) {
            restored = index.add(session, std::move(*it->detached));
        } else {
            restored = index.rollback(session, it->operation, it->handle);
        }

        if (!restored) {
            pending_inserts.erase(it->handle.token());
            continue;
        }
        // Earlier records of the same row must follow it into its new slot.
        for (auto earlier = std::next(it); earlier != log.rend(); ++earlier) {
            if (earlier->handle.token() == restored->token()) {
                earlier->handle = *restored;
            }
        }
    }
    log.clear();
}

std::vector<std::byte> make_payload(std::mt19937& rng)
{
    std::uniform_int_distribution<int> byte_dist{0, 255};
    std::vector<std::byte> payload(16U);
    for (auto& value : payload) {
        value = static_cast<std::byte>(byte_dist(rng));
    }
    return payload;
}

WorkloadReport run_workload(const WorkloadOptions& options)
{
    if (options.sessions == 0U) {
        throw std::invalid_argument("workload requires at least one session");
    }

    EventLog event_log{options.log_path};
    ScanIndexTelemetry telemetry;
    StorageTelemetryRegistry registry;
    registry.register_scan_index("WORKLOAD_DATA", [&telemetry] { return telemetry.snapshot(); });

    rowscan::storage::LargeObjectStoreStub large_objects;
    rowscan::storage::ScanDatabaseStub database{options.multi_version, &large_objects};
    rowscan::storage::ScanTableStub table{rowscan::storage::ScanTableStub::Options{{1U}, "WORKLOAD", false, true}};

    ScanIndex::Config config{};
    config.database = &database;
    config.table = &table;
    config.index_id = rowscan::storage::IndexId{1U};
    config.telemetry = &telemetry;
    config.event_logger = event_log.logger();
    ScanIndex index{config};

    rowscan::txn::SessionIdAllocatorStub session_ids;
    std::vector<SessionId> sessions;
    std::map<SessionId, std::vector<UndoEntry>> undo_logs;
    for (std::size_t i = 0; i < options.sessions; ++i) {
        const auto session = session_ids.allocate();
        sessions.push_back(session);
        undo_logs[session];
    }
    std::unordered_map<RowToken, SessionId> pending_inserts;

    std::mt19937 rng{options.seed};
    std::uniform_int_distribution<std::size_t> session_dist{0U, sessions.size() - 1U};
    std::uniform_int_distribution<int> action_dist{0, 99};

    WorkloadReport report{};
    for (std::size_t step = 0; step < options.operations; ++step) {
        const auto session = sessions[session_dist(rng)];
        auto& log = undo_logs[session];
        const int action = action_dist(rng);

        if (action < 45) {
            const auto stored = index.add(session, Row{make_payload(rng)});
            log.push_back(UndoEntry{UndoOperation::Insert, stored, std::nullopt});
            pending_inserts[stored.token()] = session;
            ++report.adds;
        } else if (action < 70) {
            auto candidates = removable_rows(index, session, pending_inserts);
            if (candidates.empty()) {
                continue;
            }
            std::uniform_int_distribution<std::size_t> pick{0U, candidates.size() - 1U};
            const auto& victim = candidates[pick(rng)];
            auto detached = index.remove(session, victim);
            log.push_back(UndoEntry{UndoOperation::Delete, victim, std::move(detached)});
            ++report.removes;
        } else if (action < 85) {
            commit_session(index, log, pending_inserts);
            ++report.commits;
        } else {
            rollback_session(index, session, log, pending_inserts);
            ++report.rollbacks;
        }

        ++report.operations;
        report.mismatches += verify_sessions(index, sessions);
    }

    for (const auto session : sessions) {
        SessionReport session_report{};
        session_report.session = session;
        session_report.row_count = index.row_count(session);
        session_report.cursor_rows = count_cursor_rows(index, session);
        session_report.pending_records = undo_logs[session].size();
        report.sessions.push_back(session_report);
    }

    for (const auto session : sessions) {
        commit_session(index, undo_logs[session], pending_inserts);
    }
    report.mismatches += verify_sessions(index, sessions);

    report.final_row_count = index.row_count(sessions.front());
    report.final_delta_size = index.delta_size();
    report.final_retired = index.retired_count();
    report.slot_count = index.slot_count();
    report.free_list = index.free_list();
    report.telemetry = telemetry.snapshot();

    if (options.metrics) {
        const auto metrics = rowscan::storage::collect_storage_metrics(registry);
        std::cout << rowscan::storage::storage_metrics_to_openmetrics(metrics);
    }
    registry.unregister_scan_index("WORKLOAD_DATA");
    return report;
}

std::string format_free_list(const std::vector<rowscan::storage::SlotIndex>& free_list)
{
    std::ostringstream stream;
    stream << '[';
    for (std::size_t i = 0; i < free_list.size(); ++i) {
        if (i > 0U) {
            stream << ',';
        }
        stream << free_list[i].value;
    }
    stream << ']';
    return stream.str();
}

void print_json_report(const WorkloadReport& report, const WorkloadOptions& options, std::ostream& out)
{
    out << '{';
    out << "\"multi_version\":" << (options.multi_version ? "true" : "false");
    out << ",\"seed\":" << options.seed;
    out << ",\"operations\":" << report.operations;
    out << ",\"adds\":" << report.adds;
    out << ",\"removes\":" << report.removes;
    out << ",\"commits\":" << report.commits;
    out << ",\"rollbacks\":" << report.rollbacks;
    out << ",\"mismatches\":" << report.mismatches;
    out << ",\"sessions\":[";
    for (std::size_t i = 0; i < report.sessions.size(); ++i) {
        const auto& session = report.sessions[i];
        if (i > 0U) {
            out << ',';
        }
        out << "{\"session\":" << session.session << ",\"row_count\":" << session.row_count
            << ",\"cursor_rows\":" << session.cursor_rows << ",\"pending_records\":" << session.pending_records
            << '}';
    }
    out << ']';
    out << ",\"final_row_count\":" << report.final_row_count;
    out << ",\"final_delta_size\":" << report.final_delta_size;
    out << ",\"final_retired\":" << report.final_retired;
    out << ",\"slot_count\":" << report.slot_count;
    out << ",\"free_list\":" << format_free_list(report.free_list);
    out << ",\"telemetry\":{";
    out << "\"rows_added\":" << report.telemetry.rows_added;
    out << ",\"slots_reused\":" << report.telemetry.slots_reused;
    out << ",\"rows_removed\":" << report.telemetry.rows_removed;
    out << ",\"store_resets\":" << report.telemetry.store_resets;
    out << ",\"commits\":" << report.telemetry.commits;
    out << ",\"rollbacks\":" << report.telemetry.rollbacks;
    out << ",\"cursors_opened\":" << report.telemetry.cursors_opened;
    out << ",\"cursor_rows_read\":" << report.telemetry.cursor_rows_read;
    out << ",\"cursor_rows_visible\":" << report.telemetry.cursor_rows_visible;
    out << ",\"failures\":" << report.telemetry.failures;
    out << "}}" << '\n';
}

void print_text_report(const WorkloadReport& report, const WorkloadOptions& options, std::ostream& out)
{
    out << "Workload (" << (options.multi_version ? "multi-version" : "single-version") << ", seed "
        << options.seed << ")\n";
    out << "  operations: " << report.operations << " (add " << report.adds << ", remove " << report.removes
        << ", commit " << report.commits << ", rollback " << report.rollbacks << ")\n";
    out << "  sessions before final commit:\n";
    for (const auto& session : report.sessions) {
        out << "    " << std::setw(4) << session.session << "  rows " << std::setw(8) << session.row_count
            << "  cursor " << std::setw(8) << session.cursor_rows << "  pending " << session.pending_records
            << '\n';
    }
    out << "  final rows: " << report.final_row_count << ", delta " << report.final_delta_size << ", retired "
        << report.final_retired << '\n';
    out << "  slots: " << report.slot_count << ", free list " << format_free_list(report.free_list) << '\n';
    out << "  slot reuses: " << report.telemetry.slots_reused << ", store resets "
        << report.telemetry.store_resets << '\n';
    out << "  cursor rows: " << report.telemetry.cursor_rows_visible << " visible of "
        << report.telemetry.cursor_rows_read << " read\n";
    out << "  mismatches: " << report.mismatches << '\n';
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Operational tooling for the rowscan table scan storage"};
    app.require_subcommand(1);

    WorkloadOptions options{};
    int exit_code = EXIT_SUCCESS;

    auto* workload = app.add_subcommand("workload", "Replay a randomized multi-session workload");
    workload->add_option("-n,--operations", options.operations, "Number of operations to replay");
    workload->add_option("-s,--sessions", options.sessions, "Number of concurrent sessions")
        ->check(CLI::PositiveNumber);
    workload->add_flag("--multi-version", options.multi_version, "Run the index in multi-version mode");
    workload->add_option("--seed", options.seed, "Random seed");
    workload->add_option("-f,--format", options.format, "Output format (json or text)")
        ->transform(CLI::CheckedTransformer({{"json", "json"}, {"text", "text"}}));
    workload->add_flag("--metrics", options.metrics, "Print storage metrics in OpenMetrics format");
    workload->add_option("--log", options.log_path, "Write JSON event lines to a file ('-' for stderr)");
    workload->callback([&]() {
        const auto report = run_workload(options);
        if (options.format == "json") {
            print_json_report(report, options, std::cout);
        } else {
            print_text_report(report, options, std::cout);
        }
        if (report.mismatches != 0U || report.final_delta_size != 0U || report.final_retired != 0U) {
            std::cerr << "error: row count does not match the cursor scan" << '\n';
            exit_code = EXIT_FAILURE;
        }
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return exit_code;
}
