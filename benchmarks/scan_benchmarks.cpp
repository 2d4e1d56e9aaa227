#include "rowscan/storage/scan_collaborators.hpp"
#include "rowscan/storage/scan_index.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace rs = rowscan::storage;

namespace {

struct BenchmarkOptions final {
    std::size_t samples = 5U;
    std::size_t churn_rows = 4096U;
    std::size_t churn_rounds = 16U;
    std::size_t scan_rows = 65536U;
    std::size_t session_count = 8U;
    std::size_t transaction_rows = 32U;
    bool json_output = false;
};

struct BenchmarkResult final {
    std::string name{};
    std::vector<double> samples_ms{};
    std::size_t work_units = 0U;
};

struct Summary final {
    double mean_ms = 0.0;
    double min_ms = 0.0;
    double max_ms = 0.0;
    double p95_ms = 0.0;
};

[[noreturn]] void usage()
{
    std::cerr << "Usage: rowscan_benchmarks [options]\n"
              << "  --samples=N            Number of samples per benchmark (default 5)\n"
              << "  --churn-rows=N         Rows kept live during slot churn (default 4096)\n"
              << "  --churn-rounds=N       Remove/re-add rounds per churn sample (default 16)\n"
              << "  --scan-rows=N          Rows scanned by the cursor benchmark (default 65536)\n"
              << "  --sessions=N           Sessions in the multi-version benchmark (default 8)\n"
              << "  --transaction-rows=N   Rows per multi-version transaction (default 32)\n"
              << "  --json                 Emit JSON summary instead of table output\n"
              << "  --help                 Show this message\n";
    std::exit(1);
}

std::size_t parse_size(std::string_view value, std::string_view option)
{
    std::size_t result = 0U;
    const auto* begin = value.data();
    const auto* end = value.data() + value.size();
    if (auto [ptr, ec] = std::from_chars(begin, end, result); ec != std::errc{} || ptr != end) {
        throw std::invalid_argument(std::string{"Invalid value for "} + std::string(option));
    }
    return result;
}

Summary summarise(const std::vector<double>& samples)
{
    if (samples.empty()) {
        return {};
    }

    Summary summary{};
    summary.min_ms = *std::min_element(samples.begin(), samples.end());
    summary.max_ms = *std::max_element(samples.begin(), samples.end());
    summary.mean_ms = std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());

    auto sorted = samples;
    std::sort(sorted.begin(), sorted.end());
    const auto index = static_cast<std::size_t>(std::ceil(0.95 * static_cast<double>(sorted.size()))) - 1U;
    summary.p95_ms = sorted[std::min(index, sorted.size() - 1U)];
    return summary;
}

std::vector<std::byte> make_payload(std::size_t seed)
{
    std::vector<std::byte> payload(24U);
    for (std::size_t pos = 0; pos < payload.size(); ++pos) {
        payload[pos] = static_cast<std::byte>(((seed + 7U) * (pos + 3U)) & 0xFFU);
    }
    return payload;
}

class IndexFixture final {
public:
    explicit IndexFixture(bool multi_version)
        : database_{multi_version}
    {
        rs::ScanIndex::Config config{};
        config.database = &database_;
        config.table = &table_;
        index_.emplace(config);
    }

    [[nodiscard]] rs::ScanIndex& index() noexcept { return *index_; }

private:
    rs::ScanDatabaseStub database_;
    rs::ScanTableStub table_{};
    std::optional<rs::ScanIndex> index_{};
};

BenchmarkResult benchmark_slot_churn(const BenchmarkOptions& options)
{
    BenchmarkResult result{};
    result.name = "slot_churn";
    result.work_units = options.churn_rows * options.churn_rounds;

    for (std::size_t sample = 0; sample < options.samples; ++sample) {
        IndexFixture fixture{false};
        auto& index = fixture.index();

        std::vector<rs::Row> rows;
        rows.reserve(options.churn_rows);
        for (std::size_t i = 0; i < options.churn_rows; ++i) {
            rows.push_back(index.add(1U, rs::Row{make_payload(i)}));
        }

        const auto start = std::chrono::steady_clock::now();
        for (std::size_t round = 0; round < options.churn_rounds; ++round) {
            // Every other row goes to the free list, then comes back through it.
            for (std::size_t i = round % 2U; i < rows.size(); i += 2U) {
                auto detached = index.remove(1U, rows[i]);
                if (!detached) {
                    throw std::runtime_error("slot churn expected the removed row back");
                }
                rows[i] = index.add(1U, std::move(*detached));
            }
        }
        const auto end = std::chrono::steady_clock::now();

        if (index.slot_count() != options.churn_rows) {
            throw std::runtime_error("slot churn grew the arena instead of reusing slots");
        }
        result.samples_ms.push_back(std::chrono::duration<double, std::milli>(end - start).count());
    }

    return result;
}

BenchmarkResult benchmark_cursor_scan(const BenchmarkOptions& options)
{
    BenchmarkResult result{};
    result.name = "cursor_scan";
    result.work_units = options.scan_rows;

    for (std::size_t sample = 0; sample < options.samples; ++sample) {
        IndexFixture fixture{false};
        auto& index = fixture.index();

        std::vector<rs::Row> rows;
        rows.reserve(options.scan_rows);
        for (std::size_t i = 0; i < options.scan_rows; ++i) {
            rows.push_back(index.add(1U, rs::Row{make_payload(i)}));
        }
        // Leave holes so the cursor has free slots to skip.
        for (std::size_t i = 0; i < rows.size(); i += 5U) {
            (void)index.remove(1U, rows[i]);
        }
        const auto expected = index.row_count(1U);

        const auto start = std::chrono::steady_clock::now();
        auto cursor = index.open_cursor(1U);
        rs::Row row;
        std::uint64_t visited = 0U;
        while (cursor->next(row)) {
            ++visited;
        }
        const auto end = std::chrono::steady_clock::now();

        if (visited != expected) {
            throw std::runtime_error("cursor scan visited an unexpected number of rows");
        }
        result.samples_ms.push_back(std::chrono::duration<double, std::milli>(end - start).count());
    }

    return result;
}

BenchmarkResult benchmark_multi_version_commit(const BenchmarkOptions& options)
{
    BenchmarkResult result{};
    result.name = "multi_version_commit";
    result.work_units = options.session_count * options.transaction_rows * 2U;

    for (std::size_t sample = 0; sample < options.samples; ++sample) {
        IndexFixture fixture{true};
        auto& index = fixture.index();

        const auto start = std::chrono::steady_clock::now();
        std::vector<std::vector<rs::Row>> inserted(options.session_count);
        for (std::size_t s = 0; s < options.session_count; ++s) {
            const auto session = static_cast<rowscan::txn::SessionId>(s + 1U);
            for (std::size_t i = 0; i < options.transaction_rows; ++i) {
                inserted[s].push_back(index.add(session, rs::Row{make_payload(s * 1000U + i)}));
            }
        }
        for (std::size_t s = 0; s < options.session_count; ++s) {
            for (const auto& row : inserted[s]) {
                index.commit(rowscan::txn::UndoOperation::Insert, row);
            }
            for (const auto& row : inserted[s]) {
                index.complete_commit(row);
            }
        }
        // Each session deletes its rows again and rolls the deletes back.
        for (std::size_t s = 0; s < options.session_count; ++s) {
            const auto session = static_cast<rowscan::txn::SessionId>(s + 1U);
            for (const auto& row : inserted[s]) {
                (void)index.remove(session, row);
            }
            for (auto it = inserted[s].rbegin(); it != inserted[s].rend(); ++it) {
                (void)index.rollback(session, rowscan::txn::UndoOperation::Delete, *it);
            }
        }
        const auto end = std::chrono::steady_clock::now();

        if (index.delta_size() != 0U || index.row_count(1U) != options.session_count * options.transaction_rows) {
            throw std::runtime_error("multi-version benchmark left uncommitted state behind");
        }
        result.samples_ms.push_back(std::chrono::duration<double, std::milli>(end - start).count());
    }

    return result;
}

void print_json(const std::vector<BenchmarkResult>& results)
{
    std::cout << "{\"benchmarks\":[";
    for (std::size_t index = 0; index < results.size(); ++index) {
        const auto& result = results[index];
        auto summary = summarise(result.samples_ms);
        if (index > 0) {
            std::cout << ',';
        }
        std::cout << "{\"name\":\"" << result.name << "\""
                  << ",\"samples\":" << result.samples_ms.size()
                  << ",\"work_units\":" << result.work_units
                  << ",\"mean_ms\":" << std::fixed << std::setprecision(3) << summary.mean_ms
                  << ",\"min_ms\":" << std::fixed << std::setprecision(3) << summary.min_ms
                  << ",\"max_ms\":" << std::fixed << std::setprecision(3) << summary.max_ms
                  << ",\"p95_ms\":" << std::fixed << std::setprecision(3) << summary.p95_ms
                  << '}';
    }
    std::cout << "]}" << std::endl;
}

void print_table(const std::vector<BenchmarkResult>& results)
{
    std::cout << std::left << std::setw(24) << "Benchmark"
              << std::right << std::setw(10) << "Samples"
              << std::setw(14) << "Work Units"
              << std::setw(14) << "Mean (ms)"
              << std::setw(14) << "Min (ms)"
              << std::setw(14) << "Max (ms)"
              << std::setw(14) << "P95 (ms)" << '\n';

    for (const auto& result : results) {
        auto summary = summarise(result.samples_ms);
        std::cout << std::left << std::setw(24) << result.name
                  << std::right << std::setw(10) << result.samples_ms.size()
                  << std::setw(14) << result.work_units
                  << std::setw(14) << std::fixed << std::setprecision(3) << summary.mean_ms
                  << std::setw(14) << std::fixed << std::setprecision(3) << summary.min_ms
                  << std::setw(14) << std::fixed << std::setprecision(3) << summary.max_ms
                  << std::setw(14) << std::fixed << std::setprecision(3) << summary.p95_ms
                  << '\n';
    }
}

BenchmarkOptions parse_options(int argc, char** argv)
{
    BenchmarkOptions options{};
    for (int index = 1; index < argc; ++index) {
        std::string_view argument{argv[index]};
        if (argument == "--json") {
            options.json_output = true;
        } else if (argument == "--help") {
            usage();
        } else if (argument.rfind("--samples=", 0) == 0) {
            options.samples = parse_size(argument.substr(10), "--samples");
        } else if (argument.rfind("--churn-rows=", 0) == 0) {
            options.churn_rows = parse_size(argument.substr(13), "--churn-rows");
        } else if (argument.rfind("--churn-rounds=", 0) == 0) {
            options.churn_rounds = parse_size(argument.substr(15), "--churn-rounds");
        } else if (argument.rfind("--scan-rows=", 0) == 0) {
            options.scan_rows = parse_size(argument.substr(12), "--scan-rows");
        } else if (argument.rfind("--sessions=", 0) == 0) {
            options.session_count = parse_size(argument.substr(11), "--sessions");
            if (options.session_count == 0U) {
                throw std::invalid_argument("--sessions must be positive");
            }
        } else if (argument.rfind("--transaction-rows=", 0) == 0) {
            options.transaction_rows = parse_size(argument.substr(19), "--transaction-rows");
        } else {
            usage();
        }
    }
    return options;
}

}  // namespace

int main(int argc, char** argv)
{
    try {
        const auto options = parse_options(argc, argv);

        std::vector<BenchmarkResult> results;
        results.reserve(3U);
        results.push_back(benchmark_slot_churn(options));
        results.push_back(benchmark_cursor_scan(options));
        results.push_back(benchmark_multi_version_commit(options));

        if (options.json_output) {
            print_json(results);
        } else {
            print_table(results);
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Benchmark harness failed: " << ex.what() << '\n';
        return 1;
    }
}
