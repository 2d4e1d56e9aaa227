#include "rowscan/tools/scan_log_formatter.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace {

// Names and messages are plain text; control characters only show up in odd table names.
void append_json_string(std::string& out, std::string_view text)
{
    constexpr char kHex[] = "0123456789ABCDEF";
    out.push_back('"');
    for (unsigned char ch : text) {
        if (ch == '"' || ch == '\\') {
            out.push_back('\\');
            out.push_back(static_cast<char>(ch));
        } else if (ch < 0x20U) {
            out.append("\\u00");
            out.push_back(kHex[ch >> 4U]);
            out.push_back(kHex[ch & 0x0FU]);
        } else {
            out.push_back(static_cast<char>(ch));
        }
    }
    out.push_back('"');
}

// Events published by a ScanIndex are always stamped; hand-built ones may not be.
void append_timestamp(std::string& out, std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        out.append("null");
        return;
    }

    const auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
    const auto time_value = std::chrono::system_clock::to_time_t(seconds);
    std::tm buffer{};
    gmtime_r(&time_value, &buffer);

    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - seconds).count();
    std::ostringstream stream;
    stream << '"' << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
           << micros << "Z\"";
    out.append(stream.str());
}

}  // namespace

namespace rowscan::tools {

std::string format_scan_event_log_json(const rowscan::storage::ScanIndexEvent& event)
{
    std::string json;
    json.reserve(256U);
    json.push_back('{');
    bool first = true;

    auto append_field = [&](const char* name) {
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(name);
        json.push_back('"');
        json.push_back(':');
    };

    auto append_string_field = [&](const char* name, std::string_view value) {
        append_field(name);
        append_json_string(json, value);
    };

    auto append_number_field = [&](const char* name, auto value) {
        append_field(name);
        json.append(std::to_string(value));
    };

    append_string_field("event", rowscan::storage::to_string(event.kind));
    append_string_field("index", event.index_name);
    append_number_field("session", event.session);

    append_field("slot");
    if (event.slot) {
        json.append(std::to_string(event.slot->value));
    } else {
        json.append("null");
    }

    append_number_field("token", event.token);
    append_number_field("row_count", event.row_count);
    append_number_field("delta_size", event.delta_size);

    append_field("error");
    if (event.error) {
        json.push_back('{');
        json.append("\"category\":");
        append_json_string(json, event.error.category().name());
        json.append(",\"code\":");
        json.append(std::to_string(event.error.value()));
        json.append(",\"message\":");
        append_json_string(json, event.error.message());
        json.push_back('}');
    } else {
        json.append("null");
    }

    if (!event.context.empty()) {
        append_string_field("context", event.context);
    }

    append_field("timestamp");
    append_timestamp(json, event.timestamp);

    json.push_back('}');
    return json;
}

}  // namespace rowscan::tools
