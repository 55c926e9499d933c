/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 * @author Dimitris Kafetzis
 */

#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

namespace node_order {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir, const std::string& prefix)
    : path_(log_dir / (prefix + ".ndjson")) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (!ec) {
        current_file_.open(path_, std::ios::app);
    }
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

void JsonFileSink::write(std::string_view json_line) {
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

// ── MemorySink ───────────────────────────────

size_t MemorySink::count_containing(std::string_view needle) const {
    return static_cast<size_t>(std::count_if(lines_.begin(), lines_.end(),
        [needle](const std::string& line) {
            return line.find(needle) != std::string::npos;
        }));
}

}  // namespace node_order
