/**
 * @file json_sink.hpp
 * @brief Log sinks: NDJSON file, stdout, in-memory, and null.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace node_order {

/**
 * @brief Appends NDJSON lines to `<log_dir>/<prefix>.ndjson`.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir, const std::string& prefix);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] bool is_open() const { return current_file_.is_open(); }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::ofstream current_file_;
};

/**
 * @brief Writes to stdout, for development and debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Keeps every line in memory so tests can assert on warnings.
 *
 * Not synchronized on its own: read it only once the writers are done.
 */
class MemorySink : public ILogSink {
public:
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

    [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return lines_; }
    [[nodiscard]] size_t count_containing(std::string_view needle) const;
    [[nodiscard]] bool contains(std::string_view needle) const { return count_containing(needle) > 0; }
    void clear() { lines_.clear(); }

private:
    std::vector<std::string> lines_;
};

/**
 * @brief Discards all output, for benchmarks.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace node_order
