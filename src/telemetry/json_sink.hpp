/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, console, null and in-memory.
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace pipeseg {

/**
 * @brief Writes NDJSON to "<log_dir>/<prefix>.ndjson", rotating to
 *        "<prefix>.1.ndjson" ... "<prefix>.<max_files-1>.ndjson".
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stderr, leaving stdout to program output.
 */
class StderrSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Appends every line to a caller-owned vector.
 *
 * The vector must outlive the sink. Used by tests to inspect log output.
 */
class MemorySink : public ILogSink {
public:
    explicit MemorySink(std::vector<std::string>& lines) : lines_(lines) {}

    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

}  // namespace pipeseg
