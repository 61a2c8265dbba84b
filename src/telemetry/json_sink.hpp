/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, console, and null.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace beaconfig {

/**
 * @brief Writes NDJSON to <log_dir>/<prefix>.ndjson with size-based rotation.
 *
 * When the active file reaches max_file_size_mb it is renamed to
 * <prefix>.1.ndjson (older generations shift up by one) and a fresh file is
 * opened. At most max_files rotated generations are kept.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 10,
                 uint32_t max_files = 3);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path active_path() const;
    [[nodiscard]] std::filesystem::path generation_path(uint32_t generation) const;

    /// Byte limit override, for rotation without writing megabytes.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void open_active();
    void rotate_if_needed();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
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
 * @brief Writes to stderr, keeping stdout free for command output.
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

}  // namespace beaconfig
