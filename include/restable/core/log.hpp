#pragma once

/// @file log.hpp
/// @brief Resource table logger
///
/// All restable diagnostics go to one spdlog logger named "restable". It
/// writes to stderr at warn level until the host changes the level or sink.

#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define RESTABLE_LOG_TRACE(...) ::restable_core::table_logger()->trace(__VA_ARGS__)
#define RESTABLE_LOG_DEBUG(...) ::restable_core::table_logger()->debug(__VA_ARGS__)
#define RESTABLE_LOG_WARN(...) ::restable_core::table_logger()->warn(__VA_ARGS__)

namespace restable_core {

/// Logger shared by every table, resolver and assembler
std::shared_ptr<spdlog::logger> table_logger();

/// Set the table logger level
void set_log_level(spdlog::level::level_enum level);

/// Current table logger level
[[nodiscard]] spdlog::level::level_enum get_log_level();

/// Route table diagnostics to a host sink instead of stderr
///
/// Not synchronized with logging calls; install the sink before tables are used.
/// A null sink restores the stderr sink.
void set_log_sink(spdlog::sink_ptr sink);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// Traces entry and exit of a block with its duration
class LogScope {
public:
    explicit LogScope(std::string name);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::chrono::steady_clock::time_point m_start;
};

#define RESTABLE_LOG_CONCAT_INNER(a, b) a##b
#define RESTABLE_LOG_CONCAT(a, b) RESTABLE_LOG_CONCAT_INNER(a, b)
#define RESTABLE_LOG_SCOPE(name) \
    ::restable_core::LogScope RESTABLE_LOG_CONCAT(_log_scope_, __LINE__)(name)

} // namespace restable_core
