/// @file log.cpp
/// @brief Resource table logger implementation

#include <restable/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace restable_core {

namespace {

spdlog::sink_ptr make_stderr_sink() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
    return sink;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> table_logger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        auto created = std::make_shared<spdlog::logger>("restable", make_stderr_sink());
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return logger;
}

void set_log_level(spdlog::level::level_enum level) {
    table_logger()->set_level(level);
}

spdlog::level::level_enum get_log_level() {
    return table_logger()->level();
}

void set_log_sink(spdlog::sink_ptr sink) {
    auto& sinks = table_logger()->sinks();
    sinks.clear();
    sinks.push_back(sink ? std::move(sink) : make_stderr_sink());
}

// =============================================================================
// Log Scoping
// =============================================================================

LogScope::LogScope(std::string name)
    : m_name(std::move(name))
    , m_start(std::chrono::steady_clock::now())
{
    RESTABLE_LOG_TRACE(">>> Entering {}", m_name);
}

LogScope::~LogScope() {
    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - m_start);
    RESTABLE_LOG_TRACE("<<< Exiting {} ({}us)", m_name, duration.count());
}

} // namespace restable_core
