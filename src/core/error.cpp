/// @file error.cpp
/// @brief Error handling implementation for restable_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Table error factories that need hex formatting
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <restable/core/error.hpp>
#include <cstdio>
#include <sstream>
#include <vector>

namespace restable_core {

namespace {

std::string format_hex_id(std::uint32_t resource_id) {
    char buf[11];
    std::snprintf(buf, sizeof(buf), "0x%08x", resource_id);
    return std::string(buf);
}

} // anonymous namespace

// =============================================================================
// TableError
// =============================================================================

TableError TableError::undefined_res_object(std::uint32_t resource_id) {
    return TableError{Kind::UndefinedResObject,
        "Undefined resource spec: " + format_hex_id(resource_id), {}, {}, {}, resource_id};
}

TableError TableError::undefined_res_object(const std::string& package, std::uint32_t resource_id) {
    return TableError{Kind::UndefinedResObject,
        "Undefined resource spec: " + format_hex_id(resource_id) + " (package " + package + ")",
        package, {}, {}, resource_id};
}

const char* table_error_kind_name(TableError::Kind kind) {
    switch (kind) {
        case TableError::Kind::DuplicateId: return "DuplicateId";
        case TableError::Kind::DuplicateName: return "DuplicateName";
        case TableError::Kind::UndefinedPackage: return "UndefinedPackage";
        case TableError::Kind::UndefinedType: return "UndefinedType";
        case TableError::Kind::UndefinedResource: return "UndefinedResource";
        case TableError::Kind::UndefinedResObject: return "UndefinedResObject";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format table error with its kind; the message already names the subject
std::string format_table_error(const TableError& err) {
    std::ostringstream oss;
    oss << "[" << table_error_kind_name(err.kind) << "] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    // Error code
    oss << "[" << error_code_name(error.code()) << "] ";

    // Main message based on variant type
    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, TableError>) {
            oss << detail::format_table_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " (" << key << ": " << value << ")";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint32_t, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

} // namespace restable_core
