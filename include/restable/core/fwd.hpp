#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for restable_core module

#include <cstdint>

namespace restable_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct TableError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

class LogScope;

} // namespace restable_core
