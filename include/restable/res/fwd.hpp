#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for restable_res module

#include <cstdint>
#include <string>

namespace restable_res {

// =============================================================================
// Identifier Types
// =============================================================================

struct ResourceId;

// =============================================================================
// Data Model Types
// =============================================================================

enum class ValueType : std::uint8_t;
class ResValue;
struct ResResource;
class ResResSpec;
class ResType;
class ResPackage;

// =============================================================================
// Context Types
// =============================================================================

class SdkInfo;
struct VersionInfo;
struct TableContext;

// =============================================================================
// Table Types
// =============================================================================

/// Which partition of the table a package belongs to
enum class PackageRole : std::uint8_t {
    Main,       ///< Package owned by the application being processed
    Framework   ///< Dependency package supplying referenced resources
};

/// Which rule chose the current package
enum class SelectionSource : std::uint8_t {
    ContextId,           ///< Explicit package id from the context
    SingleMainPackage,   ///< The only main package
    HighestSpec,         ///< Largest non-base package by spec count
    FallbackPackageOne   ///< No candidate; package id 1 was used
};

struct PackageSelection;
class ResTable;
class ResourceResolver;

// =============================================================================
// Metadata Types
// =============================================================================

struct UsesFramework;
struct PackageInfo;
struct ForcedPackageId;
struct MetaInfo;
class MetaInfoAssembler;

// =============================================================================
// Collaborators
// =============================================================================

class FrameworkLoader;
class CachedFrameworkLoader;
class PlaceholderResolver;
class MapPlaceholderResolver;
class MetaInfoSink;

// =============================================================================
// Utility Functions
// =============================================================================

/// Convert PackageRole to string
[[nodiscard]] const char* package_role_to_string(PackageRole role) noexcept;

/// Convert SelectionSource to string
[[nodiscard]] const char* selection_source_to_string(SelectionSource source) noexcept;

/// ASCII case-insensitive string equality
[[nodiscard]] bool equals_ignore_case(const std::string& a, const std::string& b) noexcept;

} // namespace restable_res
