#pragma once

/// @file placeholder.hpp
/// @brief Placeholder value resolution for metadata fields
///
/// Manifest values such as versionName or minSdkVersion may be symbolic
/// references ("@string/app_version", "@integer/min_sdk") instead of
/// literals. A PlaceholderResolver substitutes the concrete value.

#include "fwd.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace restable_res {

// =============================================================================
// PlaceholderResolver
// =============================================================================

class PlaceholderResolver {
public:
    virtual ~PlaceholderResolver() = default;

    /// Concrete value for a string reference
    ///
    /// @param out_dir Output directory of the decoding pass
    /// @param value Value that may be a symbolic reference
    /// @return Substitute, or nullopt if the value is concrete or unresolvable
    [[nodiscard]] virtual std::optional<std::string> resolve_string_reference(
        const std::filesystem::path& out_dir,
        const std::string& value) const = 0;

    /// Concrete value for an integer reference
    [[nodiscard]] virtual std::optional<std::string> resolve_integer_reference(
        const std::filesystem::path& out_dir,
        const std::string& value) const = 0;
};

// =============================================================================
// MapPlaceholderResolver
// =============================================================================

/// Resolver over in-memory "@string/<name>" and "@integer/<name>" tables
///
/// The output directory is not consulted; values are registered up front.
class MapPlaceholderResolver : public PlaceholderResolver {
public:
    static constexpr const char* kStringPrefix = "@string/";
    static constexpr const char* kIntegerPrefix = "@integer/";

    void add_string(const std::string& name, std::string value) {
        m_strings[name] = std::move(value);
    }

    void add_integer(const std::string& name, std::string value) {
        m_integers[name] = std::move(value);
    }

    [[nodiscard]] std::optional<std::string> resolve_string_reference(
        const std::filesystem::path& out_dir,
        const std::string& value) const override;

    [[nodiscard]] std::optional<std::string> resolve_integer_reference(
        const std::filesystem::path& out_dir,
        const std::string& value) const override;

private:
    std::map<std::string, std::string> m_strings;
    std::map<std::string, std::string> m_integers;
};

} // namespace restable_res
