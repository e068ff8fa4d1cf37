#pragma once

/// @file context.hpp
/// @brief Processing context for a resource table
///
/// The context carries everything about the current decoding pass that is
/// not a package: the active package id, rename tracking, mode flags, SDK
/// bounds and version info. It is passed explicitly to the resolver and the
/// metadata assembler.

#include "fwd.hpp"
#include <restable/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace restable_res {

// =============================================================================
// SdkInfo
// =============================================================================

/// Insertion-ordered string map of SDK bounds
class SdkInfo {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    static constexpr const char* kMinSdkVersion = "minSdkVersion";
    static constexpr const char* kTargetSdkVersion = "targetSdkVersion";
    static constexpr const char* kMaxSdkVersion = "maxSdkVersion";

    /// Set a value; an existing key keeps its position
    void set(const std::string& key, std::string value);

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;
    [[nodiscard]] bool contains(const std::string& key) const;

    void clear() noexcept { m_entries.clear(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

    [[nodiscard]] const_iterator begin() const noexcept { return m_entries.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_entries.end(); }

    bool operator==(const SdkInfo&) const = default;

private:
    std::vector<Entry> m_entries;
};

// =============================================================================
// VersionInfo
// =============================================================================

struct VersionInfo {
    std::optional<std::string> version_name;
    std::optional<std::string> version_code;

    bool operator==(const VersionInfo&) const = default;
};

// =============================================================================
// TableContext
// =============================================================================

struct TableContext {
    std::optional<std::string> package_renamed;
    std::optional<std::string> package_original;
    std::uint8_t package_id = 0;    ///< 0 = unset
    bool analysis_mode = false;
    bool shared_library = false;
    bool sparse_resources = false;
    SdkInfo sdk_info;
    VersionInfo version_info;

    [[nodiscard]] bool has_package_id() const noexcept { return package_id != 0; }

    /// Load context from a JSON file
    ///
    /// @param path Path to the JSON file
    /// @return Parsed context or Error (NotFound / IOError / ParseError)
    [[nodiscard]] static restable_core::Result<TableContext> load(const std::filesystem::path& path);

    /// Parse context from a JSON string
    ///
    /// All fields are optional; see the layout below.
    ///
    /// ```json
    /// { "package": { "renamed": "com.b", "original": "com.a", "id": 127 },
    ///   "analysisMode": false, "sharedLibrary": false, "sparseResources": false,
    ///   "sdkInfo": { "minSdkVersion": "21" },
    ///   "versionInfo": { "versionName": "1.0", "versionCode": "1" } }
    /// ```
    [[nodiscard]] static restable_core::Result<TableContext> from_json_string(const std::string& json_str);
};

} // namespace restable_res
