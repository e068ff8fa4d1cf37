#pragma once

/// @file meta_info.hpp
/// @brief Summary metadata for a decoded resource set
///
/// The MetaInfoAssembler reads the table and the context once, at the end
/// of a decoding pass, and produces an immutable MetaInfo record that a
/// MetaInfoSink persists.
///
/// Every assembly step is a plain value computation except one: the forced
/// package id. Resolving the renamed package is best-effort and reports
/// whether it fell back to the context id, through ForcedPackageId rather
/// than an Error.

#include "fwd.hpp"
#include "context.hpp"
#include <restable/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace restable_res {

// =============================================================================
// Summary Records
// =============================================================================

/// Framework packages the resource set depends on
struct UsesFramework {
    std::vector<std::uint8_t> ids;   ///< Ascending

    bool operator==(const UsesFramework&) const = default;
};

/// Package rename tracking
struct PackageInfo {
    std::optional<std::string> rename_manifest_package;   ///< Only when the name changed
    std::string forced_package_id;

    bool operator==(const PackageInfo&) const = default;
};

/// Outcome of the best-effort renamed-package lookup
struct ForcedPackageId {
    enum class Source : std::uint8_t {
        RenamedPackage,    ///< Id of the package named by package_renamed
        ContextFallback    ///< Renamed package not found; context id kept
    };

    std::uint8_t id = 0;
    Source source = Source::ContextFallback;

    [[nodiscard]] bool fell_back() const noexcept { return source == Source::ContextFallback; }
};

/// Immutable summary of one decoded resource set
struct MetaInfo {
    bool is_framework_apk = false;
    std::optional<UsesFramework> uses_framework;
    std::optional<SdkInfo> sdk_info;
    std::optional<PackageInfo> package_info;
    VersionInfo version_info;
    bool shared_library = false;
    bool sparse_resources = false;

    /// Render as JSON (absent optionals are omitted)
    [[nodiscard]] std::string to_json_string(int indent = 2) const;
};

// =============================================================================
// MetaInfoSink
// =============================================================================

/// Consumer that persists a MetaInfo record
class MetaInfoSink {
public:
    virtual ~MetaInfoSink() = default;

    [[nodiscard]] virtual restable_core::Result<void> write(const MetaInfo& meta) = 0;
};

// =============================================================================
// MetaInfoAssembler
// =============================================================================

class MetaInfoAssembler {
public:
    /// Highest package id reserved for platform frameworks
    static constexpr std::uint8_t kMaxFrameworkPackageId = 63;

    MetaInfoAssembler(const ResTable& table, const PlaceholderResolver& placeholders)
        : m_table(table), m_placeholders(placeholders) {}

    /// True if any main package has an id in [1, 63]
    [[nodiscard]] bool is_framework_set() const;

    /// Framework package ids in ascending order, or nullopt when there are none
    [[nodiscard]] std::optional<UsesFramework> uses_framework() const;

    /// SDK bounds with integer references substituted, or nullopt when empty
    [[nodiscard]] std::optional<SdkInfo> sdk_summary(
        const std::filesystem::path& out_dir,
        const TableContext& ctx) const;

    /// Id of the renamed package, falling back to the context id
    [[nodiscard]] ForcedPackageId forced_package_id(const TableContext& ctx) const;

    /// Rename record, or nullopt when no original package name is known
    [[nodiscard]] std::optional<PackageInfo> package_summary(const TableContext& ctx) const;

    /// Version info with a string reference in version_name substituted
    [[nodiscard]] VersionInfo version_summary(
        const std::filesystem::path& out_dir,
        const TableContext& ctx) const;

    /// Run every step
    [[nodiscard]] MetaInfo assemble(
        const std::filesystem::path& out_dir,
        const TableContext& ctx) const;

    /// Assemble and hand the result to a sink
    [[nodiscard]] restable_core::Result<void> assemble_into(
        MetaInfoSink& sink,
        const std::filesystem::path& out_dir,
        const TableContext& ctx) const;

private:
    const ResTable& m_table;
    const PlaceholderResolver& m_placeholders;
};

} // namespace restable_res
