#pragma once

/// @file table.hpp
/// @brief Resource table: the registry of loaded packages
///
/// The ResTable owns every package loaded for one decoding pass: the
/// application's own (main) packages and the framework packages they depend
/// on. Packages are indexed by numeric id and by name; both indices are
/// updated together or not at all.

#include "fwd.hpp"
#include "context.hpp"
#include "res_package.hpp"
#include <restable/core/error.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace restable_res {

// =============================================================================
// PackageSelection
// =============================================================================

/// A package chosen by one of the current-package rules, and which rule chose it
struct PackageSelection {
    ResPackage* package = nullptr;
    SelectionSource source = SelectionSource::ContextId;

    /// True when a heuristic, not explicit context, decided
    [[nodiscard]] bool is_heuristic() const noexcept {
        return source == SelectionSource::HighestSpec
            || source == SelectionSource::FallbackPackageOne;
    }
};

// =============================================================================
// ResTable
// =============================================================================

/// Registry of resource packages for one decoding pass
///
/// Thread-safety: NOT thread-safe. Packages are registered during a setup
/// phase by a single owner; concurrent registration needs external locking.
class ResTable {
public:
    /// Name of the platform base framework, excluded from the spec-count heuristic
    static constexpr const char* kBaseFrameworkName = "android";

    /// Package id used when no other candidate exists
    static constexpr std::uint8_t kBaseFrameworkId = 1;

    // =========================================================================
    // Construction
    // =========================================================================

    ResTable() = default;

    /// Construct bound to a framework loader (not owned, must outlive the table)
    explicit ResTable(FrameworkLoader* loader) : m_loader(loader) {}

    // Non-copyable, non-movable: resolvers and loaders hold references into the table
    ResTable(const ResTable&) = delete;
    ResTable& operator=(const ResTable&) = delete;
    ResTable(ResTable&&) = delete;
    ResTable& operator=(ResTable&&) = delete;

    void set_framework_loader(FrameworkLoader* loader) noexcept { m_loader = loader; }
    [[nodiscard]] FrameworkLoader* framework_loader() const noexcept { return m_loader; }

    // =========================================================================
    // Registration
    // =========================================================================

    /// Add a package to the table
    ///
    /// @param pkg Package to take ownership of
    /// @param role Main or framework partition
    /// @return Stored package, or Error (DuplicateId / DuplicateName / InvalidArgument).
    ///         On error the table is unchanged.
    [[nodiscard]] restable_core::Result<ResPackage*> add_package(
        std::unique_ptr<ResPackage> pkg,
        PackageRole role);

    // =========================================================================
    // Lookup
    // =========================================================================

    /// Get a package by id, delegating to the framework loader on a miss
    ///
    /// @return Package, or UndefinedPackage if absent and not loadable
    [[nodiscard]] restable_core::Result<ResPackage*> get_package_by_id(std::uint8_t id);

    /// Get a package by name
    ///
    /// @return Package, or UndefinedPackage
    [[nodiscard]] restable_core::Result<ResPackage*> get_package_by_name(const std::string& name) const;

    /// Non-failing lookups (no loader delegation)
    [[nodiscard]] ResPackage* find_package(std::uint8_t id) const;
    [[nodiscard]] ResPackage* find_package(const std::string& name) const;

    [[nodiscard]] bool has_package(std::uint8_t id) const { return m_by_id.count(id) > 0; }
    [[nodiscard]] bool has_package(const std::string& name) const { return m_by_name.count(name) > 0; }

    /// Partition a stored package belongs to
    [[nodiscard]] std::optional<PackageRole> role_of(const ResPackage& pkg) const;

    // =========================================================================
    // Heuristic Selection
    // =========================================================================

    /// Package with the most specs, ignoring the base framework
    ///
    /// Packages are visited in ascending id order and ties keep the first
    /// visited. A package with no specs is never chosen. When nothing
    /// qualifies, package 1 is returned (through get_package_by_id, so the loader
    /// may supply it).
    [[nodiscard]] restable_core::Result<PackageSelection> highest_spec_package();

    /// Package the current decoding pass refers to
    ///
    /// 1. The package whose id is ctx.package_id, if stored.
    /// 2. Otherwise the only main package, if there is exactly one.
    /// 3. Otherwise highest_spec_package().
    [[nodiscard]] restable_core::Result<PackageSelection> current_package(const TableContext& ctx);

    /// current_package() against the table's own context
    [[nodiscard]] restable_core::Result<PackageSelection> current_package() {
        return current_package(m_context);
    }

    // =========================================================================
    // Listings
    // =========================================================================

    [[nodiscard]] const std::vector<ResPackage*>& main_packages() const noexcept { return m_main; }
    [[nodiscard]] const std::vector<ResPackage*>& framework_packages() const noexcept { return m_framework; }

    /// All packages in ascending id order
    [[nodiscard]] std::vector<ResPackage*> packages() const;

    [[nodiscard]] std::size_t package_count() const noexcept { return m_packages.size(); }

    // =========================================================================
    // Context
    // =========================================================================

    [[nodiscard]] const TableContext& context() const noexcept { return m_context; }
    [[nodiscard]] TableContext& context_mut() noexcept { return m_context; }
    void set_context(TableContext ctx) { m_context = std::move(ctx); }

    void set_package_renamed(std::string name) { m_context.package_renamed = std::move(name); }
    void set_package_original(std::string name) { m_context.package_original = std::move(name); }
    void set_package_id(std::uint8_t id) noexcept { m_context.package_id = id; }
    void set_analysis_mode(bool mode) noexcept { m_context.analysis_mode = mode; }
    void set_shared_library(bool flag) noexcept { m_context.shared_library = flag; }
    void set_sparse_resources(bool flag) noexcept { m_context.sparse_resources = flag; }

    void add_sdk_info(const std::string& key, std::string value) {
        m_context.sdk_info.set(key, std::move(value));
    }
    void clear_sdk_info() noexcept { m_context.sdk_info.clear(); }

    void set_version_name(std::string name) { m_context.version_info.version_name = std::move(name); }
    void set_version_code(std::string code) { m_context.version_info.version_code = std::move(code); }

    // =========================================================================
    // Debugging
    // =========================================================================

    /// Format table state as string
    [[nodiscard]] std::string format_state() const;

private:
    FrameworkLoader* m_loader = nullptr;

    std::vector<std::unique_ptr<ResPackage>> m_packages;  // Owning, insertion order
    std::map<std::uint8_t, ResPackage*> m_by_id;
    std::map<std::string, ResPackage*> m_by_name;
    std::vector<ResPackage*> m_main;
    std::vector<ResPackage*> m_framework;

    TableContext m_context;
};

} // namespace restable_res
