#pragma once

/// @file framework_loader.hpp
/// @brief Framework package loader interface
///
/// A FrameworkLoader supplies packages that the table does not hold yet,
/// typically framework packages kept in a cache outside the decoded file.

#include "fwd.hpp"
#include "res_package.hpp"
#include <restable/core/error.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace restable_res {

// =============================================================================
// FrameworkLoader
// =============================================================================

/// Base interface for framework package loaders
class FrameworkLoader {
public:
    virtual ~FrameworkLoader() = default;

    /// Locate the package with this id and register it with the table
    ///
    /// Implementations normally call table.add_package(..., PackageRole::Framework)
    /// and return the stored pointer.
    ///
    /// @param table Table requesting the package
    /// @param id Package id absent from the table
    /// @return Stored package, or a loader-specific error
    [[nodiscard]] virtual restable_core::Result<ResPackage*> load_framework_package(
        ResTable& table,
        std::uint8_t id) = 0;
};

// =============================================================================
// CachedFrameworkLoader
// =============================================================================

/// Builds a fresh framework package for one table
using PackageFactory = std::function<std::unique_ptr<ResPackage>()>;

/// Loader over in-memory framework package sources
///
/// Entries stay registered after a load, so one loader can serve any number
/// of tables. Each request builds a new package from the entry's factory.
class CachedFrameworkLoader : public FrameworkLoader {
public:
    CachedFrameworkLoader() = default;

    /// Register the source for a framework package id (replaces one with the same id)
    /// @return InvalidArgument for an empty factory
    [[nodiscard]] restable_core::Result<void> add(std::uint8_t id, PackageFactory factory);

    [[nodiscard]] bool contains(std::uint8_t id) const { return m_cache.count(id) > 0; }

    /// Registered ids in ascending order
    [[nodiscard]] std::vector<std::uint8_t> cached_ids() const;

    /// Build the package for id and register it with the table
    ///
    /// Fails with NotFound for an unknown id and InvalidState when the factory
    /// yields no package or one with a different id. Table errors pass through;
    /// the entry is kept in every case.
    [[nodiscard]] restable_core::Result<ResPackage*> load_framework_package(
        ResTable& table,
        std::uint8_t id) override;

private:
    std::map<std::uint8_t, PackageFactory> m_cache;
};

} // namespace restable_res
