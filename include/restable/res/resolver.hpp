#pragma once

/// @file resolver.hpp
/// @brief Resource identifier resolution
///
/// The ResourceResolver turns a packed resource id, or a
/// (package, type, name) path, into the spec or value it designates.
/// Every miss is returned to the caller; nothing is retried or skipped.

#include "fwd.hpp"
#include "context.hpp"
#include "resource_id.hpp"
#include "res_package.hpp"
#include <restable/core/error.hpp>

#include <cstdint>
#include <string>

namespace restable_res {

/// Package id assumed for shared-library references when the context has none
///
/// Fixed legacy convention of the platform tooling: a shared library's
/// self-references resolve to package 2 until a real package id is known.
inline constexpr std::uint8_t kSharedLibraryDefaultPackageId = 2;

// =============================================================================
// ResourceResolver
// =============================================================================

/// Resolves resource ids against a table under an explicit context
///
/// The resolver holds references only; the table and any caller-supplied
/// context must outlive it. Without a supplied context the table's current
/// context is read on every lookup.
/// Resolution may load framework packages through the table's loader.
class ResourceResolver {
public:
    /// Resolve against the table's own context, following later set_context calls
    explicit ResourceResolver(ResTable& table);

    /// Resolve against a caller-supplied context
    ResourceResolver(ResTable& table, const TableContext& ctx);

    /// Id actually looked up for a given id
    ///
    /// Package byte 0 is replaced by the context package id, or by
    /// kSharedLibraryDefaultPackageId when the context has none. Other ids
    /// are returned unchanged.
    [[nodiscard]] ResourceId effective_id(ResourceId id) const noexcept;

    /// Resolve a packed id to its spec
    ///
    /// @return Spec, or UndefinedPackage / UndefinedResObject
    [[nodiscard]] restable_core::Result<const ResResSpec*> resolve(std::uint32_t raw_id);
    [[nodiscard]] restable_core::Result<const ResResSpec*> resolve(ResourceId id);

    /// Resolve a packed id to the default value of its spec
    [[nodiscard]] restable_core::Result<const ResValue*> resolve_value(std::uint32_t raw_id);

    /// Resolve package name, type name and entry name to the default value
    ///
    /// @return Value, or UndefinedPackage / UndefinedType / UndefinedResource
    [[nodiscard]] restable_core::Result<const ResValue*> resolve_by_path(
        const std::string& package_name,
        const std::string& type_name,
        const std::string& resource_name) const;

private:
    [[nodiscard]] const TableContext& context() const noexcept;

    ResTable& m_table;
    const TableContext* m_context = nullptr;  // null: use m_table.context()
};

} // namespace restable_res
