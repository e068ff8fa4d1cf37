#pragma once

/// @file res_package.hpp
/// @brief In-memory resource package model
///
/// A ResPackage is a namespace of types, each type a namespace of named
/// specs, each spec a set of configuration variants. The binary table parser
/// populates these objects; the table and resolver only query them.

#include "fwd.hpp"
#include "resource_id.hpp"
#include "value.hpp"
#include <restable/core/error.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace restable_res {

// =============================================================================
// ResResource
// =============================================================================

/// One configuration variant of a spec
struct ResResource {
    std::string qualifiers;   ///< Configuration qualifiers, empty for the default
    ResValue value;

    [[nodiscard]] bool is_default() const noexcept { return qualifiers.empty(); }
};

// =============================================================================
// ResResSpec
// =============================================================================

/// A named resource entry and its configuration variants
class ResResSpec {
public:
    ResResSpec(ResourceId id, std::string name, std::string type_name, std::string package_name)
        : m_id(id)
        , m_name(std::move(name))
        , m_type_name(std::move(type_name))
        , m_package_name(std::move(package_name)) {}

    [[nodiscard]] ResourceId id() const noexcept { return m_id; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const std::string& type_name() const noexcept { return m_type_name; }
    [[nodiscard]] const std::string& package_name() const noexcept { return m_package_name; }

    /// Add a configuration variant
    ///
    /// @return Error (AlreadyExists) if a variant with these qualifiers exists
    [[nodiscard]] restable_core::Result<void> add_resource(std::string qualifiers, ResValue value);

    /// Get the variant with empty qualifiers
    ///
    /// @return The default variant, or UndefinedResource if the spec has none
    [[nodiscard]] restable_core::Result<const ResResource*> default_resource() const;

    [[nodiscard]] bool has_default_resource() const;

    [[nodiscard]] const std::vector<ResResource>& resources() const noexcept { return m_resources; }
    [[nodiscard]] std::size_t resource_count() const noexcept { return m_resources.size(); }

private:
    ResourceId m_id;
    std::string m_name;
    std::string m_type_name;
    std::string m_package_name;
    std::vector<ResResource> m_resources;
};

// =============================================================================
// ResType
// =============================================================================

/// A resource type within one package (string, drawable, ...)
class ResType {
public:
    ResType(std::uint8_t id, std::string name, std::string package_name)
        : m_id(id), m_name(std::move(name)), m_package_name(std::move(package_name)) {}

    [[nodiscard]] std::uint8_t id() const noexcept { return m_id; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    /// Get a spec by entry name
    ///
    /// @return The spec, or UndefinedResource naming package, type and entry
    [[nodiscard]] restable_core::Result<const ResResSpec*> get_spec(const std::string& name) const;

    [[nodiscard]] bool has_spec(const std::string& name) const {
        return m_specs.find(name) != m_specs.end();
    }

    [[nodiscard]] std::size_t spec_count() const noexcept { return m_specs.size(); }

    /// Entry names in lexical order
    [[nodiscard]] std::vector<std::string> spec_names() const;

private:
    friend class ResPackage;

    std::uint8_t m_id;
    std::string m_name;
    std::string m_package_name;
    std::map<std::string, ResResSpec*> m_specs;  // Owned by the package
};

// =============================================================================
// ResPackage
// =============================================================================

/// A resource package: numeric id, unique name, and the specs it defines
///
/// Specs are keyed by (type id, entry id); the package byte of a lookup id is
/// not consulted, since callers route ids to the owning package first.
class ResPackage {
public:
    ResPackage(std::uint8_t id, std::string name)
        : m_id(id), m_name(std::move(name)) {}

    // Non-copyable, movable
    ResPackage(const ResPackage&) = delete;
    ResPackage& operator=(const ResPackage&) = delete;
    ResPackage(ResPackage&&) = default;
    ResPackage& operator=(ResPackage&&) = default;

    [[nodiscard]] std::uint8_t id() const noexcept { return m_id; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    // =========================================================================
    // Population (used by the table parser)
    // =========================================================================

    /// Define a spec, creating its type on first use
    ///
    /// @param type_id Type id (1-255)
    /// @param type_name Type name; must agree with earlier uses of type_id
    /// @param entry_id Entry id within the type
    /// @param name Entry name, unique within its type
    /// @return The new spec, or Error (AlreadyExists / InvalidArgument)
    [[nodiscard]] restable_core::Result<ResResSpec*> add_spec(
        std::uint8_t type_id,
        const std::string& type_name,
        std::uint16_t entry_id,
        const std::string& name);

    // =========================================================================
    // Queries
    // =========================================================================

    /// Number of specs this package defines
    [[nodiscard]] std::size_t spec_count() const noexcept { return m_specs.size(); }

    /// Look up a spec by (type id, entry id)
    [[nodiscard]] restable_core::Result<const ResResSpec*> get_spec(ResourceId id) const;

    [[nodiscard]] bool has_spec(ResourceId id) const {
        return m_specs.find(local_key(id)) != m_specs.end();
    }

    /// Look up a type by name
    [[nodiscard]] restable_core::Result<const ResType*> get_type(const std::string& type_name) const;

    [[nodiscard]] bool has_type(const std::string& type_name) const {
        return m_types.find(type_name) != m_types.end();
    }

    /// Type names in type-id order
    [[nodiscard]] std::vector<std::string> list_types() const;

private:
    [[nodiscard]] static constexpr std::uint32_t local_key(ResourceId id) noexcept {
        return id.raw() & 0x00FFFFFFu;
    }

    std::uint8_t m_id;
    std::string m_name;
    std::map<std::string, std::unique_ptr<ResType>> m_types;
    std::map<std::uint8_t, ResType*> m_types_by_id;
    std::map<std::uint32_t, std::unique_ptr<ResResSpec>> m_specs;
};

} // namespace restable_res
