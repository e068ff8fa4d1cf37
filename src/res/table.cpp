/// @file table.cpp
/// @brief Resource table implementation

#include <restable/res/table.hpp>
#include <restable/res/framework_loader.hpp>
#include <restable/core/log.hpp>

#include <sstream>
#include <algorithm>

namespace restable_res {

using restable_core::Err;
using restable_core::Error;
using restable_core::ErrorCode;
using restable_core::Ok;
using restable_core::Result;
using restable_core::TableError;

// =============================================================================
// Registration
// =============================================================================

Result<ResPackage*> ResTable::add_package(std::unique_ptr<ResPackage> pkg, PackageRole role) {
    if (!pkg) {
        return Err<ResPackage*>(Error(ErrorCode::InvalidArgument, "Cannot add a null package"));
    }

    if (pkg->id() == 0) {
        return Err<ResPackage*>(Error(ErrorCode::InvalidArgument,
            "Package id 0 is reserved for shared-library references (package " + pkg->name() + ")"));
    }

    // Check both keys before touching either index
    if (m_by_id.count(pkg->id())) {
        RESTABLE_LOG_WARN("Rejected package '{}': id {} already registered",
            pkg->name(), pkg->id());
        return Err<ResPackage*>(TableError::duplicate_id(pkg->id()));
    }

    if (m_by_name.count(pkg->name())) {
        RESTABLE_LOG_WARN("Rejected package id {}: name '{}' already registered",
            pkg->id(), pkg->name());
        return Err<ResPackage*>(TableError::duplicate_name(pkg->name()));
    }

    ResPackage* stored = pkg.get();
    m_packages.push_back(std::move(pkg));
    m_by_id.emplace(stored->id(), stored);
    m_by_name.emplace(stored->name(), stored);

    if (role == PackageRole::Main) {
        m_main.push_back(stored);
    } else {
        m_framework.push_back(stored);
    }

    RESTABLE_LOG_DEBUG("Registered {} package '{}' (id {}, {} specs)",
        package_role_to_string(role), stored->name(), stored->id(), stored->spec_count());

    return Ok(stored);
}

// =============================================================================
// Lookup
// =============================================================================

Result<ResPackage*> ResTable::get_package_by_id(std::uint8_t id) {
    if (ResPackage* pkg = find_package(id)) {
        return Ok(pkg);
    }

    if (m_loader == nullptr) {
        return Err<ResPackage*>(TableError::undefined_package_id(id));
    }

    RESTABLE_LOG_DEBUG("Package id {} not loaded, asking framework loader", id);

    auto loaded = m_loader->load_framework_package(*this, id);
    if (!loaded) {
        Error err(TableError::undefined_package_id(id));
        err.with_context("cause", loaded.error().message());
        return Err<ResPackage*>(std::move(err));
    }

    if (*loaded == nullptr) {
        return Err<ResPackage*>(TableError::undefined_package_id(id));
    }

    return loaded;
}

Result<ResPackage*> ResTable::get_package_by_name(const std::string& name) const {
    if (ResPackage* pkg = find_package(name)) {
        return Ok(pkg);
    }
    return Err<ResPackage*>(TableError::undefined_package_name(name));
}

ResPackage* ResTable::find_package(std::uint8_t id) const {
    auto it = m_by_id.find(id);
    return it != m_by_id.end() ? it->second : nullptr;
}

ResPackage* ResTable::find_package(const std::string& name) const {
    auto it = m_by_name.find(name);
    return it != m_by_name.end() ? it->second : nullptr;
}

std::optional<PackageRole> ResTable::role_of(const ResPackage& pkg) const {
    if (std::find(m_main.begin(), m_main.end(), &pkg) != m_main.end()) {
        return PackageRole::Main;
    }
    if (std::find(m_framework.begin(), m_framework.end(), &pkg) != m_framework.end()) {
        return PackageRole::Framework;
    }
    return std::nullopt;
}

// =============================================================================
// Heuristic Selection
// =============================================================================

Result<PackageSelection> ResTable::highest_spec_package() {
    ResPackage* best = nullptr;
    std::size_t best_count = 0;

    for (const auto& [id, pkg] : m_by_id) {
        if (pkg->spec_count() > best_count && !equals_ignore_case(pkg->name(), kBaseFrameworkName)) {
            best_count = pkg->spec_count();
            best = pkg;
        }
    }

    if (best != nullptr) {
        RESTABLE_LOG_DEBUG("Highest-spec package is '{}' ({} specs)",
            best->name(), best_count);
        return Ok(PackageSelection{best, SelectionSource::HighestSpec});
    }

    // Only the base framework (or nothing) is loaded
    auto fallback = get_package_by_id(kBaseFrameworkId);
    if (!fallback) {
        return Err<PackageSelection>(fallback.error());
    }

    RESTABLE_LOG_DEBUG("No application package found, falling back to package {}",
        kBaseFrameworkId);
    return Ok(PackageSelection{*fallback, SelectionSource::FallbackPackageOne});
}

Result<PackageSelection> ResTable::current_package(const TableContext& ctx) {
    if (ResPackage* pkg = find_package(ctx.package_id)) {
        return Ok(PackageSelection{pkg, SelectionSource::ContextId});
    }

    if (m_main.size() == 1) {
        return Ok(PackageSelection{m_main.front(), SelectionSource::SingleMainPackage});
    }

    return highest_spec_package();
}

// =============================================================================
// Listings
// =============================================================================

std::vector<ResPackage*> ResTable::packages() const {
    std::vector<ResPackage*> result;
    result.reserve(m_by_id.size());
    for (const auto& [id, pkg] : m_by_id) {
        result.push_back(pkg);
    }
    return result;
}

// =============================================================================
// Debugging
// =============================================================================

std::string ResTable::format_state() const {
    std::ostringstream oss;
    oss << "Resource Table State\n";
    oss << "====================\n\n";

    oss << "Packages: " << m_packages.size()
        << " (" << m_main.size() << " main, " << m_framework.size() << " framework)\n";
    oss << "Context package id: " << static_cast<unsigned>(m_context.package_id) << "\n";
    if (m_context.package_original) {
        oss << "Original package: " << *m_context.package_original << "\n";
    }
    if (m_context.package_renamed) {
        oss << "Renamed package: " << *m_context.package_renamed << "\n";
    }
    oss << "\n";

    for (const auto& [id, pkg] : m_by_id) {
        auto role = role_of(*pkg);
        oss << "  0x" << std::hex << static_cast<unsigned>(id) << std::dec
            << " " << pkg->name()
            << " [" << (role ? package_role_to_string(*role) : "unknown") << "] "
            << pkg->spec_count() << " specs\n";
    }

    return oss.str();
}

} // namespace restable_res
