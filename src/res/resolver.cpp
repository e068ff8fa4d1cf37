/// @file resolver.cpp
/// @brief Resource identifier resolution implementation

#include <restable/res/resolver.hpp>
#include <restable/res/table.hpp>
#include <restable/core/log.hpp>

namespace restable_res {

using restable_core::Err;
using restable_core::Ok;
using restable_core::Result;

ResourceResolver::ResourceResolver(ResTable& table)
    : m_table(table) {}

ResourceResolver::ResourceResolver(ResTable& table, const TableContext& ctx)
    : m_table(table), m_context(&ctx) {}

const TableContext& ResourceResolver::context() const noexcept {
    return m_context ? *m_context : m_table.context();
}

ResourceId ResourceResolver::effective_id(ResourceId id) const noexcept {
    if (!id.is_shared_library_ref()) {
        return id;
    }
    const TableContext& ctx = context();
    std::uint8_t pkg_id = ctx.has_package_id()
        ? ctx.package_id
        : kSharedLibraryDefaultPackageId;
    return id.with_package(pkg_id);
}

Result<const ResResSpec*> ResourceResolver::resolve(std::uint32_t raw_id) {
    return resolve(ResourceId(raw_id));
}

Result<const ResResSpec*> ResourceResolver::resolve(ResourceId id) {
    ResourceId target = effective_id(id);
    if (target != id) {
        RESTABLE_LOG_TRACE("Shared-library reference {} resolved as {}",
            id.to_string(), target.to_string());
    }

    auto pkg = m_table.get_package_by_id(target.package_id());
    if (!pkg) {
        return Err<const ResResSpec*>(pkg.error());
    }

    return (*pkg)->get_spec(target);
}

Result<const ResValue*> ResourceResolver::resolve_value(std::uint32_t raw_id) {
    auto spec = resolve(raw_id);
    if (!spec) {
        return Err<const ResValue*>(spec.error());
    }

    auto res = (*spec)->default_resource();
    if (!res) {
        return Err<const ResValue*>(res.error());
    }
    return Ok<const ResValue*>(&(*res)->value);
}

Result<const ResValue*> ResourceResolver::resolve_by_path(
    const std::string& package_name,
    const std::string& type_name,
    const std::string& resource_name) const {

    auto pkg = m_table.get_package_by_name(package_name);
    if (!pkg) {
        return Err<const ResValue*>(pkg.error());
    }

    auto type = (*pkg)->get_type(type_name);
    if (!type) {
        return Err<const ResValue*>(type.error());
    }

    auto spec = (*type)->get_spec(resource_name);
    if (!spec) {
        return Err<const ResValue*>(spec.error());
    }

    auto res = (*spec)->default_resource();
    if (!res) {
        return Err<const ResValue*>(res.error());
    }
    return Ok<const ResValue*>(&(*res)->value);
}

} // namespace restable_res
