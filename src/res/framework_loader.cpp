/// @file framework_loader.cpp
/// @brief In-memory framework package loader

#include <restable/res/framework_loader.hpp>
#include <restable/res/table.hpp>
#include <restable/core/log.hpp>

namespace restable_res {

using restable_core::Err;
using restable_core::Error;
using restable_core::ErrorCode;
using restable_core::Ok;
using restable_core::Result;

Result<void> CachedFrameworkLoader::add(std::uint8_t id, PackageFactory factory) {
    if (!factory) {
        return Err(Error(ErrorCode::InvalidArgument,
            "Empty framework package factory for id " + std::to_string(id)));
    }
    m_cache[id] = std::move(factory);
    return Ok();
}

std::vector<std::uint8_t> CachedFrameworkLoader::cached_ids() const {
    std::vector<std::uint8_t> ids;
    ids.reserve(m_cache.size());
    for (const auto& [id, factory] : m_cache) {
        ids.push_back(id);
    }
    return ids;
}

Result<ResPackage*> CachedFrameworkLoader::load_framework_package(ResTable& table, std::uint8_t id) {
    auto it = m_cache.find(id);
    if (it == m_cache.end()) {
        return Err<ResPackage*>(Error(ErrorCode::NotFound,
            "No cached framework package with id " + std::to_string(id)));
    }

    std::unique_ptr<ResPackage> pkg = it->second();
    if (!pkg) {
        return Err<ResPackage*>(Error(ErrorCode::InvalidState,
            "Framework package factory for id " + std::to_string(id) + " produced no package"));
    }
    if (pkg->id() != id) {
        return Err<ResPackage*>(Error(ErrorCode::InvalidState,
            "Framework package factory for id " + std::to_string(id) +
            " produced package id " + std::to_string(pkg->id())));
    }

    std::string name = pkg->name();
    auto added = table.add_package(std::move(pkg), PackageRole::Framework);
    if (!added) {
        return added;
    }

    RESTABLE_LOG_DEBUG("Loaded framework package '{}' (id {}) from cache", name, id);
    return added;
}

} // namespace restable_res
