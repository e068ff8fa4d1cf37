/// @file res_package.cpp
/// @brief In-memory resource package model implementation

#include <restable/res/res_package.hpp>

#include <algorithm>

namespace restable_res {

using restable_core::Err;
using restable_core::Error;
using restable_core::ErrorCode;
using restable_core::Ok;
using restable_core::Result;
using restable_core::TableError;

// =============================================================================
// ResResSpec
// =============================================================================

Result<void> ResResSpec::add_resource(std::string qualifiers, ResValue value) {
    auto it = std::find_if(m_resources.begin(), m_resources.end(),
        [&qualifiers](const ResResource& res) { return res.qualifiers == qualifiers; });
    if (it != m_resources.end()) {
        return Err(Error(ErrorCode::AlreadyExists,
            "Resource " + m_type_name + "/" + m_name + " already has a variant for config '" +
            qualifiers + "'"));
    }

    m_resources.push_back(ResResource{std::move(qualifiers), std::move(value)});
    return Ok();
}

Result<const ResResource*> ResResSpec::default_resource() const {
    for (const auto& res : m_resources) {
        if (res.is_default()) {
            return Ok<const ResResource*>(&res);
        }
    }
    Error err(TableError::undefined_resource(m_package_name, m_type_name, m_name));
    err.with_context("config", "default");
    return Err<const ResResource*>(std::move(err));
}

bool ResResSpec::has_default_resource() const {
    return std::any_of(m_resources.begin(), m_resources.end(),
        [](const ResResource& res) { return res.is_default(); });
}

// =============================================================================
// ResType
// =============================================================================

Result<const ResResSpec*> ResType::get_spec(const std::string& name) const {
    auto it = m_specs.find(name);
    if (it == m_specs.end()) {
        return Err<const ResResSpec*>(TableError::undefined_resource(m_package_name, m_name, name));
    }
    return Ok<const ResResSpec*>(it->second);
}

std::vector<std::string> ResType::spec_names() const {
    std::vector<std::string> names;
    names.reserve(m_specs.size());
    for (const auto& [name, spec] : m_specs) {
        names.push_back(name);
    }
    return names;
}

// =============================================================================
// ResPackage
// =============================================================================

Result<ResResSpec*> ResPackage::add_spec(
    std::uint8_t type_id,
    const std::string& type_name,
    std::uint16_t entry_id,
    const std::string& name) {

    if (type_id == 0) {
        return Err<ResResSpec*>(Error(ErrorCode::InvalidArgument,
            "Type id 0 is reserved (package " + m_name + ")"));
    }
    if (type_name.empty() || name.empty()) {
        return Err<ResResSpec*>(Error(ErrorCode::InvalidArgument,
            "Spec requires a type name and an entry name (package " + m_name + ")"));
    }

    // Type id and type name must stay paired
    auto by_id = m_types_by_id.find(type_id);
    auto by_name = m_types.find(type_name);
    if (by_id != m_types_by_id.end() && by_id->second->name() != type_name) {
        return Err<ResResSpec*>(Error(ErrorCode::InvalidArgument,
            "Type id " + std::to_string(type_id) + " is already named '" + by_id->second->name() +
            "', not '" + type_name + "' (package " + m_name + ")"));
    }
    if (by_name != m_types.end() && by_name->second->id() != type_id) {
        return Err<ResResSpec*>(Error(ErrorCode::InvalidArgument,
            "Type '" + type_name + "' already has id " + std::to_string(by_name->second->id()) +
            " (package " + m_name + ")"));
    }

    auto id = ResourceId::from_parts(m_id, type_id, entry_id);
    if (m_specs.count(local_key(id))) {
        return Err<ResResSpec*>(Error(ErrorCode::AlreadyExists,
            "Spec " + id.to_string() + " already defined (package " + m_name + ")"));
    }

    ResType* type = nullptr;
    if (by_name != m_types.end()) {
        type = by_name->second.get();
    }

    if (type != nullptr && type->has_spec(name)) {
        return Err<ResResSpec*>(Error(ErrorCode::AlreadyExists,
            "Spec " + type_name + "/" + name + " already defined (package " + m_name + ")"));
    }

    if (type == nullptr) {
        auto created = std::make_unique<ResType>(type_id, type_name, m_name);
        type = created.get();
        m_types.emplace(type_name, std::move(created));
        m_types_by_id.emplace(type_id, type);
    }

    auto spec = std::make_unique<ResResSpec>(id, name, type_name, m_name);
    ResResSpec* spec_ptr = spec.get();
    m_specs.emplace(local_key(id), std::move(spec));
    type->m_specs.emplace(name, spec_ptr);

    return Ok(spec_ptr);
}

Result<const ResResSpec*> ResPackage::get_spec(ResourceId id) const {
    auto it = m_specs.find(local_key(id));
    if (it == m_specs.end()) {
        return Err<const ResResSpec*>(TableError::undefined_res_object(m_name, id.raw()));
    }
    return Ok<const ResResSpec*>(it->second.get());
}

Result<const ResType*> ResPackage::get_type(const std::string& type_name) const {
    auto it = m_types.find(type_name);
    if (it == m_types.end()) {
        return Err<const ResType*>(TableError::undefined_type(m_name, type_name));
    }
    return Ok<const ResType*>(it->second.get());
}

std::vector<std::string> ResPackage::list_types() const {
    std::vector<std::string> names;
    names.reserve(m_types_by_id.size());
    for (const auto& [id, type] : m_types_by_id) {
        names.push_back(type->name());
    }
    return names;
}

} // namespace restable_res
