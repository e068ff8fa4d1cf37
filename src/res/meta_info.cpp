/// @file meta_info.cpp
/// @brief Summary metadata assembly

#include <restable/res/meta_info.hpp>
#include <restable/res/table.hpp>
#include <restable/res/placeholder.hpp>
#include <restable/core/log.hpp>

#include <nlohmann/json.hpp>
#include <algorithm>

namespace restable_res {

using restable_core::Result;

// =============================================================================
// MetaInfo
// =============================================================================

std::string MetaInfo::to_json_string(int indent) const {
    nlohmann::ordered_json j;

    j["isFrameworkApk"] = is_framework_apk;

    if (uses_framework) {
        auto ids = nlohmann::ordered_json::array();
        for (auto id : uses_framework->ids) {
            ids.push_back(static_cast<int>(id));
        }
        j["usesFramework"] = {{"ids", ids}};
    }

    if (sdk_info) {
        auto sdk = nlohmann::ordered_json::object();
        for (const auto& [key, value] : *sdk_info) {
            sdk[key] = value;
        }
        j["sdkInfo"] = sdk;
    }

    if (package_info) {
        auto pkg = nlohmann::ordered_json::object();
        pkg["forcedPackageId"] = package_info->forced_package_id;
        if (package_info->rename_manifest_package) {
            pkg["renameManifestPackage"] = *package_info->rename_manifest_package;
        }
        j["packageInfo"] = pkg;
    }

    auto ver = nlohmann::ordered_json::object();
    if (version_info.version_code) {
        ver["versionCode"] = *version_info.version_code;
    }
    if (version_info.version_name) {
        ver["versionName"] = *version_info.version_name;
    }
    j["versionInfo"] = ver;

    j["sharedLibrary"] = shared_library;
    j["sparseResources"] = sparse_resources;

    return j.dump(indent);
}

// =============================================================================
// MetaInfoAssembler
// =============================================================================

bool MetaInfoAssembler::is_framework_set() const {
    const auto& mains = m_table.main_packages();
    return std::any_of(mains.begin(), mains.end(), [](const ResPackage* pkg) {
        return pkg->id() > 0 && pkg->id() <= kMaxFrameworkPackageId;
    });
}

std::optional<UsesFramework> MetaInfoAssembler::uses_framework() const {
    const auto& frameworks = m_table.framework_packages();
    if (frameworks.empty()) {
        return std::nullopt;
    }

    UsesFramework info;
    info.ids.reserve(frameworks.size());
    for (const auto* pkg : frameworks) {
        info.ids.push_back(pkg->id());
    }
    std::sort(info.ids.begin(), info.ids.end());
    return info;
}

std::optional<SdkInfo> MetaInfoAssembler::sdk_summary(
    const std::filesystem::path& out_dir,
    const TableContext& ctx) const {

    if (ctx.sdk_info.empty()) {
        return std::nullopt;
    }

    SdkInfo info = ctx.sdk_info;
    for (const char* key : {SdkInfo::kMinSdkVersion, SdkInfo::kTargetSdkVersion, SdkInfo::kMaxSdkVersion}) {
        auto value = info.get(key);
        if (!value) {
            continue;
        }
        if (auto resolved = m_placeholders.resolve_integer_reference(out_dir, *value)) {
            info.set(key, std::move(*resolved));
        }
    }
    return info;
}

ForcedPackageId MetaInfoAssembler::forced_package_id(const TableContext& ctx) const {
    ForcedPackageId result{ctx.package_id, ForcedPackageId::Source::ContextFallback};

    if (!ctx.package_renamed) {
        return result;
    }

    if (const ResPackage* pkg = m_table.find_package(*ctx.package_renamed)) {
        result.id = pkg->id();
        result.source = ForcedPackageId::Source::RenamedPackage;
    } else {
        RESTABLE_LOG_DEBUG(
            "Renamed package '{}' not in table, keeping package id {}",
            *ctx.package_renamed, ctx.package_id);
    }
    return result;
}

std::optional<PackageInfo> MetaInfoAssembler::package_summary(const TableContext& ctx) const {
    if (!ctx.package_original || ctx.package_original->empty()) {
        return std::nullopt;
    }

    PackageInfo info;

    // Only record a rename when the manifest package actually changes
    if (ctx.package_renamed && !equals_ignore_case(*ctx.package_renamed, *ctx.package_original)) {
        info.rename_manifest_package = *ctx.package_renamed;
    }

    info.forced_package_id = std::to_string(forced_package_id(ctx).id);
    return info;
}

VersionInfo MetaInfoAssembler::version_summary(
    const std::filesystem::path& out_dir,
    const TableContext& ctx) const {

    VersionInfo info = ctx.version_info;
    if (info.version_name) {
        if (auto resolved = m_placeholders.resolve_string_reference(out_dir, *info.version_name)) {
            info.version_name = std::move(*resolved);
        }
    }
    return info;
}

MetaInfo MetaInfoAssembler::assemble(
    const std::filesystem::path& out_dir,
    const TableContext& ctx) const {

    RESTABLE_LOG_SCOPE("MetaInfoAssembler::assemble");

    MetaInfo meta;
    meta.is_framework_apk = is_framework_set();
    meta.uses_framework = uses_framework();
    meta.sdk_info = sdk_summary(out_dir, ctx);
    meta.package_info = package_summary(ctx);
    meta.version_info = version_summary(out_dir, ctx);
    meta.shared_library = ctx.shared_library;
    meta.sparse_resources = ctx.sparse_resources;
    return meta;
}

Result<void> MetaInfoAssembler::assemble_into(
    MetaInfoSink& sink,
    const std::filesystem::path& out_dir,
    const TableContext& ctx) const {

    return sink.write(assemble(out_dir, ctx));
}

} // namespace restable_res
