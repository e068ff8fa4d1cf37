/// @file context.cpp
/// @brief Table context and its JSON configuration

#include <restable/res/context.hpp>

#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace restable_res {

using restable_core::Err;
using restable_core::Error;
using restable_core::ErrorCode;
using restable_core::Ok;
using restable_core::Result;

// =============================================================================
// SdkInfo
// =============================================================================

void SdkInfo::set(const std::string& key, std::string value) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [&key](const Entry& e) { return e.first == key; });
    if (it != m_entries.end()) {
        it->second = std::move(value);
        return;
    }
    m_entries.emplace_back(key, std::move(value));
}

std::optional<std::string> SdkInfo::get(const std::string& key) const {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [&key](const Entry& e) { return e.first == key; });
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SdkInfo::contains(const std::string& key) const {
    return get(key).has_value();
}

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

Error field_error(const std::string& field, const std::string& expected) {
    return Error(ErrorCode::ParseError, "Field '" + field + "' must be " + expected);
}

/// Read an optional string field
Result<void> read_string(const nlohmann::ordered_json& obj, const char* key,
                         const std::string& path, std::optional<std::string>& out) {
    if (!obj.contains(key)) {
        return Ok();
    }
    const auto& v = obj[key];
    if (v.is_null()) {
        return Ok();
    }
    if (!v.is_string()) {
        return Err(field_error(path, "a string"));
    }
    out = v.get<std::string>();
    return Ok();
}

/// Read a string-or-integer scalar (SDK levels and version codes appear as both)
Result<std::string> read_scalar(const nlohmann::ordered_json& v, const std::string& path) {
    if (v.is_string()) {
        return Ok(v.get<std::string>());
    }
    if (v.is_number_integer()) {
        return Ok(std::to_string(v.get<std::int64_t>()));
    }
    return Err<std::string>(field_error(path, "a string or an integer"));
}

Result<void> read_bool(const nlohmann::ordered_json& obj, const char* key, bool& out) {
    if (!obj.contains(key)) {
        return Ok();
    }
    const auto& v = obj[key];
    if (!v.is_boolean()) {
        return Err(field_error(key, "a boolean"));
    }
    out = v.get<bool>();
    return Ok();
}

} // anonymous namespace

// =============================================================================
// TableContext
// =============================================================================

Result<TableContext> TableContext::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<TableContext>(Error(ErrorCode::NotFound,
            "Context file not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<TableContext>(Error(ErrorCode::IOError,
            "Failed to open context file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_json_string(buffer.str());
    if (!result) {
        auto err = result.error();
        err.with_context("file", path.string());
        return Err<TableContext>(std::move(err));
    }
    return result;
}

Result<TableContext> TableContext::from_json_string(const std::string& json_str) {
    // ordered_json keeps sdkInfo keys in document order
    nlohmann::ordered_json j;
    try {
        j = nlohmann::ordered_json::parse(json_str);
    } catch (const nlohmann::ordered_json::parse_error& e) {
        return Err<TableContext>(Error(ErrorCode::ParseError,
            std::string("JSON parse error: ") + e.what()));
    }

    if (!j.is_object()) {
        return Err<TableContext>(Error(ErrorCode::ParseError,
            "Context must be a JSON object"));
    }

    TableContext ctx;

    // "package" section
    if (j.contains("package")) {
        const auto& pkg = j["package"];
        if (!pkg.is_object()) {
            return Err<TableContext>(field_error("package", "an object"));
        }

        if (auto r = read_string(pkg, "renamed", "package.renamed", ctx.package_renamed); !r) {
            return Err<TableContext>(r.error());
        }
        if (auto r = read_string(pkg, "original", "package.original", ctx.package_original); !r) {
            return Err<TableContext>(r.error());
        }

        if (pkg.contains("id")) {
            const auto& id = pkg["id"];
            if (!id.is_number_integer()) {
                return Err<TableContext>(field_error("package.id", "an integer"));
            }
            auto value = id.get<std::int64_t>();
            if (value < 0 || value > 255) {
                return Err<TableContext>(field_error("package.id", "in range 0-255"));
            }
            ctx.package_id = static_cast<std::uint8_t>(value);
        }
    }

    // Flags
    if (auto r = read_bool(j, "analysisMode", ctx.analysis_mode); !r) {
        return Err<TableContext>(r.error());
    }
    if (auto r = read_bool(j, "sharedLibrary", ctx.shared_library); !r) {
        return Err<TableContext>(r.error());
    }
    if (auto r = read_bool(j, "sparseResources", ctx.sparse_resources); !r) {
        return Err<TableContext>(r.error());
    }

    // "sdkInfo" section
    if (j.contains("sdkInfo")) {
        const auto& sdk = j["sdkInfo"];
        if (!sdk.is_object()) {
            return Err<TableContext>(field_error("sdkInfo", "an object"));
        }
        for (const auto& [key, value] : sdk.items()) {
            auto scalar = read_scalar(value, "sdkInfo." + key);
            if (!scalar) {
                return Err<TableContext>(scalar.error());
            }
            ctx.sdk_info.set(key, std::move(*scalar));
        }
    }

    // "versionInfo" section
    if (j.contains("versionInfo")) {
        const auto& ver = j["versionInfo"];
        if (!ver.is_object()) {
            return Err<TableContext>(field_error("versionInfo", "an object"));
        }
        if (auto r = read_string(ver, "versionName", "versionInfo.versionName",
                                 ctx.version_info.version_name); !r) {
            return Err<TableContext>(r.error());
        }
        if (ver.contains("versionCode") && !ver["versionCode"].is_null()) {
            auto code = read_scalar(ver["versionCode"], "versionInfo.versionCode");
            if (!code) {
                return Err<TableContext>(code.error());
            }
            ctx.version_info.version_code = std::move(*code);
        }
    }

    return Ok(std::move(ctx));
}

} // namespace restable_res
