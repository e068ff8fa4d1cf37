// restable_res TableContext configuration tests

#include <catch2/catch_test_macros.hpp>
#include <restable/res/context.hpp>

#include <filesystem>
#include <fstream>

using namespace restable_res;
using namespace restable_core;

TEST_CASE("SdkInfo keeps insertion order", "[res][context]") {
    SdkInfo info;
    info.set("targetSdkVersion", "34");
    info.set("minSdkVersion", "21");
    info.set("targetSdkVersion", "33");

    REQUIRE(info.size() == 2);
    REQUIRE(info.begin()->first == "targetSdkVersion");
    REQUIRE(info.begin()->second == "33");
    REQUIRE(*info.get("minSdkVersion") == "21");
    REQUIRE_FALSE(info.get("maxSdkVersion").has_value());
    REQUIRE(info.contains(SdkInfo::kMinSdkVersion));
}

TEST_CASE("TableContext from JSON", "[res][context]") {
    SECTION("empty object gives defaults") {
        auto r = TableContext::from_json_string("{}");
        REQUIRE(r.is_ok());
        const auto& ctx = r.value();
        REQUIRE_FALSE(ctx.has_package_id());
        REQUIRE_FALSE(ctx.package_renamed.has_value());
        REQUIRE_FALSE(ctx.analysis_mode);
        REQUIRE(ctx.sdk_info.empty());
    }

    SECTION("full layout") {
        auto r = TableContext::from_json_string(R"({
            "package": { "renamed": "com.b", "original": "com.a", "id": 127 },
            "analysisMode": true,
            "sharedLibrary": true,
            "sparseResources": false,
            "sdkInfo": { "targetSdkVersion": 34, "minSdkVersion": "@integer/min_sdk" },
            "versionInfo": { "versionName": "1.0", "versionCode": 12 }
        })");
        REQUIRE(r.is_ok());
        const auto& ctx = r.value();

        REQUIRE(*ctx.package_renamed == "com.b");
        REQUIRE(*ctx.package_original == "com.a");
        REQUIRE(ctx.package_id == 127);
        REQUIRE(ctx.analysis_mode);
        REQUIRE(ctx.shared_library);
        REQUIRE_FALSE(ctx.sparse_resources);

        REQUIRE(ctx.sdk_info.size() == 2);
        REQUIRE(ctx.sdk_info.begin()->first == "targetSdkVersion");
        REQUIRE(*ctx.sdk_info.get("targetSdkVersion") == "34");
        REQUIRE(*ctx.sdk_info.get("minSdkVersion") == "@integer/min_sdk");

        REQUIRE(*ctx.version_info.version_name == "1.0");
        REQUIRE(*ctx.version_info.version_code == "12");
    }

    SECTION("malformed JSON") {
        auto r = TableContext::from_json_string("{ not json");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::ParseError);
    }

    SECTION("package id out of range") {
        auto r = TableContext::from_json_string(R"({ "package": { "id": 256 } })");
        REQUIRE(r.is_err());
        REQUIRE(r.error().message().find("package.id") != std::string::npos);
    }

    SECTION("wrong field types name the field") {
        auto flag = TableContext::from_json_string(R"({ "sharedLibrary": "yes" })");
        REQUIRE(flag.is_err());
        REQUIRE(flag.error().message().find("sharedLibrary") != std::string::npos);

        auto sdk = TableContext::from_json_string(R"({ "sdkInfo": { "minSdkVersion": 1.5 } })");
        REQUIRE(sdk.is_err());
        REQUIRE(sdk.error().message().find("sdkInfo.minSdkVersion") != std::string::npos);

        auto top = TableContext::from_json_string("[1, 2]");
        REQUIRE(top.is_err());
    }
}

TEST_CASE("TableContext from file", "[res][context]") {
    auto dir = std::filesystem::temp_directory_path() / "restable_context_test";
    std::filesystem::create_directories(dir);
    auto path = dir / "context.json";

    SECTION("missing file") {
        std::filesystem::remove(path);
        auto r = TableContext::load(path);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }

    SECTION("valid file") {
        {
            std::ofstream out(path);
            out << R"({ "package": { "id": 2 }, "sharedLibrary": true })";
        }
        auto r = TableContext::load(path);
        REQUIRE(r.is_ok());
        REQUIRE(r.value().package_id == 2);
        REQUIRE(r.value().shared_library);
    }

    SECTION("parse errors carry the file path") {
        {
            std::ofstream out(path);
            out << "{";
        }
        auto r = TableContext::load(path);
        REQUIRE(r.is_err());
        REQUIRE(r.error().get_context("file") != nullptr);
    }

    std::filesystem::remove_all(dir);
}
