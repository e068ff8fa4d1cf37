// restable_res metadata assembly tests
//
// Tests for the summary produced at the end of a decoding pass:
// - Framework detection and dependency list
// - SDK and version placeholder substitution
// - Package rename summary and its fallback
// - JSON rendering and sink hand-off

#include <catch2/catch_test_macros.hpp>
#include <restable/res/meta_info.hpp>
#include <restable/res/placeholder.hpp>
#include <restable/res/table.hpp>

#include <nlohmann/json.hpp>
#include <memory>

using namespace restable_res;
using namespace restable_core;

// =============================================================================
// Test Utilities
// =============================================================================

namespace {

void add_package(ResTable& table, std::uint8_t id, const std::string& name, PackageRole role) {
    REQUIRE(table.add_package(std::make_unique<ResPackage>(id, name), role).is_ok());
}

/// Sink that keeps the last record, or fails on demand
class RecordingSink : public MetaInfoSink {
public:
    Result<void> write(const MetaInfo& meta) override {
        if (fail) {
            return Err(Error(ErrorCode::IOError, "disk full"));
        }
        last = meta;
        ++writes;
        return Ok();
    }

    bool fail = false;
    int writes = 0;
    std::optional<MetaInfo> last;
};

const std::filesystem::path kOutDir = "out";

} // anonymous namespace

// =============================================================================
// Placeholder Tests
// =============================================================================

TEST_CASE("MapPlaceholderResolver", "[res][placeholder]") {
    MapPlaceholderResolver placeholders;
    placeholders.add_string("app_version", "2.1.0");
    placeholders.add_integer("min_sdk", "21");

    SECTION("registered references resolve") {
        REQUIRE(*placeholders.resolve_string_reference(kOutDir, "@string/app_version") == "2.1.0");
        REQUIRE(*placeholders.resolve_integer_reference(kOutDir, "@integer/min_sdk") == "21");
    }

    SECTION("concrete and unknown values do not resolve") {
        REQUIRE_FALSE(placeholders.resolve_string_reference(kOutDir, "2.1.0").has_value());
        REQUIRE_FALSE(placeholders.resolve_string_reference(kOutDir, "@string/").has_value());
        REQUIRE_FALSE(placeholders.resolve_string_reference(kOutDir, "@string/other").has_value());
        REQUIRE_FALSE(placeholders.resolve_integer_reference(kOutDir, "@string/app_version").has_value());
    }
}

// =============================================================================
// Framework Tests
// =============================================================================

TEST_CASE("MetaInfoAssembler framework detection", "[res][meta]") {
    ResTable table;
    MapPlaceholderResolver placeholders;
    MetaInfoAssembler assembler(table, placeholders);

    SECTION("main package in the framework range") {
        add_package(table, 50, "com.vendor.framework", PackageRole::Main);
        REQUIRE(assembler.is_framework_set());
    }

    SECTION("main package outside the framework range") {
        add_package(table, 127, "com.app", PackageRole::Main);
        REQUIRE_FALSE(assembler.is_framework_set());
    }

    SECTION("range bounds") {
        add_package(table, 63, "edge", PackageRole::Main);
        REQUIRE(assembler.is_framework_set());

        ResTable other;
        add_package(other, 64, "beyond", PackageRole::Main);
        REQUIRE_FALSE(MetaInfoAssembler(other, placeholders).is_framework_set());
    }

    SECTION("framework packages do not count") {
        add_package(table, 1, "android", PackageRole::Framework);
        REQUIRE_FALSE(assembler.is_framework_set());
    }
}

TEST_CASE("MetaInfoAssembler framework dependencies", "[res][meta]") {
    ResTable table;
    MapPlaceholderResolver placeholders;
    MetaInfoAssembler assembler(table, placeholders);

    SECTION("no framework packages") {
        add_package(table, 0x7f, "com.app", PackageRole::Main);
        REQUIRE_FALSE(assembler.uses_framework().has_value());
    }

    SECTION("ids are sorted") {
        add_package(table, 9, "fw9", PackageRole::Framework);
        add_package(table, 3, "fw3", PackageRole::Framework);
        add_package(table, 5, "fw5", PackageRole::Framework);
        add_package(table, 0x7f, "com.app", PackageRole::Main);

        auto uses = assembler.uses_framework();
        REQUIRE(uses.has_value());
        REQUIRE(uses->ids == std::vector<std::uint8_t>{3, 5, 9});
    }
}

// =============================================================================
// SDK and Version Tests
// =============================================================================

TEST_CASE("MetaInfoAssembler SDK summary", "[res][meta]") {
    ResTable table;
    MapPlaceholderResolver placeholders;
    placeholders.add_integer("min_sdk", "21");
    MetaInfoAssembler assembler(table, placeholders);

    SECTION("empty SDK info is omitted") {
        TableContext ctx;
        REQUIRE_FALSE(assembler.sdk_summary(kOutDir, ctx).has_value());
    }

    SECTION("resolvable values are replaced and others kept") {
        TableContext ctx;
        ctx.sdk_info.set(SdkInfo::kMinSdkVersion, "@integer/min_sdk");
        ctx.sdk_info.set(SdkInfo::kTargetSdkVersion, "34");
        ctx.sdk_info.set(SdkInfo::kMaxSdkVersion, "@integer/unknown");

        auto sdk = assembler.sdk_summary(kOutDir, ctx);
        REQUIRE(sdk.has_value());
        REQUIRE(*sdk->get(SdkInfo::kMinSdkVersion) == "21");
        REQUIRE(*sdk->get(SdkInfo::kTargetSdkVersion) == "34");
        REQUIRE(*sdk->get(SdkInfo::kMaxSdkVersion) == "@integer/unknown");
        REQUIRE(sdk->begin()->first == SdkInfo::kMinSdkVersion);

        // Context is left as it was
        REQUIRE(*ctx.sdk_info.get(SdkInfo::kMinSdkVersion) == "@integer/min_sdk");
    }

    SECTION("other keys pass through untouched") {
        TableContext ctx;
        ctx.sdk_info.set("compileSdkVersion", "@integer/min_sdk");

        auto sdk = assembler.sdk_summary(kOutDir, ctx);
        REQUIRE(sdk.has_value());
        REQUIRE(*sdk->get("compileSdkVersion") == "@integer/min_sdk");
    }
}

TEST_CASE("MetaInfoAssembler version summary", "[res][meta]") {
    ResTable table;
    MapPlaceholderResolver placeholders;
    placeholders.add_string("version", "3.0");
    MetaInfoAssembler assembler(table, placeholders);

    SECTION("symbolic name is resolved and code kept") {
        TableContext ctx;
        ctx.version_info.version_name = "@string/version";
        ctx.version_info.version_code = "@integer/code";

        auto info = assembler.version_summary(kOutDir, ctx);
        REQUIRE(*info.version_name == "3.0");
        REQUIRE(*info.version_code == "@integer/code");
    }

    SECTION("unset name stays unset") {
        TableContext ctx;
        ctx.version_info.version_code = "7";

        auto info = assembler.version_summary(kOutDir, ctx);
        REQUIRE_FALSE(info.version_name.has_value());
        REQUIRE(*info.version_code == "7");
    }
}

// =============================================================================
// Package Rename Tests
// =============================================================================

TEST_CASE("MetaInfoAssembler package summary", "[res][meta]") {
    ResTable table;
    add_package(table, 7, "com.b", PackageRole::Main);
    MapPlaceholderResolver placeholders;
    MetaInfoAssembler assembler(table, placeholders);

    SECTION("no original name means no record") {
        TableContext ctx;
        ctx.package_renamed = "com.b";
        REQUIRE_FALSE(assembler.package_summary(ctx).has_value());

        ctx.package_original = "";
        REQUIRE_FALSE(assembler.package_summary(ctx).has_value());
    }

    SECTION("unchanged name records no rename") {
        TableContext ctx;
        ctx.package_original = "com.a";
        ctx.package_renamed = "com.a";
        ctx.package_id = 0x7f;

        auto info = assembler.package_summary(ctx);
        REQUIRE(info.has_value());
        REQUIRE_FALSE(info->rename_manifest_package.has_value());
        REQUIRE(info->forced_package_id == "127");
    }

    SECTION("name comparison ignores case") {
        TableContext ctx;
        ctx.package_original = "com.A";
        ctx.package_renamed = "COM.a";

        auto info = assembler.package_summary(ctx);
        REQUIRE(info.has_value());
        REQUIRE_FALSE(info->rename_manifest_package.has_value());
    }

    SECTION("renamed package resolves its id") {
        TableContext ctx;
        ctx.package_original = "com.a";
        ctx.package_renamed = "com.b";
        ctx.package_id = 0x7f;

        auto forced = assembler.forced_package_id(ctx);
        REQUIRE(forced.id == 7);
        REQUIRE_FALSE(forced.fell_back());

        auto info = assembler.package_summary(ctx);
        REQUIRE(info.has_value());
        REQUIRE(*info->rename_manifest_package == "com.b");
        REQUIRE(info->forced_package_id == "7");
    }

    SECTION("unknown renamed package falls back to the context id") {
        TableContext ctx;
        ctx.package_original = "com.a";
        ctx.package_renamed = "com.c";
        ctx.package_id = 0x7f;

        auto forced = assembler.forced_package_id(ctx);
        REQUIRE(forced.fell_back());
        REQUIRE(forced.id == 0x7f);

        auto info = assembler.package_summary(ctx);
        REQUIRE(info.has_value());
        REQUIRE(*info->rename_manifest_package == "com.c");
        REQUIRE(info->forced_package_id == "127");
    }

    SECTION("no renamed package keeps the context id") {
        TableContext ctx;
        ctx.package_original = "com.a";
        ctx.package_id = 0x7f;

        auto info = assembler.package_summary(ctx);
        REQUIRE(info.has_value());
        REQUIRE_FALSE(info->rename_manifest_package.has_value());
        REQUIRE(info->forced_package_id == "127");
    }
}

// =============================================================================
// Assembly Tests
// =============================================================================

TEST_CASE("MetaInfoAssembler assemble", "[res][meta]") {
    ResTable table;
    add_package(table, 1, "android", PackageRole::Framework);
    add_package(table, 0x7f, "com.app", PackageRole::Main);

    MapPlaceholderResolver placeholders;
    placeholders.add_integer("min_sdk", "24");
    placeholders.add_string("version", "1.2.3");

    table.set_package_original("com.app");
    table.set_package_renamed("com.app.renamed");
    table.set_package_id(0x7f);
    table.set_sparse_resources(true);
    table.add_sdk_info(SdkInfo::kMinSdkVersion, "@integer/min_sdk");
    table.set_version_name("@string/version");
    table.set_version_code("42");

    MetaInfoAssembler assembler(table, placeholders);
    auto meta = assembler.assemble(kOutDir, table.context());

    SECTION("record fields") {
        REQUIRE_FALSE(meta.is_framework_apk);
        REQUIRE(meta.uses_framework.has_value());
        REQUIRE(meta.uses_framework->ids == std::vector<std::uint8_t>{1});
        REQUIRE(*meta.sdk_info->get(SdkInfo::kMinSdkVersion) == "24");
        REQUIRE(*meta.package_info->rename_manifest_package == "com.app.renamed");
        REQUIRE(meta.package_info->forced_package_id == "127");
        REQUIRE(*meta.version_info.version_name == "1.2.3");
        REQUIRE(*meta.version_info.version_code == "42");
        REQUIRE_FALSE(meta.shared_library);
        REQUIRE(meta.sparse_resources);
    }

    SECTION("JSON rendering") {
        auto j = nlohmann::json::parse(meta.to_json_string());
        REQUIRE_FALSE(j["isFrameworkApk"].get<bool>());
        REQUIRE(j["usesFramework"]["ids"].get<std::vector<int>>() == std::vector<int>{1});
        REQUIRE(j["sdkInfo"]["minSdkVersion"].get<std::string>() == "24");
        REQUIRE(j["packageInfo"]["forcedPackageId"].get<std::string>() == "127");
        REQUIRE(j["packageInfo"]["renameManifestPackage"].get<std::string>() == "com.app.renamed");
        REQUIRE(j["versionInfo"]["versionCode"].get<std::string>() == "42");
        REQUIRE(j["versionInfo"]["versionName"].get<std::string>() == "1.2.3");
        REQUIRE_FALSE(j["sharedLibrary"].get<bool>());
        REQUIRE(j["sparseResources"].get<bool>());
    }

    SECTION("absent sections are omitted") {
        MetaInfo bare;
        auto j = nlohmann::json::parse(bare.to_json_string());
        REQUIRE_FALSE(j.contains("usesFramework"));
        REQUIRE_FALSE(j.contains("sdkInfo"));
        REQUIRE_FALSE(j.contains("packageInfo"));
        REQUIRE(j["versionInfo"].empty());
    }

    SECTION("table context is not modified") {
        REQUIRE(*table.context().version_info.version_name == "@string/version");
        REQUIRE(*table.context().sdk_info.get(SdkInfo::kMinSdkVersion) == "@integer/min_sdk");
    }
}

TEST_CASE("MetaInfoAssembler sink hand-off", "[res][meta]") {
    ResTable table;
    add_package(table, 0x7f, "com.app", PackageRole::Main);
    MapPlaceholderResolver placeholders;
    MetaInfoAssembler assembler(table, placeholders);
    RecordingSink sink;

    SECTION("record reaches the sink") {
        auto r = assembler.assemble_into(sink, kOutDir, table.context());
        REQUIRE(r.is_ok());
        REQUIRE(sink.writes == 1);
        REQUIRE(sink.last.has_value());
        REQUIRE_FALSE(sink.last->uses_framework.has_value());
    }

    SECTION("sink failure is returned") {
        sink.fail = true;
        auto r = assembler.assemble_into(sink, kOutDir, table.context());
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::IOError);
        REQUIRE(sink.writes == 0);
    }
}
