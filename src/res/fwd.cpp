/// @file fwd.cpp
/// @brief Implementation of forward declaration utilities

#include <restable/res/fwd.hpp>
#include <algorithm>
#include <cctype>

namespace restable_res {

const char* package_role_to_string(PackageRole role) noexcept {
    switch (role) {
        case PackageRole::Main:      return "main";
        case PackageRole::Framework: return "framework";
        default:                     return "unknown";
    }
}

const char* selection_source_to_string(SelectionSource source) noexcept {
    switch (source) {
        case SelectionSource::ContextId:          return "context_id";
        case SelectionSource::SingleMainPackage:  return "single_main_package";
        case SelectionSource::HighestSpec:        return "highest_spec";
        case SelectionSource::FallbackPackageOne: return "fallback_package_one";
        default:                                  return "unknown";
    }
}

bool equals_ignore_case(const std::string& a, const std::string& b) noexcept {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
            return std::tolower(x) == std::tolower(y);
        });
}

} // namespace restable_res
