/// @file resource_id.cpp
/// @brief Resource identifier formatting and parsing

#include <restable/res/resource_id.hpp>

#include <charconv>
#include <string_view>
#include <cstdio>

namespace restable_res {

std::string ResourceId::to_string() const {
    char buf[11];
    std::snprintf(buf, sizeof(buf), "0x%08x", bits);
    return std::string(buf);
}

restable_core::Result<ResourceId> ResourceId::parse(const std::string& text) {
    std::string_view digits(text);
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits.remove_prefix(2);
    }

    if (digits.empty() || digits.size() > 8) {
        return restable_core::Err<ResourceId>(
            restable_core::Error(restable_core::ErrorCode::ParseError,
                "Invalid resource id: '" + text + "'"));
    }

    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return restable_core::Err<ResourceId>(
            restable_core::Error(restable_core::ErrorCode::ParseError,
                "Invalid resource id: '" + text + "'"));
    }

    return restable_core::Ok(ResourceId(value));
}

} // namespace restable_res
