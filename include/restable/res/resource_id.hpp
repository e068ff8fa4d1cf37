#pragma once

/// @file resource_id.hpp
/// @brief Packed 32-bit resource identifier
///
/// Layout: [package(8 bits) | type(8 bits) | entry(16 bits)]
///
/// A package byte of 0 is never a real package. It marks a shared library
/// referring to its own resources before its final package id is known, and
/// must be rewritten against the current package before lookup.

#include "fwd.hpp"
#include <restable/core/error.hpp>

#include <cstdint>
#include <compare>
#include <functional>
#include <ostream>
#include <string>

namespace restable_res {

// =============================================================================
// ResourceId
// =============================================================================

struct ResourceId {
    std::uint32_t bits = 0;

    constexpr ResourceId() noexcept = default;

    /// Construct from raw bits
    constexpr explicit ResourceId(std::uint32_t raw) noexcept : bits(raw) {}

    /// Pack package, type and entry fields
    [[nodiscard]] static constexpr ResourceId from_parts(
        std::uint8_t package_id, std::uint8_t type_id, std::uint16_t entry_id) noexcept {
        return ResourceId((static_cast<std::uint32_t>(package_id) << 24)
                        | (static_cast<std::uint32_t>(type_id) << 16)
                        | static_cast<std::uint32_t>(entry_id));
    }

    /// Parse "0x7f010000" or "7f010000"
    [[nodiscard]] static restable_core::Result<ResourceId> parse(const std::string& text);

    [[nodiscard]] constexpr std::uint8_t package_id() const noexcept {
        return static_cast<std::uint8_t>(bits >> 24);
    }

    [[nodiscard]] constexpr std::uint8_t type_id() const noexcept {
        return static_cast<std::uint8_t>((bits >> 16) & 0xFF);
    }

    [[nodiscard]] constexpr std::uint16_t entry_id() const noexcept {
        return static_cast<std::uint16_t>(bits & 0xFFFF);
    }

    [[nodiscard]] constexpr std::uint32_t raw() const noexcept { return bits; }

    /// Same type and entry, different package byte
    [[nodiscard]] constexpr ResourceId with_package(std::uint8_t package_id) const noexcept {
        return ResourceId((bits & 0x00FFFFFFu) | (static_cast<std::uint32_t>(package_id) << 24));
    }

    /// Package byte is 0 (shared-library self-reference)
    [[nodiscard]] constexpr bool is_shared_library_ref() const noexcept {
        return package_id() == 0;
    }

    /// Format as 0x%08x
    [[nodiscard]] std::string to_string() const;

    constexpr auto operator<=>(const ResourceId&) const noexcept = default;
    constexpr bool operator==(const ResourceId&) const noexcept = default;
};

inline std::ostream& operator<<(std::ostream& os, const ResourceId& id) {
    return os << id.to_string();
}

} // namespace restable_res

template<>
struct std::hash<restable_res::ResourceId> {
    std::size_t operator()(const restable_res::ResourceId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.bits);
    }
};
