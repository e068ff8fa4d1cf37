#pragma once

/// @file value.hpp
/// @brief Decoded resource values

#include "fwd.hpp"
#include "resource_id.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace restable_res {

// =============================================================================
// ValueType
// =============================================================================

/// Kind of a decoded value word
enum class ValueType : std::uint8_t {
    Null,
    Reference,   ///< Resource reference (@...)
    Attribute,   ///< Theme attribute reference (?...)
    String,
    Float,
    Dimension,
    Fraction,
    IntDec,
    IntHex,
    Boolean,
    Color
};

/// Convert ValueType to string
[[nodiscard]] const char* value_type_to_string(ValueType type) noexcept;

// =============================================================================
// ResValue
// =============================================================================

/// A single decoded value: a type tag, the raw data word and, for strings, the text
class ResValue {
public:
    ResValue() = default;
    ResValue(ValueType type, std::uint32_t data, std::string text = {})
        : m_type(type), m_data(data), m_text(std::move(text)) {}

    // =========================================================================
    // Factories
    // =========================================================================

    [[nodiscard]] static ResValue null() { return ResValue(); }

    [[nodiscard]] static ResValue reference(ResourceId id) {
        return ResValue(ValueType::Reference, id.raw());
    }

    [[nodiscard]] static ResValue attribute(ResourceId id) {
        return ResValue(ValueType::Attribute, id.raw());
    }

    [[nodiscard]] static ResValue string(std::string text) {
        return ResValue(ValueType::String, 0, std::move(text));
    }

    [[nodiscard]] static ResValue int_dec(std::int32_t value) {
        return ResValue(ValueType::IntDec, static_cast<std::uint32_t>(value));
    }

    [[nodiscard]] static ResValue int_hex(std::uint32_t value) {
        return ResValue(ValueType::IntHex, value);
    }

    [[nodiscard]] static ResValue boolean(bool value) {
        return ResValue(ValueType::Boolean, value ? 0xFFFFFFFFu : 0u);
    }

    [[nodiscard]] static ResValue color(std::uint32_t argb) {
        return ResValue(ValueType::Color, argb);
    }

    [[nodiscard]] static ResValue float_value(float value);

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] ValueType type() const noexcept { return m_type; }
    [[nodiscard]] std::uint32_t data() const noexcept { return m_data; }
    [[nodiscard]] const std::string& text() const noexcept { return m_text; }

    [[nodiscard]] bool is_null() const noexcept { return m_type == ValueType::Null; }

    [[nodiscard]] bool is_reference() const noexcept {
        return m_type == ValueType::Reference || m_type == ValueType::Attribute;
    }

    /// Referenced id (only meaningful when is_reference())
    [[nodiscard]] ResourceId reference_id() const noexcept { return ResourceId(m_data); }

    /// Render the value as it would appear in a decoded resource file
    [[nodiscard]] std::string to_string() const;

    bool operator==(const ResValue&) const = default;

private:
    ValueType m_type = ValueType::Null;
    std::uint32_t m_data = 0;
    std::string m_text;
};

} // namespace restable_res
