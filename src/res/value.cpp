/// @file value.cpp
/// @brief Decoded resource value implementation

#include <restable/res/value.hpp>

#include <bit>
#include <cstdio>

namespace restable_res {

const char* value_type_to_string(ValueType type) noexcept {
    switch (type) {
        case ValueType::Null:      return "null";
        case ValueType::Reference: return "reference";
        case ValueType::Attribute: return "attribute";
        case ValueType::String:    return "string";
        case ValueType::Float:     return "float";
        case ValueType::Dimension: return "dimension";
        case ValueType::Fraction:  return "fraction";
        case ValueType::IntDec:    return "int_dec";
        case ValueType::IntHex:    return "int_hex";
        case ValueType::Boolean:   return "boolean";
        case ValueType::Color:     return "color";
        default:                   return "unknown";
    }
}

ResValue ResValue::float_value(float value) {
    return ResValue(ValueType::Float, std::bit_cast<std::uint32_t>(value));
}

std::string ResValue::to_string() const {
    char buf[32];

    switch (m_type) {
        case ValueType::Null:
            return "@null";
        case ValueType::Reference:
            return "@" + reference_id().to_string();
        case ValueType::Attribute:
            return "?" + reference_id().to_string();
        case ValueType::String:
            return m_text;
        case ValueType::Float:
            std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(std::bit_cast<float>(m_data)));
            return buf;
        case ValueType::IntDec:
            return std::to_string(static_cast<std::int32_t>(m_data));
        case ValueType::IntHex:
            std::snprintf(buf, sizeof(buf), "0x%x", m_data);
            return buf;
        case ValueType::Boolean:
            return m_data != 0 ? "true" : "false";
        case ValueType::Color:
            std::snprintf(buf, sizeof(buf), "#%08x", m_data);
            return buf;
        case ValueType::Dimension:
        case ValueType::Fraction:
        default:
            // Unit decoding belongs to the table parser; keep the raw word
            std::snprintf(buf, sizeof(buf), "0x%08x", m_data);
            return buf;
    }
}

} // namespace restable_res
