/// @file placeholder.cpp
/// @brief In-memory placeholder value resolution

#include <restable/res/placeholder.hpp>

#include <cstring>

namespace restable_res {

namespace {

std::optional<std::string> lookup_reference(
    const std::map<std::string, std::string>& table,
    const char* prefix,
    const std::string& value) {

    const std::size_t prefix_len = std::strlen(prefix);
    if (value.size() <= prefix_len || value.compare(0, prefix_len, prefix) != 0) {
        return std::nullopt;
    }

    auto it = table.find(value.substr(prefix_len));
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // anonymous namespace

std::optional<std::string> MapPlaceholderResolver::resolve_string_reference(
    const std::filesystem::path& /*out_dir*/,
    const std::string& value) const {
    return lookup_reference(m_strings, kStringPrefix, value);
}

std::optional<std::string> MapPlaceholderResolver::resolve_integer_reference(
    const std::filesystem::path& /*out_dir*/,
    const std::string& value) const {
    return lookup_reference(m_integers, kIntegerPrefix, value);
}

} // namespace restable_res
