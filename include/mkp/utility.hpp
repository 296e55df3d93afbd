#pragma once

#include <cctype>
#include <expected>
#include <string>
#include <string_view>

namespace makeport {

template <typename T>
using Result = std::expected<T, std::string>;

inline std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

/// `[A-Za-z_][A-Za-z0-9_-]*`, the names make can be asked to run safely.
inline bool is_target_identifier(std::string_view s) {
    if (s.empty())
        return false;
    unsigned char first = s.front();
    if (!std::isalpha(first) && first != '_')
        return false;
    for (unsigned char c : s.substr(1)) {
        if (!std::isalnum(c) && c != '_' && c != '-')
            return false;
    }
    return true;
}

/// `[A-Za-z_][A-Za-z0-9_]*`, usable as an environment variable name.
inline bool is_variable_identifier(std::string_view s) {
    if (s.empty())
        return false;
    unsigned char first = s.front();
    if (!std::isalpha(first) && first != '_')
        return false;
    for (unsigned char c : s.substr(1)) {
        if (!std::isalnum(c) && c != '_')
            return false;
    }
    return true;
}

} // namespace makeport
