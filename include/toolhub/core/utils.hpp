#pragma once

#include <string>
#include <string_view>

namespace toolhub::utils {

auto generate_uuid() -> std::string;
auto trim(std::string_view s) -> std::string;
auto to_lower(std::string_view s) -> std::string;

/// Case-insensitive substring test. An empty needle always matches.
auto icontains(std::string_view haystack, std::string_view needle) -> bool;

/// Lowercase hex SHA-256 of `data`.
auto sha256(std::string_view data) -> std::string;

} // namespace toolhub::utils
