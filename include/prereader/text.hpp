#pragma once
#include <string>
#include <string_view>

namespace prereader {
namespace text {

std::string trim(std::string_view s);
bool is_blank(std::string_view s);
std::string to_lower(std::string s);

bool contains(std::string_view s, std::string_view needle);
bool starts_with(std::string_view s, std::string_view prefix);
bool ends_with(std::string_view s, std::string_view suffix);

} // namespace text
} // namespace prereader
