#pragma once
#include <string>
#include <vector>

namespace prereader {

// Rules deciding which lines a FilteringReader hides.
// A default-constructed Configuration disables every rule.
struct Configuration {
    static constexpr int kUnset = -1;

    bool trim_lines = false;
    bool skip_empty = false;
    bool skip_whitespace_only = false;

    int min_line_length = kUnset;
    int max_line_length = kUnset;

    // an empty entry matches every line
    std::vector<std::string> skip_containing;
    std::vector<std::string> skip_starting_with;
    std::vector<std::string> skip_ending_with;
};

} // namespace prereader
