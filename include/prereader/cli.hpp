#pragma once
#include <prereader/configuration.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace prereader {

struct Options {
    std::optional<std::filesystem::path> input;  // stdin when absent
    std::optional<std::filesystem::path> output; // stdout when absent
    std::optional<std::filesystem::path> config_file;
    Configuration overrides;
    // -1 is a valid override (clears the bound), so presence is tracked apart
    bool min_length_given = false;
    bool max_length_given = false;
    bool chars = false;
    bool verbose = false;
};

struct ParseResult {
    std::optional<Options> opts;
    bool help = false;
    bool version = false;
    std::string error;
};

ParseResult parse_cli(int argc, char** argv);

// Appends the list rules, copies the flags that were switched on and the
// length bounds that were given on the command line into base.
void merge_overrides(Configuration& base, const Options& o);

} // namespace prereader
