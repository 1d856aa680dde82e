#include <prereader/config_file.hpp>
#include <prereader/reader.hpp>
#include <prereader/text.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <limits>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace prereader {

static bool parse_bool(const std::string& key, const std::string& value) {
    const auto v = text::to_lower(value);
    if (v == "true" || v == "yes" || v == "on" || v == "1") return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    throw std::runtime_error(fmt::format("{}: expected a boolean, got '{}'", key, value));
}

static int parse_length(const std::string& key, const std::string& value) {
    long long n = 0;
    size_t used = 0;
    try {
        n = std::stoll(value, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != value.size() || n < Configuration::kUnset ||
        n > std::numeric_limits<int>::max()) {
        throw std::runtime_error(fmt::format("{}: expected a length >= -1, got '{}'", key, value));
    }
    return static_cast<int>(n);
}

static std::string unquote(const std::string& v) {
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') return v.substr(1, v.size() - 2);
    return v;
}

bool apply_setting(Configuration& cfg, const std::string& key, const std::string& value) {
    if (key == "trim") {
        cfg.trim_lines = parse_bool(key, value);
    } else if (key == "skip-empty") {
        cfg.skip_empty = parse_bool(key, value);
    } else if (key == "skip-blank") {
        cfg.skip_whitespace_only = parse_bool(key, value);
    } else if (key == "min-length") {
        cfg.min_line_length = parse_length(key, value);
    } else if (key == "max-length") {
        cfg.max_line_length = parse_length(key, value);
    } else if (key == "skip-containing") {
        cfg.skip_containing.push_back(value);
    } else if (key == "skip-prefix") {
        cfg.skip_starting_with.push_back(value);
    } else if (key == "skip-suffix") {
        cfg.skip_ending_with.push_back(value);
    } else {
        return false;
    }
    return true;
}

Configuration load_configuration(const fs::path& path) {
    auto rules = std::make_shared<Configuration>();
    rules->trim_lines = true;
    rules->skip_empty = true;
    rules->skip_starting_with = {"#", ";"};

    FilteringReader reader(path, rules);

    Configuration cfg;
    while (auto line = reader.read_line()) {
        auto eq = line->find('=');
        if (eq == std::string::npos)
            throw std::runtime_error(fmt::format("{}: expected 'key = value', got '{}'", path.string(), *line));
        auto key = text::trim(line->substr(0, eq));
        auto value = unquote(text::trim(line->substr(eq + 1)));
        try {
            if (!apply_setting(cfg, key, value))
                spdlog::warn("{}: unknown key '{}' ignored", path.string(), key);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error(fmt::format("{}: {}", path.string(), e.what()));
        }
    }
    return cfg;
}

} // namespace prereader
