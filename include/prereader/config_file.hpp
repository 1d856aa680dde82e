#pragma once
#include <prereader/configuration.hpp>

#include <filesystem>
#include <string>

namespace prereader {

/**
 * Applies one "key = value" setting to cfg.
 *
 * Keys: trim, skip-empty, skip-blank, min-length, max-length,
 * skip-containing, skip-prefix, skip-suffix. List keys append.
 *
 * @return false if the key is unknown
 * @throws std::runtime_error if the value is invalid for the key
 */
bool apply_setting(Configuration& cfg, const std::string& key, const std::string& value);

/**
 * Loads a rules file. Blank lines and lines starting with '#' or ';' are
 * ignored; a double-quoted value keeps its inner text verbatim.
 *
 * @throws std::system_error if the file cannot be opened
 * @throws std::runtime_error on a malformed line or invalid value
 */
Configuration load_configuration(const std::filesystem::path& path);

} // namespace prereader
