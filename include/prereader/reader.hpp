#pragma once
#include <prereader/configuration.hpp>
#include <prereader/line_source.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace prereader {

/**
 * FilteringReader - reads a line source while hiding every line rejected by
 * a Configuration.
 *
 * Lines are available whole (read_line) or as a character stream
 * (peek/read) in which each surviving line is followed by "\r\n".
 *
 * The Configuration is shared with the caller and consulted for every line
 * fetched, so changes made between reads apply to the next line. The reader
 * owns its LineSource and closes it exactly once.
 *
 * Not thread-safe.
 */
class FilteringReader {
public:
    static constexpr std::string_view kLineTerminator = "\r\n";

    explicit FilteringReader(const std::filesystem::path& path);
    FilteringReader(const std::filesystem::path& path, std::shared_ptr<Configuration> config);
    explicit FilteringReader(std::unique_ptr<LineSource> source);
    FilteringReader(std::unique_ptr<LineSource> source, std::shared_ptr<Configuration> config);

    FilteringReader(const FilteringReader&) = delete;
    FilteringReader& operator=(const FilteringReader&) = delete;
    ~FilteringReader();

    /**
     * Next line that survives filtering, or nullopt at end of source.
     * After partial character reads this returns the rest of the current
     * line instead of fetching a new one.
     */
    std::optional<std::string> read_line();

    // Next character without consuming it.
    std::optional<char> peek();
    std::optional<char> read();

    /**
     * Reads up to count characters into buf.
     * @return Number of characters stored; less than count only at end of stream.
     */
    std::size_t read(char* buf, std::size_t count);
    std::string read_to_end();

    void close();
    bool is_open() const { return source_ != nullptr; }

    Configuration& config() { return *config_; }
    const Configuration& config() const { return *config_; }
    void set_config(std::shared_ptr<Configuration> config);

private:
    std::unique_ptr<LineSource> source_;
    std::shared_ptr<Configuration> config_;

    // nullopt: empty; holds nullopt: end of stream
    std::optional<std::optional<char>> char_cache_;

    // current line with its terminator appended, and the next index to emit
    std::string line_;
    std::size_t cursor_{0};

    void ensure_open() const;
    void fill_char_cache();
    std::optional<char> next_char();
    std::optional<std::string> next_line();
    bool should_skip(const std::string& line) const;
};

} // namespace prereader
