#include <prereader/reader.hpp>
#include <prereader/text.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace prereader {

static const fs::path& checked_path(const fs::path& path) {
    if (text::is_blank(path.native()))
        throw std::invalid_argument("path must not be empty");
    return path;
}

static std::shared_ptr<Configuration> checked_config(std::shared_ptr<Configuration> config) {
    if (!config) throw std::invalid_argument("config must not be null");
    return config;
}

FilteringReader::FilteringReader(const fs::path& path)
: FilteringReader(path, std::make_shared<Configuration>()) {}

// config is checked before the file is opened
FilteringReader::FilteringReader(const fs::path& path, std::shared_ptr<Configuration> config)
: config_(checked_config(std::move(config))) {
    source_ = open_file(checked_path(path));
}

FilteringReader::FilteringReader(std::unique_ptr<LineSource> source)
: FilteringReader(std::move(source), std::make_shared<Configuration>()) {}

FilteringReader::FilteringReader(std::unique_ptr<LineSource> source, std::shared_ptr<Configuration> config)
: source_(std::move(source)), config_(std::move(config)) {
    if (!source_) throw std::invalid_argument("source must not be null");
    if (!config_) throw std::invalid_argument("config must not be null");
}

FilteringReader::~FilteringReader() { close(); }

void FilteringReader::close() {
    if (!source_) return;
    source_->close();
    source_.reset();
    spdlog::debug("filtering reader closed");
}

void FilteringReader::set_config(std::shared_ptr<Configuration> config) {
    config_ = checked_config(std::move(config));
}

void FilteringReader::ensure_open() const {
    if (!source_) throw std::logic_error("read from closed FilteringReader");
}

std::optional<std::string> FilteringReader::read_line() {
    ensure_open();
    if (char_cache_) {
        const auto cached = *char_cache_;
        char_cache_.reset();
        if (!cached) return std::nullopt;
        // the cached char is line_[cursor_ - 1]; hand it back to the line
        --cursor_;
    }
    if (cursor_ < line_.size()) {
        const auto content_end = line_.size() - kLineTerminator.size();
        std::string rest = cursor_ < content_end ? line_.substr(cursor_, content_end - cursor_) : std::string{};
        cursor_ = line_.size();
        return rest;
    }
    return next_line();
}

std::optional<char> FilteringReader::peek() {
    ensure_open();
    fill_char_cache();
    return *char_cache_;
}

std::optional<char> FilteringReader::read() {
    ensure_open();
    fill_char_cache();
    const auto ch = *char_cache_;
    char_cache_.reset();
    return ch;
}

std::size_t FilteringReader::read(char* buf, std::size_t count) {
    std::size_t n = 0;
    while (n < count) {
        const auto ch = read();
        if (!ch) break;
        buf[n++] = *ch;
    }
    return n;
}

std::string FilteringReader::read_to_end() {
    std::string out;
    while (const auto ch = read()) out.push_back(*ch);
    return out;
}

void FilteringReader::fill_char_cache() {
    if (char_cache_) return;
    char_cache_ = next_char();
}

std::optional<char> FilteringReader::next_char() {
    if (cursor_ >= line_.size()) {
        auto line = next_line();
        cursor_ = 0;
        if (!line) {
            line_.clear();
            return std::nullopt;
        }
        line_ = std::move(*line);
        line_ += kLineTerminator;
    }
    return line_[cursor_++];
}

std::optional<std::string> FilteringReader::next_line() {
    for (;;) {
        auto line = source_->read_line();
        if (!line) {
            spdlog::debug("line source exhausted");
            return std::nullopt;
        }
        if (config_->trim_lines) *line = text::trim(*line);
        if (!should_skip(*line)) return line;
    }
}

bool FilteringReader::should_skip(const std::string& line) const {
    const Configuration& c = *config_;
    const auto len = static_cast<long long>(line.size());

    if (c.skip_empty && line.empty()) return true;
    if (c.skip_whitespace_only && text::is_blank(line)) return true;

    if (c.min_line_length != Configuration::kUnset && len < c.min_line_length) return true;
    if (c.max_line_length != Configuration::kUnset && len > c.max_line_length) return true;

    auto any = [&line](const std::vector<std::string>& rules, auto pred) {
        return std::any_of(rules.begin(), rules.end(),
                           [&](const std::string& r){ return pred(line, r); });
    };
    if (any(c.skip_containing, text::contains)) return true;
    if (any(c.skip_starting_with, text::starts_with)) return true;
    if (any(c.skip_ending_with, text::ends_with)) return true;

    return false;
}

} // namespace prereader
