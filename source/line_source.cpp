#include <prereader/line_source.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace prereader {

StreamLineSource::StreamLineSource(std::unique_ptr<std::istream> in, std::string name)
: owned_(std::move(in)), in_(owned_.get()), name_(std::move(name)) {
    if (!in_) throw std::invalid_argument("StreamLineSource: null stream");
}

StreamLineSource::StreamLineSource(std::istream& in, std::string name)
: in_(&in), name_(std::move(name)) {}

StreamLineSource::~StreamLineSource() { close(); }

std::optional<std::string> StreamLineSource::read_line() {
    if (!in_) throw std::logic_error("read_line on closed StreamLineSource");

    errno = 0;
    auto check = [this]{
        if (!in_->bad()) return;
        const int err = errno != 0 ? errno : EIO;
        throw std::system_error(err, std::generic_category(), "read: " + name_);
    };

    char ch = 0;
    if (!in_->get(ch)) {
        check();
        return std::nullopt;
    }
    std::string line;
    do {
        if (ch == '\n') return line;
        if (ch == '\r') {
            if (in_->peek() == '\n') in_->get();
            return line;
        }
        line.push_back(ch);
    } while (in_->get(ch));
    check();
    return line;
}

void StreamLineSource::close() {
    in_ = nullptr;
    owned_.reset();
}

MemoryLineSource::MemoryLineSource(std::vector<std::string> lines) : lines_(std::move(lines)) {}

std::optional<std::string> MemoryLineSource::read_line() {
    if (closed_) throw std::logic_error("read_line on closed MemoryLineSource");
    if (next_ >= lines_.size()) return std::nullopt;
    return lines_[next_++];
}

void MemoryLineSource::close() { closed_ = true; }

std::unique_ptr<LineSource> open_file(const fs::path& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec))
        throw std::system_error(std::make_error_code(std::errc::is_a_directory), "open: " + path.string());

    errno = 0;
    auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!in->is_open()) {
        const int err = errno != 0 ? errno : ENOENT;
        throw std::system_error(err, std::generic_category(), "open: " + path.string());
    }
    spdlog::debug("opened {}", path.string());
    return std::make_unique<StreamLineSource>(std::move(in), path.string());
}

} // namespace prereader
