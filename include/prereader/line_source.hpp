#pragma once
#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace prereader {

// "Next line of text, or none at end" over some underlying stream.
// Returned lines never include their terminator.
class LineSource {
public:
    virtual ~LineSource() = default;

    virtual std::optional<std::string> read_line() = 0;

    // Releases the underlying stream. Must be safe to call more than once.
    virtual void close() = 0;
};

// Splits an std::istream on "\n", "\r\n" or a lone "\r".
// A read that leaves the stream bad throws std::system_error.
class StreamLineSource : public LineSource {
public:
    // name identifies the stream in error messages, usually its path
    explicit StreamLineSource(std::unique_ptr<std::istream> in, std::string name = "stream");
    // Borrowed stream (e.g. std::cin); close() only detaches from it.
    explicit StreamLineSource(std::istream& in, std::string name = "stream");
    ~StreamLineSource() override;

    std::optional<std::string> read_line() override;
    void close() override;

private:
    std::unique_ptr<std::istream> owned_;
    std::istream* in_{nullptr};
    std::string name_;
};

class MemoryLineSource : public LineSource {
public:
    explicit MemoryLineSource(std::vector<std::string> lines);

    std::optional<std::string> read_line() override;
    void close() override;

    bool closed() const { return closed_; }

private:
    std::vector<std::string> lines_;
    std::size_t next_{0};
    bool closed_{false};
};

// Opens a text file for reading. Throws std::system_error when the file is
// missing, is a directory or cannot be opened.
std::unique_ptr<LineSource> open_file(const std::filesystem::path& path);

} // namespace prereader
