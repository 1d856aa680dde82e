#pragma once
#include <prereader/reader.hpp>

#include <array>
#include <streambuf>

namespace prereader {

// Read-only streambuf over a FilteringReader's character stream, so the
// filtered text can be consumed through std::istream. The reader must
// outlive the buffer, and should not be read directly while the buffer is
// in use (buffered characters are already consumed from it).
class FilteringStreamBuf : public std::streambuf {
public:
    explicit FilteringStreamBuf(FilteringReader& reader);

protected:
    int_type underflow() override;

private:
    FilteringReader& reader_;
    std::array<char, 4096> buf_{};
};

} // namespace prereader
