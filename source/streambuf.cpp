#include <prereader/streambuf.hpp>

namespace prereader {

FilteringStreamBuf::FilteringStreamBuf(FilteringReader& reader) : reader_(reader) {
    setg(buf_.data(), buf_.data(), buf_.data());
}

FilteringStreamBuf::int_type FilteringStreamBuf::underflow() {
    if (gptr() < egptr()) return traits_type::to_int_type(*gptr());

    // stop at the first line boundary so interactive sources are not
    // blocked on until the whole buffer fills
    std::size_t n = 0;
    while (n < buf_.size()) {
        const auto ch = reader_.read();
        if (!ch) break;
        buf_[n++] = *ch;
        if (*ch == '\n') break;
    }
    if (n == 0) return traits_type::eof();
    setg(buf_.data(), buf_.data(), buf_.data() + n);
    return traits_type::to_int_type(*gptr());
}

} // namespace prereader
