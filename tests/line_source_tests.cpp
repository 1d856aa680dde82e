#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <prereader/line_source.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace prereader;
namespace fs = std::filesystem;

static fs::path mkd(const char* name){
    auto d = fs::temp_directory_path() / (std::string("prereader_src_")+name);
    fs::create_directories(d);
    return d;
}

namespace {
// Serves its text, then throws from underflow like a failing device.
class BrokenBuf : public std::streambuf {
public:
    explicit BrokenBuf(std::string text) : text_(std::move(text)) {
        setg(text_.data(), text_.data(), text_.data() + text_.size());
    }
protected:
    int_type underflow() override { throw std::runtime_error("device gone"); }
private:
    std::string text_;
};
}

static std::vector<std::string> drain(LineSource& src){
    std::vector<std::string> out;
    while (auto line = src.read_line()) out.push_back(*line);
    return out;
}

TEST_CASE("stream source splits on LF, CRLF and lone CR") {
    StreamLineSource src(std::make_unique<std::istringstream>("a\nb\r\nc\rd"));
    REQUIRE(drain(src) == std::vector<std::string>{"a", "b", "c", "d"});
    REQUIRE_FALSE(src.read_line().has_value());
}

TEST_CASE("trailing terminator does not produce an extra line") {
    StreamLineSource src(std::make_unique<std::istringstream>("a\n\nb\n"));
    REQUIRE(drain(src) == std::vector<std::string>{"a", "", "b"});
}

TEST_CASE("empty stream has no lines") {
    StreamLineSource src(std::make_unique<std::istringstream>(""));
    REQUIRE_FALSE(src.read_line().has_value());
}

TEST_CASE("borrowed stream is left usable after close") {
    std::istringstream in("one\ntwo\n");
    {
        StreamLineSource src(in);
        REQUIRE(src.read_line() == std::optional<std::string>("one"));
        src.close();
        src.close();
        REQUIRE_THROWS_AS(src.read_line(), std::logic_error);
    }
    std::string rest;
    std::getline(in, rest);
    REQUIRE(rest == "two");
}

TEST_CASE("memory source replays its lines") {
    MemoryLineSource src({"x", "", "y"});
    REQUIRE(drain(src) == std::vector<std::string>{"x", "", "y"});
    src.close();
    REQUIRE(src.closed());
}

TEST_CASE("open_file reads a file") {
    auto d = mkd("open");
    auto f = d / "in.txt";
    std::ofstream(f) << "first\r\nsecond";
    auto src = open_file(f);
    REQUIRE(drain(*src) == std::vector<std::string>{"first", "second"});
}

TEST_CASE("open_file reports missing files and directories") {
    auto d = mkd("missing");
    REQUIRE_THROWS_AS(open_file(d / "nope.txt"), std::system_error);
    try {
        open_file(d);
        FAIL("directory opened");
    } catch (const std::system_error& e) {
        REQUIRE(e.code() == std::errc::is_a_directory);
    }
}

TEST_CASE("a failing stream turns into system_error naming the source") {
    BrokenBuf buf("ok\npartial");
    std::istream in(&buf);
    StreamLineSource src(in, "flaky.txt");
    REQUIRE(src.read_line() == std::optional<std::string>("ok"));
    try {
        src.read_line();
        FAIL("read error swallowed");
    } catch (const std::system_error& e) {
        REQUIRE(std::string(e.what()).find("flaky.txt") != std::string::npos);
    }
}

TEST_CASE("a stream failing on its first read is not mistaken for end") {
    BrokenBuf buf("");
    std::istream in(&buf);
    StreamLineSource src(in);
    REQUIRE_THROWS_AS(src.read_line(), std::system_error);
}
