#include <prereader/app.hpp>
#include <prereader/cli.hpp>
#include <prereader/config_file.hpp>
#include <prereader/reader.hpp>
#include <prereader/streambuf.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <istream>
#include <memory>
#include <string>
#include <system_error>

#ifndef PREREADER_VERSION
#define PREREADER_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace prereader {

static void print_help(std::ostream& os) {
    os <<
        R"(prefilter - copy text with unwanted lines removed

Usage:
  prefilter [OPTIONS] [FILE|-]

Options:
  --config PATH           load rules from a rules file
  --trim                  trim whitespace from every line first
  --skip-empty            drop empty lines
  --skip-blank            drop whitespace-only lines
  --min-length N          drop lines shorter than N (-1 clears the bound)
  --max-length N          drop lines longer than N (-1 clears the bound)
  --skip-containing STR   drop lines containing STR (repeatable)
  --skip-prefix STR       drop lines starting with STR (repeatable)
  --skip-suffix STR       drop lines ending with STR (repeatable)
  --chars                 copy as a character stream (CRLF line ends)
  -o, --output PATH       write to PATH instead of stdout
  -v, --verbose           debug logging on stderr
  -h, --help
  --version
)";
}

static void setup_logging(bool verbose) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("prefilter", sink));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

static FilteringReader open_reader(const Options& o, std::shared_ptr<Configuration> config) {
    if (o.input) return FilteringReader(*o.input, std::move(config));
    return FilteringReader(std::make_unique<StreamLineSource>(std::cin, "stdin"), std::move(config));
}

std::size_t copy_lines(FilteringReader& reader, std::ostream& out) {
    std::size_t n = 0;
    while (auto line = reader.read_line()) {
        out << *line << '\n';
        ++n;
    }
    return n;
}

std::size_t copy_chars(FilteringReader& reader, std::ostream& out) {
    FilteringStreamBuf buf(reader);
    std::istream in(&buf);
    // rethrow errors from the source instead of leaving them as badbit
    in.exceptions(std::ios::badbit);

    std::array<char, 4096> chunk{};
    std::size_t n = 0;
    for (;;) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = in.gcount();
        if (got <= 0) break;
        out.write(chunk.data(), got);
        n += static_cast<std::size_t>(got);
    }
    return n;
}

int App::run(int argc, char** argv) {
    auto pr = parse_cli(argc, argv);
    if (pr.help) {
        print_help(std::cout);
        return 0;
    }
    if (pr.version) {
        std::cout << fmt::format("prefilter {}\n", PREREADER_VERSION);
        return 0;
    }
    setup_logging(pr.opts && pr.opts->verbose);
    if (!pr.opts) {
        spdlog::error("{}", pr.error);
        print_help(std::cerr);
        return 2;
    }
    const Options& o = *pr.opts;

    try {
        Configuration cfg;
        if (o.config_file) {
            cfg = load_configuration(*o.config_file);
            spdlog::debug("rules loaded from {}", o.config_file->string());
        }
        merge_overrides(cfg, o);

        auto reader = open_reader(o, std::make_shared<Configuration>(std::move(cfg)));

        std::ofstream file;
        if (o.output) {
            file.open(*o.output, std::ios::binary | std::ios::trunc);
            if (!file)
                throw std::system_error(std::make_error_code(std::errc::io_error), "open: " + o.output->string());
        }
        std::ostream& out = o.output ? static_cast<std::ostream&>(file) : std::cout;

        if (o.chars) {
            const auto n = copy_chars(reader, out);
            spdlog::debug("{} characters written", n);
        } else {
            const auto n = copy_lines(reader, out);
            spdlog::debug("{} lines written", n);
        }
        out.flush();
        if (!out)
            throw std::system_error(std::make_error_code(std::errc::io_error), "write failed");
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}

} // namespace prereader
