#include <prereader/cli.hpp>
#include <prereader/config_file.hpp>

#include <stdexcept>
#include <string_view>

namespace prereader {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

ParseResult parse_cli(int argc, char** argv) {
    ParseResult r{};
    Options o{};

    for (int i = 1; i < argc; i++) {
        std::string_view a = argv[i];

        // flags that take a value map straight onto rules-file keys
        auto setting = [&](const char* key) -> bool {
            if (!has_arg(i, argc)) {
                r.error = std::string(a) + ": value required";
                return false;
            }
            try {
                if (!apply_setting(o.overrides, key, argv[++i])) {
                    r.error = std::string("unsupported setting: ") + key;
                    return false;
                }
            } catch (const std::runtime_error& e) {
                r.error = e.what();
                return false;
            }
            return true;
        };

        if (a == "-h" || a == "--help") {
            r.help = true;
            return r;
        } else if (a == "--version") {
            r.version = true;
            return r;
        } else if (a == "-v" || a == "--verbose") {
            o.verbose = true;
        } else if (a == "--chars") {
            o.chars = true;
        } else if (a == "--trim") {
            o.overrides.trim_lines = true;
        } else if (a == "--skip-empty") {
            o.overrides.skip_empty = true;
        } else if (a == "--skip-blank") {
            o.overrides.skip_whitespace_only = true;
        } else if (a == "--config") {
            if (!has_arg(i, argc)) { r.error = "--config: path required"; return r; }
            o.config_file = std::filesystem::path(argv[++i]);
        } else if (a == "-o" || a == "--output") {
            if (!has_arg(i, argc)) { r.error = "--output: path required"; return r; }
            o.output = std::filesystem::path(argv[++i]);
        } else if (a == "--min-length") {
            if (!setting("min-length")) return r;
            o.min_length_given = true;
        } else if (a == "--max-length") {
            if (!setting("max-length")) return r;
            o.max_length_given = true;
        } else if (a == "--skip-containing") {
            if (!setting("skip-containing")) return r;
        } else if (a == "--skip-prefix") {
            if (!setting("skip-prefix")) return r;
        } else if (a == "--skip-suffix") {
            if (!setting("skip-suffix")) return r;
        } else if (a == "-" || (!a.empty() && a[0] != '-')) {
            if (o.input) { r.error = "only one input file may be given"; return r; }
            // an empty path stands for stdin until parsing is done
            o.input = a == "-" ? std::filesystem::path{} : std::filesystem::path(argv[i]);
        } else {
            r.error = "unknown argument: " + std::string(a);
            return r;
        }
    }

    if (o.input && o.input->empty()) o.input.reset();
    r.opts = std::move(o);
    return r;
}

void merge_overrides(Configuration& base, const Options& o) {
    const Configuration& overrides = o.overrides;
    base.trim_lines = base.trim_lines || overrides.trim_lines;
    base.skip_empty = base.skip_empty || overrides.skip_empty;
    base.skip_whitespace_only = base.skip_whitespace_only || overrides.skip_whitespace_only;
    if (o.min_length_given) base.min_line_length = overrides.min_line_length;
    if (o.max_length_given) base.max_line_length = overrides.max_line_length;

    auto append = [](std::vector<std::string>& dst, const std::vector<std::string>& src) {
        dst.insert(dst.end(), src.begin(), src.end());
    };
    append(base.skip_containing, overrides.skip_containing);
    append(base.skip_starting_with, overrides.skip_starting_with);
    append(base.skip_ending_with, overrides.skip_ending_with);
}

} // namespace prereader
