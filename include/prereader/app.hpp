#pragma once
#include <cstddef>
#include <ostream>

namespace prereader {

class FilteringReader;

// prefilter command line tool: copies a file (or stdin) to stdout with the
// configured lines removed.
class App {
public:
    int run(int argc, char** argv);
};

// Writes each surviving line followed by '\n'. Returns the line count.
std::size_t copy_lines(FilteringReader& reader, std::ostream& out);

// Writes the character stream (CRLF line ends). Returns the character count.
// Errors from the line source propagate unchanged.
std::size_t copy_chars(FilteringReader& reader, std::ostream& out);

} // namespace prereader
