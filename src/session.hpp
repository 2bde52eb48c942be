#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "diag.hpp"
#include "source.hpp"

namespace tapl {

// State shared by every stage of one compilation: the source files it reads
// and the diagnostics it produces. Discarded together with the compilation.
struct Session {
    SourceManager sources{};
    std::vector<Diagnostic> diags{};

    void error(Span span, std::string message);
    void note(Span span, std::string message);

    bool has_errors() const;
    std::size_t error_count() const;
    void print_diagnostics(std::ostream& os) const;
};

}  // namespace tapl
