#include "session.hpp"

#include <ostream>
#include <utility>

namespace tapl {

void Session::error(Span span, std::string message) {
  diags.push_back(Diagnostic{.severity = Severity::Error, .span = span, .message = std::move(message)});
}

void Session::note(Span span, std::string message) {
  diags.push_back(Diagnostic{.severity = Severity::Note, .span = span, .message = std::move(message)});
}

bool Session::has_errors() const {
  for (const auto& d : diags) {
    if (d.severity == Severity::Error) return true;
  }
  return false;
}

std::size_t Session::error_count() const {
  std::size_t n = 0;
  for (const auto& d : diags) {
    if (d.severity == Severity::Error) n++;
  }
  return n;
}

void Session::print_diagnostics(std::ostream& os) const {
  for (const auto& d : diags) os << format_diagnostic(sources, d) << "\n";
}

}  // namespace tapl
