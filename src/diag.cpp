#include "diag.hpp"

#include <sstream>

namespace tapl {

static const char* severity_name(Severity s) {
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
  }
  return "error";
}

std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d) {
  std::ostringstream out;
  const std::string path = sm.has_file(d.span.file) ? sm.path(d.span.file) : std::string("<unknown>");
  out << path << ":" << d.span.begin.line << ":" << d.span.begin.column << ": "
      << severity_name(d.severity) << ": " << d.message;
  if (auto text = sm.line_text(d.span.file, d.span.begin.line)) out << "\n    " << *text;
  return out.str();
}

}  // namespace tapl
