#pragma once

#include "source.hpp"

#include <string>

namespace tapl {

enum class Severity : std::uint8_t { Error, Warning, Note };

struct Diagnostic {
  Severity severity = Severity::Error;
  Span span{};
  std::string message{};
};

// `path:line:col: severity: message`, followed by the offending source line
// when the source manager has its text.
std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d);

}  // namespace tapl
