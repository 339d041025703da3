#include "row_reader/format_violation.hpp"
#include <sstream>

namespace rr {

std::string_view to_string(FormatViolation::Kind k) noexcept {
  switch (k) {
    case FormatViolation::Kind::EmptyInput:        return "empty input";
    case FormatViolation::Kind::BareQuote:         return "quote inside unquoted field";
    case FormatViolation::Kind::AfterClosingQuote: return "unexpected character after closing quote";
    case FormatViolation::Kind::UnterminatedQuote: return "unterminated quoted field";
  }
  return "unknown";
}

std::string FormatViolation::message() const {
  std::ostringstream o;
  o << "CSV format error at line " << line
    << ", column " << column
    << " (row " << row << ", field " << field << "): "
    << to_string(kind);
  return o.str();
}

}
