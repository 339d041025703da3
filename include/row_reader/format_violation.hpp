#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace rr {

// Position of an illegal character, as seen by the row reader's cursor.
// All counters are 1-based.
struct FormatViolation {
  enum class Kind {
    EmptyInput,         // stream ended before its first character
    BareQuote,          // '"' inside an unquoted field
    AfterClosingQuote,  // anything but ',' or a line end after a closing quote
    UnterminatedQuote   // stream ended inside a quoted field
  };

  Kind kind = Kind::EmptyInput;
  std::uint64_t line   = 1;
  std::uint64_t column = 1;
  std::uint64_t row    = 1;
  std::uint64_t field  = 1;

  std::string message() const;
};

std::string_view to_string(FormatViolation::Kind k) noexcept;

}
