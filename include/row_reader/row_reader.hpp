#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "row_reader/char_source.hpp"
#include "row_reader/format_violation.hpp"

namespace rr {

struct ReaderConfig {
  bool keep_quoted_cr         = false; // keep '\r' inside quoted fields instead of dropping it
  bool emit_partial_final_row = false; // return an unterminated last line instead of dropping it
};

enum class ReadStatus { Row, End, FormatError, IoError };

// Strict CSV row reader: ',' delimiter, '"' quote, LF row terminator, CR ignored.
// Pulls characters from a borrowed CharSource one at a time and assembles
// exactly one row per read_row() call. The source is never closed here.
//
// After FormatError or IoError the reader is unusable; every later call
// returns the same status without touching the source.
class RowReader {
public:
  explicit RowReader(CharSource& src, const ReaderConfig& cfg = {});

  RowReader(const RowReader&) = delete;
  RowReader& operator=(const RowReader&) = delete;

  // Clears `row`, then fills it with the next row's fields on ReadStatus::Row.
  // An empty stream (no character ever read) is a FormatError at 1:1.
  ReadStatus read_row(std::vector<std::string>& row);

  const FormatViolation& violation() const noexcept { return violation_; }
  const std::string& error() const { return err_; }
  int io_errno() const noexcept { return io_errno_; }

  // Cursor: line/row are stream-wide, column/field restart at every read_row().
  std::uint64_t line()   const noexcept { return line_; }
  std::uint64_t row()    const noexcept { return row_; }
  std::uint64_t column() const noexcept { return col_; }
  std::uint64_t field()  const noexcept { return field_; }

private:
  enum class State { Initial, TextData, Quote, EscapeQuote, InnerQuote };
  enum class Step { Next, Redispatch, RowDone, Fail };

  Step step(int c, std::vector<std::string>& row);
  Step end_row(std::vector<std::string>& row);
  Step violate(FormatViolation::Kind k);
  void emit_field(std::vector<std::string>& row);
  ReadStatus on_end(std::vector<std::string>& row);
  ReadStatus on_format_error(std::vector<std::string>& row);
  ReadStatus on_io_error(std::vector<std::string>& row);

  CharSource& src_;
  ReaderConfig cfg_;
  State state_{State::Initial};
  std::string field_buf_;

  std::uint64_t line_{1};
  std::uint64_t row_{1};
  std::uint64_t col_{1};
  std::uint64_t field_{1};

  bool consumed_any_{false};
  std::optional<ReadStatus> sticky_;
  FormatViolation violation_;
  std::string err_;
  int io_errno_{0};
};

}
