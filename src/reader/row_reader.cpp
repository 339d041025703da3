#include "row_reader/row_reader.hpp"
#include <cerrno>
#include <cstring>

namespace rr {

RowReader::RowReader(CharSource& src, const ReaderConfig& cfg)
  : src_(src), cfg_(cfg) {}

void RowReader::emit_field(std::vector<std::string>& row) {
  row.emplace_back(field_buf_);
  field_buf_.clear(); // keeps capacity for the next field
  ++field_;
}

RowReader::Step RowReader::end_row(std::vector<std::string>& row) {
  emit_field(row);
  ++line_;
  ++row_;
  return Step::RowDone;
}

RowReader::Step RowReader::violate(FormatViolation::Kind k) {
  violation_.kind   = k;
  violation_.line   = line_;
  violation_.column = col_;
  violation_.row    = row_;
  violation_.field  = field_;
  return Step::Fail;
}

RowReader::Step RowReader::step(int c, std::vector<std::string>& row) {
  switch (state_) {
    case State::Initial:
      switch (c) {
        case '\r': return Step::Next;
        case '\n': return end_row(row);
        case ',':  emit_field(row); return Step::Next; // empty field
        case '"':  state_ = State::Quote; return Step::Next;
        default:
          field_buf_.push_back(static_cast<char>(c));
          state_ = State::TextData;
          return Step::Next;
      }

    case State::TextData:
      switch (c) {
        case '\r': return Step::Next;
        case '\n': return end_row(row);
        case ',':  emit_field(row); state_ = State::Initial; return Step::Next;
        case '"':  return violate(FormatViolation::Kind::BareQuote);
        default:   field_buf_.push_back(static_cast<char>(c)); return Step::Next;
      }

    case State::Quote:
      switch (c) {
        case '\r':
          if (cfg_.keep_quoted_cr) field_buf_.push_back('\r');
          return Step::Next;
        case '\n':
          field_buf_.push_back('\n');
          ++line_;
          return Step::Next;
        case '"':  state_ = State::EscapeQuote; return Step::Next;
        default:   field_buf_.push_back(static_cast<char>(c)); return Step::Next;
      }

    case State::EscapeQuote:
      switch (c) {
        case '\r': return Step::Next;
        case '\n': return end_row(row);
        case ',':  emit_field(row); state_ = State::Initial; return Step::Next;
        // Doubled quote: hand the same '"' to InnerQuote, which emits the literal.
        case '"':  state_ = State::InnerQuote; return Step::Redispatch;
        default:   return violate(FormatViolation::Kind::AfterClosingQuote);
      }

    case State::InnerQuote:
      switch (c) {
        case '\r': return Step::Next;
        case '\n': return end_row(row);
        case ',':  emit_field(row); state_ = State::Initial; return Step::Next;
        case '"':
          field_buf_.push_back('"');
          state_ = State::Quote;
          return Step::Next;
        default:   return violate(FormatViolation::Kind::AfterClosingQuote);
      }
  }
  return Step::Next;
}

ReadStatus RowReader::read_row(std::vector<std::string>& row) {
  row.clear();
  if (sticky_) return *sticky_;

  col_ = 1;
  field_ = 1;
  state_ = State::Initial;
  field_buf_.clear();

  while (true) {
    const int c = src_.next();
    if (c == CharSource::kError) return on_io_error(row);
    if (c == CharSource::kEnd)   return on_end(row);
    consumed_any_ = true;

    Step s;
    do { s = step(c, row); } while (s == Step::Redispatch);

    if (s == Step::RowDone) return ReadStatus::Row;
    if (s == Step::Fail)    return on_format_error(row);
    ++col_;
  }
}

ReadStatus RowReader::on_end(std::vector<std::string>& row) {
  if (!consumed_any_) {
    violate(FormatViolation::Kind::EmptyInput);
    return on_format_error(row);
  }

  sticky_ = ReadStatus::End;
  const bool partial = !row.empty() || !field_buf_.empty() || state_ != State::Initial;
  if (!cfg_.emit_partial_final_row || !partial) {
    row.clear();
    return ReadStatus::End;
  }
  if (state_ == State::Quote) {
    violate(FormatViolation::Kind::UnterminatedQuote);
    return on_format_error(row);
  }
  emit_field(row);
  ++row_;
  return ReadStatus::Row;
}

ReadStatus RowReader::on_format_error(std::vector<std::string>& row) {
  row.clear();
  err_ = violation_.message();
  sticky_ = ReadStatus::FormatError;
  return ReadStatus::FormatError;
}

ReadStatus RowReader::on_io_error(std::vector<std::string>& row) {
  row.clear();
  io_errno_ = src_.last_error() ? src_.last_error() : EIO;
  err_ = std::string("I/O error: ") + std::strerror(io_errno_);
  sticky_ = ReadStatus::IoError;
  return ReadStatus::IoError;
}

}
