#include "row_reader/metrics.hpp"
#include "row_reader/run_json.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <simdjson.h>

int main() {
  rr::MetricsRegistry m;
  m.start_stage("read_rows");
  m.add_row(3);
  m.add_row(2);
  m.end_stage("read_rows");
  m.end_stage("never_started"); // ignored
  m.set_bytes(2 * 1024 * 1024);
  m.add_violation();

  rr::RunStats s = m.snapshot(1000.0);
  if (s.rows != 2 || s.fields != 5 || s.violations != 1) {
    std::cerr << "[FAIL] snapshot counters rows=" << s.rows << " fields=" << s.fields << "\n";
    return 1;
  }
  if (s.throughput_mb_s != 2.0 || s.rows_per_sec != 2.0) {
    std::cerr << "[FAIL] derived rates mb/s=" << s.throughput_mb_s << " rows/s=" << s.rows_per_sec << "\n";
    return 1;
  }
  if (s.stages.size() != 1 || s.stages[0].name != "read_rows") {
    std::cerr << "[FAIL] stages\n"; return 1;
  }
  if (m.snapshot(0.0).throughput_mb_s != 0.0) { std::cerr << "[FAIL] zero wall time\n"; return 1; }

  rr::RunJsonPayload p;
  rr::fill_from_stats(p, s);
  p.status = "format_error";
  p.error = "CSV format error at line 2, column 4 (row 2, field 2): quote inside unquoted field";
  p.violation = rr::FormatViolation{rr::FormatViolation::Kind::BareQuote, 2, 4, 2, 2};
  p.filename = "dir/\"odd\"\tname.csv";
  p.file_size = 42;

  const std::string js = rr::RunJsonWriter::to_json(p);
  simdjson::dom::parser parser;
  simdjson::dom::element doc;
  if (parser.parse(js).get(doc)) { std::cerr << "[FAIL] invalid json: " << js << "\n"; return 1; }

  uint64_t rows = 0, fields = 0, vline = 0, vcol = 0, vrow = 0, vfld = 0;
  std::string_view status, fname;
  simdjson::dom::element v;
  if (doc["rows"].get(rows) || doc["fields"].get(fields) ||
      doc["status"].get(status) || doc["filename"].get(fname) ||
      doc["violation"].get(v)) {
    std::cerr << "[FAIL] missing keys: " << js << "\n"; return 1;
  }
  if (v["line"].get(vline) || v["column"].get(vcol) || v["row"].get(vrow) || v["field"].get(vfld)) {
    std::cerr << "[FAIL] violation object: " << js << "\n"; return 1;
  }

  bool ok = true;
  if (rows != 2 || fields != 5) { std::cerr << "[FAIL] rows/fields in json\n"; ok = false; }
  if (status != "format_error") { std::cerr << "[FAIL] status=" << status << "\n"; ok = false; }
  if (vline != 2 || vcol != 4 || vrow != 2 || vfld != 2) { std::cerr << "[FAIL] violation position\n"; ok = false; }
  if (fname != p.filename) { std::cerr << "[FAIL] filename escaping: " << fname << "\n"; ok = false; }

  // A clean run writes violation as null.
  rr::RunJsonPayload clean;
  const std::string clean_json = rr::RunJsonWriter::to_json(clean);
  if (clean_json.find("\"violation\":null") == std::string::npos) {
    std::cerr << "[FAIL] clean run violation not null: " << clean_json << "\n"; ok = false;
  }

  if (!ok) return 1;
  std::cout << "[PASS] run_json\n";
  return 0;
}
