#include "row_reader/run_json.hpp"
#include "row_reader/metrics.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <fstream>
#include <sstream>

namespace rr {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char u[8];
          std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << u;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

void fill_from_stats(RunJsonPayload& p, const RunStats& s) {
  p.rows = s.rows;
  p.fields = s.fields;
  p.bytes = s.bytes;
  p.wall_time_ms = s.wall_ms;
  p.throughput_mb_s = s.throughput_mb_s;
  p.rows_per_sec = s.rows_per_sec;
  p.stage_times.clear();
  for (auto& st : s.stages) p.stage_times.emplace_back(st.name, st.duration_ms);
}

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"rows\":" << p.rows << ",";
  o << "\"fields\":" << p.fields << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"rows_per_sec\":" << safe_num(p.rows_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  o << "\"status\":"; esc(o, p.status); o << ",";
  o << "\"error\":";  esc(o, p.error);  o << ",";
  o << "\"violation\":";
  if (p.violation) {
    const auto& v = *p.violation;
    o << "{"
      << "\"kind\":";   esc(o, std::string(to_string(v.kind))); o << ","
      << "\"line\":"   << v.line   << ","
      << "\"column\":" << v.column << ","
      << "\"row\":"    << v.row    << ","
      << "\"field\":"  << v.field
      << "}";
  } else {
    o << "null";
  }
  o << ",";

  o << "\"filename\":"; esc(o, p.filename); o << ",";
  o << "\"file_size\":" << p.file_size;

  o << "}";
  return o.str();
}

bool RunJsonWriter::write_file(const std::string& path, const RunJsonPayload& p,
                               std::string* err_out) {
  const std::string s = to_json(p);
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    if (err_out) *err_out = "failed to open " + path;
    return false;
  }
  out.write(s.data(), static_cast<std::streamsize>(s.size()));
  if (!out) {
    if (err_out) *err_out = "write failed: " + path;
    return false;
  }
  return true;
}

}
