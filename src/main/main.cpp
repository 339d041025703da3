#include "row_reader/char_source.hpp"
#include "row_reader/row_reader.hpp"

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_row(std::ostream& out, const std::vector<std::string>& row) {
  out << '[';
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (i) out << ", ";
    out << row[i];
  }
  out << "]\n";
}

int dump_rows(const std::string& path) {
  rr::FileCharSource src(path); // closed on every return path
  if (!src.is_open()) {
    std::cerr << "[csv-rows] cannot open " << path << ": "
              << std::strerror(src.last_error()) << "\n";
    return 1;
  }

  rr::RowReader reader(src);
  std::vector<std::string> row;
  while (true) {
    switch (reader.read_row(row)) {
      case rr::ReadStatus::Row:
        print_row(std::cout, row);
        break;
      case rr::ReadStatus::End:
        return 0;
      case rr::ReadStatus::FormatError:
      case rr::ReadStatus::IoError:
        std::cout.flush();
        std::cerr << "[csv-rows] " << path << ": " << reader.error() << "\n";
        return 1;
    }
  }
}

}

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cout << "usage: csv-rows <filename.csv>\n";
    return 0;
  }
  return dump_rows(argv[1]);
}
