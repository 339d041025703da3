#include "row_reader/char_source.hpp"
#include <cerrno>
#include <cstdio>
#include <vector>

namespace rr {

struct FileCharSource::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  int last_errno{0};
  std::uint64_t bytes{0};

  std::vector<char> buf;
  std::size_t pos{0};
  std::size_t len{0};
  bool eof{false};

  void open() {
    f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return; }
    buf.assign(cfg.chunk_bytes ? cfg.chunk_bytes : 1, 0);
  }

  // Refill the window; false on end of input or read failure.
  bool refill() {
    if (!f || eof) return false;
    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0 && std::ferror(f)) { last_errno = errno ? errno : EIO; return false; }
    if (n == 0) { eof = true; return false; }
    bytes += n;
    pos = 0;
    len = n;
    return true;
  }

  void close() noexcept {
    if (f) { std::fclose(f); f = nullptr; }
    pos = len = 0;
  }
};

FileCharSource::FileCharSource(std::string path)
  : FileCharSource(std::move(path), Config{}) {}

FileCharSource::FileCharSource(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) { p_->open(); }

FileCharSource::~FileCharSource() {
  p_->close();
  delete p_;
}

int FileCharSource::next() {
  if (p_->pos < p_->len) return static_cast<unsigned char>(p_->buf[p_->pos++]);
  if (p_->refill()) return static_cast<unsigned char>(p_->buf[p_->pos++]);
  // A failed open or fread leaves last_errno set; a closed handle reads as end.
  return p_->last_errno ? kError : kEnd;
}

void FileCharSource::close() noexcept { p_->close(); }
int  FileCharSource::last_error() const noexcept { return p_->last_errno; }
std::uint64_t FileCharSource::bytes_read() const noexcept { return p_->bytes; }
bool FileCharSource::is_open() const noexcept { return p_->f != nullptr; }
const std::string& FileCharSource::path() const noexcept { return p_->path; }

}
