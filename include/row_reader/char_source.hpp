#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace rr {

// Pull-one-byte-at-a-time producer over an underlying stream.
class CharSource {
public:
  static constexpr int kEnd   = -1;  // end of input
  static constexpr int kError = -2;  // underlying read failed, see last_error()

  virtual ~CharSource() = default;

  // Next byte as 0..255, kEnd or kError.
  virtual int next() = 0;

  // Release the underlying resource. Safe to call more than once.
  virtual void close() noexcept = 0;

  virtual int last_error() const noexcept = 0;
  virtual std::uint64_t bytes_read() const noexcept = 0;
};

class FileCharSource final : public CharSource {
public:
  struct Config {
    std::size_t chunk_bytes = 64 * 1024; // 64 KiB fread window
  };

  explicit FileCharSource(std::string path);      // uses default Config{}
  FileCharSource(std::string path, Config cfg);   // explicit Config
  ~FileCharSource() override;

  FileCharSource(const FileCharSource&) = delete;
  FileCharSource& operator=(const FileCharSource&) = delete;

  int next() override;
  void close() noexcept override;
  int last_error() const noexcept override;
  std::uint64_t bytes_read() const noexcept override;

  bool is_open() const noexcept;
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

// In-memory source; used when the whole input is already a string.
class StringCharSource final : public CharSource {
public:
  explicit StringCharSource(std::string text) : text_(std::move(text)) {}

  int next() override {
    if (closed_ || pos_ >= text_.size()) return kEnd;
    return static_cast<unsigned char>(text_[pos_++]);
  }
  void close() noexcept override { closed_ = true; }
  int last_error() const noexcept override { return 0; }
  std::uint64_t bytes_read() const noexcept override { return pos_; }

private:
  std::string text_;
  std::size_t pos_{0};
  bool closed_{false};
};

}
