#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace oocsi {

enum class line_kind { keep_alive, event, ignored };

/// Classify one protocol line received from the broker.
inline line_kind classify_line(std::string_view line) {
  if (line.rfind("ping", 0) == 0 || line.rfind(".", 0) == 0)
    return line_kind::keep_alive;
  if (line.rfind("{", 0) == 0)
    return line_kind::event;
  return line_kind::ignored;
}

/// Splits the receive stream into newline-terminated lines.
///
/// Bytes after the last newline are kept until the next push(), so a line
/// split across two reads comes out whole. A partial line longer than
/// max_length is thrown away and the framer resumes after the next newline.
class line_framer {
public:
  explicit line_framer(size_t max_length = 65536) : max_length_(max_length) {}

  void push(const char *data, size_t size) {
    size_t start = 0;
    if (discarding_) {
      const void *nl = std::char_traits<char>::find(data, size, '\n');
      if (nl == nullptr)
        return;
      start = static_cast<size_t>(static_cast<const char *>(nl) - data) + 1;
      discarding_ = false;
    }
    buffer_.append(data + start, size - start);
    enforce_limit();
  }

  void push(std::string_view chunk) { push(chunk.data(), chunk.size()); }

  /// Pop the next complete line, without its terminator. Returns false when
  /// only a partial line (or nothing) is buffered.
  bool next_line(std::string &out) {
    auto nl = buffer_.find('\n', read_pos_);
    if (nl == std::string::npos) {
      compact();
      return false;
    }
    size_t end = nl;
    if (end > read_pos_ && buffer_[end - 1] == '\r')
      --end;
    out.assign(buffer_, read_pos_, end - read_pos_);
    read_pos_ = nl + 1;
    return true;
  }

  bool has_line() const {
    return buffer_.find('\n', read_pos_) != std::string::npos;
  }

  /// Bytes buffered but not yet returned as lines.
  size_t pending() const { return buffer_.size() - read_pos_; }

  void reset() {
    buffer_.clear();
    read_pos_ = 0;
    discarding_ = false;
  }

private:
  void compact() {
    if (read_pos_ > 0) {
      buffer_.erase(0, read_pos_);
      read_pos_ = 0;
    }
  }

  void enforce_limit() {
    auto last_nl = buffer_.rfind('\n');
    size_t tail_start = last_nl == std::string::npos ? read_pos_ : last_nl + 1;
    if (tail_start < read_pos_)
      tail_start = read_pos_;
    if (buffer_.size() - tail_start <= max_length_)
      return;
    // oversized partial line: keep complete lines, skip to the next newline
    buffer_.erase(tail_start);
    discarding_ = true;
  }

  size_t max_length_;
  std::string buffer_;
  size_t read_pos_ = 0;
  bool discarding_ = false;
};

} // namespace oocsi
