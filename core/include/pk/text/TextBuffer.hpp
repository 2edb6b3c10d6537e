#pragma once
#include "pk/errors/RangeError.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace pk {

// Receiver: a single mutable string addressed by character position.
class TextBuffer {
public:
  TextBuffer() = default;
  explicit TextBuffer(std::string initial) : text_(std::move(initial)) {}

  // Insert at the end.
  void insert(const std::string& text);

  // Insert at position. Throws RangeError if position > length().
  void insert(const std::string& text, std::size_t position);

  // Remove up to `length` characters starting at position and return them.
  // A length running past the end is clamped. Throws RangeError if
  // position > length().
  std::string erase(std::size_t position, std::size_t length);

  const std::string& text() const { return text_; }
  std::size_t length() const { return text_.size(); }
  bool empty() const { return text_.empty(); }

  // Traces "[TextBuffer] Text: '...'".
  void show() const;

private:
  std::string text_;

  void requirePosition(std::size_t position, const char* op) const;
};

} // namespace pk
