#include "pk/text/TextBuffer.hpp"
#include "pk/debug/Trace.hpp"

#include <algorithm>

namespace pk {

void TextBuffer::requirePosition(std::size_t position, const char* op) const {
  if (position > text_.size()) {
    throw RangeError(std::string("TextBuffer::") + op + ": position " +
                     std::to_string(position) + " past end (length " +
                     std::to_string(text_.size()) + ")");
  }
}

void TextBuffer::insert(const std::string& text) {
  insert(text, text_.size());
}

void TextBuffer::insert(const std::string& text, std::size_t position) {
  requirePosition(position, "insert");
  text_.insert(position, text);

  trace("[TextBuffer] Inserted '%s' at position %zu\n", text.c_str(), position);
  trace("[TextBuffer] Current text: '%s'\n", text_.c_str());
}

std::string TextBuffer::erase(std::size_t position, std::size_t length) {
  requirePosition(position, "erase");
  const std::size_t n = std::min(length, text_.size() - position);
  std::string removed = text_.substr(position, n);
  text_.erase(position, n);

  trace("[TextBuffer] Deleted '%s' at position %zu\n", removed.c_str(), position);
  trace("[TextBuffer] Current text: '%s'\n", text_.c_str());
  return removed;
}

void TextBuffer::show() const {
  trace("[TextBuffer] Text: '%s'\n", text_.c_str());
}

} // namespace pk
