#pragma once
#include <stdexcept>
#include <string>

namespace pk {

// Thrown when a position or level lies outside its valid range.
class RangeError : public std::out_of_range {
public:
  explicit RangeError(const std::string& what) : std::out_of_range(what) {}
};

} // namespace pk
