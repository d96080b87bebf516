#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace sv {

using Shape   = std::vector<std::size_t>;
using Strides = std::vector<std::ptrdiff_t>;  // bytes, signed

namespace detail {

// shape helpers
std::size_t numel(const Shape& shp);
// numel(shp) * itemsize if it fits in ptrdiff_t, else nullopt. Any zero extent gives 0.
std::optional<std::size_t> checked_nbytes(const Shape& shp, std::size_t itemsize);
// checked_nbytes, or std::length_error("array is too big; ...").
std::size_t nbytes_for(const Shape& shp, std::size_t itemsize);
Shape strides_for(const Shape& shp);                      // C-order, in elements
Strides byte_strides_for(const Shape& shp, std::size_t itemsize);
std::ptrdiff_t ravel_index(const Shape& idx, const Strides& strides);
Shape unravel_index(std::size_t linear, const Shape& dims);

// broadcasting helpers (NumPy-style, right-aligned; 1 is wildcard)
Shape broadcast_two(const Shape& A, const Shape& B);

// Python-style floor division (rounds toward -inf).
std::int64_t floor_div(std::int64_t a, std::int64_t b);

// "(3, 4)", "(3,)", "()"
template <class T>
std::string shape_str(const std::vector<T>& s) {
  std::ostringstream oss;
  oss << "(";
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (i) oss << ", ";
    oss << s[i];
  }
  if (s.size() == 1) oss << ",";
  oss << ")";
  return oss.str();
}

}
} // namespace sv::detail
