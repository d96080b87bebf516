#include "sv/core/shape_utils.hpp"
#include "sv/core/errors.hpp"
#include <algorithm>
#include <functional>
#include <limits>
#include <stdexcept>
#include <numeric>

namespace sv {
namespace detail {

std::size_t numel(const Shape& shp) {
  return std::accumulate(shp.begin(), shp.end(), std::size_t{1}, std::multiplies<>());
}

std::optional<std::size_t> checked_nbytes(const Shape& shp, std::size_t itemsize) {
  if (std::find(shp.begin(), shp.end(), std::size_t{0}) != shp.end()) return std::size_t{0};
  const auto lim = static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max());
  if (itemsize > lim) return std::nullopt;
  std::size_t n = itemsize;
  for (auto d : shp) {
    if (n != 0 && d > lim / n) return std::nullopt;
    n *= d;
  }
  return n;
}

std::size_t nbytes_for(const Shape& shp, std::size_t itemsize) {
  const auto n = checked_nbytes(shp, itemsize);
  if (!n)
    throw std::length_error("array is too big; shape " + shape_str(shp) + " with itemsize "
                            + std::to_string(itemsize) + " does not fit in memory");
  return *n;
}

Shape strides_for(const Shape& shp) {
  Shape st(shp.size(), 1);
  for (int i = int(shp.size()) - 2; i >= 0; --i)
    st[std::size_t(i)] = st[std::size_t(i + 1)] * shp[std::size_t(i + 1)];
  return st;
}

Strides byte_strides_for(const Shape& shp, std::size_t itemsize) {
  const auto el = strides_for(shp);
  Strides st(el.size());
  for (std::size_t d = 0; d < el.size(); ++d)
    st[d] = static_cast<std::ptrdiff_t>(el[d] * itemsize);
  return st;
}

std::ptrdiff_t ravel_index(const Shape& idx, const Strides& strides) {
  std::ptrdiff_t off = 0;
  for (std::size_t d = 0; d < idx.size(); ++d)
    off += static_cast<std::ptrdiff_t>(idx[d]) * strides[d];
  return off;
}

Shape unravel_index(std::size_t linear, const Shape& dims) {
  Shape idx(dims.size());
  for (int i = int(dims.size()) - 1; i >= 0; --i) {
    const auto ui = std::size_t(i);
    idx[ui] = dims[ui] ? (linear % dims[ui]) : 0;
    linear /= (dims[ui] ? dims[ui] : 1);
  }
  return idx;
}

Shape broadcast_two(const Shape& A, const Shape& B) {
  const std::size_t r = std::max(A.size(), B.size());
  Shape out(r, 1);
  for (std::size_t i = 0; i < r; ++i) {
    const std::size_t ad = (i < r - A.size()) ? 1 : A[i - (r - A.size())];
    const std::size_t bd = (i < r - B.size()) ? 1 : B[i - (r - B.size())];
    if (ad != bd && ad != 1 && bd != 1)
      throw BroadcastError("shape mismatch: objects cannot be broadcast to a single shape: "
                           + shape_str(A) + " and " + shape_str(B));
    // 1 stretches to the other extent, including 0
    out[i] = (ad == 1) ? bd : ad;
  }
  return out;
}

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

}
} // namespace sv::detail
