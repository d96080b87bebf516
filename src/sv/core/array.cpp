#include "sv/core/array.hpp"
#include "sv/core/log.hpp"
#include <typeinfo>

namespace sv {
using detail::numel;
using detail::ravel_index;
using detail::unravel_index;
using detail::shape_str;

Array::Array(ArrayHeader h) : h_(std::move(h)) {
  if (h_.shape.size() != h_.strides.size())
    throw std::invalid_argument("Array: mismatch in size of strides and shape: "
                                + shape_str(h_.strides) + " vs " + shape_str(h_.shape));
  if (!h_.storage) throw std::invalid_argument("Array: storage required");
  // size() and nbytes() rely on this product not wrapping.
  (void)detail::nbytes_for(h_.shape, h_.dtype.itemsize());
  // Never more writable than what backs it.
  if (!h_.storage->writeable()) h_.writeable = false;
  if (h_.base && !h_.base->writeable()) h_.writeable = false;
  if (!h_.writeable) h_.warn_on_write = false;
}

ArrayPtr Array::make(ArrayHeader h) {
  return std::make_shared<Array>(std::move(h));
}

ArrayPtr Array::empty(const DType& dt, const Shape& shape) {
  ArrayHeader h;
  h.dtype = dt;
  h.shape = shape;
  h.strides = detail::byte_strides_for(shape, dt.itemsize());
  h.storage = Storage::allocate(detail::nbytes_for(shape, dt.itemsize()));
  return make(std::move(h));
}

ArrayPtr Array::wrap(const DType& dt, const Shape& shape, const Strides& strides,
                     std::shared_ptr<Storage> storage, std::ptrdiff_t offset,
                     bool writeable) {
  ArrayHeader h;
  h.dtype = dt;
  h.shape = shape;
  h.strides = strides;
  h.storage = std::move(storage);
  h.offset = offset;
  h.writeable = writeable;
  return make(std::move(h));
}

ArrayPtr Array::rewrap(ArrayHeader h) const {
  return std::make_shared<Array>(std::move(h));
}

bool Array::is_base_type() const {
  return typeid(*this) == typeid(Array);
}

bool Array::is_c_contiguous() const {
  if (size() == 0) return true;
  std::ptrdiff_t expect = static_cast<std::ptrdiff_t>(itemsize());
  for (int d = int(ndim()) - 1; d >= 0; --d) {
    const auto ud = std::size_t(d);
    if (h_.shape[ud] == 1) continue;
    if (h_.strides[ud] != expect) return false;
    expect *= static_cast<std::ptrdiff_t>(h_.shape[ud]);
  }
  return true;
}

std::ptrdiff_t Array::byte_offset(const Shape& idx) const {
  if (idx.size() != ndim())
    throw std::out_of_range("Array: index rank " + std::to_string(idx.size())
                            + " != ndim " + std::to_string(ndim()));
  for (std::size_t d = 0; d < idx.size(); ++d) {
    if (idx[d] >= h_.shape[d])
      throw std::out_of_range("Array: index " + std::to_string(idx[d]) + " is out of bounds for axis "
                              + std::to_string(d) + " with size " + std::to_string(h_.shape[d]));
  }
  return ravel_index(idx, h_.strides);
}

void Array::check_elem(std::size_t sz, const char* who) const {
  if (sz != itemsize())
    throw std::invalid_argument(std::string("Array::") + who + ": element size " + std::to_string(sz)
                                + " does not match dtype " + h_.dtype.str());
}

std::byte* Array::mutable_ptr(const Shape& idx) {
  if (!h_.writeable) throw std::runtime_error("assignment destination is read-only");
  const auto off = byte_offset(idx);
  if (h_.warn_on_write && !warned_) {
    warned_ = true;
    SV_LOG_WARN("writing to a broadcast array of shape %s; several elements may share one "
                "memory location", shape_str(h_.shape).c_str());
  }
  return data() + off;
}

ArrayPtr Array::copy() const {
  ArrayHeader h;
  h.dtype = h_.dtype;
  h.shape = h_.shape;
  h.strides = detail::byte_strides_for(h_.shape, itemsize());
  h.storage = Storage::allocate(detail::nbytes_for(h_.shape, itemsize()));

  const std::size_t N = size();
  const std::size_t isz = itemsize();
  const std::byte* src = data();
  std::byte* dst = h.storage->data();
  for (std::size_t lin = 0; lin < N; ++lin) {
    const auto idx = unravel_index(lin, h_.shape);
    std::memcpy(dst + lin * isz, src + ravel_index(idx, h_.strides), isz);
  }

  auto out = rewrap(std::move(h));
  out->array_finalize(*this);
  return out;
}

} // namespace sv
