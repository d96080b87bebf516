#pragma once
#include <cstddef>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "sv/core/dtype.hpp"
#include "sv/core/shape_utils.hpp"
#include "sv/core/storage.hpp"

namespace sv {

class Array;
using ArrayPtr = std::shared_ptr<Array>;

// Everything that describes an array except its concrete C++ type.
struct ArrayHeader {
  DType dtype;
  Shape shape;
  Strides strides;                   // bytes per step along each axis
  std::shared_ptr<Storage> storage;
  std::ptrdiff_t offset = 0;         // bytes from storage->data() to element 0
  bool writeable = true;
  bool warn_on_write = false;        // first write logs a warning (write still happens)
  ArrayPtr base;                     // array this one was derived from; kept alive
};

// N-d strided array header over shared storage.
//
// - The header is fixed at construction. Bytes may still change through a
//   writable array.
// - Several arrays may alias the same bytes (views, zero strides, sliding
//   windows). Nothing here guards against overlapping writes.
// - Always handled through ArrayPtr; pointer identity is array identity.
// - Subtypes override rewrap() (so derived views keep the concrete type)
//   and may override array_finalize() to restore their own invariants.
class Array : public std::enable_shared_from_this<Array> {
public:
  explicit Array(ArrayHeader h);
  virtual ~Array() = default;

  Array(const Array&)            = delete;
  Array& operator=(const Array&) = delete;
  Array(Array&&)                 = delete;
  Array& operator=(Array&&)      = delete;

  // ----- construction -----
  static ArrayPtr make(ArrayHeader h);
  static ArrayPtr empty(const DType& dt, const Shape& shape);   // C-contiguous, zero-filled
  static ArrayPtr zeros(const DType& dt, const Shape& shape) { return empty(dt, shape); }
  static ArrayPtr wrap(const DType& dt, const Shape& shape, const Strides& strides,
                       std::shared_ptr<Storage> storage, std::ptrdiff_t offset = 0,
                       bool writeable = true);

  template <class T>
  static ArrayPtr from_vector(const std::vector<T>& values, const Shape& shape);

  // ----- subtype hooks -----
  // New array of the same dynamic type over `h`.
  virtual ArrayPtr rewrap(ArrayHeader h) const;
  // Called on a freshly minted subtype view with the array it came from.
  virtual void array_finalize(const Array& from) { (void)from; }
  virtual const char* type_name() const { return "Array"; }
  bool is_base_type() const;

  // ----- header -----
  const ArrayHeader& header() const { return h_; }
  const DType& dtype() const { return h_.dtype; }
  std::size_t itemsize() const { return h_.dtype.itemsize(); }
  const Shape& shape() const { return h_.shape; }
  const Strides& strides() const { return h_.strides; }
  std::size_t ndim() const { return h_.shape.size(); }
  std::size_t size() const { return detail::numel(h_.shape); }
  std::size_t nbytes() const { return size() * itemsize(); }
  std::ptrdiff_t offset() const { return h_.offset; }
  const std::shared_ptr<Storage>& storage() const { return h_.storage; }
  const ArrayPtr& base() const { return h_.base; }
  bool writeable() const { return h_.writeable; }
  bool warn_on_write() const { return h_.warn_on_write; }
  bool is_c_contiguous() const;

  std::byte* data() const { return h_.storage->data() + h_.offset; }
  // Byte offset of `idx` relative to data(). Validates the index, not the storage.
  std::ptrdiff_t byte_offset(const Shape& idx) const;

  // ----- elements -----
  template <class T> T at(const Shape& idx) const;
  template <class T> void set(const Shape& idx, const T& v);
  template <class T> std::vector<T> to_vector() const;     // C order

  // Deep C-contiguous writable copy. Keeps the concrete type.
  ArrayPtr copy() const;

private:
  void check_elem(std::size_t sz, const char* who) const;
  std::byte* mutable_ptr(const Shape& idx);

  ArrayHeader h_;
  bool warned_ = false;
};

// ===== template definitions =====

template <class T>
ArrayPtr Array::from_vector(const std::vector<T>& values, const Shape& shape) {
  if (detail::numel(shape) != values.size())
    throw std::invalid_argument("Array::from_vector: value size != numel(shape)");
  auto out = empty(DType::of<T>(), shape);
  std::byte* p = out->data();
  for (std::size_t i = 0; i < values.size(); ++i) {
    const T v = values[i];
    std::memcpy(p + i * sizeof(T), &v, sizeof(T));
  }
  return out;
}

template <class T>
T Array::at(const Shape& idx) const {
  check_elem(sizeof(T), "at");
  T v;
  std::memcpy(&v, data() + byte_offset(idx), sizeof(T));
  return v;
}

template <class T>
void Array::set(const Shape& idx, const T& v) {
  check_elem(sizeof(T), "set");
  std::memcpy(mutable_ptr(idx), &v, sizeof(T));
}

template <class T>
std::vector<T> Array::to_vector() const {
  check_elem(sizeof(T), "to_vector");
  const std::size_t N = size();
  std::vector<T> out(N);
  const std::byte* p = data();
  for (std::size_t lin = 0; lin < N; ++lin) {
    const auto idx = detail::unravel_index(lin, h_.shape);
    T v;
    std::memcpy(&v, p + detail::ravel_index(idx, h_.strides), sizeof(T));
    out[lin] = v;
  }
  return out;
}

} // namespace sv
