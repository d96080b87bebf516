#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace sv {

enum class Kind : int {
  Bool, Int8, Int16, Int32, Int64,
  UInt8, UInt16, UInt32, UInt64,
  Float32, Float64,
  Structured
};

class DType;

// One named member of a structured element type.
struct Field {
  std::string name;
  std::shared_ptr<const DType> dtype;
  std::size_t offset = 0;
};

// Element type descriptor. Plain kinds have a fixed item size; structured
// dtypes carry their own field list and total item size (which may include
// padding past the last field).
class DType {
public:
  DType();                           // float64
  explicit DType(Kind k);

  static DType structured(std::vector<Field> fields, std::size_t itemsize);
  static DType structured(std::vector<Field> fields);  // packed: itemsize = end of last field

  template <class T> static DType of();

  Kind kind() const { return kind_; }
  std::size_t itemsize() const { return itemsize_; }
  bool is_structured() const { return kind_ == Kind::Structured; }
  const std::vector<Field>& fields() const;

  std::string str() const;

  bool operator==(const DType& o) const;
  bool operator!=(const DType& o) const { return !(*this == o); }

private:
  Kind kind_;
  std::size_t itemsize_;
  std::shared_ptr<const std::vector<Field>> fields_;
};

std::size_t kind_size(Kind k);
const char* kind_name(Kind k);

template <class T>
DType DType::of() {
  using U = std::remove_cv_t<T>;
  if constexpr (std::is_same_v<U, bool>)          return DType(Kind::Bool);
  else if constexpr (std::is_same_v<U, std::int8_t>)   return DType(Kind::Int8);
  else if constexpr (std::is_same_v<U, std::int16_t>)  return DType(Kind::Int16);
  else if constexpr (std::is_same_v<U, std::int32_t>)  return DType(Kind::Int32);
  else if constexpr (std::is_same_v<U, std::int64_t>)  return DType(Kind::Int64);
  else if constexpr (std::is_same_v<U, std::uint8_t>)  return DType(Kind::UInt8);
  else if constexpr (std::is_same_v<U, std::uint16_t>) return DType(Kind::UInt16);
  else if constexpr (std::is_same_v<U, std::uint32_t>) return DType(Kind::UInt32);
  else if constexpr (std::is_same_v<U, std::uint64_t>) return DType(Kind::UInt64);
  else if constexpr (std::is_same_v<U, float>)         return DType(Kind::Float32);
  else if constexpr (std::is_same_v<U, double>)        return DType(Kind::Float64);
  else {
    static_assert(std::is_arithmetic_v<U>, "DType::of<T>: unsupported element type");
    // remaining integer aliases (long vs long long etc.) map by width/signedness
    if constexpr (std::is_signed_v<U>) {
      return DType(sizeof(U) == 8 ? Kind::Int64 : sizeof(U) == 4 ? Kind::Int32
                 : sizeof(U) == 2 ? Kind::Int16 : Kind::Int8);
    } else {
      return DType(sizeof(U) == 8 ? Kind::UInt64 : sizeof(U) == 4 ? Kind::UInt32
                 : sizeof(U) == 2 ? Kind::UInt16 : Kind::UInt8);
    }
  }
}

} // namespace sv
