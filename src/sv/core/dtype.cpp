#include "sv/core/dtype.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace sv {

std::size_t kind_size(Kind k) {
  switch (k) {
    case Kind::Bool:   case Kind::Int8:  case Kind::UInt8:  return 1;
    case Kind::Int16:  case Kind::UInt16:                   return 2;
    case Kind::Int32:  case Kind::UInt32: case Kind::Float32: return 4;
    case Kind::Int64:  case Kind::UInt64: case Kind::Float64: return 8;
    case Kind::Structured: return 0;
  }
  return 0;
}

const char* kind_name(Kind k) {
  switch (k) {
    case Kind::Bool:    return "bool";
    case Kind::Int8:    return "int8";
    case Kind::Int16:   return "int16";
    case Kind::Int32:   return "int32";
    case Kind::Int64:   return "int64";
    case Kind::UInt8:   return "uint8";
    case Kind::UInt16:  return "uint16";
    case Kind::UInt32:  return "uint32";
    case Kind::UInt64:  return "uint64";
    case Kind::Float32: return "float32";
    case Kind::Float64: return "float64";
    case Kind::Structured: return "structured";
  }
  return "?";
}

DType::DType() : DType(Kind::Float64) {}

DType::DType(Kind k) : kind_(k), itemsize_(kind_size(k)) {
  if (k == Kind::Structured)
    throw std::invalid_argument("DType: use DType::structured() for structured kinds");
}

DType DType::structured(std::vector<Field> fields, std::size_t itemsize) {
  for (const auto& f : fields) {
    if (!f.dtype) throw std::invalid_argument("DType::structured: field '" + f.name + "' has no dtype");
    if (f.offset + f.dtype->itemsize() > itemsize)
      throw std::invalid_argument("DType::structured: field '" + f.name + "' overruns itemsize");
  }
  DType d(Kind::Bool);
  d.kind_ = Kind::Structured;
  d.itemsize_ = itemsize;
  d.fields_ = std::make_shared<const std::vector<Field>>(std::move(fields));
  return d;
}

DType DType::structured(std::vector<Field> fields) {
  std::size_t end = 0;
  for (const auto& f : fields) {
    if (f.dtype) end = std::max(end, f.offset + f.dtype->itemsize());
  }
  return structured(std::move(fields), end);
}

const std::vector<Field>& DType::fields() const {
  static const std::vector<Field> none;
  return fields_ ? *fields_ : none;
}

std::string DType::str() const {
  if (!is_structured()) return kind_name(kind_);
  std::ostringstream oss;
  oss << "{";
  const auto& fs = fields();
  for (std::size_t i = 0; i < fs.size(); ++i) {
    if (i) oss << ",";
    oss << fs[i].name << ":" << fs[i].dtype->str() << "@" << fs[i].offset;
  }
  oss << "}";
  if (!fs.empty()) {
    const auto& last = fs.back();
    if (last.offset + last.dtype->itemsize() != itemsize_) oss << "[" << itemsize_ << "]";
  } else {
    oss << "[" << itemsize_ << "]";
  }
  return oss.str();
}

bool DType::operator==(const DType& o) const {
  if (kind_ != o.kind_ || itemsize_ != o.itemsize_) return false;
  if (!is_structured()) return true;
  const auto& a = fields();
  const auto& b = o.fields();
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (a[i].name != b[i].name || a[i].offset != b[i].offset) return false;
    if (!(*a[i].dtype == *b[i].dtype)) return false;
  }
  return true;
}

} // namespace sv
