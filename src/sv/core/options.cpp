#include "sv/core/options.hpp"
#include "sv/core/errors.hpp"
#include <algorithm>
#include <sstream>

namespace sv {

ShapeArg::ShapeArg(std::int64_t scalar) : scalar_(true), values_{scalar} {}

ShapeArg::ShapeArg(std::initializer_list<std::int64_t> values) : values_(values) {}

ShapeArg::ShapeArg(std::vector<std::int64_t> values) : values_(std::move(values)) {}

ShapeArg::ShapeArg(const std::vector<std::size_t>& values) {
  values_.reserve(values.size());
  for (auto v : values) values_.push_back(static_cast<std::int64_t>(v));
}

ShapeArg ShapeArg::nested(std::vector<ShapeArg> items) {
  // A sequence of bare integers is just a flat sequence.
  const bool all_scalar = std::all_of(items.begin(), items.end(),
                                      [](const ShapeArg& a){ return a.is_scalar(); });
  ShapeArg out;
  if (all_scalar) {
    for (const auto& a : items) out.values_.push_back(a.values_.front());
    return out;
  }
  out.nested_ = true;
  out.items_ = std::move(items);
  return out;
}

std::size_t ShapeArg::depth() const {
  if (scalar_) return 0;
  if (!nested_) return 1;
  std::size_t d = 0;
  for (const auto& it : items_) d = std::max(d, it.depth());
  return d + 1;
}

std::vector<std::int64_t> ShapeArg::to_tuple(const char* what) const {
  if (nested_)
    throw ShapeTypeError(std::string("`") + what + "` must be one-dimensional sequence of integer, got " + str());
  return values_;
}

std::vector<std::int64_t> ShapeArg::to_sequence(const char* what) const {
  if (scalar_)
    throw ShapeTypeError(std::string("`") + what + "` must be a sequence of integer, got " + str());
  return to_tuple(what);
}

std::string ShapeArg::str() const {
  if (scalar_) return std::to_string(values_.front());
  std::ostringstream oss;
  oss << "(";
  if (nested_) {
    for (std::size_t i = 0; i < items_.size(); ++i) { if (i) oss << ", "; oss << items_[i].str(); }
    if (items_.size() == 1) oss << ",";
  } else {
    for (std::size_t i = 0; i < values_.size(); ++i) { if (i) oss << ", "; oss << values_[i]; }
    if (values_.size() == 1) oss << ",";
  }
  oss << ")";
  return oss.str();
}

// ---------------------------------------------------------------------------

Options& Options::set(const std::string& key, OptionValue v) {
  values_[key] = std::move(v);
  consumed_.erase(key);
  return *this;
}

bool Options::take_bool(const std::string& key, bool def) {
  auto it = values_.find(key);
  if (it == values_.end()) return def;
  consumed_[key] = true;
  if (auto b = std::get_if<bool>(&it->second)) return *b;
  if (auto i = std::get_if<std::int64_t>(&it->second)) return *i != 0;
  throw ShapeTypeError("option '" + key + "' expects a boolean");
}

std::optional<ShapeArg> Options::take_shape(const std::string& key) {
  auto it = values_.find(key);
  if (it == values_.end()) return std::nullopt;
  consumed_[key] = true;
  if (auto s = std::get_if<ShapeArg>(&it->second)) return *s;
  if (auto i = std::get_if<std::int64_t>(&it->second)) return ShapeArg(*i);
  throw ShapeTypeError("option '" + key + "' expects an integer or a sequence of integers");
}

void Options::expect_consumed(const char* fn) const {
  for (const auto& kv : values_) {
    if (!consumed_.count(kv.first))
      throw UnexpectedOptionError(std::string(fn) + "() got an unexpected keyword argument '" + kv.first + "'");
  }
}

} // namespace sv
