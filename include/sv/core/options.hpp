#pragma once
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sv {

// A shape-like argument as front ends hand it over: a bare integer, a flat
// sequence, or (invalidly) a nested sequence. The view builders decide which
// forms they accept.
class ShapeArg {
public:
  ShapeArg() = default;                                  // empty sequence: ()
  ShapeArg(std::int64_t scalar);                         // bare integer
  ShapeArg(std::initializer_list<std::int64_t> values);
  ShapeArg(std::vector<std::int64_t> values);
  ShapeArg(const std::vector<std::size_t>& values);

  // Sequence whose items are themselves sequences/scalars.
  static ShapeArg nested(std::vector<ShapeArg> items);

  bool is_scalar() const { return scalar_; }
  bool is_flat() const { return !scalar_ && !nested_; }
  std::size_t depth() const;

  // Flat sequence -> values; bare integer -> (value,). Nested -> ShapeTypeError.
  std::vector<std::int64_t> to_tuple(const char* what) const;
  // Flat sequence only. Bare integer or nested -> ShapeTypeError.
  std::vector<std::int64_t> to_sequence(const char* what) const;

  std::string str() const;

private:
  bool scalar_ = false;
  bool nested_ = false;
  std::vector<std::int64_t> values_;
  std::vector<ShapeArg> items_;
};

using OptionValue = std::variant<bool, std::int64_t, ShapeArg>;

// Named-option dictionary for front ends that pass keyword arguments
// (subok, writeable, step). Each operation takes the keys it knows and then
// calls expect_consumed(); anything left is an UnexpectedOptionError.
class Options {
public:
  Options() = default;
  Options(std::initializer_list<std::pair<const std::string, OptionValue>> kv) : values_(kv) {}

  Options& set(const std::string& key, OptionValue v);
  bool contains(const std::string& key) const { return values_.count(key) != 0; }
  bool empty() const { return values_.empty(); }
  std::size_t size() const { return values_.size(); }

  bool take_bool(const std::string& key, bool def);
  std::optional<ShapeArg> take_shape(const std::string& key);

  // Throws UnexpectedOptionError naming the first unconsumed key.
  void expect_consumed(const char* fn) const;

private:
  std::map<std::string, OptionValue> values_;
  std::map<std::string, bool> consumed_;
};

} // namespace sv
