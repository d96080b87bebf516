#pragma once
#include <stdexcept>
#include <string>

namespace sv {

// Caller-input errors raised by the view builders. Everything derives from
// std::invalid_argument so `catch (const std::invalid_argument&)` still works.
struct Error : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// A shape/step argument is not a flat sequence of integers.
struct ShapeTypeError : Error { using Error::Error; };

// Argument rank disagrees with the source array rank.
struct DimensionMismatchError : Error { using Error::Error; };

// Window or step entry <= 0.
struct NonPositiveError : Error { using Error::Error; };

// Computed sliding-window output extent <= 0 on some axis.
struct WindowTooLargeError : Error { using Error::Error; };

// Shapes disagree on a non-1 axis, or non-scalar -> scalar.
struct BroadcastError : Error { using Error::Error; };

// Target shape contains a negative size.
struct NegativeDimensionError : Error { using Error::Error; };

// Unrecognized named option.
struct UnexpectedOptionError : Error { using Error::Error; };

} // namespace sv
