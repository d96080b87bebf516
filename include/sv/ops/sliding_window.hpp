#pragma once
#include <optional>

#include "sv/core/array.hpp"
#include "sv/core/options.hpp"

namespace sv {

// Sliding windows of `window_shape` over every axis of x, moving by `step`
// (default 1 per axis).
//
//   result.shape   = ((x.shape - window) // step + 1) ++ window
//   result.strides = (x.strides * step) ++ x.strides
//
// writeable=false: read-only view; windows overlap and share memory.
// writeable=true : a deep, non-aliased copy of that view (may be much larger
//                  than x).
//
// Throws ShapeTypeError, DimensionMismatchError, NonPositiveError for a bad
// window_shape or step, WindowTooLargeError if a window does not fit.
ArrayPtr sliding_window_view(const ArrayPtr& x,
                             const ShapeArg& window_shape,
                             const std::optional<ShapeArg>& step = std::nullopt,
                             bool subok = false,
                             bool writeable = false);

// Keyword form: recognizes "step", "subok" and "writeable".
ArrayPtr sliding_window_view(const ArrayPtr& x,
                             const ShapeArg& window_shape,
                             Options opts);

} // namespace sv
