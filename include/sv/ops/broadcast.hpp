#pragma once
#include <vector>

#include "sv/core/array.hpp"
#include "sv/core/options.hpp"

namespace sv {

// Read-only view of x broadcast to `shape` (NumPy rules, right-aligned;
// size-1 axes and missing leading axes get stride 0). A bare integer shape
// means (shape,). More than one element of the result may refer to a single
// memory location, which is why it is never writable.
ArrayPtr broadcast_to(const ArrayPtr& x, const ShapeArg& shape, bool subok = false);

// Keyword form: recognizes "subok".
ArrayPtr broadcast_to(const ArrayPtr& x, const ShapeArg& shape, Options opts);

// Shape that results from broadcasting all `shapes` against each other.
// No limit on the number of shapes. Empty input -> ().
Shape broadcast_shapes(const std::vector<Shape>& shapes);

// Broadcast any number of arrays against each other.
//
// If every array already has the common shape the (normalized) inputs are
// returned as-is. Otherwise each one becomes a broadcast view at the common
// shape. Unlike broadcast_to, those views stay writable when their source
// is, and are flagged warn_on_write: the first write logs a warning. Make
// copies before writing.
std::vector<ArrayPtr> broadcast_arrays(const std::vector<ArrayPtr>& arrays, bool subok = false);

// Keyword form: recognizes "subok" only.
std::vector<ArrayPtr> broadcast_arrays(const std::vector<ArrayPtr>& arrays, Options opts);

namespace detail {

// readonly=false keeps the source's writability (used by broadcast_arrays).
ArrayPtr broadcast_to_impl(const ArrayPtr& x, const ShapeArg& shape, bool subok, bool readonly,
                           bool warn_on_write = false);

} // namespace detail

} // namespace sv
