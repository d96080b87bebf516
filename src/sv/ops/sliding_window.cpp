#include "sv/ops/sliding_window.hpp"
#include "sv/ops/as_strided.hpp"
#include "sv/core/errors.hpp"
#include "sv/core/log.hpp"
#include <limits>

namespace sv {
using detail::floor_div;
using detail::shape_str;

namespace {

// Flat, one entry per axis, all strictly positive.
std::vector<std::int64_t> per_axis(const ShapeArg& arg, const char* what, std::size_t ndim) {
  auto v = arg.to_sequence(what);
  if (v.size() != ndim)
    throw DimensionMismatchError(std::string("`") + what + "` length doesn't match with input array dimensions: "
                                 + shape_str(v) + " for a " + std::to_string(ndim) + "-d array");
  for (auto e : v) {
    if (e <= 0)
      throw NonPositiveError(std::string("`") + what + "` cannot contain non-positive value: " + shape_str(v));
  }
  return v;
}

// stride * step, or nullopt when the product does not fit in ptrdiff_t.
std::optional<std::ptrdiff_t> step_stride(std::ptrdiff_t stride, std::int64_t step) {
  if (stride == 0) return 0;
  const auto lim = std::numeric_limits<std::ptrdiff_t>::max();
  const std::ptrdiff_t mag = stride == std::numeric_limits<std::ptrdiff_t>::min() ? lim
                           : (stride < 0 ? -stride : stride);
  if (step > lim / mag) return std::nullopt;
  return stride * static_cast<std::ptrdiff_t>(step);
}

} // anon

ArrayPtr sliding_window_view(const ArrayPtr& x_in,
                             const ShapeArg& window_shape,
                             const std::optional<ShapeArg>& step,
                             bool subok,
                             bool writeable) {
  auto x = asarray(x_in, subok);
  const std::size_t R = x->ndim();

  const auto window = per_axis(window_shape, "shape", R);
  std::vector<std::int64_t> steps(R, 1);
  if (step) steps = per_axis(*step, "step", R);

  const auto& xs = x->shape();
  const auto& xst = x->strides();
  Shape view_shape(2 * R);
  Strides view_strides(2 * R);
  for (std::size_t d = 0; d < R; ++d) {
    const auto n = static_cast<std::int64_t>(xs[d]);
    const auto o = floor_div(n - window[d], steps[d]) + 1;
    if (o <= 0)
      throw WindowTooLargeError("window shape cannot larger than input array shape: window "
                                + shape_str(window) + " over input " + shape_str(xs));
    view_shape[d] = static_cast<std::size_t>(o);
    view_shape[R + d] = static_cast<std::size_t>(window[d]);
    // With a single position the position stride is never applied.
    const auto st = step_stride(xst[d], steps[d]);
    if (!st && o > 1)
      throw WindowTooLargeError("step " + shape_str(steps) + " times strides " + shape_str(xst)
                                + " overflows on axis " + std::to_string(d));
    view_strides[d] = st ? *st : 0;
    view_strides[R + d] = xst[d];
  }

  auto view = as_strided(x, view_shape, view_strides, subok, writeable);
  SV_LOG_DEBUG("sliding_window_view: input %s window %s step %s -> %s%s",
               shape_str(xs).c_str(), shape_str(window).c_str(), shape_str(steps).c_str(),
               shape_str(view_shape).c_str(), writeable ? " (copied)" : "");

  // Overlapping windows: writes go to a private copy, never the shared bytes.
  if (writeable) return view->copy();
  return view;
}

ArrayPtr sliding_window_view(const ArrayPtr& x,
                             const ShapeArg& window_shape,
                             Options opts) {
  const auto step = opts.take_shape("step");
  const bool subok = opts.take_bool("subok", false);
  const bool writeable = opts.take_bool("writeable", false);
  opts.expect_consumed("sliding_window_view");
  return sliding_window_view(x, window_shape, step, subok, writeable);
}

} // namespace sv
