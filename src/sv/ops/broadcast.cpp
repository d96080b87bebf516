#include "sv/ops/broadcast.hpp"
#include "sv/ops/as_strided.hpp"
#include "sv/core/config.hpp"
#include "sv/core/errors.hpp"
#include "sv/core/log.hpp"
#include <algorithm>

namespace sv {
using detail::broadcast_two;
using detail::shape_str;

namespace detail {

ArrayPtr broadcast_to_impl(const ArrayPtr& x_in, const ShapeArg& shape, bool subok, bool readonly,
                           bool warn_on_write) {
  const auto target = shape.to_tuple("shape");
  auto x = asarray(x_in, subok);

  if (target.empty() && x->ndim() > 0)
    throw BroadcastError("cannot broadcast a non-scalar to a scalar array");
  for (auto s : target) {
    if (s < 0)
      throw NegativeDimensionError("all elements of broadcast shape must be non-negative: " + shape_str(target));
  }

  const Shape out_shape(target.begin(), target.end());
  if (!detail::checked_nbytes(out_shape, x->itemsize()))
    throw BroadcastError("array is too big; cannot broadcast to shape " + shape_str(out_shape)
                         + " with itemsize " + std::to_string(x->itemsize()));
  const auto& in_shape = x->shape();
  const auto& in_str = x->strides();
  const std::size_t ra = in_shape.size(), rb = out_shape.size();
  if (ra > rb)
    throw BroadcastError("input operand has more dimensions than allowed by the axis remapping: "
                         + shape_str(in_shape) + " and requested shape " + shape_str(out_shape));

  // Right-aligned; new leading axes and stretched size-1 axes repeat memory.
  Strides out_str(rb, 0);
  for (std::size_t i = rb - ra; i < rb; ++i) {
    const std::size_t ad = in_shape[i - (rb - ra)];
    const std::size_t bd = out_shape[i];
    if (ad == bd) {
      out_str[i] = in_str[i - (rb - ra)];
    } else if (ad != 1) {
      throw BroadcastError("operands could not be broadcast together with remapped shapes "
                           "[original->remapped]: " + shape_str(in_shape)
                           + " and requested shape " + shape_str(out_shape));
    }
  }

  ArrayHeader h;
  h.dtype = x->dtype();
  h.shape = out_shape;
  h.strides = out_str;
  h.storage = x->storage();
  h.offset = x->offset();
  h.writeable = !readonly && x->writeable();
  h.warn_on_write = warn_on_write;
  h.base = x;

  auto view = make_view(x, std::move(h));
  SV_LOG_DEBUG("broadcast_to: %s -> %s strides=%s writeable=%d",
               shape_str(in_shape).c_str(), shape_str(out_shape).c_str(),
               shape_str(out_str).c_str(), int(view->writeable()));
  return view;
}

} // namespace detail

ArrayPtr broadcast_to(const ArrayPtr& x, const ShapeArg& shape, bool subok) {
  return detail::broadcast_to_impl(x, shape, subok, /*readonly=*/true);
}

ArrayPtr broadcast_to(const ArrayPtr& x, const ShapeArg& shape, Options opts) {
  const bool subok = opts.take_bool("subok", false);
  opts.expect_consumed("broadcast_to");
  return broadcast_to(x, shape, subok);
}

Shape broadcast_shapes(const std::vector<Shape>& shapes) {
  if (shapes.empty()) return {};
  Shape acc = shapes.front();
  for (std::size_t k = 1; k < shapes.size(); ++k) {
    try {
      acc = broadcast_two(acc, shapes[k]);
    } catch (const BroadcastError&) {
      // The running shape only holds extents some earlier input supplied, so
      // one of them clashes with shapes[k] directly.
      for (std::size_t j = 0; j < k; ++j) {
        try {
          (void)broadcast_two(shapes[j], shapes[k]);
        } catch (const BroadcastError&) {
          throw BroadcastError("shape mismatch: objects cannot be broadcast to a single shape.  "
                               "Mismatch is between arg " + std::to_string(j) + " with shape "
                               + shape_str(shapes[j]) + " and arg " + std::to_string(k)
                               + " with shape " + shape_str(shapes[k]) + ".");
        }
      }
      throw;
    }
  }
  if (!detail::checked_nbytes(acc, 1))
    throw BroadcastError("array is too big; broadcast shape " + shape_str(acc) + " does not fit in memory");
  return acc;
}

std::vector<ArrayPtr> broadcast_arrays(const std::vector<ArrayPtr>& arrays, bool subok) {
  std::vector<ArrayPtr> args;
  args.reserve(arrays.size());
  for (const auto& a : arrays) args.push_back(asarray(a, subok));

  std::vector<Shape> shapes;
  shapes.reserve(args.size());
  for (const auto& a : args) shapes.push_back(a->shape());
  const Shape shape = broadcast_shapes(shapes);

  // Common case: nothing to broadcast.
  if (std::all_of(args.begin(), args.end(), [&](const ArrayPtr& a){ return a->shape() == shape; }))
    return args;

  const bool warn = config::warn_on_write_enabled();
  const ShapeArg target(shape);
  std::vector<ArrayPtr> out;
  out.reserve(args.size());
  for (const auto& a : args)
    out.push_back(detail::broadcast_to_impl(a, target, subok, /*readonly=*/false, warn));
  return out;
}

std::vector<ArrayPtr> broadcast_arrays(const std::vector<ArrayPtr>& arrays, Options opts) {
  const bool subok = opts.take_bool("subok", false);
  opts.expect_consumed("broadcast_arrays");
  return broadcast_arrays(arrays, subok);
}

} // namespace sv
