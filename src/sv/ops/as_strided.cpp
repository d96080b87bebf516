#include "sv/ops/as_strided.hpp"
#include "sv/core/errors.hpp"
#include "sv/core/log.hpp"

namespace sv {
using detail::shape_str;

ArrayPtr asarray(const ArrayPtr& x, bool subok) {
  if (!x) throw std::invalid_argument("asarray: null array");
  if (subok || x->is_base_type()) return x;
  ArrayHeader h = x->header();
  h.base = x;
  return Array::make(std::move(h));
}

namespace detail {

ArrayPtr make_view(const ArrayPtr& src, ArrayHeader h) {
  if (src->is_base_type()) return Array::make(std::move(h));
  auto view = src->rewrap(std::move(h));
  view->array_finalize(*src);
  return view;
}

} // namespace detail

ArrayPtr as_strided(const ArrayPtr& x_in,
                    const std::optional<Shape>& shape,
                    const std::optional<Strides>& strides,
                    bool subok,
                    bool writeable) {
  auto x = asarray(x_in, subok);

  ArrayHeader h;
  h.dtype   = x->dtype();   // copied as-is, structured fields included
  h.shape   = shape ? *shape : x->shape();
  h.strides = strides ? *strides : x->strides();
  h.storage = x->storage();
  h.offset  = x->offset();
  h.writeable = x->writeable() && writeable;
  h.base    = x;

  if (h.shape.size() != h.strides.size())
    throw DimensionMismatchError("as_strided: mismatch in size of strides and shape: "
                                 + shape_str(h.strides) + " vs " + shape_str(h.shape));

  auto view = detail::make_view(x, std::move(h));
  SV_LOG_DEBUG("as_strided: %s shape=%s strides=%s writeable=%d",
               view->type_name(), shape_str(view->shape()).c_str(),
               shape_str(view->strides()).c_str(), int(view->writeable()));
  return view;
}

ArrayPtr as_strided(const ArrayPtr& x,
                    const std::optional<Shape>& shape,
                    const std::optional<Strides>& strides,
                    Options opts) {
  const bool subok = opts.take_bool("subok", false);
  const bool writeable = opts.take_bool("writeable", true);
  opts.expect_consumed("as_strided");
  return as_strided(x, shape, strides, subok, writeable);
}

} // namespace sv
