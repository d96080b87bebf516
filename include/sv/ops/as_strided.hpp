#pragma once
#include <optional>

#include "sv/core/array.hpp"
#include "sv/core/options.hpp"

namespace sv {

// Normalize an input array. With subok=false a subtype instance is replaced
// by a plain Array view over the same header (base = x); otherwise x itself.
ArrayPtr asarray(const ArrayPtr& x, bool subok = false);

// Create a view into x with the given shape and byte strides (defaulting to
// x's own). The view shares x's storage and offset and keeps x alive.
//
// Use with extreme care: nothing checks that the requested shape/strides stay
// inside x's storage, and the result may alias itself (several indices, one
// memory location). Out-of-range access through the view is undefined.
//
// The result is writable only if x is and `writeable` is true.
ArrayPtr as_strided(const ArrayPtr& x,
                    const std::optional<Shape>& shape = std::nullopt,
                    const std::optional<Strides>& strides = std::nullopt,
                    bool subok = false,
                    bool writeable = true);

// Keyword form: recognizes "subok" and "writeable".
ArrayPtr as_strided(const ArrayPtr& x,
                    const std::optional<Shape>& shape,
                    const std::optional<Strides>& strides,
                    Options opts);

namespace detail {

// Mint a view over `h` that has src's concrete type. Subtypes are rewrapped
// and get array_finalize(*src).
ArrayPtr make_view(const ArrayPtr& src, ArrayHeader h);

} // namespace detail

} // namespace sv
