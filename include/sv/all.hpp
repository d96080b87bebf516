#pragma once
// Umbrella header to simplify includes from bindings and examples.

// Core
#include "sv/core/errors.hpp"
#include "sv/core/dtype.hpp"
#include "sv/core/storage.hpp"
#include "sv/core/shape_utils.hpp"
#include "sv/core/array.hpp"
#include "sv/core/options.hpp"
#include "sv/core/config.hpp"
#include "sv/core/log.hpp"

// Ops
#include "sv/ops/as_strided.hpp"
#include "sv/ops/sliding_window.hpp"
#include "sv/ops/broadcast.hpp"
