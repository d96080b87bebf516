// bindings/sv_module.cpp - pybind11 module exposing the strided-view ops.
//
// Arrays come in through the buffer protocol (NumPy arrays, memoryviews,
// bytearrays) and go back out the same way, so np.asarray(result) is a
// zero-copy view of the same memory.
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "sv/all.hpp"

namespace py = pybind11;

#ifndef SV_BINDINGS_VERSION
#define SV_BINDINGS_VERSION "0.1.0"
#endif

namespace {

struct FormatEntry { const char* fmt; sv::Kind kind; };

sv::DType dtype_from_format(std::string fmt) {
  while (!fmt.empty() && (fmt[0] == '@' || fmt[0] == '=' || fmt[0] == '<')) fmt.erase(0, 1);
  static const FormatEntry table[] = {
    {"?", sv::Kind::Bool},
    {"b", sv::Kind::Int8},  {"h", sv::Kind::Int16}, {"i", sv::Kind::Int32},
    {"B", sv::Kind::UInt8}, {"H", sv::Kind::UInt16}, {"I", sv::Kind::UInt32},
    {"f", sv::Kind::Float32}, {"d", sv::Kind::Float64},
  };
  for (const auto& e : table) if (fmt == e.fmt) return sv::DType(e.kind);
  if (fmt == "q" || (fmt == "l" && sizeof(long) == 8)) return sv::DType(sv::Kind::Int64);
  if (fmt == "Q" || (fmt == "L" && sizeof(long) == 8)) return sv::DType(sv::Kind::UInt64);
  if (fmt == "l") return sv::DType(sv::Kind::Int32);
  if (fmt == "L") return sv::DType(sv::Kind::UInt32);
  throw py::type_error("unsupported buffer format '" + fmt + "'");
}

std::string format_for(const sv::DType& dt) {
  switch (dt.kind()) {
    case sv::Kind::Bool:    return "?";
    case sv::Kind::Int8:    return "b";
    case sv::Kind::Int16:   return "h";
    case sv::Kind::Int32:   return "i";
    case sv::Kind::Int64:   return "q";
    case sv::Kind::UInt8:   return "B";
    case sv::Kind::UInt16:  return "H";
    case sv::Kind::UInt32:  return "I";
    case sv::Kind::UInt64:  return "Q";
    case sv::Kind::Float32: return "f";
    case sv::Kind::Float64: return "d";
    case sv::Kind::Structured: break;
  }
  // opaque record of itemsize bytes
  return std::to_string(dt.itemsize()) + "x";
}

// Adopt a Python buffer without copying; the storage keeps the exporter alive.
sv::ArrayPtr from_buffer(py::buffer obj) {
  py::buffer_info info = obj.request(/*writable=*/false);
  const auto dt = dtype_from_format(info.format);
  if (static_cast<std::size_t>(info.itemsize) != dt.itemsize())
    throw py::type_error("buffer itemsize does not match its format");

  sv::Shape shape(info.shape.begin(), info.shape.end());
  sv::Strides strides(info.strides.begin(), info.strides.end());

  // Extent covering every addressable element (strides may be negative).
  std::ptrdiff_t lo = 0, hi = 0;
  bool empty = false;
  for (std::size_t d = 0; d < shape.size(); ++d) {
    if (shape[d] == 0) { empty = true; break; }
    const auto span = static_cast<std::ptrdiff_t>(shape[d] - 1) * strides[d];
    if (span < 0) lo += span; else hi += span;
  }
  const std::size_t nbytes = empty ? 0 : static_cast<std::size_t>(hi - lo) + dt.itemsize();
  auto* base_ptr = static_cast<std::byte*>(info.ptr) + lo;

  std::shared_ptr<void> keep(new py::object(obj), [](void* p) {
    py::gil_scoped_acquire gil;
    delete static_cast<py::object*>(p);
  });
  auto storage = sv::Storage::adopt(base_ptr, nbytes, std::move(keep), !info.readonly);
  return sv::Array::wrap(dt, shape, strides, std::move(storage), -lo, !info.readonly);
}

sv::ArrayPtr to_array(const py::handle& h) {
  if (py::isinstance<sv::Array>(h)) return h.cast<sv::ArrayPtr>();
  if (py::isinstance<py::buffer>(h)) return from_buffer(py::reinterpret_borrow<py::buffer>(h));
  throw py::type_error("expected an sv.Array or an object supporting the buffer protocol");
}

// int -> scalar, sequence -> (possibly nested) sequence.
sv::ShapeArg to_shape_arg(const py::handle& h) {
  if (py::isinstance<py::bool_>(h))
    throw sv::ShapeTypeError("expected an integer or a sequence of integers, got bool");
  if (py::isinstance<py::int_>(h)) return sv::ShapeArg(h.cast<std::int64_t>());
  if (py::isinstance<py::sequence>(h) && !py::isinstance<py::str>(h)) {
    std::vector<sv::ShapeArg> items;
    for (auto it : h.cast<py::sequence>()) items.push_back(to_shape_arg(it));
    return sv::ShapeArg::nested(std::move(items));
  }
  throw sv::ShapeTypeError("expected an integer or a sequence of integers, got "
                           + std::string(py::str(py::type::of(h))));
}

template <class T>
std::vector<T> to_vector(const py::handle& h, const char* what) {
  if (!py::isinstance<py::sequence>(h))
    throw sv::ShapeTypeError(std::string("`") + what + "` must be a sequence of integer");
  std::vector<T> out;
  for (auto it : h.cast<py::sequence>()) out.push_back(it.cast<T>());
  return out;
}

sv::Options to_options(const py::kwargs& kw) {
  sv::Options opts;
  for (auto item : kw) {
    const auto key = item.first.cast<std::string>();
    py::handle v = item.second;
    if (py::isinstance<py::bool_>(v))      opts.set(key, v.cast<bool>());
    else if (py::isinstance<py::int_>(v))  opts.set(key, v.cast<std::int64_t>());
    else if (v.is_none())                  continue;
    else                                   opts.set(key, to_shape_arg(v));
  }
  return opts;
}

py::list to_list(const std::vector<sv::ArrayPtr>& arrays) {
  py::list out;
  for (const auto& a : arrays) out.append(py::cast(a));
  return out;
}

} // anon

PYBIND11_MODULE(sv, m) {
  m.attr("__version__") = SV_BINDINGS_VERSION;

  // Base first: pybind11 tries the most recently registered translator first.
  auto base_err = py::register_exception<sv::Error>(m, "Error", PyExc_ValueError);
  py::register_exception<sv::ShapeTypeError>(m, "ShapeTypeError", PyExc_TypeError);
  py::register_exception<sv::UnexpectedOptionError>(m, "UnexpectedOptionError", PyExc_TypeError);
  py::register_exception<sv::DimensionMismatchError>(m, "DimensionMismatchError", base_err.ptr());
  py::register_exception<sv::NonPositiveError>(m, "NonPositiveError", base_err.ptr());
  py::register_exception<sv::WindowTooLargeError>(m, "WindowTooLargeError", base_err.ptr());
  py::register_exception<sv::BroadcastError>(m, "BroadcastError", base_err.ptr());
  py::register_exception<sv::NegativeDimensionError>(m, "NegativeDimensionError", base_err.ptr());

  py::class_<sv::Array, std::shared_ptr<sv::Array>>(m, "Array", py::buffer_protocol())
    .def(py::init([](py::buffer b){ return from_buffer(std::move(b)); }), py::arg("buffer"))
    .def_buffer([](sv::Array& a) -> py::buffer_info {
      std::vector<py::ssize_t> shape(a.shape().begin(), a.shape().end());
      std::vector<py::ssize_t> strides(a.strides().begin(), a.strides().end());
      return py::buffer_info(a.data(), static_cast<py::ssize_t>(a.itemsize()), format_for(a.dtype()),
                             static_cast<py::ssize_t>(a.ndim()), shape, strides, !a.writeable());
    })
    .def_property_readonly("shape", [](const sv::Array& a){ return py::tuple(py::cast(a.shape())); })
    .def_property_readonly("strides", [](const sv::Array& a){ return py::tuple(py::cast(a.strides())); })
    .def_property_readonly("ndim", &sv::Array::ndim)
    .def_property_readonly("size", &sv::Array::size)
    .def_property_readonly("itemsize", &sv::Array::itemsize)
    .def_property_readonly("dtype", [](const sv::Array& a){ return a.dtype().str(); })
    .def_property_readonly("writeable", &sv::Array::writeable)
    .def_property_readonly("base", &sv::Array::base)
    .def("copy", &sv::Array::copy)
    .def("__repr__", [](const sv::Array& a){
      return "<sv.Array shape=" + sv::detail::shape_str(a.shape()) + " dtype=" + a.dtype().str()
             + (a.writeable() ? "" : " readonly") + ">";
    });

  m.def("as_strided", [](py::handle x, py::object shape, py::object strides, py::kwargs kw) {
      std::optional<sv::Shape> shp;
      std::optional<sv::Strides> st;
      if (!shape.is_none()) shp = to_vector<std::size_t>(shape, "shape");
      if (!strides.is_none()) st = to_vector<std::ptrdiff_t>(strides, "strides");
      return sv::as_strided(to_array(x), shp, st, to_options(kw));
    }, py::arg("x"), py::arg("shape") = py::none(), py::arg("strides") = py::none(),
    "Create a view into the array with the given shape and strides (no bounds checks)");

  m.def("sliding_window_view", [](py::handle x, py::handle shape, py::kwargs kw) {
      return sv::sliding_window_view(to_array(x), to_shape_arg(shape), to_options(kw));
    }, py::arg("x"), py::arg("shape"),
    "Sliding window views (read-only) or copies (writeable=True) of x");

  m.def("broadcast_to", [](py::handle x, py::handle shape, py::kwargs kw) {
      return sv::broadcast_to(to_array(x), to_shape_arg(shape), to_options(kw));
    }, py::arg("array"), py::arg("shape"),
    "Read-only view of array broadcast to shape");

  m.def("broadcast_arrays", [](py::args args, py::kwargs kw) {
      std::vector<sv::ArrayPtr> arrays;
      for (auto a : args) arrays.push_back(to_array(a));
      return to_list(sv::broadcast_arrays(arrays, to_options(kw)));
    }, "Broadcast any number of arrays against each other");

  m.def("broadcast_shapes", [](py::args args) {
      std::vector<sv::Shape> shapes;
      for (auto s : args) {
        const auto t = to_shape_arg(s).to_tuple("shape");
        sv::Shape shp;
        for (auto v : t) {
          if (v < 0) throw sv::NegativeDimensionError("negative dimensions are not allowed");
          shp.push_back(static_cast<std::size_t>(v));
        }
        shapes.push_back(std::move(shp));
      }
      return py::tuple(py::cast(sv::broadcast_shapes(shapes)));
    }, "Shape resulting from broadcasting the given shapes against each other");

  m.def("set_log_level", [](const std::string& lv){
      sv::config::set_log_level(sv::config::_parse_level(lv.c_str(), sv::config::log_level()));
    }, py::arg("level"));
}
