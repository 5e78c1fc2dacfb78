// python/bindings.cpp — Pybind11 bindings for the kansujilib module.

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include <pybind11/operators.h>
#include <pybind11/pybind11.h>

#include <kansuji/kansuji.hpp>

namespace py = pybind11;
using kansuji::Kansuji;

static py::int_ to_python_int(kansuji::uint128 value) {
    const auto builtins = py::module_::import("builtins");
    return builtins.attr("int")(kansuji::to_decimal_string(value));
}

static kansuji::uint128 from_python_int(const py::int_& value) {
    const std::string digits = py::str(value);
    if (digits.empty() || digits.front() == '-') {
        throw py::value_error("kansuji values must not be negative");
    }
    kansuji::uint128 result = 0;
    for (const char ch : digits) {
        const auto next = kansuji::core::detail::checked_mul(result, 10);
        const auto sum = next ? kansuji::core::detail::checked_add(
                                    *next, static_cast<kansuji::uint128>(ch - '0'))
                              : std::nullopt;
        if (!sum) {
            throw py::value_error("integer exceeds 128 bits");
        }
        result = *sum;
    }
    return result;
}

PYBIND11_MODULE(kansujilib, module) {
    module.doc() = "Japanese kanji numeral (kansuji) codec";

    py::register_exception<kansuji::parse_error>(module, "ParseError", PyExc_ValueError);
    py::register_exception<kansuji::overflow_error>(module, "KansujiOverflowError",
                                                    PyExc_OverflowError);
    py::register_exception<kansuji::range_error>(module, "RangeError", PyExc_ValueError);
    py::register_exception<kansuji::conversion_error>(module, "ConversionError", PyExc_ValueError);

    module.attr("MAX_INTEGER") = to_python_int(kansuji::max_integer);

    py::class_<Kansuji> py_kansuji(module, "Kansuji",
                                   "Immutable numeral value from 垓 (10^20) down to 毛 (10^-3)");
    py_kansuji.def(py::init<>())
        .def(py::init([](const std::string& text) { return Kansuji::from_string(text); }),
             py::arg("text"))
        .def_static("from_string", [](const std::string& text) { return Kansuji::from_string(text); },
                    py::arg("text"), "Decode kansuji text")
        .def_static("from_int",
                    [](const py::int_& value) { return Kansuji::from_u128(from_python_int(value)); },
                    py::arg("value"), "Build from a non-negative integer below 10**24")
        .def_static("from_float", &Kansuji::from_double, py::arg("value"),
                    "Build from a float, rounding the fraction to the nearest 毛")
        .def("to_int", [](const Kansuji& self) { return to_python_int(self.to_u128()); })
        .def("to_float", &Kansuji::to_double)
        .def("to_string", &Kansuji::to_string)
        .def("is_zero", &Kansuji::is_zero)
        .def("is_integer", &Kansuji::is_integer)
        .def_property_readonly("integer",
                               [](const Kansuji& self) { return to_python_int(self.integer()); })
        .def_property_readonly("fraction", &Kansuji::fraction)
        .def("__int__", [](const Kansuji& self) { return to_python_int(self.to_u128()); })
        .def("__float__", &Kansuji::to_double)
        .def("__str__", &Kansuji::to_string)
        .def("__repr__",
             [](const Kansuji& self) { return "<kansujilib.Kansuji " + self.to_string() + ">"; })
        .def("__hash__", [](const Kansuji& self) { return std::hash<Kansuji>{}(self); })
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def(py::self < py::self)
        .def(py::self <= py::self)
        .def(py::self > py::self)
        .def(py::self >= py::self);
}
