#include <pybind11/complex.h>
#include <pybind11/eigen.h>
#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "nport/dot.hpp"
#include "nport/errors.hpp"
#include "nport/sweep.hpp"

namespace py = pybind11;
using namespace nport;

namespace {

// Accept Python port specs as ints (single port) or 2-tuples (pairs).
std::vector<PortSpec> to_portspecs(const py::list &items) {
  std::vector<PortSpec> specs;
  for (const auto &item : items) {
    if (py::isinstance<py::tuple>(item)) {
      auto pair = item.cast<py::tuple>();
      if (pair.size() != 2) {
        throw ShapeMismatch("A port pair must have exactly two ports");
      }
      specs.emplace_back(pair[0].cast<int>(), pair[1].cast<int>());
    } else {
      specs.emplace_back(item.cast<int>());
    }
  }
  return specs;
}

} // namespace

PYBIND11_MODULE(pynport, m) {
  m.doc() = "Python bindings for the nport n-port parameter library.";

  auto error = py::register_exception<Error>(m, "Error", PyExc_RuntimeError);
  py::register_exception<InvalidType>(m, "InvalidType", error.ptr());
  py::register_exception<ImpedanceRuleViolation>(m, "ImpedanceRuleViolation",
                                                 error.ptr());
  py::register_exception<ShapeMismatch>(m, "ShapeMismatch", error.ptr());
  py::register_exception<TypeMismatch>(m, "TypeMismatch", error.ptr());
  py::register_exception<ImpedanceMismatch>(m, "ImpedanceMismatch",
                                            error.ptr());
  py::register_exception<UnsupportedConversion>(m, "UnsupportedConversion",
                                                error.ptr());
  py::register_exception<PortIndexError>(m, "PortIndexError", error.ptr());
  py::register_exception<OutOfDomain>(m, "OutOfDomain", error.ptr());
  py::register_exception<NotImplemented>(m, "NotImplemented", error.ptr());
  py::register_exception<SingularMatrix>(m, "SingularMatrix", error.ptr());
  py::register_exception<InvalidArgument>(m, "InvalidArgument", error.ptr());

  py::enum_<ParameterType>(m, "ParameterType")
      .value("Z", ParameterType::Z)
      .value("Y", ParameterType::Y)
      .value("S", ParameterType::S)
      .value("T", ParameterType::T)
      .value("H", ParameterType::H)
      .value("G", ParameterType::G)
      .value("ABCD", ParameterType::ABCD);

  m.attr("DEFAULT_Z0") = kDefaultReferenceImpedance;
  m.def("parse_parameter_type", &parse_parameter_type,
        "Parse a parameter type tag such as 'S' or 'ABCD'.", py::arg("name"));
  m.def("requires_reference_impedance", &requires_reference_impedance,
        py::arg("type"));

  py::class_<PassivityOptions>(m, "PassivityOptions",
                               "Options for the passivity check.")
      .def(py::init<>())
      .def_readwrite("tolerance", &PassivityOptions::tolerance,
                     "Slack on the per-row power sum")
      .def_readwrite("verbose", &PassivityOptions::verbose,
                     "Report the offending row to stderr");

  py::class_<AlignOptions>(m, "AlignOptions",
                           "Options for frequency-aligned operations.")
      .def(py::init<>())
      .def_readwrite("verbose", &AlignOptions::verbose,
                     "Report the common frequency grid to stderr");

  py::class_<BlockMatrix>(m, "BlockMatrix",
                          "2n-port matrix partitioned into 2x2 blocks.")
      .def(py::init<Eigen::MatrixXcd, Eigen::MatrixXcd, Eigen::MatrixXcd,
                    Eigen::MatrixXcd, ParameterType, std::optional<double>>(),
           py::arg("x11"), py::arg("x12"), py::arg("x21"), py::arg("x22"),
           py::arg("type"), py::arg("z0") = py::none())
      .def_property_readonly("x11", &BlockMatrix::x11)
      .def_property_readonly("x12", &BlockMatrix::x12)
      .def_property_readonly("x21", &BlockMatrix::x21)
      .def_property_readonly("x22", &BlockMatrix::x22)
      .def_property_readonly("type", &BlockMatrix::type)
      .def_property_readonly("z0", &BlockMatrix::z0)
      .def_property_readonly("ports", &BlockMatrix::ports)
      .def("full", &BlockMatrix::full, "Reassembled 2n x 2n matrix.")
      .def("convert", &BlockMatrix::convert, py::arg("type"),
           py::arg("z0") = py::none())
      .def("__matmul__", &multiply);

  py::class_<PortMatrix>(m, "PortMatrix",
                         "Parameter matrix of an n-port at one frequency.")
      .def(py::init<Eigen::MatrixXcd, ParameterType, std::optional<double>>(),
           py::arg("matrix"), py::arg("type"), py::arg("z0") = py::none())
      .def_property_readonly("matrix", &PortMatrix::matrix)
      .def_property_readonly("type", &PortMatrix::type)
      .def_property_readonly("z0", &PortMatrix::z0)
      .def_property_readonly("ports", &PortMatrix::ports)
      .def("convert", &PortMatrix::convert, py::arg("type"),
           py::arg("z0") = py::none())
      .def("renormalize", &PortMatrix::renormalize, py::arg("z0"))
      .def(
          "recombine",
          [](const PortMatrix &p, const py::list &portsets) {
            return p.recombine(to_portspecs(portsets));
          },
          "Recombine ports; ints keep a port, tuples form port pairs.",
          py::arg("portsets"))
      .def("submatrix", &PortMatrix::submatrix, py::arg("ports"))
      .def("twonportmatrix",
           py::overload_cast<>(&PortMatrix::twonportmatrix, py::const_))
      .def("twonportmatrix",
           py::overload_cast<const std::vector<int> &,
                             const std::vector<int> &>(
               &PortMatrix::twonportmatrix, py::const_),
           py::arg("inports"), py::arg("outports"))
      .def("ispassive", &PortMatrix::ispassive,
           py::arg("options") = PassivityOptions())
      .def("isreciprocal", &PortMatrix::isreciprocal)
      .def("issymmetrical", &PortMatrix::issymmetrical);

  py::class_<FrequencySweep>(m, "FrequencySweep",
                             "An n-port across a list of frequencies.")
      .def(py::init<std::vector<double>, std::vector<Eigen::MatrixXcd>,
                    ParameterType, std::optional<double>>(),
           py::arg("freqs"), py::arg("matrices"), py::arg("type"),
           py::arg("z0") = py::none())
      .def_property_readonly("freqs", &FrequencySweep::frequencies)
      .def_property_readonly("matrices", &FrequencySweep::matrices)
      .def_property_readonly("type", &FrequencySweep::type)
      .def_property_readonly("z0", &FrequencySweep::z0)
      .def_property_readonly("ports", &FrequencySweep::ports)
      .def("__len__", &FrequencySweep::size)
      .def("__getitem__",
           [](const FrequencySweep &s, std::size_t i) {
             if (i >= s.size())
               throw py::index_error("sweep index out of range");
             return s[i];
           })
      .def("get_parameter", &FrequencySweep::parameter, py::arg("port1"),
           py::arg("port2"))
      .def("get_element", &FrequencySweep::element, py::arg("port1"),
           py::arg("port2"))
      .def("at", py::overload_cast<double>(&FrequencySweep::at, py::const_),
           py::arg("freq"))
      .def("at",
           py::overload_cast<const std::vector<double> &>(&FrequencySweep::at,
                                                          py::const_),
           py::arg("freqs"))
      .def("average", &FrequencySweep::average, py::arg("n"))
      .def("add",
           py::overload_cast<double, const PortMatrix &>(&FrequencySweep::add,
                                                         py::const_),
           py::arg("freq"), py::arg("matrix"))
      .def("add",
           py::overload_cast<double, const Eigen::MatrixXcd &>(
               &FrequencySweep::add, py::const_),
           py::arg("freq"), py::arg("matrix"))
      .def("convert", &FrequencySweep::convert, py::arg("type"),
           py::arg("z0") = py::none())
      .def("renormalize", &FrequencySweep::renormalize, py::arg("z0"))
      .def(
          "recombine",
          [](const FrequencySweep &s, const py::list &portsets) {
            return s.recombine(to_portspecs(portsets));
          },
          py::arg("portsets"))
      .def("submatrix", &FrequencySweep::submatrix, py::arg("ports"))
      .def("invert", &FrequencySweep::invert)
      .def("retag", &FrequencySweep::retag, py::arg("type"),
           py::arg("z0") = py::none())
      .def("twonport", py::overload_cast<>(&FrequencySweep::twonport, py::const_))
      .def("twonport",
           py::overload_cast<const std::vector<int> &,
                             const std::vector<int> &>(
               &FrequencySweep::twonport, py::const_),
           py::arg("inports"), py::arg("outports"))
      .def("ispassive", &FrequencySweep::ispassive,
           py::arg("options") = PassivityOptions())
      .def(py::self + py::self)
      .def(py::self - py::self)
      .def(py::self * py::self)
      .def(py::self / py::self)
      .def(py::self + std::complex<double>())
      .def(py::self - std::complex<double>())
      .def(py::self * std::complex<double>())
      .def(py::self / std::complex<double>())
      .def(std::complex<double>() + py::self)
      .def(std::complex<double>() - py::self)
      .def(std::complex<double>() * py::self)
      .def(std::complex<double>() / py::self);

  py::class_<BlockSweep>(m, "BlockSweep",
                         "A 2n-port in block form across frequencies.")
      .def(py::init<std::vector<double>, std::vector<BlockMatrix>,
                    ParameterType, std::optional<double>>(),
           py::arg("freqs"), py::arg("matrices"), py::arg("type"),
           py::arg("z0") = py::none())
      .def_property_readonly("freqs", &BlockSweep::frequencies)
      .def_property_readonly("type", &BlockSweep::type)
      .def_property_readonly("z0", &BlockSweep::z0)
      .def_property_readonly("ports", &BlockSweep::ports)
      .def("__len__", &BlockSweep::size)
      .def("__getitem__",
           [](const BlockSweep &s, std::size_t i) {
             if (i >= s.size())
               throw py::index_error("sweep index out of range");
             return s[i];
           })
      .def("at", py::overload_cast<double>(&BlockSweep::at, py::const_),
           py::arg("freq"))
      .def("convert", &BlockSweep::convert, py::arg("type"),
           py::arg("z0") = py::none())
      .def("to_sweep", &BlockSweep::to_sweep);

  m.def("dot",
        py::overload_cast<const FrequencySweep &, const FrequencySweep &,
                          const AlignOptions &>(&dot),
        "Frequency-aligned matrix product of two sweeps.", py::arg("lhs"),
        py::arg("rhs"), py::arg("options") = AlignOptions());
  m.def("dot",
        py::overload_cast<const FrequencySweep &, const Eigen::MatrixXcd &>(
            &dot),
        "Every sample times a constant matrix.", py::arg("lhs"),
        py::arg("rhs"));
  m.def("dot",
        py::overload_cast<const BlockSweep &, const BlockSweep &,
                          const AlignOptions &>(&dot),
        "Frequency-aligned block product of two 2n-port sweeps.",
        py::arg("lhs"), py::arg("rhs"), py::arg("options") = AlignOptions());
}
