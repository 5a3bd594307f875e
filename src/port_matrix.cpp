#include "nport/port_matrix.hpp"

#include <Eigen/Dense>
#include <iostream>
#include <string>
#include <utility>

#include "nport/errors.hpp"
#include "nport/linalg.hpp"

namespace nport {

void check_port(int port, int ports) {
  if (port == 0) {
    throw PortIndexError("Port numbers start at 1");
  }
  if (port < 0 || port > ports) {
    throw PortIndexError("Port " + std::to_string(port) +
                         " does not exist in a " + std::to_string(ports) +
                         "-port");
  }
}

PortMatrix::PortMatrix(Eigen::MatrixXcd matrix, ParameterType type,
                       std::optional<double> z0)
    : matrix_(std::move(matrix)), type_(type),
      z0_(check_reference_impedance(type, z0)) {
  if (matrix_.rows() != matrix_.cols()) {
    throw ShapeMismatch("Parameter matrix must be square (got " +
                        std::to_string(matrix_.rows()) + "x" +
                        std::to_string(matrix_.cols()) + ")");
  }
}

PortMatrix PortMatrix::convert(ParameterType type,
                               std::optional<double> z0) const {
  const auto target_z0 = resolve_target_impedance(type_, z0_, type, z0);

  if (type == ParameterType::ABCD || type == ParameterType::T) {
    throw UnsupportedConversion("Cannot convert an n-port matrix to " +
                                to_string(type) +
                                "-parameters; partition it with "
                                "twonportmatrix() first");
  }
  if (type != ParameterType::Z && type != ParameterType::Y &&
      type != ParameterType::S) {
    throw UnsupportedConversion("Conversion to " + to_string(type) +
                                "-parameters is not supported");
  }

  const int n = ports();
  const Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(n, n);
  const Eigen::MatrixXcd &M = matrix_;

  switch (type_) {
  case ParameterType::S: {
    const double z = *z0_;
    if (type == ParameterType::Z) {
      // Z = (2 (I - S)^-1 - I) z0
      return PortMatrix((2.0 * inverse(I - M) - I) * z, type);
    }
    if (type == ParameterType::Y) {
      // Y = (2 (I + S)^-1 - I) / z0
      return PortMatrix((2.0 * inverse(I + M) - I) / z, type);
    }
    return renormalize(*target_z0);
  }
  case ParameterType::Z: {
    if (type == ParameterType::S) {
      // S = I - 2 (I + Z/z0)^-1
      return PortMatrix(I - 2.0 * inverse(I + M / *target_z0), type,
                        target_z0);
    }
    if (type == ParameterType::Y) {
      return PortMatrix(inverse(M), type);
    }
    return *this;
  }
  case ParameterType::Y: {
    if (type == ParameterType::S) {
      // S = 2 (I + Y z0)^-1 - I
      return PortMatrix(2.0 * inverse(I + M * *target_z0) - I, type,
                        target_z0);
    }
    if (type == ParameterType::Z) {
      return PortMatrix(inverse(M), type);
    }
    return *this;
  }
  default:
    break;
  }
  throw UnsupportedConversion("Cannot convert " + to_string(type_) +
                              "-parameters of an n-port matrix; only Z, Y "
                              "and S sources are supported");
}

PortMatrix PortMatrix::renormalize(double z0) const {
  if (type_ != ParameterType::S) {
    throw UnsupportedConversion("Only S-parameters can be renormalized (got " +
                                to_string(type_) + ")");
  }
  if (z0 == *z0_) {
    return *this;
  }

  // Renormalization of S-parameters to different port impedances:
  // S' = (S - I r) (I - r S)^-1 with r = (z0' - z0) / (z0' + z0)
  const int n = ports();
  const Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(n, n);
  const double r = (z0 - *z0_) / (z0 + *z0_);
  return PortMatrix((matrix_ - I * r) * inverse(I - r * matrix_), type_, z0);
}

PortMatrix PortMatrix::recombine(const std::vector<PortSpec> &portspecs) const {
  if (type_ != ParameterType::Z) {
    throw UnsupportedConversion(
        "Ports can only be recombined on an impedance matrix (got " +
        to_string(type_) + ")");
  }

  const int n = ports();
  Eigen::MatrixXd M = Eigen::MatrixXd::Zero(portspecs.size(), n);
  for (std::size_t i = 0; i < portspecs.size(); ++i) {
    const PortSpec &spec = portspecs[i];
    if (spec.is_pair()) {
      check_port(spec.port, n);
      check_port(spec.reference, n);
      M(i, spec.port - 1) = 1.0;
      M(i, spec.reference - 1) = -1.0;
    } else if (spec.port < 0) {
      check_port(-spec.port, n);
      M(i, -spec.port - 1) = -1.0;
    } else {
      check_port(spec.port, n);
      M(i, spec.port - 1) = 1.0;
    }
  }

  const Eigen::MatrixXcd Mc = M.cast<std::complex<double>>();
  return PortMatrix(Mc * matrix_ * Mc.transpose(), type_, z0_);
}

PortMatrix PortMatrix::submatrix(const std::vector<int> &ports) const {
  std::vector<int> indices;
  indices.reserve(ports.size());
  for (int port : ports) {
    check_port(port, this->ports());
    indices.push_back(port - 1);
  }
  return PortMatrix(permute_ports(matrix_, indices), type_, z0_);
}

BlockMatrix PortMatrix::twonportmatrix() const {
  return BlockMatrix::from_full(matrix_, type_, z0_);
}

BlockMatrix PortMatrix::twonportmatrix(const std::vector<int> &inports,
                                       const std::vector<int> &outports) const {
  if (ports() % 2 != 0) {
    throw ShapeMismatch("A " + std::to_string(ports()) +
                        "-port cannot be split into a 2n-port");
  }
  const std::size_t n = static_cast<std::size_t>(ports() / 2);
  if (inports.size() != n || outports.size() != n) {
    throw ShapeMismatch("A " + std::to_string(ports()) + "-port needs " +
                        std::to_string(n) + " input and " + std::to_string(n) +
                        " output ports");
  }

  std::vector<int> order;
  order.reserve(2 * n);
  std::vector<bool> used(2 * n, false);
  for (const auto *set : {&inports, &outports}) {
    for (int port : *set) {
      check_port(port, ports());
      if (used[port - 1]) {
        throw ShapeMismatch("Port " + std::to_string(port) +
                            " is listed more than once");
      }
      used[port - 1] = true;
      order.push_back(port - 1);
    }
  }

  return BlockMatrix::from_full(permute_ports(matrix_, order), type_, z0_);
}

bool PortMatrix::ispassive(const PassivityOptions &opt) const {
  if (type_ != ParameterType::S) {
    return convert(ParameterType::S).ispassive(opt);
  }

  // Power leaving each port for unit incident waves
  const Eigen::VectorXd row_power = matrix_.cwiseAbs2().rowwise().sum();
  for (int i = 0; i < row_power.size(); ++i) {
    if (row_power(i) > 1.0 + opt.tolerance) {
      if (opt.verbose) {
        std::cerr << "nport: row " << i + 1 << " of S carries power "
                  << row_power(i) << " > 1\n";
      }
      return false;
    }
  }
  return true;
}

bool PortMatrix::isreciprocal() const {
  throw NotImplemented("Reciprocity check is not implemented");
}

bool PortMatrix::issymmetrical() const {
  throw NotImplemented("Symmetry check is not implemented");
}

} // namespace nport
