#include "nport/block_matrix.hpp"

#include <string>
#include <utility>

#include "nport/errors.hpp"
#include "nport/linalg.hpp"
#include "nport/port_matrix.hpp"

namespace nport {

namespace {

bool is_square(const Eigen::MatrixXcd &A, Eigen::Index n) {
  return A.rows() == n && A.cols() == n;
}

// Z-parameters of a block matrix of any supported type.
BlockMatrix to_impedance(const BlockMatrix &X) {
  switch (X.type()) {
  case ParameterType::Z:
    return X;
  case ParameterType::Y:
  case ParameterType::S:
    return BlockMatrix::from_full(
        X.to_port_matrix().convert(ParameterType::Z).matrix(),
        ParameterType::Z);
  case ParameterType::T:
    return to_impedance(X.convert(ParameterType::S));
  case ParameterType::ABCD: {
    // Z11 = A C^-1, Z12 = A C^-1 D - B, Z21 = C^-1, Z22 = C^-1 D
    const Eigen::MatrixXcd Cinv = inverse(X.x21());
    return BlockMatrix(X.x11() * Cinv, X.x11() * Cinv * X.x22() - X.x12(),
                       Cinv, Cinv * X.x22(), ParameterType::Z);
  }
  default:
    break;
  }
  throw UnsupportedConversion("Block conversion from " + to_string(X.type()) +
                              "-parameters is not supported");
}

// [b1; a1] = T [a2; b2]
BlockMatrix s_to_t(const BlockMatrix &S) {
  const Eigen::MatrixXcd S21inv = inverse(S.x21());
  return BlockMatrix(S.x12() - S.x11() * S21inv * S.x22(), S.x11() * S21inv,
                     -S21inv * S.x22(), S21inv, ParameterType::T, S.z0());
}

BlockMatrix t_to_s(const BlockMatrix &T) {
  const Eigen::MatrixXcd T22inv = inverse(T.x22());
  return BlockMatrix(T.x12() * T22inv, T.x11() - T.x12() * T22inv * T.x21(),
                     T22inv, -T22inv * T.x21(), ParameterType::S, T.z0());
}

} // namespace

BlockMatrix::BlockMatrix(Eigen::MatrixXcd x11, Eigen::MatrixXcd x12,
                         Eigen::MatrixXcd x21, Eigen::MatrixXcd x22,
                         ParameterType type, std::optional<double> z0)
    : x11_(std::move(x11)), x12_(std::move(x12)), x21_(std::move(x21)),
      x22_(std::move(x22)), type_(type),
      z0_(check_reference_impedance(type, z0)) {
  const Eigen::Index n = x11_.rows();
  if (!is_square(x11_, n) || !is_square(x12_, n) || !is_square(x21_, n) ||
      !is_square(x22_, n)) {
    throw ShapeMismatch("All four blocks of a 2n-port matrix must be " +
                        std::to_string(n) + "x" + std::to_string(n));
  }
}

BlockMatrix BlockMatrix::from_full(const Eigen::MatrixXcd &full,
                                   ParameterType type,
                                   std::optional<double> z0) {
  if (full.rows() != full.cols() || full.rows() % 2 != 0) {
    throw ShapeMismatch("A " + std::to_string(full.rows()) + "x" +
                        std::to_string(full.cols()) +
                        " matrix cannot be split into a 2n-port");
  }
  const Eigen::Index n = full.rows() / 2;
  return BlockMatrix(full.topLeftCorner(n, n), full.topRightCorner(n, n),
                     full.bottomLeftCorner(n, n), full.bottomRightCorner(n, n),
                     type, z0);
}

const Eigen::MatrixXcd &BlockMatrix::block(int row, int col) const {
  if (row == 0 && col == 0)
    return x11_;
  if (row == 0 && col == 1)
    return x12_;
  if (row == 1 && col == 0)
    return x21_;
  if (row == 1 && col == 1)
    return x22_;
  throw InvalidArgument("Block indices must be 0 or 1");
}

Eigen::MatrixXcd BlockMatrix::full() const {
  const Eigen::Index n = half_ports();
  Eigen::MatrixXcd result(2 * n, 2 * n);
  result << x11_, x12_, x21_, x22_;
  return result;
}

PortMatrix BlockMatrix::to_port_matrix() const {
  return PortMatrix(full(), type_, z0_);
}

BlockMatrix BlockMatrix::convert(ParameterType type,
                                 std::optional<double> z0) const {
  const auto target_z0 = resolve_target_impedance(type_, z0_, type, z0);
  if (type == type_ && target_z0 == z0_) {
    return *this;
  }

  switch (type) {
  case ParameterType::Z:
    return to_impedance(*this);
  case ParameterType::Y:
    return from_full(inverse(to_impedance(*this).full()), ParameterType::Y);
  case ParameterType::ABCD: {
    // A = Z11 Z21^-1, B = Z11 Z21^-1 Z22 - Z12, C = Z21^-1, D = Z21^-1 Z22
    const BlockMatrix Z = to_impedance(*this);
    const Eigen::MatrixXcd Z21inv = inverse(Z.x21());
    return BlockMatrix(Z.x11() * Z21inv, Z.x11() * Z21inv * Z.x22() - Z.x12(),
                       Z21inv, Z21inv * Z.x22(), ParameterType::ABCD);
  }
  case ParameterType::S: {
    if (type_ == ParameterType::T) {
      const BlockMatrix S = t_to_s(*this);
      return from_full(S.to_port_matrix().renormalize(*target_z0).matrix(),
                       ParameterType::S, target_z0);
    }
    if (type_ == ParameterType::S) {
      return from_full(to_port_matrix().renormalize(*target_z0).matrix(),
                       ParameterType::S, target_z0);
    }
    const PortMatrix Z = to_impedance(*this).to_port_matrix();
    return from_full(Z.convert(ParameterType::S, target_z0).matrix(),
                     ParameterType::S, target_z0);
  }
  case ParameterType::T:
    return s_to_t(convert(ParameterType::S, target_z0));
  default:
    break;
  }
  throw UnsupportedConversion("Block conversion to " + to_string(type) +
                              "-parameters is not supported");
}

BlockMatrix multiply(const BlockMatrix &lhs, const BlockMatrix &rhs) {
  if (lhs.half_ports() != rhs.half_ports()) {
    throw ShapeMismatch("Cannot multiply 2n-port matrices of " +
                        std::to_string(lhs.ports()) + " and " +
                        std::to_string(rhs.ports()) + " ports");
  }
  const auto &A = lhs.x11(), &B = lhs.x12(), &C = lhs.x21(), &D = lhs.x22();
  const auto &E = rhs.x11(), &F = rhs.x12(), &G = rhs.x21(), &H = rhs.x22();
  return BlockMatrix(A * E + B * G, A * F + B * H, C * E + D * G,
                     C * F + D * H, lhs.type(), lhs.z0());
}

} // namespace nport
