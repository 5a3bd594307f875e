#pragma once

#include <optional>

#include <Eigen/Core>

#include "nport/parameter.hpp"

namespace nport {

class PortMatrix;

/// 2n-port parameter matrix partitioned into four n×n blocks
///
///   | x11 x12 |
///   | x21 x22 |
///
/// where block row/column 1 holds the input ports and 2 the output ports.
/// This is the form transfer-type parameters (T, ABCD) are defined in.
///
/// Conventions: T relates [b1; a1] = T [a2; b2] and ABCD relates
/// [V1; I1] = ABCD [V2; -I2], so cascading two 2n-ports multiplies their
/// T or ABCD block matrices.
class BlockMatrix {
public:
  /// @throws ShapeMismatch if the blocks are not all n×n
  /// @throws ImpedanceRuleViolation if z0 is given for a type without one
  BlockMatrix(Eigen::MatrixXcd x11, Eigen::MatrixXcd x12,
              Eigen::MatrixXcd x21, Eigen::MatrixXcd x22, ParameterType type,
              std::optional<double> z0 = std::nullopt);

  /// Partition a full 2n×2n matrix.
  /// @throws ShapeMismatch if `full` is not square with an even size
  static BlockMatrix from_full(const Eigen::MatrixXcd &full,
                               ParameterType type,
                               std::optional<double> z0 = std::nullopt);

  const Eigen::MatrixXcd &x11() const { return x11_; }
  const Eigen::MatrixXcd &x12() const { return x12_; }
  const Eigen::MatrixXcd &x21() const { return x21_; }
  const Eigen::MatrixXcd &x22() const { return x22_; }

  /// Block by 0-based block row/column.
  const Eigen::MatrixXcd &block(int row, int col) const;

  ParameterType type() const { return type_; }
  std::optional<double> z0() const { return z0_; }

  /// Ports on each side (n).
  int half_ports() const { return static_cast<int>(x11_.rows()); }
  int ports() const { return 2 * half_ports(); }

  /// Reassembled 2n×2n matrix.
  Eigen::MatrixXcd full() const;

  /// The reassembled matrix as a PortMatrix of the same type.
  PortMatrix to_port_matrix() const;

  /// Convert to another representation. Supports Z, Y, S, T and ABCD;
  /// everything goes through Z except S<->T.
  /// @param z0 Target reference impedance for S/T targets
  /// @throws UnsupportedConversion for H/G
  /// @throws SingularMatrix if a required inversion fails (e.g. Z21 singular
  ///         for ABCD, S21 singular for T)
  BlockMatrix convert(ParameterType type,
                      std::optional<double> z0 = std::nullopt) const;

private:
  Eigen::MatrixXcd x11_, x12_, x21_, x22_;
  ParameterType type_;
  std::optional<double> z0_;
};

/// Block matrix product
///   | A B | | E F |   | AE+BG  AF+BH |
///   | C D | | G H | = | CE+DG  CF+DH |
/// The result carries the type and impedance of `lhs`.
/// @throws ShapeMismatch if the block sizes differ
BlockMatrix multiply(const BlockMatrix &lhs, const BlockMatrix &rhs);

} // namespace nport
