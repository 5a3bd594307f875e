#pragma once

#include <complex>
#include <optional>
#include <vector>

#include <Eigen/Core>

#include "nport/block_matrix.hpp"
#include "nport/options.hpp"
#include "nport/parameter.hpp"

namespace nport {

/// One output port of a recombination.
/// A single port number keeps that port (a negative number reverses its
/// polarity). A pair (port, reference) forms a new port from `port` measured
/// against `reference`.
struct PortSpec {
  PortSpec(int port) : port(port) {}
  PortSpec(int port, int reference) : port(port), reference(reference) {}

  int port;          // 1-based, signed when single
  int reference = 0; // 1-based, 0 for a single port

  bool is_pair() const { return reference != 0; }
};

/// Parameter matrix of an n-port at a single frequency.
/// Immutable: every operation returns a new PortMatrix.
class PortMatrix {
public:
  /// @param matrix n×n parameter matrix
  /// @param type Parameter representation of `matrix`
  /// @param z0 Reference impedance; S and T default to 50 ohms, other types
  ///           must not specify one
  /// @throws ShapeMismatch if the matrix is not square
  /// @throws ImpedanceRuleViolation if z0 is given for a type without one
  PortMatrix(Eigen::MatrixXcd matrix, ParameterType type,
             std::optional<double> z0 = std::nullopt);

  const Eigen::MatrixXcd &matrix() const { return matrix_; }
  ParameterType type() const { return type_; }
  std::optional<double> z0() const { return z0_; }
  int ports() const { return static_cast<int>(matrix_.rows()); }

  /// Entry at 0-based row/column.
  std::complex<double> operator()(int row, int col) const {
    return matrix_(row, col);
  }

  /// Convert to Z, Y or S parameters.
  /// @param type Target representation
  /// @param z0 Target reference impedance (S only). Defaults to this
  ///           matrix's impedance for an S/T source, else 50 ohms.
  /// @throws UnsupportedConversion for ABCD/T targets (use twonportmatrix())
  ///         and for H/G
  /// @throws SingularMatrix if a required inversion fails
  PortMatrix convert(ParameterType type,
                     std::optional<double> z0 = std::nullopt) const;

  /// Renormalize S-parameters to a new reference impedance.
  /// @throws UnsupportedConversion if this is not an S matrix
  PortMatrix renormalize(double z0) const;

  /// Form new ports from combinations of existing ones (Z matrices only).
  /// recombine({{1, 3}, {2, 4}, 5, -6}) yields a 4-port whose port 1 is
  /// port 1 referenced to port 3, port 2 is port 2 referenced to port 4,
  /// port 3 is port 5 and port 4 is port 6 with reversed polarity.
  /// @throws UnsupportedConversion if this is not a Z matrix
  /// @throws PortIndexError for port 0 or a port beyond ports()
  PortMatrix recombine(const std::vector<PortSpec> &portspecs) const;

  /// Keep only the given (1-based) ports.
  /// @throws PortIndexError for port 0 or a port beyond ports()
  PortMatrix submatrix(const std::vector<int> &ports) const;

  /// Partition a 2n-port into 2×2 blocks, first n ports as inputs.
  /// @throws ShapeMismatch if the port count is odd
  BlockMatrix twonportmatrix() const;

  /// Partition a 2n-port into 2×2 blocks with explicit input/output ports.
  /// Rows and columns are reordered to [inports..., outports...] first.
  /// @throws ShapeMismatch if the sets do not have n ports each or overlap
  /// @throws PortIndexError for port 0 or a port beyond ports()
  BlockMatrix twonportmatrix(const std::vector<int> &inports,
                             const std::vector<int> &outports) const;

  /// Check passivity: every row of the S matrix carries at most unit power.
  /// Other types are converted to S first.
  bool ispassive(const PassivityOptions &opt = PassivityOptions()) const;

  /// @throws NotImplemented
  bool isreciprocal() const;

  /// @throws NotImplemented
  bool issymmetrical() const;

private:
  Eigen::MatrixXcd matrix_;
  ParameterType type_;
  std::optional<double> z0_;
};

/// Check a 1-based port number against a port count.
/// @throws PortIndexError if port is 0 or exceeds ports
void check_port(int port, int ports);

} // namespace nport
