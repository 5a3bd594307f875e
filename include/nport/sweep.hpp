#pragma once

#include <complex>
#include <cstddef>
#include <optional>
#include <vector>

#include <Eigen/Core>

#include "nport/block_sweep.hpp"
#include "nport/options.hpp"
#include "nport/parameter.hpp"
#include "nport/port_matrix.hpp"

namespace nport {

/// An n-port across a list of frequencies.
///
/// Holds one raw n×n matrix per frequency; all samples share the sweep's
/// parameter type and reference impedance. Frequencies are strictly
/// increasing. Immutable: every operation returns a new sweep.
class FrequencySweep {
public:
  /// @param freqs Strictly increasing frequencies (Hz)
  /// @param matrices One n×n matrix per frequency
  /// @param type Parameter representation of every matrix
  /// @param z0 Reference impedance (S/T only, default 50 ohms)
  /// @throws ShapeMismatch for length mismatch, non-square or unequal
  ///         matrices, or unsorted/duplicate frequencies
  FrequencySweep(std::vector<double> freqs,
                 std::vector<Eigen::MatrixXcd> matrices, ParameterType type,
                 std::optional<double> z0 = std::nullopt);

  /// Build a sweep from PortMatrix samples, converted to `type`/`z0`
  /// where they differ.
  static FrequencySweep from_samples(const std::vector<double> &freqs,
                                     const std::vector<PortMatrix> &samples,
                                     ParameterType type,
                                     std::optional<double> z0 = std::nullopt);

  const std::vector<double> &frequencies() const { return freqs_; }
  const std::vector<Eigen::MatrixXcd> &matrices() const { return matrices_; }
  ParameterType type() const { return type_; }
  std::optional<double> z0() const { return z0_; }
  int ports() const { return static_cast<int>(matrices_.front().rows()); }
  std::size_t size() const { return freqs_.size(); }

  /// Sample i as a PortMatrix.
  /// @throws InvalidArgument if i >= size()
  PortMatrix operator[](std::size_t i) const;

  /// Parameter (port1, port2) (1-based) at every frequency.
  std::vector<std::complex<double>> parameter(int port1, int port2) const;

  /// 1×1 sweep holding only parameter (port1, port2).
  FrequencySweep element(int port1, int port2) const;

  /// Linearly interpolated sample at a single frequency.
  /// @throws OutOfDomain outside [frequencies().front(), frequencies().back()]
  PortMatrix at(double freq) const;

  /// Linearly interpolated sweep at the given frequencies.
  /// @throws ShapeMismatch if `freqs` is empty or not strictly increasing
  /// @throws OutOfDomain if any frequency is outside the sampled range
  FrequencySweep at(const std::vector<double> &freqs) const;

  /// Centered moving average over n samples, replicating the edge samples
  /// where the window runs past either end.
  /// @throws InvalidArgument if n < 1
  FrequencySweep average(int n) const;

  /// Insert a sample given in this sweep's type and impedance.
  /// @throws ShapeMismatch for a wrong port count or an existing frequency
  FrequencySweep add(double freq, const Eigen::MatrixXcd &matrix) const;

  /// Insert a sample, converting it to this sweep's type and impedance.
  FrequencySweep add(double freq, const PortMatrix &matrix) const;

  /// Convert every sample (Z, Y or S targets).
  FrequencySweep convert(ParameterType type,
                         std::optional<double> z0 = std::nullopt) const;

  /// Renormalize every sample; S sweeps only.
  FrequencySweep renormalize(double z0) const;

  /// Recombine ports of every sample; Z sweeps only.
  FrequencySweep recombine(const std::vector<PortSpec> &portspecs) const;

  /// Keep only the given (1-based) ports.
  FrequencySweep submatrix(const std::vector<int> &ports) const;

  /// Invert every sample. The type is not changed: inverting a Z sweep
  /// yields admittances still tagged Z, use retag() to fix the tag.
  /// @throws SingularMatrix if any sample is singular
  FrequencySweep invert() const;

  /// Same samples under a different type/impedance tag.
  FrequencySweep retag(ParameterType type,
                       std::optional<double> z0 = std::nullopt) const;

  /// Partition every sample into 2×2 blocks (first half of ports as inputs).
  BlockSweep twonport() const;

  /// Partition every sample into 2×2 blocks with explicit port sets.
  BlockSweep twonport(const std::vector<int> &inports,
                      const std::vector<int> &outports) const;

  /// True if every sample is passive.
  bool ispassive(const PassivityOptions &opt = PassivityOptions()) const;

private:
  std::vector<double> freqs_;
  std::vector<Eigen::MatrixXcd> matrices_;
  ParameterType type_;
  std::optional<double> z0_;
};

/// Elementwise arithmetic operator applied by combine().
enum class BinaryOp { Add, Subtract, Multiply, Divide };

/// Combine two sweeps elementwise on their common frequency grid.
/// The grid is the union of both frequency sets within the overlapping
/// range; both operands are interpolated onto it.
/// @throws TypeMismatch / ImpedanceMismatch before any computation
/// @throws ShapeMismatch for different port counts
/// @throws OutOfDomain if the frequency ranges do not overlap
FrequencySweep combine(BinaryOp op, const FrequencySweep &lhs,
                       const FrequencySweep &rhs,
                       const AlignOptions &opt = AlignOptions());

/// Combine every sample with a scalar (sweep op value).
FrequencySweep combine(BinaryOp op, const FrequencySweep &lhs,
                       std::complex<double> rhs);

/// Combine a scalar with every sample (value op sweep).
FrequencySweep combine(BinaryOp op, std::complex<double> lhs,
                       const FrequencySweep &rhs);

/// Combine every sample elementwise with a constant n×n matrix.
/// @throws ShapeMismatch if the constant does not match the port count
FrequencySweep combine(BinaryOp op, const FrequencySweep &lhs,
                       const Eigen::MatrixXcd &rhs);

/// Combine a constant n×n matrix elementwise with every sample.
FrequencySweep combine(BinaryOp op, const Eigen::MatrixXcd &lhs,
                       const FrequencySweep &rhs);

FrequencySweep operator+(const FrequencySweep &lhs, const FrequencySweep &rhs);
FrequencySweep operator-(const FrequencySweep &lhs, const FrequencySweep &rhs);
FrequencySweep operator*(const FrequencySweep &lhs, const FrequencySweep &rhs);
FrequencySweep operator/(const FrequencySweep &lhs, const FrequencySweep &rhs);

FrequencySweep operator+(const FrequencySweep &lhs, std::complex<double> rhs);
FrequencySweep operator-(const FrequencySweep &lhs, std::complex<double> rhs);
FrequencySweep operator*(const FrequencySweep &lhs, std::complex<double> rhs);
FrequencySweep operator/(const FrequencySweep &lhs, std::complex<double> rhs);

FrequencySweep operator+(std::complex<double> lhs, const FrequencySweep &rhs);
FrequencySweep operator-(std::complex<double> lhs, const FrequencySweep &rhs);
FrequencySweep operator*(std::complex<double> lhs, const FrequencySweep &rhs);
FrequencySweep operator/(std::complex<double> lhs, const FrequencySweep &rhs);

FrequencySweep operator+(const FrequencySweep &lhs,
                         const Eigen::MatrixXcd &rhs);
FrequencySweep operator-(const FrequencySweep &lhs,
                         const Eigen::MatrixXcd &rhs);
FrequencySweep operator*(const FrequencySweep &lhs,
                         const Eigen::MatrixXcd &rhs);
FrequencySweep operator/(const FrequencySweep &lhs,
                         const Eigen::MatrixXcd &rhs);

FrequencySweep operator+(const Eigen::MatrixXcd &lhs,
                         const FrequencySweep &rhs);
FrequencySweep operator-(const Eigen::MatrixXcd &lhs,
                         const FrequencySweep &rhs);
FrequencySweep operator*(const Eigen::MatrixXcd &lhs,
                         const FrequencySweep &rhs);
FrequencySweep operator/(const Eigen::MatrixXcd &lhs,
                         const FrequencySweep &rhs);

} // namespace nport
