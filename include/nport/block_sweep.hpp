#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "nport/block_matrix.hpp"
#include "nport/parameter.hpp"

namespace nport {

class FrequencySweep;

/// A 2n-port in block form across a list of frequencies.
class BlockSweep {
public:
  /// @throws ShapeMismatch for length mismatch, unequal block sizes or
  ///         unsorted/duplicate frequencies
  /// @throws TypeMismatch / ImpedanceMismatch if a sample is tagged
  ///         differently from the sweep
  BlockSweep(std::vector<double> freqs, std::vector<BlockMatrix> matrices,
             ParameterType type, std::optional<double> z0 = std::nullopt);

  const std::vector<double> &frequencies() const { return freqs_; }
  const std::vector<BlockMatrix> &matrices() const { return matrices_; }
  ParameterType type() const { return type_; }
  std::optional<double> z0() const { return z0_; }
  int half_ports() const { return matrices_.front().half_ports(); }
  int ports() const { return matrices_.front().ports(); }
  std::size_t size() const { return freqs_.size(); }

  /// @throws InvalidArgument if i >= size()
  const BlockMatrix &operator[](std::size_t i) const;

  /// Interpolated block matrix at one frequency.
  /// @throws OutOfDomain outside the sampled range
  BlockMatrix at(double freq) const;

  /// Interpolated block sweep at the given frequencies.
  /// @throws ShapeMismatch if `freqs` is empty or not strictly increasing
  BlockSweep at(const std::vector<double> &freqs) const;

  /// Convert every sample (see BlockMatrix::convert).
  BlockSweep convert(ParameterType type,
                     std::optional<double> z0 = std::nullopt) const;

  /// Reassemble the full 2n×2n matrices into a plain sweep of the same type.
  FrequencySweep to_sweep() const;

private:
  std::vector<double> freqs_;
  std::vector<BlockMatrix> matrices_;
  ParameterType type_;
  std::optional<double> z0_;
};

} // namespace nport
