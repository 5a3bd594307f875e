#pragma once

#include <Eigen/Core>

#include "nport/block_sweep.hpp"
#include "nport/options.hpp"
#include "nport/sweep.hpp"

namespace nport {

/// Matrix product of two sweeps, frequency by frequency.
/// Both sweeps are interpolated onto the union of their frequencies within
/// the overlapping range (both range ends included).
/// @return Sweep tagged with the type and impedance of `lhs`
/// @throws TypeMismatch / ImpedanceMismatch for differently tagged operands
/// @throws ShapeMismatch for different port counts
/// @throws OutOfDomain if the frequency ranges do not overlap
FrequencySweep dot(const FrequencySweep &lhs, const FrequencySweep &rhs,
                   const AlignOptions &opt = AlignOptions());

/// Every sample of `lhs` multiplied by a constant n×n matrix.
/// @throws ShapeMismatch if `rhs` is not n×n
FrequencySweep dot(const FrequencySweep &lhs, const Eigen::MatrixXcd &rhs);

/// Block matrix product of two block sweeps (cascading for T and ABCD).
/// Frequencies are aligned as for plain sweeps.
BlockSweep dot(const BlockSweep &lhs, const BlockSweep &rhs,
               const AlignOptions &opt = AlignOptions());

/// Mixed plain/block products are not supported.
/// @throws NotImplemented
FrequencySweep dot(const FrequencySweep &lhs, const BlockSweep &rhs);

/// @throws NotImplemented
FrequencySweep dot(const BlockSweep &lhs, const FrequencySweep &rhs);

/// @throws NotImplemented
BlockSweep dot(const BlockSweep &lhs, const Eigen::MatrixXcd &rhs);

} // namespace nport
