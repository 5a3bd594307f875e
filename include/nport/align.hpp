#pragma once

#include <cstddef>
#include <vector>

#include <Eigen/Core>

namespace nport {

/// Location of a frequency within a sampled frequency axis.
struct Bracket {
  std::size_t lower; // Sample at or below the frequency
  std::size_t upper; // Sample at or above the frequency
  double weight;     // Weight of the upper sample (0 on an exact hit)
};

/// Verify a frequency axis is non-empty and strictly increasing.
/// @throws ShapeMismatch otherwise
void check_frequency_axis(const std::vector<double> &freqs);

/// Find the two samples enclosing f.
/// @param freqs Strictly increasing frequency axis
/// @param f Query frequency
/// @throws OutOfDomain if f lies outside [freqs.front(), freqs.back()]
Bracket locate_frequency(const std::vector<double> &freqs, double f);

/// Linear interpolation between two samples, component-wise on the complex
/// entries. Returns `lower` itself when weight is zero.
Eigen::MatrixXcd lerp(const Eigen::MatrixXcd &lower,
                      const Eigen::MatrixXcd &upper, double weight);

/// Common frequency grid of two sweeps: the sorted union of both axes,
/// restricted to the overlap [max(starts), min(ends)] (both ends included).
/// @throws OutOfDomain if the two ranges do not overlap
std::vector<double> merge_frequencies(const std::vector<double> &a,
                                      const std::vector<double> &b);

} // namespace nport
