#include "nport/block_sweep.hpp"

#include <string>
#include <utility>

#include "nport/align.hpp"
#include "nport/errors.hpp"
#include "nport/sweep.hpp"

namespace nport {

namespace {

BlockMatrix lerp_blocks(const BlockMatrix &lower, const BlockMatrix &upper,
                        double weight) {
  if (weight == 0.0) {
    return lower;
  }
  return BlockMatrix::from_full(lerp(lower.full(), upper.full(), weight),
                                lower.type(), lower.z0());
}

} // namespace

BlockSweep::BlockSweep(std::vector<double> freqs,
                       std::vector<BlockMatrix> matrices, ParameterType type,
                       std::optional<double> z0)
    : freqs_(std::move(freqs)), matrices_(std::move(matrices)), type_(type),
      z0_(check_reference_impedance(type, z0)) {
  if (freqs_.size() != matrices_.size()) {
    throw ShapeMismatch("The list of frequencies (" +
                        std::to_string(freqs_.size()) +
                        ") and the list of block matrices (" +
                        std::to_string(matrices_.size()) +
                        ") must have equal lengths");
  }
  check_frequency_axis(freqs_);

  const int n = matrices_.front().half_ports();
  for (const auto &X : matrices_) {
    if (X.half_ports() != n) {
      throw ShapeMismatch("All block matrices of a sweep must have the same "
                          "number of ports");
    }
    if (X.type() != type_) {
      throw TypeMismatch("Block matrix of type " + to_string(X.type()) +
                         " in a " + to_string(type_) + " sweep");
    }
    if (X.z0() != z0_) {
      throw ImpedanceMismatch("Block matrix reference impedance differs from "
                              "the sweep's");
    }
  }
}

const BlockMatrix &BlockSweep::operator[](std::size_t i) const {
  if (i >= size()) {
    throw InvalidArgument("Sample " + std::to_string(i) +
                          " is out of range for a sweep of " +
                          std::to_string(size()) + " samples");
  }
  return matrices_[i];
}

BlockMatrix BlockSweep::at(double freq) const {
  const Bracket b = locate_frequency(freqs_, freq);
  return lerp_blocks(matrices_[b.lower], matrices_[b.upper], b.weight);
}

BlockSweep BlockSweep::at(const std::vector<double> &freqs) const {
  check_frequency_axis(freqs);
  std::vector<BlockMatrix> matrices;
  matrices.reserve(freqs.size());
  for (double f : freqs) {
    matrices.push_back(at(f));
  }
  return BlockSweep(freqs, std::move(matrices), type_, z0_);
}

BlockSweep BlockSweep::convert(ParameterType type,
                               std::optional<double> z0) const {
  const auto target_z0 = resolve_target_impedance(type_, z0_, type, z0);
  std::vector<BlockMatrix> converted;
  converted.reserve(size());
  for (const auto &X : matrices_) {
    converted.push_back(X.convert(type, target_z0));
  }
  return BlockSweep(freqs_, std::move(converted), type, target_z0);
}

FrequencySweep BlockSweep::to_sweep() const {
  std::vector<Eigen::MatrixXcd> matrices;
  matrices.reserve(size());
  for (const auto &X : matrices_) {
    matrices.push_back(X.full());
  }
  return FrequencySweep(freqs_, std::move(matrices), type_, z0_);
}

} // namespace nport
