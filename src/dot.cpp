#include "nport/dot.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "nport/align.hpp"
#include "nport/errors.hpp"

namespace nport {

namespace {

template <typename Sweep>
void check_compatible(const Sweep &lhs, const Sweep &rhs) {
  if (lhs.type() != rhs.type()) {
    throw TypeMismatch("Operands have different types (" +
                       to_string(lhs.type()) + " and " +
                       to_string(rhs.type()) + ")");
  }
  if (lhs.z0() != rhs.z0()) {
    throw ImpedanceMismatch("Operands have different reference impedances");
  }
  if (lhs.ports() != rhs.ports()) {
    throw ShapeMismatch("Operands have different port counts (" +
                        std::to_string(lhs.ports()) + " and " +
                        std::to_string(rhs.ports()) + ")");
  }
}

std::vector<double> aligned_frequencies(const std::vector<double> &a,
                                        const std::vector<double> &b,
                                        const AlignOptions &opt) {
  auto freqs = merge_frequencies(a, b);
  if (opt.verbose) {
    std::cerr << "nport: aligned " << freqs.size() << " samples over ["
              << freqs.front() << ", " << freqs.back() << "] Hz\n";
  }
  return freqs;
}

} // namespace

FrequencySweep dot(const FrequencySweep &lhs, const FrequencySweep &rhs,
                   const AlignOptions &opt) {
  check_compatible(lhs, rhs);
  const auto freqs =
      aligned_frequencies(lhs.frequencies(), rhs.frequencies(), opt);
  const FrequencySweep a = lhs.at(freqs);
  const FrequencySweep b = rhs.at(freqs);

  std::vector<Eigen::MatrixXcd> result;
  result.reserve(freqs.size());
  for (std::size_t i = 0; i < freqs.size(); ++i) {
    result.push_back(a.matrices()[i] * b.matrices()[i]);
  }
  return FrequencySweep(freqs, std::move(result), lhs.type(), lhs.z0());
}

FrequencySweep dot(const FrequencySweep &lhs, const Eigen::MatrixXcd &rhs) {
  if (rhs.rows() != lhs.ports() || rhs.cols() != lhs.ports()) {
    throw ShapeMismatch("Cannot multiply a " + std::to_string(lhs.ports()) +
                        "-port sweep by a " + std::to_string(rhs.rows()) +
                        "x" + std::to_string(rhs.cols()) + " matrix");
  }
  std::vector<Eigen::MatrixXcd> result;
  result.reserve(lhs.size());
  for (const auto &M : lhs.matrices()) {
    result.push_back(M * rhs);
  }
  return FrequencySweep(lhs.frequencies(), std::move(result), lhs.type(),
                        lhs.z0());
}

BlockSweep dot(const BlockSweep &lhs, const BlockSweep &rhs,
               const AlignOptions &opt) {
  check_compatible(lhs, rhs);
  const auto freqs =
      aligned_frequencies(lhs.frequencies(), rhs.frequencies(), opt);
  const BlockSweep a = lhs.at(freqs);
  const BlockSweep b = rhs.at(freqs);

  std::vector<BlockMatrix> result;
  result.reserve(freqs.size());
  for (std::size_t i = 0; i < freqs.size(); ++i) {
    result.push_back(multiply(a[i], b[i]));
  }
  return BlockSweep(freqs, std::move(result), lhs.type(), lhs.z0());
}

FrequencySweep dot(const FrequencySweep &, const BlockSweep &) {
  throw NotImplemented("dot() of a plain sweep and a 2n-port block sweep is "
                       "not implemented");
}

FrequencySweep dot(const BlockSweep &, const FrequencySweep &) {
  throw NotImplemented("dot() of a 2n-port block sweep and a plain sweep is "
                       "not implemented");
}

BlockSweep dot(const BlockSweep &, const Eigen::MatrixXcd &) {
  throw NotImplemented("dot() of a 2n-port block sweep and a constant matrix "
                       "is not implemented");
}

} // namespace nport
