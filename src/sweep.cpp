#include "nport/sweep.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>

#include "nport/align.hpp"
#include "nport/errors.hpp"
#include "nport/linalg.hpp"

namespace nport {

namespace {

Eigen::MatrixXcd apply(BinaryOp op, const Eigen::MatrixXcd &a,
                       const Eigen::MatrixXcd &b) {
  switch (op) {
  case BinaryOp::Add:
    return a + b;
  case BinaryOp::Subtract:
    return a - b;
  case BinaryOp::Multiply:
    return a.cwiseProduct(b);
  case BinaryOp::Divide:
    return a.cwiseQuotient(b);
  }
  throw InvalidArgument("Unknown arithmetic operator");
}

void check_constant_shape(const Eigen::MatrixXcd &constant, int ports) {
  if (constant.rows() != ports || constant.cols() != ports) {
    throw ShapeMismatch("Constant of size " + std::to_string(constant.rows()) +
                        "x" + std::to_string(constant.cols()) +
                        " does not match a " + std::to_string(ports) +
                        "-port sweep");
  }
}

} // namespace

FrequencySweep::FrequencySweep(std::vector<double> freqs,
                               std::vector<Eigen::MatrixXcd> matrices,
                               ParameterType type, std::optional<double> z0)
    : freqs_(std::move(freqs)), matrices_(std::move(matrices)), type_(type),
      z0_(check_reference_impedance(type, z0)) {
  if (freqs_.size() != matrices_.size()) {
    throw ShapeMismatch("The list of frequencies (" +
                        std::to_string(freqs_.size()) +
                        ") and the list of matrices (" +
                        std::to_string(matrices_.size()) +
                        ") must have equal lengths");
  }
  check_frequency_axis(freqs_);

  const Eigen::Index n = matrices_.front().rows();
  for (const auto &M : matrices_) {
    if (M.rows() != M.cols()) {
      throw ShapeMismatch("The matrices must be square");
    }
    if (M.rows() != n) {
      throw ShapeMismatch("All matrices of a sweep must have the same number "
                          "of ports");
    }
  }
}

FrequencySweep FrequencySweep::from_samples(
    const std::vector<double> &freqs, const std::vector<PortMatrix> &samples,
    ParameterType type, std::optional<double> z0) {
  const auto resolved = check_reference_impedance(type, z0);
  std::vector<Eigen::MatrixXcd> matrices;
  matrices.reserve(samples.size());
  for (const auto &sample : samples) {
    if (sample.type() == type && sample.z0() == resolved) {
      matrices.push_back(sample.matrix());
    } else {
      matrices.push_back(sample.convert(type, resolved).matrix());
    }
  }
  return FrequencySweep(freqs, std::move(matrices), type, resolved);
}

PortMatrix FrequencySweep::operator[](std::size_t i) const {
  if (i >= size()) {
    throw InvalidArgument("Sample " + std::to_string(i) +
                          " is out of range for a sweep of " +
                          std::to_string(size()) + " samples");
  }
  return PortMatrix(matrices_[i], type_, z0_);
}

std::vector<std::complex<double>> FrequencySweep::parameter(int port1,
                                                            int port2) const {
  check_port(port1, ports());
  check_port(port2, ports());
  std::vector<std::complex<double>> values;
  values.reserve(size());
  for (const auto &M : matrices_) {
    values.push_back(M(port1 - 1, port2 - 1));
  }
  return values;
}

FrequencySweep FrequencySweep::element(int port1, int port2) const {
  const auto values = parameter(port1, port2);
  std::vector<Eigen::MatrixXcd> matrices;
  matrices.reserve(values.size());
  for (const auto &v : values) {
    matrices.push_back(Eigen::MatrixXcd::Constant(1, 1, v));
  }
  return FrequencySweep(freqs_, std::move(matrices), type_, z0_);
}

PortMatrix FrequencySweep::at(double freq) const {
  const Bracket b = locate_frequency(freqs_, freq);
  return PortMatrix(lerp(matrices_[b.lower], matrices_[b.upper], b.weight),
                    type_, z0_);
}

FrequencySweep FrequencySweep::at(const std::vector<double> &freqs) const {
  check_frequency_axis(freqs);
  std::vector<Eigen::MatrixXcd> matrices;
  matrices.reserve(freqs.size());
  for (double f : freqs) {
    const Bracket b = locate_frequency(freqs_, f);
    matrices.push_back(lerp(matrices_[b.lower], matrices_[b.upper], b.weight));
  }
  return FrequencySweep(freqs, std::move(matrices), type_, z0_);
}

FrequencySweep FrequencySweep::average(int n) const {
  if (n < 1) {
    throw InvalidArgument("Averaging window must hold at least one sample");
  }
  const long last = static_cast<long>(size()) - 1;
  const int before = n / 2;     // floor(n/2)
  const int after = (n + 1) / 2; // ceil(n/2)

  std::vector<Eigen::MatrixXcd> averaged;
  averaged.reserve(size());
  for (long i = 0; i <= last; ++i) {
    Eigen::MatrixXcd sum = Eigen::MatrixXcd::Zero(ports(), ports());
    for (long j = -before; j < after; ++j) {
      const long index = std::clamp(i + j, 0L, last);
      sum += matrices_[index] / static_cast<double>(n);
    }
    averaged.push_back(sum);
  }
  return FrequencySweep(freqs_, std::move(averaged), type_, z0_);
}

FrequencySweep FrequencySweep::add(double freq,
                                   const Eigen::MatrixXcd &matrix) const {
  auto it = std::lower_bound(freqs_.begin(), freqs_.end(), freq);
  if (it != freqs_.end() && *it == freq) {
    throw ShapeMismatch("The sweep already holds a sample at " +
                        std::to_string(freq) + " Hz");
  }
  const auto index = it - freqs_.begin();

  std::vector<double> freqs = freqs_;
  std::vector<Eigen::MatrixXcd> matrices = matrices_;
  freqs.insert(freqs.begin() + index, freq);
  matrices.insert(matrices.begin() + index, matrix);
  return FrequencySweep(std::move(freqs), std::move(matrices), type_, z0_);
}

FrequencySweep FrequencySweep::add(double freq,
                                   const PortMatrix &matrix) const {
  if (matrix.type() == type_ && matrix.z0() == z0_) {
    return add(freq, matrix.matrix());
  }
  return add(freq, matrix.convert(type_, z0_).matrix());
}

FrequencySweep FrequencySweep::convert(ParameterType type,
                                       std::optional<double> z0) const {
  const auto target_z0 = resolve_target_impedance(type_, z0_, type, z0);
  std::vector<Eigen::MatrixXcd> converted;
  converted.reserve(size());
  for (std::size_t i = 0; i < size(); ++i) {
    converted.push_back((*this)[i].convert(type, target_z0).matrix());
  }
  return FrequencySweep(freqs_, std::move(converted), type, target_z0);
}

FrequencySweep FrequencySweep::renormalize(double z0) const {
  if (type_ != ParameterType::S) {
    throw UnsupportedConversion("Only S-parameters can be renormalized (got " +
                                to_string(type_) + ")");
  }
  if (z0 == *z0_) {
    return *this;
  }
  std::vector<Eigen::MatrixXcd> renormalized;
  renormalized.reserve(size());
  for (std::size_t i = 0; i < size(); ++i) {
    renormalized.push_back((*this)[i].renormalize(z0).matrix());
  }
  return FrequencySweep(freqs_, std::move(renormalized), type_, z0);
}

FrequencySweep
FrequencySweep::recombine(const std::vector<PortSpec> &portspecs) const {
  if (type_ != ParameterType::Z) {
    throw UnsupportedConversion(
        "Ports can only be recombined on an impedance sweep (got " +
        to_string(type_) + ")");
  }
  std::vector<Eigen::MatrixXcd> recombined;
  recombined.reserve(size());
  for (std::size_t i = 0; i < size(); ++i) {
    recombined.push_back((*this)[i].recombine(portspecs).matrix());
  }
  return FrequencySweep(freqs_, std::move(recombined), type_, z0_);
}

FrequencySweep FrequencySweep::submatrix(const std::vector<int> &ports) const {
  std::vector<Eigen::MatrixXcd> submatrices;
  submatrices.reserve(size());
  for (std::size_t i = 0; i < size(); ++i) {
    submatrices.push_back((*this)[i].submatrix(ports).matrix());
  }
  return FrequencySweep(freqs_, std::move(submatrices), type_, z0_);
}

FrequencySweep FrequencySweep::invert() const {
  std::vector<Eigen::MatrixXcd> inverted;
  inverted.reserve(size());
  for (const auto &M : matrices_) {
    inverted.push_back(inverse(M));
  }
  return FrequencySweep(freqs_, std::move(inverted), type_, z0_);
}

FrequencySweep FrequencySweep::retag(ParameterType type,
                                     std::optional<double> z0) const {
  return FrequencySweep(freqs_, matrices_, type, z0);
}

BlockSweep FrequencySweep::twonport() const {
  std::vector<BlockMatrix> blocks;
  blocks.reserve(size());
  for (std::size_t i = 0; i < size(); ++i) {
    blocks.push_back((*this)[i].twonportmatrix());
  }
  return BlockSweep(freqs_, std::move(blocks), type_, z0_);
}

BlockSweep FrequencySweep::twonport(const std::vector<int> &inports,
                                    const std::vector<int> &outports) const {
  std::vector<BlockMatrix> blocks;
  blocks.reserve(size());
  for (std::size_t i = 0; i < size(); ++i) {
    blocks.push_back((*this)[i].twonportmatrix(inports, outports));
  }
  return BlockSweep(freqs_, std::move(blocks), type_, z0_);
}

bool FrequencySweep::ispassive(const PassivityOptions &opt) const {
  for (std::size_t i = 0; i < size(); ++i) {
    if (!(*this)[i].ispassive(opt)) {
      if (opt.verbose) {
        std::cerr << "nport: sample at f=" << freqs_[i]
                  << " Hz is not passive\n";
      }
      return false;
    }
  }
  return true;
}

FrequencySweep combine(BinaryOp op, const FrequencySweep &lhs,
                       const FrequencySweep &rhs, const AlignOptions &opt) {
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

  const auto freqs = merge_frequencies(lhs.frequencies(), rhs.frequencies());
  if (opt.verbose) {
    std::cerr << "nport: aligned " << freqs.size() << " samples over ["
              << freqs.front() << ", " << freqs.back() << "] Hz\n";
  }
  const FrequencySweep a = lhs.at(freqs);
  const FrequencySweep b = rhs.at(freqs);

  std::vector<Eigen::MatrixXcd> result;
  result.reserve(freqs.size());
  for (std::size_t i = 0; i < freqs.size(); ++i) {
    result.push_back(apply(op, a.matrices()[i], b.matrices()[i]));
  }
  return FrequencySweep(freqs, std::move(result), lhs.type(), lhs.z0());
}

FrequencySweep combine(BinaryOp op, const FrequencySweep &lhs,
                       std::complex<double> rhs) {
  const Eigen::MatrixXcd constant =
      Eigen::MatrixXcd::Constant(lhs.ports(), lhs.ports(), rhs);
  return combine(op, lhs, constant);
}

FrequencySweep combine(BinaryOp op, std::complex<double> lhs,
                       const FrequencySweep &rhs) {
  const Eigen::MatrixXcd constant =
      Eigen::MatrixXcd::Constant(rhs.ports(), rhs.ports(), lhs);
  return combine(op, constant, rhs);
}

FrequencySweep combine(BinaryOp op, const FrequencySweep &lhs,
                       const Eigen::MatrixXcd &rhs) {
  check_constant_shape(rhs, lhs.ports());
  std::vector<Eigen::MatrixXcd> result;
  result.reserve(lhs.size());
  for (const auto &M : lhs.matrices()) {
    result.push_back(apply(op, M, rhs));
  }
  return FrequencySweep(lhs.frequencies(), std::move(result), lhs.type(),
                        lhs.z0());
}

FrequencySweep combine(BinaryOp op, const Eigen::MatrixXcd &lhs,
                       const FrequencySweep &rhs) {
  check_constant_shape(lhs, rhs.ports());
  std::vector<Eigen::MatrixXcd> result;
  result.reserve(rhs.size());
  for (const auto &M : rhs.matrices()) {
    result.push_back(apply(op, lhs, M));
  }
  return FrequencySweep(rhs.frequencies(), std::move(result), rhs.type(),
                        rhs.z0());
}

FrequencySweep operator+(const FrequencySweep &lhs, const FrequencySweep &rhs) {
  return combine(BinaryOp::Add, lhs, rhs);
}

FrequencySweep operator-(const FrequencySweep &lhs, const FrequencySweep &rhs) {
  return combine(BinaryOp::Subtract, lhs, rhs);
}

FrequencySweep operator*(const FrequencySweep &lhs, const FrequencySweep &rhs) {
  return combine(BinaryOp::Multiply, lhs, rhs);
}

FrequencySweep operator/(const FrequencySweep &lhs, const FrequencySweep &rhs) {
  return combine(BinaryOp::Divide, lhs, rhs);
}

FrequencySweep operator+(const FrequencySweep &lhs, std::complex<double> rhs) {
  return combine(BinaryOp::Add, lhs, rhs);
}

FrequencySweep operator-(const FrequencySweep &lhs, std::complex<double> rhs) {
  return combine(BinaryOp::Subtract, lhs, rhs);
}

FrequencySweep operator*(const FrequencySweep &lhs, std::complex<double> rhs) {
  return combine(BinaryOp::Multiply, lhs, rhs);
}

FrequencySweep operator/(const FrequencySweep &lhs, std::complex<double> rhs) {
  return combine(BinaryOp::Divide, lhs, rhs);
}

FrequencySweep operator+(std::complex<double> lhs, const FrequencySweep &rhs) {
  return combine(BinaryOp::Add, lhs, rhs);
}

FrequencySweep operator-(std::complex<double> lhs, const FrequencySweep &rhs) {
  return combine(BinaryOp::Subtract, lhs, rhs);
}

FrequencySweep operator*(std::complex<double> lhs, const FrequencySweep &rhs) {
  return combine(BinaryOp::Multiply, lhs, rhs);
}

FrequencySweep operator/(std::complex<double> lhs, const FrequencySweep &rhs) {
  return combine(BinaryOp::Divide, lhs, rhs);
}

FrequencySweep operator+(const FrequencySweep &lhs,
                         const Eigen::MatrixXcd &rhs) {
  return combine(BinaryOp::Add, lhs, rhs);
}

FrequencySweep operator-(const FrequencySweep &lhs,
                         const Eigen::MatrixXcd &rhs) {
  return combine(BinaryOp::Subtract, lhs, rhs);
}

FrequencySweep operator*(const FrequencySweep &lhs,
                         const Eigen::MatrixXcd &rhs) {
  return combine(BinaryOp::Multiply, lhs, rhs);
}

FrequencySweep operator/(const FrequencySweep &lhs,
                         const Eigen::MatrixXcd &rhs) {
  return combine(BinaryOp::Divide, lhs, rhs);
}

FrequencySweep operator+(const Eigen::MatrixXcd &lhs,
                         const FrequencySweep &rhs) {
  return combine(BinaryOp::Add, lhs, rhs);
}

FrequencySweep operator-(const Eigen::MatrixXcd &lhs,
                         const FrequencySweep &rhs) {
  return combine(BinaryOp::Subtract, lhs, rhs);
}

FrequencySweep operator*(const Eigen::MatrixXcd &lhs,
                         const FrequencySweep &rhs) {
  return combine(BinaryOp::Multiply, lhs, rhs);
}

FrequencySweep operator/(const Eigen::MatrixXcd &lhs,
                         const FrequencySweep &rhs) {
  return combine(BinaryOp::Divide, lhs, rhs);
}

} // namespace nport
