#include "nport/align.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

#include "nport/errors.hpp"

namespace nport {

void check_frequency_axis(const std::vector<double> &freqs) {
  if (freqs.empty()) {
    throw ShapeMismatch("A frequency sweep needs at least one sample");
  }
  for (std::size_t i = 1; i < freqs.size(); ++i) {
    if (!(freqs[i] > freqs[i - 1])) {
      std::ostringstream msg;
      msg << "Frequencies must be strictly increasing (sample " << i << ": "
          << freqs[i] << " after " << freqs[i - 1] << ")";
      throw ShapeMismatch(msg.str());
    }
  }
}

Bracket locate_frequency(const std::vector<double> &freqs, double f) {
  // Written so that NaN fails the range test too
  if (freqs.empty() || !(f >= freqs.front() && f <= freqs.back())) {
    std::ostringstream msg;
    msg << "Frequency " << f << " is outside the sampled range";
    if (!freqs.empty()) {
      msg << " [" << freqs.front() << ", " << freqs.back() << "]";
    }
    throw OutOfDomain(msg.str());
  }

  // First sample not below f
  auto it = std::lower_bound(freqs.begin(), freqs.end(), f);
  std::size_t upper = static_cast<std::size_t>(it - freqs.begin());
  if (*it == f) {
    return {upper, upper, 0.0};
  }
  std::size_t lower = upper - 1;
  double weight = (f - freqs[lower]) / (freqs[upper] - freqs[lower]);
  return {lower, upper, weight};
}

Eigen::MatrixXcd lerp(const Eigen::MatrixXcd &lower,
                      const Eigen::MatrixXcd &upper, double weight) {
  if (weight == 0.0) {
    return lower;
  }
  return (1.0 - weight) * lower + weight * upper;
}

std::vector<double> merge_frequencies(const std::vector<double> &a,
                                      const std::vector<double> &b) {
  if (a.empty() || b.empty()) {
    throw OutOfDomain("Cannot align an empty frequency axis");
  }
  const double fmin = std::max(a.front(), b.front());
  const double fmax = std::min(a.back(), b.back());
  if (fmin > fmax) {
    std::ostringstream msg;
    msg << "Frequency ranges [" << a.front() << ", " << a.back() << "] and ["
        << b.front() << ", " << b.back() << "] do not overlap";
    throw OutOfDomain(msg.str());
  }

  std::vector<double> merged;
  merged.reserve(a.size() + b.size());
  std::set_union(a.begin(), a.end(), b.begin(), b.end(),
                 std::back_inserter(merged));

  std::vector<double> result;
  result.reserve(merged.size());
  for (double f : merged) {
    if (f >= fmin && f <= fmax) {
      result.push_back(f);
    }
  }
  return result;
}

} // namespace nport
