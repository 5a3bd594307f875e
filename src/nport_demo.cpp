#include <algorithm>
#include <cmath>
#include <complex>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "nport/dot.hpp"
#include "nport/errors.hpp"
#include "nport/sweep.hpp"

using namespace nport;

namespace {

// Z-parameters of a lossy transmission line section.
Eigen::MatrixXcd line_impedance(double f, double zc, double length) {
  const double c0 = 299792458.0;
  const std::complex<double> gamma(0.05, 2.0 * M_PI * f / c0);
  const std::complex<double> gl = gamma * length;
  Eigen::MatrixXcd Z(2, 2);
  Z(0, 0) = Z(1, 1) = zc / std::tanh(gl);
  Z(0, 1) = Z(1, 0) = zc / std::sinh(gl);
  return Z;
}

FrequencySweep line(const std::vector<double> &freqs, double zc,
                    double length) {
  std::vector<Eigen::MatrixXcd> matrices;
  for (double f : freqs)
    matrices.push_back(line_impedance(f, zc, length));
  return FrequencySweep(freqs, matrices, ParameterType::Z);
}

} // namespace

int main(int argc, char **argv) {
  bool verbose = false;
  double zc = 75.0;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::transform(arg.begin(), arg.end(), arg.begin(), ::tolower);
    if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else {
      try {
        zc = std::stod(arg);
      } catch (const std::exception &) {
        std::cerr << "Usage: " << argv[0] << " [-v] [line impedance (ohm)]\n";
        return 1;
      }
    }
  }

  std::vector<double> freqs;
  const int N = 11;
  for (int i = 0; i < N; ++i)
    freqs.push_back(1e9 + 1e8 * i);
  std::vector<double> shifted;
  for (int i = 0; i < N; ++i)
    shifted.push_back(1.05e9 + 1e8 * i);

  try {
    const FrequencySweep a = line(freqs, zc, 0.10);
    const FrequencySweep b = line(shifted, zc, 0.05);

    AlignOptions align;
    align.verbose = verbose;
    PassivityOptions passivity;
    passivity.verbose = verbose;

    // Cascade through ABCD blocks and compare against the S-parameters of a
    // single 15 cm section on the common grid.
    const BlockSweep abcd = dot(a.twonport().convert(ParameterType::ABCD),
                                b.twonport().convert(ParameterType::ABCD),
                                align);
    const FrequencySweep cascade =
        abcd.convert(ParameterType::S, 50.0).to_sweep();
    const FrequencySweep reference =
        line(cascade.frequencies(), zc, 0.15).convert(ParameterType::S, 50.0);

    std::cout << "cascade of " << zc << " ohm lines, " << cascade.size()
              << " aligned samples\n";
    const auto s21 = cascade.parameter(2, 1);
    const auto s21_ref = reference.parameter(2, 1);
    for (std::size_t i = 0; i < cascade.size(); ++i) {
      std::cout << "f=" << cascade.frequencies()[i] / 1e9
                << " GHz, |S21|=" << std::abs(s21[i])
                << " (single line " << std::abs(s21_ref[i]) << ")\n";
    }
    std::cout << "passive: " << (cascade.ispassive(passivity) ? "yes" : "no")
              << "\n";
  } catch (const Error &e) {
    std::cerr << "nport: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
