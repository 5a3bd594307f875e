#include <Eigen/Dense>
#include <cassert>
#include <cmath>
#include <complex>
#include <iostream>
#include <vector>

#include "nport/errors.hpp"
#include "nport/sweep.hpp"

using namespace nport;
using cd = std::complex<double>;

Eigen::MatrixXcd scalar(cd value) {
  return Eigen::MatrixXcd::Constant(1, 1, value);
}

// 1-port Z sweep with samples `values` at `freqs`.
FrequencySweep scalar_sweep(const std::vector<double> &freqs,
                            const std::vector<cd> &values,
                            ParameterType type = ParameterType::Z) {
  std::vector<Eigen::MatrixXcd> matrices;
  for (const auto &v : values)
    matrices.push_back(scalar(v));
  return FrequencySweep(freqs, matrices, type);
}

Eigen::MatrixXcd two_port(double r) {
  Eigen::MatrixXcd Z(2, 2);
  Z << cd(r + 50.0, 1.0), cd(r, 0.0), cd(r, 0.0), cd(r + 30.0, -2.0);
  return Z;
}

FrequencySweep two_port_sweep() {
  return FrequencySweep({1e9, 2e9, 3e9}, {two_port(10), two_port(20),
                                          two_port(30)},
                        ParameterType::Z);
}

void test_construction() {
  std::cout << "test_construction..." << std::endl;

  FrequencySweep sweep = two_port_sweep();
  assert(sweep.size() == 3);
  assert(sweep.ports() == 2);
  assert(sweep.type() == ParameterType::Z && !sweep.z0());

  FrequencySweep s =
      scalar_sweep({1.0, 2.0}, {0.0, 0.5}, ParameterType::S);
  assert(s.z0() == 50.0);

  bool caught = false;
  try {
    FrequencySweep bad({1.0, 2.0}, {scalar(1.0)}, ParameterType::Z);
  } catch (const ShapeMismatch &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    FrequencySweep bad({1.0}, {Eigen::MatrixXcd::Zero(1, 2)},
                       ParameterType::Z);
  } catch (const ShapeMismatch &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    FrequencySweep bad({1.0, 2.0}, {scalar(1.0), two_port(1.0)},
                       ParameterType::Z);
  } catch (const ShapeMismatch &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    scalar_sweep({2.0, 1.0}, {1.0, 2.0});
  } catch (const ShapeMismatch &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    scalar_sweep({1.0, 1.0}, {1.0, 2.0});
  } catch (const ShapeMismatch &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    FrequencySweep bad({1.0}, {scalar(1.0)}, ParameterType::Y, 50.0);
  } catch (const ImpedanceRuleViolation &) {
    caught = true;
  }
  assert(caught);
}

void test_sample_access() {
  std::cout << "test_sample_access..." << std::endl;

  FrequencySweep sweep = two_port_sweep();
  PortMatrix second = sweep[1];
  assert(second.type() == ParameterType::Z);
  assert(second.matrix() == two_port(20));

  auto s21 = sweep.parameter(2, 1);
  assert(s21.size() == 3);
  assert(s21[2] == cd(30.0, 0.0));

  FrequencySweep z22 = sweep.element(2, 2);
  assert(z22.ports() == 1);
  assert(z22.frequencies() == sweep.frequencies());
  assert(z22.matrices()[0](0, 0) == cd(40.0, -2.0));

  bool caught = false;
  try {
    sweep[3];
  } catch (const InvalidArgument &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    sweep.parameter(3, 1);
  } catch (const PortIndexError &) {
    caught = true;
  }
  assert(caught);
}

void test_interpolation() {
  std::cout << "test_interpolation..." << std::endl;

  FrequencySweep sweep = scalar_sweep({1.0, 2.0, 4.0}, {cd(0.0, 0.0),
                                                       cd(2.0, 2.0),
                                                       cd(2.0, 2.0)});

  // Exact sample frequency returns the stored sample unchanged
  assert(sweep.at(2.0).matrix() == sweep.matrices()[1]);
  assert(sweep.at(4.0).matrix() == sweep.matrices()[2]);

  // Midpoint of identical samples is that sample
  assert(sweep.at(3.0)(0, 0) == cd(2.0, 2.0));

  // Linear in both real and imaginary parts
  assert(std::abs(sweep.at(1.5)(0, 0) - cd(1.0, 1.0)) < 1e-12);
  assert(std::abs(sweep.at(1.25)(0, 0) - cd(0.5, 0.5)) < 1e-12);

  FrequencySweep resampled = sweep.at(std::vector<double>{1.0, 1.5, 3.0});
  assert(resampled.size() == 3);
  assert(resampled.frequencies()[1] == 1.5);
  assert(std::abs(resampled.matrices()[1](0, 0) - cd(1.0, 1.0)) < 1e-12);
  assert(resampled.type() == sweep.type());

  for (double f : {0.5, 4.5, std::nan("")}) {
    bool caught = false;
    try {
      sweep.at(f);
    } catch (const OutOfDomain &) {
      caught = true;
    }
    assert(caught);
  }

  bool caught = false;
  try {
    sweep.at(std::vector<double>{2.0, 5.0});
  } catch (const OutOfDomain &) {
    caught = true;
  }
  assert(caught);

  // Query frequencies must be increasing without repeats
  for (const std::vector<double> &freqs :
       {std::vector<double>{3.0, 1.5}, std::vector<double>{2.0, 2.0}}) {
    caught = false;
    try {
      sweep.at(freqs);
    } catch (const ShapeMismatch &) {
      caught = true;
    }
    assert(caught);
  }
}

void test_average() {
  std::cout << "test_average..." << std::endl;

  FrequencySweep sweep =
      scalar_sweep({1.0, 2.0, 3.0, 4.0}, {0.0, 3.0, 6.0, 9.0});

  // Window i-1 .. i+1, edges replicated
  FrequencySweep avg3 = sweep.average(3);
  const double expected3[] = {1.0, 3.0, 6.0, 8.0};
  for (int i = 0; i < 4; ++i)
    assert(std::abs(avg3.matrices()[i](0, 0) - expected3[i]) < 1e-12);
  assert(avg3.frequencies() == sweep.frequencies());

  // Even window i-1 .. i
  FrequencySweep avg2 = sweep.average(2);
  const double expected2[] = {0.0, 1.5, 4.5, 7.5};
  for (int i = 0; i < 4; ++i)
    assert(std::abs(avg2.matrices()[i](0, 0) - expected2[i]) < 1e-12);

  FrequencySweep avg1 = sweep.average(1);
  for (int i = 0; i < 4; ++i)
    assert(avg1.matrices()[i] == sweep.matrices()[i]);

  bool caught = false;
  try {
    sweep.average(0);
  } catch (const InvalidArgument &) {
    caught = true;
  }
  assert(caught);
}

void test_add() {
  std::cout << "test_add..." << std::endl;

  FrequencySweep sweep = scalar_sweep({1.0, 3.0}, {1.0, 3.0});
  FrequencySweep middle = sweep.add(2.0, scalar(2.0));
  assert(middle.size() == 3);
  assert(middle.frequencies() == std::vector<double>({1.0, 2.0, 3.0}));
  assert(middle.matrices()[1](0, 0) == cd(2.0, 0.0));
  assert(sweep.size() == 2);

  FrequencySweep first = sweep.add(0.5, scalar(0.5));
  assert(first.frequencies().front() == 0.5);
  FrequencySweep last = sweep.add(4.0, scalar(4.0));
  assert(last.frequencies().back() == 4.0);

  // A matched S sample lands in a Z sweep as z0
  FrequencySweep z = sweep.add(5.0, PortMatrix(scalar(0.0), ParameterType::S));
  assert(std::abs(z.matrices()[2](0, 0) - cd(50.0, 0.0)) < 1e-12);

  bool caught = false;
  try {
    sweep.add(3.0, scalar(0.0));
  } catch (const ShapeMismatch &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    sweep.add(2.0, two_port(1.0));
  } catch (const ShapeMismatch &) {
    caught = true;
  }
  assert(caught);
}

void test_convert_and_renormalize() {
  std::cout << "test_convert_and_renormalize..." << std::endl;

  FrequencySweep Z = two_port_sweep();
  FrequencySweep S = Z.convert(ParameterType::S);
  assert(S.type() == ParameterType::S && S.z0() == 50.0);
  assert(S.frequencies() == Z.frequencies());

  FrequencySweep back = S.convert(ParameterType::Z);
  assert(back.type() == ParameterType::Z && !back.z0());
  for (std::size_t i = 0; i < Z.size(); ++i)
    assert(back.matrices()[i].isApprox(Z.matrices()[i], 1e-10));

  FrequencySweep S75 = S.renormalize(75.0);
  assert(S75.z0() == 75.0);
  FrequencySweep direct = Z.convert(ParameterType::S, 75.0);
  for (std::size_t i = 0; i < Z.size(); ++i)
    assert(S75.matrices()[i].isApprox(direct.matrices()[i], 1e-10));

  FrequencySweep same = S.renormalize(50.0);
  for (std::size_t i = 0; i < S.size(); ++i)
    assert(same.matrices()[i] == S.matrices()[i]);

  bool caught = false;
  try {
    Z.renormalize(75.0);
  } catch (const UnsupportedConversion &) {
    caught = true;
  }
  assert(caught);
}

void test_recombine_and_submatrix() {
  std::cout << "test_recombine_and_submatrix..." << std::endl;

  FrequencySweep Z = two_port_sweep();
  FrequencySweep diff = Z.recombine({{1, 2}});
  assert(diff.ports() == 1);
  for (std::size_t i = 0; i < Z.size(); ++i) {
    const auto &M = Z.matrices()[i];
    cd expected = M(0, 0) - M(0, 1) - M(1, 0) + M(1, 1);
    assert(std::abs(diff.matrices()[i](0, 0) - expected) < 1e-12);
  }

  FrequencySweep sub = Z.submatrix({2});
  assert(sub.ports() == 1);
  assert(sub.matrices()[0](0, 0) == Z.matrices()[0](1, 1));

  bool caught = false;
  try {
    Z.convert(ParameterType::S).recombine({{1, 2}});
  } catch (const UnsupportedConversion &) {
    caught = true;
  }
  assert(caught);
}

void test_invert_and_retag() {
  std::cout << "test_invert_and_retag..." << std::endl;

  FrequencySweep Z = two_port_sweep();
  FrequencySweep inv = Z.invert();
  assert(inv.type() == ParameterType::Z);
  for (std::size_t i = 0; i < Z.size(); ++i)
    assert(inv.matrices()[i].isApprox(Z.matrices()[i].inverse(), 1e-12));

  FrequencySweep Y = inv.retag(ParameterType::Y);
  assert(Y.type() == ParameterType::Y);
  FrequencySweep viaConvert = Z.convert(ParameterType::Y);
  for (std::size_t i = 0; i < Z.size(); ++i)
    assert(Y.matrices()[i].isApprox(viaConvert.matrices()[i], 1e-12));

  assert(inv.retag(ParameterType::S).z0() == 50.0);

  bool caught = false;
  try {
    scalar_sweep({1.0}, {0.0}).invert();
  } catch (const SingularMatrix &) {
    caught = true;
  }
  assert(caught);
}

void test_twonport() {
  std::cout << "test_twonport..." << std::endl;

  FrequencySweep Z = two_port_sweep();
  BlockSweep blocks = Z.twonport();
  assert(blocks.size() == Z.size());
  assert(blocks.half_ports() == 1);
  assert(blocks.type() == ParameterType::Z);
  assert(blocks[1].x21()(0, 0) == cd(20.0, 0.0));

  BlockSweep swapped = Z.twonport({2}, {1});
  assert(swapped[0].x11()(0, 0) == Z.matrices()[0](1, 1));
  assert(blocks.to_sweep().matrices()[2] == Z.matrices()[2]);
}

void test_passivity() {
  std::cout << "test_passivity..." << std::endl;

  FrequencySweep Z = two_port_sweep();
  assert(Z.ispassive());
  assert(Z.convert(ParameterType::S).ispassive());

  FrequencySweep S =
      scalar_sweep({1.0, 2.0, 3.0}, {0.5, 1.5, 0.5}, ParameterType::S);
  assert(!S.ispassive());

  PassivityOptions opt;
  opt.verbose = true;
  assert(!S.ispassive(opt));
}

int main() {
  test_construction();
  test_sample_access();
  test_interpolation();
  test_average();
  test_add();
  test_convert_and_renormalize();
  test_recombine_and_submatrix();
  test_invert_and_retag();
  test_twonport();
  test_passivity();
  std::cout << "All frequency sweep tests passed!" << std::endl;
  return 0;
}
