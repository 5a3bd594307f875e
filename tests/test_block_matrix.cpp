#include <Eigen/Dense>
#include <cassert>
#include <cmath>
#include <complex>
#include <iostream>
#include <vector>

#include "nport/dot.hpp"
#include "nport/errors.hpp"

using namespace nport;
using cd = std::complex<double>;

Eigen::MatrixXcd scalar(cd value) {
  return Eigen::MatrixXcd::Constant(1, 1, value);
}

// Z-parameters of a T-network with series arms za, zb and shunt arm zc.
Eigen::MatrixXcd tee(cd za, cd zb, cd zc) {
  Eigen::MatrixXcd Z(2, 2);
  Z << za + zc, zc, zc, zb + zc;
  return Z;
}

void test_partition() {
  std::cout << "test_partition..." << std::endl;

  Eigen::MatrixXcd M(4, 4);
  for (int i = 0; i < 4; ++i)
    for (int j = 0; j < 4; ++j)
      M(i, j) = cd(i, j);

  BlockMatrix X = BlockMatrix::from_full(M, ParameterType::S);
  assert(X.z0() == 50.0);
  assert(X.half_ports() == 2 && X.ports() == 4);
  assert(X.block(1, 0) == M.bottomLeftCorner(2, 2));
  assert(X.full() == M);
  assert(X.to_port_matrix().matrix() == M);

  bool caught = false;
  try {
    BlockMatrix::from_full(Eigen::MatrixXcd::Zero(3, 3), ParameterType::Z);
  } catch (const ShapeMismatch &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    BlockMatrix bad(scalar(1.0), Eigen::MatrixXcd::Zero(2, 2), scalar(1.0),
                    scalar(1.0), ParameterType::Z);
  } catch (const ShapeMismatch &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    BlockMatrix bad(scalar(1.0), scalar(1.0), scalar(1.0), scalar(1.0),
                    ParameterType::ABCD, 50.0);
  } catch (const ImpedanceRuleViolation &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    X.block(2, 0);
  } catch (const InvalidArgument &) {
    caught = true;
  }
  assert(caught);
}

void test_multiply() {
  std::cout << "test_multiply..." << std::endl;

  // 2x2 blocks: the block product equals the full matrix product
  Eigen::MatrixXcd L = Eigen::MatrixXcd::Random(4, 4);
  Eigen::MatrixXcd R = Eigen::MatrixXcd::Random(4, 4);
  BlockMatrix P = multiply(BlockMatrix::from_full(L, ParameterType::T, 75.0),
                           BlockMatrix::from_full(R, ParameterType::T, 75.0));
  assert(P.full().isApprox(L * R, 1e-12));
  assert(P.type() == ParameterType::T && P.z0() == 75.0);

  bool caught = false;
  try {
    multiply(BlockMatrix::from_full(L, ParameterType::T),
             BlockMatrix::from_full(Eigen::MatrixXcd::Zero(2, 2),
                                    ParameterType::T));
  } catch (const ShapeMismatch &) {
    caught = true;
  }
  assert(caught);
}

void test_abcd_of_tee() {
  std::cout << "test_abcd_of_tee..." << std::endl;

  BlockMatrix Z = BlockMatrix::from_full(tee(10.0, 20.0, 50.0),
                                         ParameterType::Z);
  BlockMatrix abcd = Z.convert(ParameterType::ABCD);

  // A = 1 + Za/Zc, B = Za + Zb + Za Zb / Zc, C = 1/Zc, D = 1 + Zb/Zc
  assert(abcd.type() == ParameterType::ABCD && !abcd.z0());
  assert(std::abs(abcd.x11()(0, 0) - 1.2) < 1e-12);
  assert(std::abs(abcd.x12()(0, 0) - 34.0) < 1e-12);
  assert(std::abs(abcd.x21()(0, 0) - 0.02) < 1e-12);
  assert(std::abs(abcd.x22()(0, 0) - 1.4) < 1e-12);

  BlockMatrix back = abcd.convert(ParameterType::Z);
  assert(back.full().isApprox(Z.full(), 1e-12));

  BlockMatrix Y = abcd.convert(ParameterType::Y);
  assert(Y.full().isApprox(Z.full().inverse(), 1e-12));
}

void test_s_and_t() {
  std::cout << "test_s_and_t..." << std::endl;

  // A lossless thru has the identity as transfer matrix
  Eigen::MatrixXcd thru(2, 2);
  thru << 0.0, 1.0, 1.0, 0.0;
  BlockMatrix T = BlockMatrix::from_full(thru, ParameterType::S)
                      .convert(ParameterType::T);
  assert(T.type() == ParameterType::T && T.z0() == 50.0);
  assert(T.full().isApprox(Eigen::MatrixXcd::Identity(2, 2), 1e-12));

  // Round trip on a lossy, non-symmetric 2-port
  Eigen::MatrixXcd Z = tee(cd(10.0, 5.0), cd(20.0, -3.0), cd(50.0, 8.0));
  BlockMatrix S = PortMatrix(Z, ParameterType::Z)
                      .convert(ParameterType::S)
                      .twonportmatrix();
  BlockMatrix S2 = S.convert(ParameterType::T).convert(ParameterType::S);
  assert(S2.full().isApprox(S.full(), 1e-12));

  // Leaving T for another reference impedance renormalizes
  BlockMatrix S75 = S.convert(ParameterType::T).convert(ParameterType::S, 75.0);
  assert(S75.z0() == 75.0);
  assert(S75.full().isApprox(
      PortMatrix(Z, ParameterType::Z).convert(ParameterType::S, 75.0).matrix(),
      1e-10));

  // T to Z goes through S
  BlockMatrix Zb = S.convert(ParameterType::T).convert(ParameterType::Z);
  assert(Zb.full().isApprox(Z, 1e-10));
}

void test_cascade_consistency() {
  std::cout << "test_cascade_consistency..." << std::endl;

  BlockMatrix Z = BlockMatrix::from_full(tee(10.0, 20.0, 50.0),
                                         ParameterType::Z);

  // Two identical tees: ABCD^2 = [[2.12, 88.4], [0.052, 2.64]]
  BlockMatrix abcd = Z.convert(ParameterType::ABCD);
  BlockMatrix cascade = multiply(abcd, abcd);
  assert(std::abs(cascade.x11()(0, 0) - 2.12) < 1e-12);
  assert(std::abs(cascade.x12()(0, 0) - 88.4) < 1e-10);
  assert(std::abs(cascade.x21()(0, 0) - 0.052) < 1e-12);
  assert(std::abs(cascade.x22()(0, 0) - 2.64) < 1e-12);

  // Cascading in T gives the same S-parameters as cascading in ABCD
  BlockMatrix T = Z.convert(ParameterType::T);
  BlockMatrix viaT = multiply(T, T).convert(ParameterType::S);
  BlockMatrix viaABCD = cascade.convert(ParameterType::S);
  assert(viaT.full().isApprox(viaABCD.full(), 1e-10));

  std::cout << "  Cascade S21 = " << viaT.x21()(0, 0) << std::endl;
}

void test_unsupported_and_singular() {
  std::cout << "test_unsupported_and_singular..." << std::endl;

  BlockMatrix Z = BlockMatrix::from_full(tee(10.0, 20.0, 50.0),
                                         ParameterType::Z);
  bool caught = false;
  try {
    Z.convert(ParameterType::H);
  } catch (const UnsupportedConversion &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    BlockMatrix::from_full(tee(10.0, 20.0, 50.0), ParameterType::G)
        .convert(ParameterType::Z);
  } catch (const UnsupportedConversion &) {
    caught = true;
  }
  assert(caught);

  // An ideal thru has no impedance matrix
  Eigen::MatrixXcd thru(2, 2);
  thru << 0.0, 1.0, 1.0, 0.0;
  caught = false;
  try {
    BlockMatrix::from_full(thru, ParameterType::S)
        .convert(ParameterType::ABCD);
  } catch (const SingularMatrix &) {
    caught = true;
  }
  assert(caught);
}

void test_block_sweep() {
  std::cout << "test_block_sweep..." << std::endl;

  BlockMatrix A = BlockMatrix::from_full(tee(10.0, 20.0, 50.0),
                                         ParameterType::Z);
  BlockMatrix B = BlockMatrix::from_full(tee(30.0, 40.0, 50.0),
                                         ParameterType::Z);
  BlockSweep sweep({1.0, 3.0}, {A, B}, ParameterType::Z);
  assert(sweep.size() == 2 && sweep.half_ports() == 1);

  BlockMatrix mid = sweep.at(2.0);
  assert(mid.full().isApprox(tee(20.0, 30.0, 50.0), 1e-12));
  assert(sweep.at(1.0).full() == A.full());

  BlockSweep abcd = sweep.convert(ParameterType::ABCD);
  assert(abcd.type() == ParameterType::ABCD);
  assert(std::abs(abcd[0].x12()(0, 0) - 34.0) < 1e-12);

  FrequencySweep full = sweep.to_sweep();
  assert(full.ports() == 2);
  assert(full.matrices()[1] == B.full());

  // Cascading block sweeps with dot() and converting back
  BlockSweep twice = dot(abcd, abcd);
  FrequencySweep S = twice.convert(ParameterType::S, 50.0).to_sweep();
  assert(S.type() == ParameterType::S && S.z0() == 50.0);
  assert(S.ispassive());

  bool caught = false;
  try {
    BlockSweep bad({1.0, 2.0}, {A, abcd[0]}, ParameterType::Z);
  } catch (const TypeMismatch &) {
    caught = true;
  }
  assert(caught);

  BlockMatrix S50 = A.convert(ParameterType::S, 50.0);
  BlockMatrix S75 = A.convert(ParameterType::S, 75.0);
  caught = false;
  try {
    BlockSweep bad({1.0, 2.0}, {S50, S75}, ParameterType::S, 50.0);
  } catch (const ImpedanceMismatch &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    BlockSweep bad({1.0, 2.0}, {A}, ParameterType::Z);
  } catch (const ShapeMismatch &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    sweep.at(4.0);
  } catch (const OutOfDomain &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    sweep.at(std::nan(""));
  } catch (const OutOfDomain &) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    sweep.at(std::vector<double>{2.5, 1.5});
  } catch (const ShapeMismatch &) {
    caught = true;
  }
  assert(caught);
}

int main() {
  test_partition();
  test_multiply();
  test_abcd_of_tee();
  test_s_and_t();
  test_cascade_consistency();
  test_unsupported_and_singular();
  test_block_sweep();
  std::cout << "All block matrix tests passed!" << std::endl;
  return 0;
}
