#include "nport/linalg.hpp"

#include <Eigen/LU>
#include <string>

#include "nport/errors.hpp"

namespace nport {

Eigen::MatrixXcd inverse(const Eigen::MatrixXcd &A) {
  if (A.rows() != A.cols()) {
    throw ShapeMismatch("Cannot invert a non-square matrix");
  }
  Eigen::FullPivLU<Eigen::MatrixXcd> lu(A);
  if (!lu.isInvertible()) {
    throw SingularMatrix("Matrix is singular (rank " +
                         std::to_string(lu.rank()) + " of " +
                         std::to_string(A.rows()) + ")");
  }
  return lu.inverse();
}

Eigen::MatrixXcd permute_ports(const Eigen::MatrixXcd &A,
                               const std::vector<int> &order) {
  const int n = static_cast<int>(order.size());
  Eigen::MatrixXcd result(n, n);
  for (int i = 0; i < n; ++i) {
    for (int j = 0; j < n; ++j) {
      result(i, j) = A(order[i], order[j]);
    }
  }
  return result;
}

} // namespace nport
