#pragma once

#include <vector>

#include <Eigen/Core>

namespace nport {

/// Inverse of a square complex matrix.
/// @param A Square matrix
/// @return A^-1
/// @throws ShapeMismatch if A is not square
/// @throws SingularMatrix if A is not invertible
Eigen::MatrixXcd inverse(const Eigen::MatrixXcd &A);

/// Reorder rows and columns of a square matrix.
/// Row/column k of the result is row/column order[k] (0-based) of A.
Eigen::MatrixXcd permute_ports(const Eigen::MatrixXcd &A,
                               const std::vector<int> &order);

} // namespace nport
