#pragma once

#include <stdexcept>
#include <string>

namespace nport {

/// Base class of every error raised by nport. All errors are thrown
/// synchronously and leave the operands untouched.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Unrecognized parameter type tag.
class InvalidType : public Error {
public:
  using Error::Error;
};

/// Reference impedance given for a type that forbids one.
class ImpedanceRuleViolation : public Error {
public:
  using Error::Error;
};

/// Non-square matrix, mismatched port counts or sample counts, or port sets
/// that do not partition the ports.
class ShapeMismatch : public Error {
public:
  using Error::Error;
};

/// Binary operation between operands of different parameter types.
class TypeMismatch : public Error {
public:
  using Error::Error;
};

/// Binary operation between operands of different reference impedances.
class ImpedanceMismatch : public Error {
public:
  using Error::Error;
};

/// Conversion or type-restricted operation not available for the operand.
class UnsupportedConversion : public Error {
public:
  using Error::Error;
};

/// Port number of zero or beyond the port count.
class PortIndexError : public Error {
public:
  using Error::Error;
};

/// Frequency query outside the sampled range.
class OutOfDomain : public Error {
public:
  using Error::Error;
};

class NotImplemented : public Error {
public:
  using Error::Error;
};

/// Matrix inversion of a singular matrix.
class SingularMatrix : public Error {
public:
  using Error::Error;
};

/// Scalar argument out of its valid range (sample index, window length).
class InvalidArgument : public Error {
public:
  using Error::Error;
};

} // namespace nport
