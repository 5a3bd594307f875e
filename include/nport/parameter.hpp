#pragma once

#include <optional>
#include <string>

namespace nport {

/// Parameter matrix representation of an n-port.
enum class ParameterType {
  Z,   // Impedance
  Y,   // Admittance
  S,   // Scattering
  T,   // Scattering transfer
  H,   // Hybrid
  G,   // Inverse hybrid
  ABCD // Transmission
};

/// Reference impedance assumed for S and T parameters when none is given.
inline constexpr double kDefaultReferenceImpedance = 50.0;

/// True for the types normalized to a reference impedance (S and T).
bool requires_reference_impedance(ParameterType type);

/// Short tag of a parameter type ("Z", "S", "ABCD", ...).
std::string to_string(ParameterType type);

/// Parse a type tag as produced by to_string(). Case sensitive.
/// @throws InvalidType for any other string
ParameterType parse_parameter_type(const std::string &name);

/// Apply the reference impedance rule for a matrix of the given type.
/// S and T default to kDefaultReferenceImpedance; every other type must not
/// carry an impedance.
/// @throws ImpedanceRuleViolation if z0 is given for a type without one
std::optional<double> check_reference_impedance(ParameterType type,
                                                std::optional<double> z0);

/// Resolve the reference impedance of a conversion result.
/// For an S or T target without an explicit z0 the source impedance is kept
/// when the source is itself S or T, otherwise the default is used.
/// @param source_type Type being converted from
/// @param source_z0 Impedance of the source (if any)
/// @param target Type being converted to
/// @param z0 Impedance requested by the caller (if any)
/// @throws ImpedanceRuleViolation if z0 is given for a target without one
std::optional<double> resolve_target_impedance(ParameterType source_type,
                                               std::optional<double> source_z0,
                                               ParameterType target,
                                               std::optional<double> z0);

} // namespace nport
