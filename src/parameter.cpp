#include "nport/parameter.hpp"

#include "nport/errors.hpp"

namespace nport {

bool requires_reference_impedance(ParameterType type) {
  return type == ParameterType::S || type == ParameterType::T;
}

std::string to_string(ParameterType type) {
  switch (type) {
  case ParameterType::Z:
    return "Z";
  case ParameterType::Y:
    return "Y";
  case ParameterType::S:
    return "S";
  case ParameterType::T:
    return "T";
  case ParameterType::H:
    return "H";
  case ParameterType::G:
    return "G";
  case ParameterType::ABCD:
    return "ABCD";
  }
  throw InvalidType("Unknown n-port parameter type");
}

ParameterType parse_parameter_type(const std::string &name) {
  for (ParameterType type :
       {ParameterType::Z, ParameterType::Y, ParameterType::S, ParameterType::T,
        ParameterType::H, ParameterType::G, ParameterType::ABCD}) {
    if (to_string(type) == name) {
      return type;
    }
  }
  throw InvalidType("Illegal n-port parameter type '" + name + "'");
}

std::optional<double> check_reference_impedance(ParameterType type,
                                                std::optional<double> z0) {
  if (requires_reference_impedance(type)) {
    return z0.value_or(kDefaultReferenceImpedance);
  }
  if (z0) {
    throw ImpedanceRuleViolation("The " + to_string(type) +
                                 "-parameter representation does not take a "
                                 "reference impedance");
  }
  return std::nullopt;
}

std::optional<double> resolve_target_impedance(ParameterType source_type,
                                               std::optional<double> source_z0,
                                               ParameterType target,
                                               std::optional<double> z0) {
  if (requires_reference_impedance(target)) {
    if (z0) {
      return z0;
    }
    if (requires_reference_impedance(source_type) && source_z0) {
      return source_z0;
    }
    return kDefaultReferenceImpedance;
  }
  if (z0) {
    throw ImpedanceRuleViolation("The " + to_string(target) +
                                 "-parameter representation does not take a "
                                 "reference impedance");
  }
  return std::nullopt;
}

} // namespace nport
