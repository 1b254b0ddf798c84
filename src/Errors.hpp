#pragma once

#include <stdexcept>
#include <string>

// Operands of incompatible shape.
class DimensionMismatch : public std::invalid_argument {
  public:
    explicit DimensionMismatch(const std::string& message) : std::invalid_argument(message) {}
};

// Element access outside of a container.
class IndexOutOfRange : public std::out_of_range {
  public:
    explicit IndexOutOfRange(const std::string& message) : std::out_of_range(message) {}
};

// Division or normalization by zero, invalid polar radius, or an input which
// violates a structural constraint (Hermiticity, unit trace).
class DomainError : public std::domain_error {
  public:
    explicit DomainError(const std::string& message) : std::domain_error(message) {}
};

// Singular Padé denominator or a non-finite series.
class NumericalError : public std::runtime_error {
  public:
    explicit NumericalError(const std::string& message) : std::runtime_error(message) {}
};

// The eigensolver did not converge.
class ConvergenceError : public NumericalError {
  public:
    explicit ConvergenceError(const std::string& message) : NumericalError(message) {}
};
