#pragma once

#include <cstdint>
#include <string>

#include <Eigen/Dense>

#include "LinearAlgebra.h"

#define QE_TAYLOR_ORDER 16
#define QE_PADE_ORDER 6

// ------------------------------------------------------------------
// Matrix exponentials. The series methods scale the argument by 2^-s until its
// Frobenius norm is at most 1/2 and square the result s times; with the default
// orders the truncation error is below 1e-12 at that norm.

// exp(A) for a 2x2 A, using trace t and discriminant d = (a00 - a11)^2 + 4 a01 a10:
//   exp(A) = exp(t/2) [cosh(sqrt(d)/2) I + sinh(sqrt(d)/2)/(sqrt(d)/2) (A - t/2 I)]
Matrix expm_closed_form(const Matrix& A);

Matrix expm_taylor(const Matrix& A, uint32_t order=QE_TAYLOR_ORDER);

// Diagonal [n/n] Padé approximant, exp(A) ~ D(A)^-1 N(A). Throws NumericalError if
// D(A) is singular.
Matrix expm_pade(const Matrix& A, uint32_t order=QE_PADE_ORDER);

// ------------------------------------------------------------------
// Hermitian eigendecomposition H = V diag(lambda) V^dagger, eigenvalues ascending.

struct Eigensystem {
  Eigen::VectorXd eigenvalues;
  Matrix eigenvectors;

  size_t size() const {
    return eigenvalues.size();
  }

  Vector eigenvector(size_t i) const;

  // Index of the eigenvalue of largest magnitude. Eigenvalues within QE_ATOL of
  // the largest are considered tied and the lowest index wins.
  size_t dominant_index() const;
};

// Throws ConvergenceError if the solver fails and DomainError if H is not Hermitian.
Eigensystem hermitian_eigensystem(const Matrix& H);

// V diag(exp(-i lambda dt / hbar)) V^dagger
Matrix eigen_unitary(const Matrix& H, double dt, double hbar=1.0);

// U psi with U from eigen_unitary, renormalized
Vector evolve_state(const Vector& psi, const Matrix& H, double dt, double hbar=1.0);

// ------------------------------------------------------------------

enum class ExpMethod { ClosedForm, Taylor, Pade, Eigen };

ExpMethod parse_exp_method(const std::string& s);
std::string exp_method_to_string(ExpMethod method);

// Throws DimensionMismatch unless H is square and DomainError unless it is Hermitian
// to within QE_ATOL relative to its norm.
void assert_generator(const Matrix& H);

// Builds U = exp(-i H dt / hbar) for a Hermitian generator H with a fixed strategy.
class TimeEvolution {
  public:
    TimeEvolution(ExpMethod method=ExpMethod::Pade, double hbar=1.0, uint32_t order=0);

    ExpMethod get_method() const {
      return method;
    }

    double get_hbar() const {
      return hbar;
    }

    Matrix unitary(const Matrix& H, double dt) const;

    // U psi, renormalized to absorb the residual drift of the approximation
    Vector evolve(const Vector& psi, const Matrix& H, double dt) const;

    static Vector apply(const Matrix& U, const Vector& psi);

  private:
    ExpMethod method;
    double hbar;
    uint32_t order;
};
