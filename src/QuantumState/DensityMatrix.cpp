#include "QuantumStates.h"
#include "Logger.hpp"

#include <cmath>
#include <sstream>

DensityMatrix::DensityMatrix(size_t dim) : data(dim, dim) {
  if (dim == 0) {
    throw DimensionMismatch("DensityMatrix must have dimension > 0.");
  }
  data.data(0, 0) = 1.0;
}

DensityMatrix::DensityMatrix(const Vector& psi) {
  Vector v = psi.normalized();
  data = v.outer(v);
}

DensityMatrix::DensityMatrix(const Matrix& rho) : data(rho) {
  data.assert_square("DensityMatrix");
  if (dim() == 0) {
    throw DimensionMismatch("DensityMatrix must have dimension > 0.");
  }

  if (!data.is_hermitian(QE_DENSITY_TOL)) {
    throw DomainError(fmt::format("Provided {}x{} data is not Hermitian; max |rho - rho^dagger| = {:.3e}.", dim(), dim(), data.distance(data.adjoint())));
  }

  Complex t = data.trace();
  if (std::abs(t.re - 1.0) > QE_DENSITY_TOL || std::abs(t.im) > QE_DENSITY_TOL) {
    throw DomainError(fmt::format("Provided {}x{} data has trace {}; expected 1.", dim(), dim(), t));
  }

  data = data.hermitian_part();

  double min_eigenvalue = eigensystem().eigenvalues.minCoeff();
  if (min_eigenvalue < -QE_DENSITY_TOL) {
    throw DomainError(fmt::format("Provided {}x{} data is not positive semidefinite; minimum eigenvalue = {:.3e}.", dim(), dim(), min_eigenvalue));
  }
}

DensityMatrix DensityMatrix::maximally_mixed(size_t dim) {
  if (dim == 0) {
    throw DimensionMismatch("DensityMatrix must have dimension > 0.");
  }

  DensityMatrix rho;
  rho.data = Matrix::identity(dim)*Complex(1.0/static_cast<double>(dim));
  return rho;
}

double DensityMatrix::purity() const {
  return (data*data).trace().re;
}

Complex DensityMatrix::expectation(const Matrix& O) const {
  size_t r = O.rows();
  size_t c = O.cols();

  if (r != c || r != dim()) {
    throw DimensionMismatch(fmt::format("Expectation of provided {}x{} matrix cannot be calculated for DensityMatrix of dimension {}.", r, c, dim()));
  }

  return (data*O).trace();
}

void DensityMatrix::evolve(const Matrix& U) {
  if (U.rows() != dim() || U.cols() != dim()) {
    throw DimensionMismatch(fmt::format("Cannot evolve DensityMatrix of dimension {} with {}x{} operator.", dim(), U.rows(), U.cols()));
  }

  data = U*data*U.adjoint();
  restore_invariants("evolve");
}

void DensityMatrix::evolve(const Matrix& H, double dt, const TimeEvolution& evolution) {
  evolve(evolution.unitary(H, dt));
}

void DensityMatrix::restore_invariants(const std::string& op) {
  double asymmetry = data.distance(data.adjoint());
  if (asymmetry > QE_DENSITY_TOL) {
    Logger::log_warning(fmt::format("DensityMatrix::{}: symmetrizing {}x{} result with asymmetry {:.3e}.", op, dim(), dim(), asymmetry));
  }
  data = data.hermitian_part();

  double t = data.trace().re;
  if (!(std::abs(t) > QE_ATOL) || !std::isfinite(t)) {
    std::string msg = fmt::format("DensityMatrix::{}: trace {} cannot be normalized.", op, t);
    Logger::log_error(msg);
    throw DomainError(msg);
  }

  if (std::abs(t - 1.0) > QE_DENSITY_TOL) {
    Logger::log_warning(fmt::format("DensityMatrix::{}: renormalizing trace {:.8f}.", op, t));
  }
  data = data*Complex(1.0/t);
}

DensityMatrix DensityMatrix::tensor(const DensityMatrix& other) const {
  DensityMatrix rho;
  rho.data = data.tensor(other.data);
  return rho;
}

Eigensystem DensityMatrix::eigensystem() const {
  return hermitian_eigensystem(data);
}

Vector DensityMatrix::dominant_state() const {
  Eigensystem eig = eigensystem();
  return eig.eigenvector(eig.dominant_index()).normalized();
}

std::string DensityMatrix::to_string() const {
  std::stringstream ss;
  ss << data.data;
  return fmt::format("DensityMatrix({}):\n{}\n", dim(), ss.str());
}
