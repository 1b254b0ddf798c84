#include "Evolution.h"
#include "Logger.hpp"

#include <cmath>

#include <Eigen/Eigenvalues>

Vector Eigensystem::eigenvector(size_t i) const {
  if (i >= size()) {
    throw IndexOutOfRange(fmt::format("Eigenvector {} requested from an eigensystem of size {}.", i, size()));
  }
  return Vector(Eigen::VectorXcd(eigenvectors.data.col(i)));
}

size_t Eigensystem::dominant_index() const {
  if (size() == 0) {
    throw DimensionMismatch("Empty eigensystem has no dominant eigenvector.");
  }

  double max = eigenvalues.cwiseAbs().maxCoeff();
  for (size_t i = 0; i < size(); i++) {
    if (std::abs(eigenvalues(i)) >= max - QE_ATOL) {
      return i;
    }
  }

  return size() - 1;
}

Eigensystem hermitian_eigensystem(const Matrix& H) {
  assert_generator(H);
  if (H.rows() == 0) {
    throw DimensionMismatch("hermitian_eigensystem of an empty matrix.");
  }

  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> solver(H.data);
  if (solver.info() != Eigen::Success) {
    std::string msg = fmt::format("Eigendecomposition of {}x{} Hermitian matrix did not converge.", H.rows(), H.cols());
    Logger::log_error(msg);
    throw ConvergenceError(msg);
  }

  return Eigensystem{solver.eigenvalues(), Matrix(solver.eigenvectors())};
}

Matrix eigen_unitary(const Matrix& H, double dt, double hbar) {
  if (!(hbar > 0.0)) {
    throw DomainError(fmt::format("hbar must be positive; got {}.", hbar));
  }

  Eigensystem eig = hermitian_eigensystem(H);

  size_t n = eig.size();
  Eigen::VectorXcd phases(n);
  for (size_t i = 0; i < n; i++) {
    phases(i) = std::exp(std::complex<double>(0.0, -eig.eigenvalues(i)*dt/hbar));
  }

  const Eigen::MatrixXcd& V = eig.eigenvectors.data;
  return Matrix(Eigen::MatrixXcd(V * phases.asDiagonal() * V.adjoint()));
}

Vector evolve_state(const Vector& psi, const Matrix& H, double dt, double hbar) {
  Matrix U = eigen_unitary(H, dt, hbar);
  return TimeEvolution::apply(U, psi);
}
