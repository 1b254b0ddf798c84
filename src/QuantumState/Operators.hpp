#pragma once

#include <array>
#include <cmath>
#include <vector>

#include "QuantumStates.h"

// Spin-1/2 and Dirac operators shared by the simulators.
namespace operators {
  inline Vector basis_vector(size_t n, size_t i) {
    return Vector::basis(n, i);
  }

  inline Matrix identity2() {
    return Matrix::identity(2);
  }

  inline Matrix sigma_x() {
    return Matrix(ComplexRows{{0.0, 1.0}, {1.0, 0.0}});
  }

  inline Matrix sigma_y() {
    return Matrix(ComplexRows{{0.0, Complex(0.0, -1.0)}, {Complex(0.0, 1.0), 0.0}});
  }

  inline Matrix sigma_z() {
    return Matrix(ComplexRows{{1.0, 0.0}, {0.0, -1.0}});
  }

  inline std::array<Matrix, 3> pauli_matrices() {
    return {sigma_x(), sigma_y(), sigma_z()};
  }

  // S_i = sigma_i / 2 (hbar = 1)
  inline std::array<Matrix, 3> spin_operators() {
    return {sigma_x()*Complex(0.5), sigma_y()*Complex(0.5), sigma_z()*Complex(0.5)};
  }

  // Dirac representation: gamma^0 = diag(I, -I), gamma^k = [[0, sigma_k], [-sigma_k, 0]]
  inline Matrix gamma(size_t mu) {
    if (mu > 3) {
      throw IndexOutOfRange(fmt::format("Gamma matrix index {} not in [0, 3].", mu));
    }

    Matrix upper(2, 2);
    upper.data(0, 0) = 1.0;
    Matrix lower(2, 2);
    lower.data(1, 1) = 1.0;

    if (mu == 0) {
      return upper.tensor(identity2()) - lower.tensor(identity2());
    }

    Matrix raise(2, 2);
    raise.data(0, 1) = 1.0;
    Matrix drop(2, 2);
    drop.data(1, 0) = 1.0;

    Matrix sigma = pauli_matrices()[mu - 1];
    return raise.tensor(sigma) - drop.tensor(sigma);
  }

  // Minkowski metric diag(1, -1, -1, -1)
  inline double metric(size_t mu, size_t nu) {
    if (mu > 3 || nu > 3) {
      throw IndexOutOfRange(fmt::format("Metric index ({}, {}) not in [0, 3].", mu, nu));
    }

    if (mu != nu) {
      return 0.0;
    }
    return (mu == 0) ? 1.0 : -1.0;
  }

  inline Vector apply_gamma(size_t mu, const Vector& spinor) {
    if (spinor.size() != 4) {
      throw DimensionMismatch(fmt::format("Gamma matrix applied to a spinor of dimension {}.", spinor.size()));
    }
    return gamma(mu)*spinor;
  }

  // e^{i theta} psi
  inline Vector twist(const Vector& psi, double theta) {
    return psi*Complex::polar(1.0, theta);
  }

  inline std::vector<Vector> orthonormal_basis(size_t n) {
    std::vector<Vector> basis;
    basis.reserve(n);
    for (size_t i = 0; i < n; i++) {
      basis.push_back(Vector::basis(n, i));
    }
    return basis;
  }

  // Jordan-Wigner: c_j = Z^{(x) j} (x) |0><1| (x) I^{(x) n-j-1} on 2^n occupation states,
  // with mode 0 the leftmost factor.
  inline Matrix annihilation(size_t mode, size_t num_modes) {
    if (num_modes == 0) {
      throw DimensionMismatch("Fermionic operators need at least one mode.");
    }
    if (mode >= num_modes) {
      throw IndexOutOfRange(fmt::format("Mode {} not in [0, {}).", mode, num_modes));
    }

    Matrix lower(2, 2);
    lower.data(0, 1) = 1.0;

    Matrix c = Matrix::identity(1);
    for (size_t j = 0; j < num_modes; j++) {
      if (j < mode) {
        c = c.tensor(sigma_z());
      } else if (j == mode) {
        c = c.tensor(lower);
      } else {
        c = c.tensor(identity2());
      }
    }
    return c;
  }

  inline Matrix creation(size_t mode, size_t num_modes) {
    return annihilation(mode, num_modes).adjoint();
  }

  inline Matrix number_operator(size_t mode, size_t num_modes) {
    return creation(mode, num_modes)*annihilation(mode, num_modes);
  }

  // -gamma/2 (B . sigma)
  inline Matrix spin_hamiltonian(const std::array<double, 3>& field, double gyromagnetic_ratio) {
    auto sigma = pauli_matrices();
    Matrix H(2, 2);
    for (size_t i = 0; i < 3; i++) {
      H = H + sigma[i]*Complex(-0.5*gyromagnetic_ratio*field[i]);
    }
    return H;
  }

  // cos(theta/2)|0> + e^{i phi} sin(theta/2)|1>
  inline Vector bloch_state(double theta, double phi) {
    Vector psi(2);
    psi.data(0) = std::cos(theta/2.0);
    psi.data(1) = std::sin(theta/2.0)*std::exp(std::complex<double>(0.0, phi));
    return psi;
  }

  // (I + n . sigma)/2; requires |n| <= 1
  inline DensityMatrix bloch_density_matrix(double nx, double ny, double nz) {
    double r = std::sqrt(nx*nx + ny*ny + nz*nz);
    if (r > 1.0 + QE_DENSITY_TOL) {
      throw DomainError(fmt::format("Bloch vector ({}, {}, {}) has length {} > 1.", nx, ny, nz, r));
    }

    auto sigma = pauli_matrices();
    Matrix rho = (identity2() + sigma[0]*Complex(nx) + sigma[1]*Complex(ny) + sigma[2]*Complex(nz))*Complex(0.5);
    return DensityMatrix(rho);
  }

  // (Tr rho sigma_x, Tr rho sigma_y, Tr rho sigma_z)
  inline std::array<double, 3> bloch_vector(const DensityMatrix& rho) {
    if (rho.dim() != 2) {
      throw DimensionMismatch(fmt::format("Bloch vector of a DensityMatrix of dimension {}.", rho.dim()));
    }

    auto sigma = pauli_matrices();
    return {rho.expectation(sigma[0]).re, rho.expectation(sigma[1]).re, rho.expectation(sigma[2]).re};
  }

  inline std::array<double, 3> bloch_vector(const Vector& psi) {
    if (psi.size() != 2) {
      throw DimensionMismatch(fmt::format("Bloch vector of a state of dimension {}.", psi.size()));
    }

    auto sigma = pauli_matrices();
    Vector v = psi.normalized();
    return {sigma[0].expectation(v).re, sigma[1].expectation(v).re, sigma[2].expectation(v).re};
  }
}
