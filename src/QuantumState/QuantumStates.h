#pragma once

#include <string>
#include <utility>

#include <Eigen/Dense>
#include <fmt/format.h>

#include "LinearAlgebra.h"
#include "Evolution.h"

// Tolerance for the Hermiticity and unit-trace checks on externally supplied data
#define QE_DENSITY_TOL 1e-6

enum class Subsystem { A, B };

// Square Hermitian trace-one matrix. Every update re-symmetrizes (M + M^dagger)/2
// and restores unit trace.
class DensityMatrix {
  public:
    Matrix data;

    // |0><0|
    explicit DensityMatrix(size_t dim);

    // |psi><psi| for psi normalized; throws DomainError if psi is zero
    DensityMatrix(const Vector& psi);

    // Throws DimensionMismatch unless square, DomainError unless Hermitian with unit trace
    DensityMatrix(const Matrix& rho);

    DensityMatrix(const DensityMatrix& other)=default;
    DensityMatrix& operator=(const DensityMatrix& other)=default;

    static DensityMatrix maximally_mixed(size_t dim);

    size_t dim() const {
      return data.rows();
    }

    Complex get(size_t i, size_t j) const {
      return data.get(i, j);
    }

    Complex trace() const {
      return data.trace();
    }

    // Tr(rho^2)
    double purity() const;

    // Tr(rho O)
    Complex expectation(const Matrix& O) const;

    // rho -> U rho U^dagger
    void evolve(const Matrix& U);
    void evolve(const Matrix& H, double dt, const TimeEvolution& evolution);

    // Reduces a state on a dim_a x dim_b tensor space by tracing out one factor:
    //   traced B: rho_A[i,j] = sum_k rho[i dim_b + k, j dim_b + k]
    //   traced A: rho_B[i,j] = sum_k rho[k dim_b + i, k dim_b + j]
    DensityMatrix partial_trace(Subsystem traced, size_t dim_a, size_t dim_b) const;

    // Both factors of dimension sqrt(dim())
    DensityMatrix partial_trace(Subsystem traced) const;

    DensityMatrix tensor(const DensityMatrix& other) const;

    Eigensystem eigensystem() const;

    // Normalized eigenvector of the eigenvalue of largest magnitude; see
    // Eigensystem::dominant_index for the tie-break.
    Vector dominant_state() const;

    std::string to_string() const;

  private:
    DensityMatrix()=default;

    // Symmetrizes and rescales to unit trace. op names the calling operation.
    void restore_invariants(const std::string& op);
};

// |psi><psi| on dim_a x dim_b, reduced to the dominant pure state of each marginal.
std::pair<Vector, Vector> split_joint_state(const Vector& joint, size_t dim_a, size_t dim_b);
std::pair<Vector, Vector> split_joint_state(const DensityMatrix& joint, size_t dim_a, size_t dim_b);
