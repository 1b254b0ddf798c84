#pragma once

#include <vector>

#include <Simulator.hpp>

#include "QuantumStates.h"

// Pairs of d-level particles (2k, 2k+1). Each step evolves the joint state
// psi_A (x) psi_B under
//   H_joint = H (x) I + I (x) H + g K (x) K,   H = diag((omega + B) j),
// with K the nearest-level hopping matrix, then collapses it back to the
// dominant eigenvector of each marginal.
class EntangledPairSimulator : public Simulator {
  public:
    EntangledPairSimulator(dataframe::ExperimentParams& params);

    virtual void timesteps(uint32_t num_steps) override;

    size_t num_particles() const {
      return states.size();
    }

    size_t get_state_dimension() const {
      return state_dimension;
    }

    const Vector& get_state(size_t i) const {
      return states.at(i);
    }

    static size_t partner(size_t i) {
      return i ^ 1u;
    }

    const Matrix& get_hamiltonian() const {
      return hamiltonian;
    }

    const Matrix& get_joint_hamiltonian() const {
      return joint_hamiltonian;
    }

    static Matrix single_hamiltonian(size_t d, double rotation_frequency, double magnetic_field);
    static Matrix joint_hamiltonian_for(const Matrix& H, double coupling);

    // Mean <psi|H|psi> over particles
    double energy() const;

    virtual dataframe::SampleMap take_samples() const override;

  private:
    size_t num_pairs;
    size_t state_dimension;
    double timestep;
    double hbar;
    double coupling;

    Matrix hamiltonian;
    Matrix joint_hamiltonian;
    Matrix joint_unitary;

    std::vector<Vector> states;

    // Mean Tr(rho_A^2) of the joint states produced by the last step
    double marginal_purity;

    Vector random_state();
};
