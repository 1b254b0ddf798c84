#pragma once

#include <array>
#include <vector>

#include <Simulator.hpp>

#include "QuantumStates.h"

using BlochVector = std::array<double, 3>;

// Periodic cubic lattice of spin-1/2 sites, each precessing in its local field
//   B_i = B_ext + J <s_j>_{j ~ i} + xi,   xi ~ N(0, T)
// under H_i = -gamma/2 B_i . sigma. Each step reads the field from a snapshot of
// the previous step and swaps in the new buffer only after every site succeeded.
class LatticeSimulator : public Simulator {
  public:
    LatticeSimulator(dataframe::ExperimentParams& params);
    virtual ~LatticeSimulator()=default;

    size_t get_system_size() const {
      return system_size;
    }

    size_t num_sites() const {
      return system_size*system_size*system_size;
    }

    virtual BlochVector site_bloch_vector(size_t i) const=0;

    // Lattice average of the site Bloch vectors
    BlochVector magnetization() const;

    // Product of the lattice standard deviations of <sigma_x> and <sigma_y>
    double uncertainty() const;

    // Lattice average of -gamma J/2 s_i . <s_j>_{j ~ i}, the coupling term of <H_i>
    double exchange_energy() const;

    virtual dataframe::SampleMap take_samples() const override;

    static size_t wrap(size_t i, int offset, size_t n) {
      return (i + n + offset) % n;
    }

  protected:
    size_t system_size;
    double timestep;
    double gyromagnetic_ratio;
    double exchange;
    BlochVector field;
    double temperature;
    TimeEvolution evolution;

    size_t index(size_t x, size_t y, size_t z) const {
      return x + system_size*(y + system_size*z);
    }

    std::array<size_t, 6> neighbors(size_t i) const;

    std::vector<BlochVector> snapshot() const;

    // Draws the thermal field for site i from the generator
    Matrix local_unitary(size_t i, const std::vector<BlochVector>& snapshot);

    // Uniformly distributed on the Bloch sphere
    Vector random_spinor();
};

class SpinLatticeSimulator : public LatticeSimulator {
  public:
    SpinLatticeSimulator(dataframe::ExperimentParams& params);

    virtual void timesteps(uint32_t num_steps) override;

    virtual BlochVector site_bloch_vector(size_t i) const override;

    const Vector& get_spinor(size_t i) const {
      return spinors.at(i);
    }

  private:
    std::vector<Vector> spinors;
};

class DensityLatticeSimulator : public LatticeSimulator {
  public:
    DensityLatticeSimulator(dataframe::ExperimentParams& params);

    virtual void timesteps(uint32_t num_steps) override;

    virtual BlochVector site_bloch_vector(size_t i) const override;

    const DensityMatrix& get_density_matrix(size_t i) const {
      return states.at(i);
    }

    double average_purity() const;

    virtual dataframe::SampleMap take_samples() const override;

  private:
    double initial_polarization;
    std::vector<DensityMatrix> states;
};
