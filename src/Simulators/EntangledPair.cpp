#include "EntangledPair.h"
#include "Logger.hpp"

#include <cmath>

EntangledPairSimulator::EntangledPairSimulator(dataframe::ExperimentParams& params) : Simulator(params), marginal_purity(1.0) {
  int n = dataframe::utils::get<int>(params, "num_pairs", 4);
  if (n <= 0) {
    throw std::invalid_argument(fmt::format("Provided num_pairs {} is not positive.", n));
  }
  num_pairs = static_cast<size_t>(n);

  int d = dataframe::utils::get<int>(params, "state_dimension", 4);
  if (d <= 0) {
    throw std::invalid_argument(fmt::format("Provided state_dimension {} is not positive.", d));
  }
  state_dimension = static_cast<size_t>(d);

  timestep = dataframe::utils::get<double>(params, "timestep", 0.01);
  if (!(timestep > 0.0) || !std::isfinite(timestep)) {
    throw std::invalid_argument(fmt::format("Provided timestep {} is not positive.", timestep));
  }

  hbar = dataframe::utils::get<double>(params, "hbar", 1.0);
  if (!(hbar > 0.0) || !std::isfinite(hbar)) {
    throw std::invalid_argument(fmt::format("Provided hbar {} is not positive.", hbar));
  }

  double rotation_frequency = dataframe::utils::get<double>(params, "rotation_frequency", 1.0);
  double magnetic_field = dataframe::utils::get<double>(params, "magnetic_field", 1.0);
  coupling = dataframe::utils::get<double>(params, "coupling", 0.1);

  hamiltonian = single_hamiltonian(state_dimension, rotation_frequency, magnetic_field);
  joint_hamiltonian = joint_hamiltonian_for(hamiltonian, coupling);
  joint_unitary = eigen_unitary(joint_hamiltonian, timestep, hbar);

  states.reserve(2*num_pairs);
  for (size_t i = 0; i < 2*num_pairs; i++) {
    states.push_back(random_state());
  }

  Logger::log_info(fmt::format("EntangledPairSimulator: {} pairs of dimension {}, dt = {}, hbar = {}, omega = {}, B = {}, g = {}.",
        num_pairs, state_dimension, timestep, hbar, rotation_frequency, magnetic_field, coupling));
}

Matrix EntangledPairSimulator::single_hamiltonian(size_t d, double rotation_frequency, double magnetic_field) {
  Vector levels(d);
  for (size_t j = 0; j < d; j++) {
    levels.set(j, (rotation_frequency + magnetic_field)*static_cast<double>(j));
  }
  return Matrix::diagonal(levels);
}

Matrix EntangledPairSimulator::joint_hamiltonian_for(const Matrix& H, double coupling) {
  H.assert_square("joint_hamiltonian_for");
  size_t d = H.rows();

  Matrix K(d, d);
  for (size_t j = 0; j + 1 < d; j++) {
    K.set(j, j + 1, 1.0);
    K.set(j + 1, j, 1.0);
  }

  Matrix I = Matrix::identity(d);
  return H.tensor(I) + I.tensor(H) + K.tensor(K)*Complex(coupling);
}

Vector EntangledPairSimulator::random_state() {
  Vector psi(state_dimension);
  for (size_t j = 0; j < state_dimension; j++) {
    double re = randf() - 0.5;
    double im = randf() - 0.5;
    psi.set(j, Complex(re, im));
  }
  return psi.normalized();
}

void EntangledPairSimulator::timesteps(uint32_t num_steps) {
  for (uint32_t t = 0; t < num_steps; t++) {
    std::vector<Vector> next(states.size());
    double purity = 0.0;

    for (size_t k = 0; k < num_pairs; k++) {
      size_t a = 2*k;
      size_t b = partner(a);

      Vector joint = TimeEvolution::apply(joint_unitary, states[a].tensor(states[b]));
      DensityMatrix rho(joint);
      purity += rho.partial_trace(Subsystem::B, state_dimension, state_dimension).purity();

      auto [psi_a, psi_b] = split_joint_state(rho, state_dimension, state_dimension);
      next[a] = psi_a;
      next[b] = psi_b;
    }

    states = std::move(next);
    marginal_purity = purity/num_pairs;
  }
}

double EntangledPairSimulator::energy() const {
  double e = 0.0;
  for (const auto& psi : states) {
    e += hamiltonian.expectation(psi).re;
  }
  return e/states.size();
}

dataframe::SampleMap EntangledPairSimulator::take_samples() const {
  dataframe::SampleMap samples;
  dataframe::utils::emplace(samples, "energy", energy());
  dataframe::utils::emplace(samples, "marginal_purity", marginal_purity);
  return samples;
}
