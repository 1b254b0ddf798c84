#include "SpinLattice.h"
#include "Operators.hpp"
#include "Logger.hpp"

#include <cmath>

LatticeSimulator::LatticeSimulator(dataframe::ExperimentParams& params) : Simulator(params) {
  int L = dataframe::utils::get<int>(params, "system_size", 4);
  if (L <= 0) {
    throw std::invalid_argument(fmt::format("Provided system_size {} is not positive.", L));
  }
  system_size = static_cast<size_t>(L);

  timestep = dataframe::utils::get<double>(params, "timestep", 0.01);
  if (!(timestep > 0.0) || !std::isfinite(timestep)) {
    throw std::invalid_argument(fmt::format("Provided timestep {} is not positive.", timestep));
  }

  double hbar = dataframe::utils::get<double>(params, "hbar", 1.0);
  if (!(hbar > 0.0) || !std::isfinite(hbar)) {
    throw std::invalid_argument(fmt::format("Provided hbar {} is not positive.", hbar));
  }

  gyromagnetic_ratio = dataframe::utils::get<double>(params, "gyromagnetic_ratio", 1.0);
  exchange = dataframe::utils::get<double>(params, "exchange", 1.0);
  field = {
    dataframe::utils::get<double>(params, "field_x", 0.0),
    dataframe::utils::get<double>(params, "field_y", 0.0),
    dataframe::utils::get<double>(params, "field_z", 1.0)
  };

  temperature = dataframe::utils::get<double>(params, "temperature", 0.0);
  if (temperature < 0.0) {
    throw std::invalid_argument(fmt::format("Provided temperature {:.3f} is negative.", temperature));
  }

  ExpMethod method = parse_exp_method(dataframe::utils::get<std::string>(params, "exponential_method", "pade"));
  evolution = TimeEvolution(method, hbar);

  Logger::log_info(fmt::format("LatticeSimulator: L = {}, dt = {}, hbar = {}, gamma = {}, J = {}, B = ({}, {}, {}), T = {}, method = {}.",
        system_size, timestep, hbar, gyromagnetic_ratio, exchange, field[0], field[1], field[2], temperature, exp_method_to_string(method)));
}

std::array<size_t, 6> LatticeSimulator::neighbors(size_t i) const {
  size_t x = i % system_size;
  size_t y = (i / system_size) % system_size;
  size_t z = i / (system_size*system_size);

  return {
    index(wrap(x, -1, system_size), y, z),
    index(wrap(x,  1, system_size), y, z),
    index(x, wrap(y, -1, system_size), z),
    index(x, wrap(y,  1, system_size), z),
    index(x, y, wrap(z, -1, system_size)),
    index(x, y, wrap(z,  1, system_size))
  };
}

std::vector<BlochVector> LatticeSimulator::snapshot() const {
  std::vector<BlochVector> s(num_sites());
  for (size_t i = 0; i < num_sites(); i++) {
    s[i] = site_bloch_vector(i);
  }
  return s;
}

Matrix LatticeSimulator::local_unitary(size_t i, const std::vector<BlochVector>& snapshot) {
  auto nbrs = neighbors(i);

  BlochVector local = field;
  for (size_t k = 0; k < 3; k++) {
    double s = 0.0;
    for (size_t j : nbrs) {
      s += snapshot[j][k];
    }
    local[k] += exchange*s/nbrs.size();
  }

  for (size_t k = 0; k < 3; k++) {
    local[k] += randn(temperature);
  }

  return evolution.unitary(operators::spin_hamiltonian(local, gyromagnetic_ratio), timestep);
}

Vector LatticeSimulator::random_spinor() {
  double theta = std::acos(2.0*randf() - 1.0);
  double phi = 2.0*M_PI*randf();
  return operators::bloch_state(theta, phi);
}

BlochVector LatticeSimulator::magnetization() const {
  BlochVector m = {0.0, 0.0, 0.0};
  for (size_t i = 0; i < num_sites(); i++) {
    BlochVector s = site_bloch_vector(i);
    for (size_t k = 0; k < 3; k++) {
      m[k] += s[k];
    }
  }

  for (size_t k = 0; k < 3; k++) {
    m[k] /= num_sites();
  }
  return m;
}

double LatticeSimulator::uncertainty() const {
  BlochVector m = magnetization();

  double var_x = 0.0;
  double var_y = 0.0;
  for (size_t i = 0; i < num_sites(); i++) {
    BlochVector s = site_bloch_vector(i);
    var_x += (s[0] - m[0])*(s[0] - m[0]);
    var_y += (s[1] - m[1])*(s[1] - m[1]);
  }

  return std::sqrt(var_x/num_sites())*std::sqrt(var_y/num_sites());
}

double LatticeSimulator::exchange_energy() const {
  std::vector<BlochVector> s = snapshot();

  double e = 0.0;
  for (size_t i = 0; i < num_sites(); i++) {
    auto nbrs = neighbors(i);
    for (size_t j : nbrs) {
      e += (s[i][0]*s[j][0] + s[i][1]*s[j][1] + s[i][2]*s[j][2])/nbrs.size();
    }
  }

  return -0.5*gyromagnetic_ratio*exchange*e/num_sites();
}

dataframe::SampleMap LatticeSimulator::take_samples() const {
  dataframe::SampleMap samples;
  BlochVector m = magnetization();
  dataframe::utils::emplace(samples, "magnetization_x", m[0]);
  dataframe::utils::emplace(samples, "magnetization_y", m[1]);
  dataframe::utils::emplace(samples, "magnetization_z", m[2]);
  dataframe::utils::emplace(samples, "magnetization", std::sqrt(m[0]*m[0] + m[1]*m[1] + m[2]*m[2]));
  dataframe::utils::emplace(samples, "uncertainty", uncertainty());
  dataframe::utils::emplace(samples, "energy_exchange", exchange_energy());
  return samples;
}

// ------------------------------------------------------------------

SpinLatticeSimulator::SpinLatticeSimulator(dataframe::ExperimentParams& params) : LatticeSimulator(params) {
  spinors.reserve(num_sites());
  for (size_t i = 0; i < num_sites(); i++) {
    spinors.push_back(random_spinor());
  }
}

void SpinLatticeSimulator::timesteps(uint32_t num_steps) {
  for (uint32_t t = 0; t < num_steps; t++) {
    std::vector<BlochVector> previous = snapshot();

    std::vector<Vector> next(num_sites());
    for (size_t i = 0; i < num_sites(); i++) {
      next[i] = TimeEvolution::apply(local_unitary(i, previous), spinors[i]);
    }

    spinors = std::move(next);
  }
}

BlochVector SpinLatticeSimulator::site_bloch_vector(size_t i) const {
  return operators::bloch_vector(spinors[i]);
}

// ------------------------------------------------------------------

DensityLatticeSimulator::DensityLatticeSimulator(dataframe::ExperimentParams& params) : LatticeSimulator(params) {
  initial_polarization = dataframe::utils::get<double>(params, "initial_polarization", 1.0);
  if (initial_polarization < 0.0 || initial_polarization > 1.0) {
    throw std::invalid_argument(fmt::format("Provided initial_polarization {} not in [0, 1].", initial_polarization));
  }

  states.reserve(num_sites());
  for (size_t i = 0; i < num_sites(); i++) {
    BlochVector n = operators::bloch_vector(random_spinor());
    double p = initial_polarization;
    states.push_back(operators::bloch_density_matrix(p*n[0], p*n[1], p*n[2]));
  }
}

void DensityLatticeSimulator::timesteps(uint32_t num_steps) {
  for (uint32_t t = 0; t < num_steps; t++) {
    std::vector<BlochVector> previous = snapshot();

    std::vector<DensityMatrix> next;
    next.reserve(num_sites());
    for (size_t i = 0; i < num_sites(); i++) {
      next.push_back(states[i]);
      next.back().evolve(local_unitary(i, previous));
    }

    states = std::move(next);
  }
}

BlochVector DensityLatticeSimulator::site_bloch_vector(size_t i) const {
  return operators::bloch_vector(states[i]);
}

double DensityLatticeSimulator::average_purity() const {
  double p = 0.0;
  for (const auto& rho : states) {
    p += rho.purity();
  }
  return p/states.size();
}

dataframe::SampleMap DensityLatticeSimulator::take_samples() const {
  dataframe::SampleMap samples = LatticeSimulator::take_samples();
  dataframe::utils::emplace(samples, "purity", average_purity());
  return samples;
}
