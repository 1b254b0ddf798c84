#pragma once

#include <random>
#include <cstdint>

#include <fmt/format.h>
#include <dataframe/Frame.h>

// Base of every time-stepped model. Parameters are read once at construction;
// the generator is seeded from "seed" and never reseeded afterwards.
class Simulator {
  public:
    Simulator(dataframe::ExperimentParams &params) {
      int seed = dataframe::utils::get<int>(params, "seed", 0);
      if (seed < 0) {
        throw std::invalid_argument(fmt::format("Provided seed {} is negative.", seed));
      }
      rng.seed(static_cast<uint32_t>(seed));
    }

    virtual ~Simulator()=default;

    virtual void timesteps(uint32_t num_steps)=0;

    // By default, do nothing special during equilibration timesteps
    virtual void equilibration_timesteps(uint32_t num_steps) {
      timesteps(num_steps);
    }

    virtual dataframe::SampleMap take_samples() const {
      return dataframe::SampleMap();
    }

  protected:
    std::minstd_rand rng;

    double randf() {
      std::uniform_real_distribution<double> dist(0.0, 1.0);
      return dist(rng);
    }

    // Zero when stddev is zero; no draw is made in that case.
    double randn(double stddev) {
      if (stddev == 0.0) {
        return 0.0;
      }
      std::normal_distribution<double> dist(0.0, stddev);
      return dist(rng);
    }
};
