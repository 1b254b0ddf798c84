#include "QuantumStates.h"

#include <cmath>

DensityMatrix DensityMatrix::partial_trace(Subsystem traced, size_t dim_a, size_t dim_b) const {
  if (dim_a == 0 || dim_b == 0 || dim_a*dim_b != dim()) {
    throw DimensionMismatch(fmt::format("Cannot split DensityMatrix of dimension {} into factors of dimension {} and {}.", dim(), dim_a, dim_b));
  }

  size_t h = (traced == Subsystem::B) ? dim_a : dim_b;
  size_t s = (traced == Subsystem::B) ? dim_b : dim_a;

  DensityMatrix reduced;
  reduced.data = Matrix(h, h);

  const Eigen::MatrixXcd& rho = data.data;
  for (size_t r = 0; r < h; r++) {
    for (size_t c = 0; c < h; c++) {
      std::complex<double> sum = 0.0;
      for (size_t k = 0; k < s; k++) {
        if (traced == Subsystem::B) {
          sum += rho(r*dim_b + k, c*dim_b + k);
        } else {
          sum += rho(k*dim_b + r, k*dim_b + c);
        }
      }
      reduced.data.data(r, c) = sum;
    }
  }

  reduced.restore_invariants("partial_trace");
  return reduced;
}

DensityMatrix DensityMatrix::partial_trace(Subsystem traced) const {
  size_t d = static_cast<size_t>(std::llround(std::sqrt(static_cast<double>(dim()))));
  if (d*d != dim()) {
    throw DimensionMismatch(fmt::format("DensityMatrix of dimension {} is not a product of two equal factors.", dim()));
  }

  return partial_trace(traced, d, d);
}

std::pair<Vector, Vector> split_joint_state(const DensityMatrix& joint, size_t dim_a, size_t dim_b) {
  DensityMatrix rho_a = joint.partial_trace(Subsystem::B, dim_a, dim_b);
  DensityMatrix rho_b = joint.partial_trace(Subsystem::A, dim_a, dim_b);

  return std::make_pair(rho_a.dominant_state(), rho_b.dominant_state());
}

std::pair<Vector, Vector> split_joint_state(const Vector& joint, size_t dim_a, size_t dim_b) {
  if (joint.size() != dim_a*dim_b) {
    throw DimensionMismatch(fmt::format("Joint state of dimension {} does not factor into {} x {}.", joint.size(), dim_a, dim_b));
  }

  return split_joint_state(DensityMatrix(joint), dim_a, dim_b);
}
