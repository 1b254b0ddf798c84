#include "Evolution.h"

#include <algorithm>
#include <cmath>

ExpMethod parse_exp_method(const std::string& s) {
  if (s == "closed_form" || s == "closed") {
    return ExpMethod::ClosedForm;
  } else if (s == "taylor") {
    return ExpMethod::Taylor;
  } else if (s == "pade") {
    return ExpMethod::Pade;
  } else if (s == "eigen" || s == "diagonalize") {
    return ExpMethod::Eigen;
  } else {
    throw std::invalid_argument(fmt::format("Invalid exponential method: {}", s));
  }
}

std::string exp_method_to_string(ExpMethod method) {
  switch (method) {
    case ExpMethod::ClosedForm: return "closed_form";
    case ExpMethod::Taylor:     return "taylor";
    case ExpMethod::Pade:       return "pade";
    case ExpMethod::Eigen:      return "eigen";
  }
  return "unknown";
}

void assert_generator(const Matrix& H) {
  H.assert_square("Generator");

  double tol = QE_ATOL*std::max(1.0, H.norm());
  if (!H.is_hermitian(tol)) {
    throw DomainError(fmt::format("Generator of size {}x{} is not Hermitian; max |H - H^dagger| = {:.3e}.", H.rows(), H.cols(), H.distance(H.adjoint())));
  }
}

TimeEvolution::TimeEvolution(ExpMethod method, double hbar, uint32_t order) : method(method), hbar(hbar), order(order) {
  if (!(hbar > 0.0) || !std::isfinite(hbar)) {
    throw DomainError(fmt::format("hbar must be positive and finite; got {}.", hbar));
  }

  if (order == 0) {
    if (method == ExpMethod::Taylor) {
      this->order = QE_TAYLOR_ORDER;
    } else if (method == ExpMethod::Pade) {
      this->order = QE_PADE_ORDER;
    }
  }
}

Matrix TimeEvolution::unitary(const Matrix& H, double dt) const {
  if (!std::isfinite(dt)) {
    throw DomainError(fmt::format("Time step must be finite; got {}.", dt));
  }

  if (method == ExpMethod::Eigen) {
    return eigen_unitary(H, dt, hbar);
  }

  assert_generator(H);
  Matrix X = H*Complex(0.0, -dt/hbar);

  switch (method) {
    case ExpMethod::ClosedForm:
      return expm_closed_form(X);
    case ExpMethod::Taylor:
      return expm_taylor(X, order);
    case ExpMethod::Pade:
      return expm_pade(X, order);
    default:
      throw std::invalid_argument(fmt::format("Unhandled exponential method {}.", exp_method_to_string(method)));
  }
}

Vector TimeEvolution::evolve(const Vector& psi, const Matrix& H, double dt) const {
  return apply(unitary(H, dt), psi);
}

Vector TimeEvolution::apply(const Matrix& U, const Vector& psi) {
  Vector result = U*psi;
  result.normalize();
  return result;
}
