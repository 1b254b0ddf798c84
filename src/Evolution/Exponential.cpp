#include "Evolution.h"
#include "Logger.hpp"

#include <cmath>
#include <complex>

// Number of squarings s such that ||X||/2^s <= 1/2.
static uint32_t scaling_exponent(const Eigen::MatrixXcd& X, const char* op) {
  double norm = X.norm();
  if (!std::isfinite(norm)) {
    std::string msg = fmt::format("{}: argument of size {}x{} has non-finite norm.", op, X.rows(), X.cols());
    Logger::log_error(msg);
    throw NumericalError(msg);
  }

  if (norm <= 0.5) {
    return 0;
  }

  uint32_t s = static_cast<uint32_t>(std::ceil(std::log2(norm/0.5)));
  Logger::log_info(fmt::format("{}: norm {:.3e}, scaling by 2^-{}.", op, norm, s));
  return s;
}

static Matrix square_repeatedly(Eigen::MatrixXcd E, uint32_t s, const char* op) {
  for (uint32_t i = 0; i < s; i++) {
    E = E * E;
  }

  if (!E.allFinite()) {
    std::string msg = fmt::format("{}: result of size {}x{} is not finite after {} squarings.", op, E.rows(), E.cols(), s);
    Logger::log_error(msg);
    throw NumericalError(msg);
  }

  return Matrix(E);
}

Matrix expm_closed_form(const Matrix& A) {
  if (A.rows() != 2 || A.cols() != 2) {
    throw DimensionMismatch(fmt::format("expm_closed_form requires a 2x2 matrix; got {}x{}.", A.rows(), A.cols()));
  }

  std::complex<double> a00 = A.data(0, 0);
  std::complex<double> a01 = A.data(0, 1);
  std::complex<double> a10 = A.data(1, 0);
  std::complex<double> a11 = A.data(1, 1);

  std::complex<double> t = a00 + a11;
  std::complex<double> delta = (a00 - a11)*(a00 - a11) + 4.0*a01*a10;
  std::complex<double> sqrt_delta = std::sqrt(delta);

  std::complex<double> exp_half_trace = std::exp(t/2.0);
  std::complex<double> c = std::cosh(sqrt_delta/2.0);

  // sinh(x/2)/x -> 1/2 as x -> 0
  std::complex<double> factor = 0.5;
  if (std::abs(sqrt_delta) > QE_ATOL) {
    factor = std::sinh(sqrt_delta/2.0)/sqrt_delta;
  }

  Eigen::MatrixXcd I = Eigen::MatrixXcd::Identity(2, 2);
  Eigen::MatrixXcd E = exp_half_trace*(c*I + 2.0*factor*(A.data - (t/2.0)*I));

  if (!E.allFinite()) {
    std::string msg = fmt::format("expm_closed_form: non-finite result for trace {} and discriminant {}.", Complex(t), Complex(delta));
    Logger::log_error(msg);
    throw NumericalError(msg);
  }

  return Matrix(E);
}

Matrix expm_taylor(const Matrix& A, uint32_t order) {
  A.assert_square("expm_taylor");
  if (order == 0) {
    throw std::invalid_argument("expm_taylor requires order > 0.");
  }

  size_t n = A.rows();
  uint32_t s = scaling_exponent(A.data, "expm_taylor");
  Eigen::MatrixXcd X = A.data/std::pow(2.0, s);

  Eigen::MatrixXcd term = Eigen::MatrixXcd::Identity(n, n);
  Eigen::MatrixXcd E = term;
  for (uint32_t k = 1; k <= order; k++) {
    term = term*X/static_cast<double>(k);
    E += term;
  }

  return square_repeatedly(E, s, "expm_taylor");
}

Matrix expm_pade(const Matrix& A, uint32_t order) {
  A.assert_square("expm_pade");
  if (order == 0) {
    throw std::invalid_argument("expm_pade requires order > 0.");
  }

  size_t n = A.rows();
  uint32_t s = scaling_exponent(A.data, "expm_pade");
  Eigen::MatrixXcd X = A.data/std::pow(2.0, s);

  // c_k = (2n - k)! n! / ((2n)! k! (n - k)!)
  double c = 1.0;
  Eigen::MatrixXcd power = Eigen::MatrixXcd::Identity(n, n);
  Eigen::MatrixXcd N = power;
  Eigen::MatrixXcd D = power;
  for (uint32_t k = 1; k <= order; k++) {
    c *= static_cast<double>(order - k + 1)/static_cast<double>(k*(2*order - k + 1));
    power = power*X;
    N += c*power;
    if (k % 2) {
      D -= c*power;
    } else {
      D += c*power;
    }
  }

  Matrix D_inv;
  try {
    D_inv = Matrix(D).inverse();
  } catch (const NumericalError& e) {
    std::string msg = fmt::format("expm_pade: denominator of order {} for {}x{} argument is singular: {}", order, n, n, e.what());
    Logger::log_error(msg);
    throw NumericalError(msg);
  }

  return square_repeatedly(D_inv.data*N, s, "expm_pade");
}
