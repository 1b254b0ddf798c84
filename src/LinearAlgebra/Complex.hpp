#pragma once

#include <cmath>
#include <complex>
#include <string>

#include <fmt/format.h>

#include "Errors.hpp"

// Complex scalar. Interchangeable with std::complex<double>, which is the element
// type of the Eigen storage underneath Vector and Matrix; unlike std::complex,
// division by zero and degenerate polar construction throw instead of producing NaN.
struct Complex {
  double re;
  double im;

  constexpr Complex() : re(0.0), im(0.0) {}
  constexpr Complex(double re) : re(re), im(0.0) {}
  constexpr Complex(double re, double im) : re(re), im(im) {}
  Complex(const std::complex<double>& c) : re(c.real()), im(c.imag()) {}

  operator std::complex<double>() const {
    return std::complex<double>(re, im);
  }

  static Complex polar(double r, double theta) {
    if (!(r > 0.0) || !std::isfinite(r) || !std::isfinite(theta)) {
      throw DomainError(fmt::format("Complex::polar requires a finite positive radius; got r = {}, theta = {}.", r, theta));
    }
    return Complex(r*std::cos(theta), r*std::sin(theta));
  }

  static constexpr Complex i() {
    return Complex(0.0, 1.0);
  }

  Complex conj() const {
    return Complex(re, -im);
  }

  // Squared modulus
  double norm() const {
    return re*re + im*im;
  }

  double modulus() const {
    return std::hypot(re, im);
  }

  double arg() const {
    return std::atan2(im, re);
  }

  bool is_finite() const {
    return std::isfinite(re) && std::isfinite(im);
  }

  bool is_zero() const {
    return re == 0.0 && im == 0.0;
  }

  Complex operator-() const {
    return Complex(-re, -im);
  }

  Complex& operator+=(const Complex& other) {
    re += other.re;
    im += other.im;
    return *this;
  }

  Complex& operator-=(const Complex& other) {
    re -= other.re;
    im -= other.im;
    return *this;
  }

  Complex& operator*=(const Complex& other) {
    double r = re*other.re - im*other.im;
    im = re*other.im + im*other.re;
    re = r;
    return *this;
  }

  Complex& operator*=(double scalar) {
    re *= scalar;
    im *= scalar;
    return *this;
  }

  Complex& operator/=(double scalar) {
    if (scalar == 0.0) {
      throw DomainError(fmt::format("Division of {} by zero.", to_string()));
    }
    re /= scalar;
    im /= scalar;
    return *this;
  }

  // Smith's algorithm; avoids forming |other|^2, which underflows for tiny divisors
  Complex& operator/=(const Complex& other) {
    if (other.is_zero()) {
      throw DomainError(fmt::format("Division of {} by zero.", to_string()));
    }

    double r, i;
    if (std::abs(other.re) >= std::abs(other.im)) {
      double t = other.im/other.re;
      double d = other.re + other.im*t;
      r = (re + im*t)/d;
      i = (im - re*t)/d;
    } else {
      double t = other.re/other.im;
      double d = other.re*t + other.im;
      r = (re*t + im)/d;
      i = (im*t - re)/d;
    }
    re = r;
    im = i;
    return *this;
  }

  std::string to_string() const {
    if (im < 0.0) {
      return fmt::format("{} - {}i", re, -im);
    }
    return fmt::format("{} + {}i", re, im);
  }
};

inline Complex operator+(Complex a, const Complex& b) { return a += b; }
inline Complex operator-(Complex a, const Complex& b) { return a -= b; }
inline Complex operator*(Complex a, const Complex& b) { return a *= b; }
inline Complex operator*(Complex a, double s) { return a *= s; }
inline Complex operator*(double s, Complex a) { return a *= s; }
inline Complex operator/(Complex a, double s) { return a /= s; }
inline Complex operator/(Complex a, const Complex& b) { return a /= b; }

inline bool operator==(const Complex& a, const Complex& b) {
  return a.re == b.re && a.im == b.im;
}

inline bool operator!=(const Complex& a, const Complex& b) {
  return !(a == b);
}

inline Complex conj(const Complex& c) {
  return c.conj();
}

inline double abs(const Complex& c) {
  return c.modulus();
}

inline Complex exp(const Complex& c) {
  return std::exp(std::complex<double>(c));
}

// Principal square root
inline Complex sqrt(const Complex& c) {
  return std::sqrt(std::complex<double>(c));
}

template <>
struct fmt::formatter<Complex> : fmt::formatter<std::string> {
  auto format(const Complex& c, fmt::format_context& ctx) const {
    return fmt::formatter<std::string>::format(c.to_string(), ctx);
  }
};
