#include "LinearAlgebra.h"

#include <cmath>

Vector::Vector(size_t n) {
  data = Eigen::VectorXcd::Zero(n);
}

Vector::Vector(const std::vector<Complex>& values) : Vector(values.size()) {
  for (size_t i = 0; i < values.size(); i++) {
    data(i) = values[i];
  }
}

Vector::Vector(const Eigen::VectorXcd& data) : data(data) {}

Vector Vector::basis(size_t n, size_t i) {
  if (i >= n) {
    throw IndexOutOfRange(fmt::format("Basis vector e_{} does not exist in dimension {}.", i, n));
  }

  Vector v(n);
  v.data(i) = 1.0;
  return v;
}

Complex Vector::get(size_t i) const {
  if (i >= size()) {
    throw IndexOutOfRange(fmt::format("Index {} out of range for Vector of dimension {}.", i, size()));
  }
  return data(i);
}

void Vector::set(size_t i, const Complex& value) {
  if (i >= size()) {
    throw IndexOutOfRange(fmt::format("Index {} out of range for Vector of dimension {}.", i, size()));
  }
  data(i) = value;
}

Vector Vector::operator+(const Vector& other) const {
  if (size() != other.size()) {
    throw DimensionMismatch(fmt::format("Cannot add Vectors of dimension {} and {}.", size(), other.size()));
  }
  return Vector(Eigen::VectorXcd(data + other.data));
}

Vector Vector::operator-(const Vector& other) const {
  if (size() != other.size()) {
    throw DimensionMismatch(fmt::format("Cannot subtract Vectors of dimension {} and {}.", size(), other.size()));
  }
  return Vector(Eigen::VectorXcd(data - other.data));
}

Vector Vector::operator*(const Complex& scalar) const {
  return Vector(Eigen::VectorXcd(data * std::complex<double>(scalar)));
}

Complex Vector::inner(const Vector& other) const {
  if (size() != other.size()) {
    throw DimensionMismatch(fmt::format("Inner product of Vectors of dimension {} and {}.", size(), other.size()));
  }
  // Eigen's dot conjugates the first argument
  return data.dot(other.data);
}

double Vector::norm() const {
  return std::sqrt(inner(*this).re);
}

void Vector::normalize() {
  double n = norm();
  if (!(n > 0.0) || !std::isfinite(n)) {
    throw DomainError(fmt::format("Cannot normalize Vector of dimension {} with norm {}.", size(), n));
  }
  data /= n;
}

Vector Vector::normalized() const {
  Vector v(*this);
  v.normalize();
  return v;
}

Vector Vector::tensor(const Vector& other) const {
  size_t n = size();
  size_t m = other.size();
  Vector result(n*m);
  for (size_t i = 0; i < n; i++) {
    for (size_t j = 0; j < m; j++) {
      result.data(i*m + j) = data(i)*other.data(j);
    }
  }
  return result;
}

Matrix Vector::outer(const Vector& other) const {
  return Matrix(Eigen::MatrixXcd(data * other.data.adjoint()));
}

std::string Vector::to_string() const {
  std::string s = "[";
  for (size_t i = 0; i < size(); i++) {
    if (i != 0) {
      s += ", ";
    }
    s += Complex(data(i)).to_string();
  }
  return fmt::format("Vector({}): {}]", size(), s);
}
