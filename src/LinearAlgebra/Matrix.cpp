#include "LinearAlgebra.h"

#include <limits>
#include <sstream>

#include <Eigen/LU>
#include <unsupported/Eigen/KroneckerProduct>

Matrix::Matrix(size_t rows, size_t cols) {
  data = Eigen::MatrixXcd::Zero(rows, cols);
}

Matrix::Matrix(const ComplexRows& values) {
  size_t nrows = values.size();
  size_t ncols = nrows > 0 ? values[0].size() : 0;

  data = Eigen::MatrixXcd::Zero(nrows, ncols);
  for (size_t i = 0; i < nrows; i++) {
    if (values[i].size() != ncols) {
      throw DimensionMismatch(fmt::format("Row {} has {} entries; expected {}.", i, values[i].size(), ncols));
    }

    for (size_t j = 0; j < ncols; j++) {
      data(i, j) = values[i][j];
    }
  }
}

Matrix::Matrix(const Eigen::MatrixXcd& data) : data(data) {}

Matrix Matrix::identity(size_t n) {
  return Matrix(Eigen::MatrixXcd(Eigen::MatrixXcd::Identity(n, n)));
}

Matrix Matrix::diagonal(const Vector& d) {
  return Matrix(Eigen::MatrixXcd(d.data.asDiagonal()));
}

Complex Matrix::get(size_t i, size_t j) const {
  if (i >= rows() || j >= cols()) {
    throw IndexOutOfRange(fmt::format("Index ({}, {}) out of range for {}x{} Matrix.", i, j, rows(), cols()));
  }
  return data(i, j);
}

void Matrix::set(size_t i, size_t j, const Complex& value) {
  if (i >= rows() || j >= cols()) {
    throw IndexOutOfRange(fmt::format("Index ({}, {}) out of range for {}x{} Matrix.", i, j, rows(), cols()));
  }
  data(i, j) = value;
}

Matrix Matrix::operator+(const Matrix& other) const {
  if (rows() != other.rows() || cols() != other.cols()) {
    throw DimensionMismatch(fmt::format("Cannot add {}x{} and {}x{} matrices.", rows(), cols(), other.rows(), other.cols()));
  }
  return Matrix(Eigen::MatrixXcd(data + other.data));
}

Matrix Matrix::operator-(const Matrix& other) const {
  if (rows() != other.rows() || cols() != other.cols()) {
    throw DimensionMismatch(fmt::format("Cannot subtract {}x{} and {}x{} matrices.", rows(), cols(), other.rows(), other.cols()));
  }
  return Matrix(Eigen::MatrixXcd(data - other.data));
}

Matrix Matrix::operator*(const Matrix& other) const {
  if (cols() != other.rows()) {
    throw DimensionMismatch(fmt::format("Cannot multiply {}x{} and {}x{} matrices.", rows(), cols(), other.rows(), other.cols()));
  }
  return Matrix(Eigen::MatrixXcd(data * other.data));
}

Vector Matrix::operator*(const Vector& v) const {
  if (cols() != v.size()) {
    throw DimensionMismatch(fmt::format("Cannot apply {}x{} Matrix to Vector of dimension {}.", rows(), cols(), v.size()));
  }
  return Vector(Eigen::VectorXcd(data * v.data));
}

Matrix Matrix::operator*(const Complex& scalar) const {
  return Matrix(Eigen::MatrixXcd(data * std::complex<double>(scalar)));
}

Matrix Matrix::transpose() const {
  return Matrix(Eigen::MatrixXcd(data.transpose()));
}

Matrix Matrix::adjoint() const {
  return Matrix(Eigen::MatrixXcd(data.adjoint()));
}

Matrix Matrix::hermitian_part() const {
  assert_square("hermitian_part");
  return Matrix(Eigen::MatrixXcd(0.5*(data + data.adjoint())));
}

Complex Matrix::trace() const {
  assert_square("trace");
  return data.trace();
}

Matrix Matrix::commutator(const Matrix& other) const {
  return (*this)*other - other*(*this);
}

Matrix Matrix::anticommutator(const Matrix& other) const {
  return (*this)*other + other*(*this);
}

Matrix Matrix::tensor(const Matrix& other) const {
  return Matrix(Eigen::MatrixXcd(Eigen::kroneckerProduct(data, other.data)));
}

Matrix Matrix::inverse() const {
  assert_square("inverse");

  size_t n = rows();
  if (n == 2) {
    std::complex<double> det = data(0, 0)*data(1, 1) - data(0, 1)*data(1, 0);
    // Relative to |A|_F^2, matching the rank threshold of the LU path
    if (std::abs(det) <= std::numeric_limits<double>::epsilon()*data.squaredNorm()) {
      throw NumericalError(fmt::format("Singular 2x2 matrix; determinant = {}.", Complex(det)));
    }

    Eigen::MatrixXcd inv(2, 2);
    inv << data(1, 1), -data(0, 1),
          -data(1, 0),  data(0, 0);
    return Matrix(Eigen::MatrixXcd(inv / det));
  }

  Eigen::FullPivLU<Eigen::MatrixXcd> lu(data);
  if (!lu.isInvertible()) {
    throw NumericalError(fmt::format("Singular {}x{} matrix; rank = {}.", n, n, lu.rank()));
  }

  return Matrix(Eigen::MatrixXcd(lu.inverse()));
}

Complex Matrix::expectation(const Vector& v) const {
  assert_square("expectation");
  if (cols() != v.size()) {
    throw DimensionMismatch(fmt::format("Expectation of {}x{} Matrix in Vector of dimension {}.", rows(), cols(), v.size()));
  }
  return v.data.dot(data * v.data);
}

double Matrix::norm() const {
  return data.norm();
}

double Matrix::distance(const Matrix& other) const {
  if (rows() != other.rows() || cols() != other.cols()) {
    throw DimensionMismatch(fmt::format("Distance between {}x{} and {}x{} matrices.", rows(), cols(), other.rows(), other.cols()));
  }

  if (rows() == 0 || cols() == 0) {
    return 0.0;
  }

  return (data - other.data).cwiseAbs().maxCoeff();
}

bool Matrix::is_hermitian(double tol) const {
  if (!is_square()) {
    return false;
  }
  return distance(adjoint()) < tol;
}

bool Matrix::is_unitary(double tol) const {
  if (!is_square()) {
    return false;
  }
  return ((*this)*adjoint()).distance(identity(rows())) < tol;
}

std::string Matrix::to_string() const {
  std::stringstream ss;
  ss << data;
  return fmt::format("Matrix({}x{}):\n{}\n", rows(), cols(), ss.str());
}

void Matrix::assert_square(const std::string& op) const {
  if (!is_square()) {
    throw DimensionMismatch(fmt::format("{} requires a square matrix; got {}x{}.", op, rows(), cols()));
  }
}
