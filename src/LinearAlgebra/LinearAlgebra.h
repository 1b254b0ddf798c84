#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <fmt/format.h>

#include "Complex.hpp"
#include "Errors.hpp"

#define QE_ATOL 1e-8

using ComplexRows = std::vector<std::vector<Complex>>;

class Matrix;

class Vector {
  public:
    Eigen::VectorXcd data;

    Vector()=default;
    explicit Vector(size_t n);
    Vector(const std::vector<Complex>& values);
    Vector(const Eigen::VectorXcd& data);

    static Vector basis(size_t n, size_t i);

    size_t size() const {
      return data.size();
    }

    Complex get(size_t i) const;
    void set(size_t i, const Complex& value);

    Vector operator+(const Vector& other) const;
    Vector operator-(const Vector& other) const;
    Vector operator*(const Complex& scalar) const;

    Complex inner(const Vector& other) const;
    double norm() const;

    void normalize();
    Vector normalized() const;

    Vector tensor(const Vector& other) const;
    Matrix outer(const Vector& other) const;

    std::string to_string() const;
};

inline Complex inner_product(const Vector& a, const Vector& b) {
  return a.inner(b);
}

class Matrix {
  public:
    Eigen::MatrixXcd data;

    Matrix()=default;
    Matrix(size_t rows, size_t cols);
    Matrix(const ComplexRows& rows);
    Matrix(const Eigen::MatrixXcd& data);

    static Matrix identity(size_t n);
    static Matrix diagonal(const Vector& d);

    size_t rows() const {
      return data.rows();
    }

    size_t cols() const {
      return data.cols();
    }

    bool is_square() const {
      return rows() == cols();
    }

    Complex get(size_t i, size_t j) const;
    void set(size_t i, size_t j, const Complex& value);

    Matrix operator+(const Matrix& other) const;
    Matrix operator-(const Matrix& other) const;
    Matrix operator*(const Matrix& other) const;
    Vector operator*(const Vector& v) const;
    Matrix operator*(const Complex& scalar) const;

    Matrix transpose() const;
    Matrix adjoint() const;
    Matrix hermitian_part() const;
    Complex trace() const;

    Matrix commutator(const Matrix& other) const;
    Matrix anticommutator(const Matrix& other) const;
    Matrix tensor(const Matrix& other) const;
    Matrix inverse() const;

    // <v|M|v>
    Complex expectation(const Vector& v) const;

    double norm() const;
    double distance(const Matrix& other) const;

    bool is_hermitian(double tol=QE_ATOL) const;
    bool is_unitary(double tol=QE_ATOL) const;

    std::string to_string() const;

    // Throws DimensionMismatch unless square; op names the calling operation
    void assert_square(const std::string& op) const;
};

inline Matrix commutator(const Matrix& a, const Matrix& b) {
  return a.commutator(b);
}

inline Matrix tensor_product(const Matrix& a, const Matrix& b) {
  return a.tensor(b);
}

inline Vector tensor_product(const Vector& a, const Vector& b) {
  return a.tensor(b);
}
