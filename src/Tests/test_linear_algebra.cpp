#include <cmath>

#include "tests.hpp"
#include "LinearAlgebra.h"
#include "Operators.hpp"

bool test_complex_arithmetic() {
  Complex a(1.0, 2.0);
  Complex b(3.0, -1.0);

  ASSERT(a + b == Complex(4.0, 1.0), fmt::format("a + b = {}", a + b));
  ASSERT(a*b == Complex(5.0, 5.0), fmt::format("a*b = {}", a*b));
  ASSERT(a.conj() == Complex(1.0, -2.0), fmt::format("conj(a) = {}", a.conj()));
  ASSERT(a - b == Complex(-2.0, 3.0));
  ASSERT(-a == Complex(-1.0, -2.0));

  ASSERT(is_close(a/b*b, a), fmt::format("(a/b)*b = {}", a/b*b));
  ASSERT(is_close(a/2.0, Complex(0.5, 1.0)));
  ASSERT(a.norm() == 5.0);
  ASSERT(is_close(a.modulus(), std::sqrt(5.0)));

  ASSERT(a.to_string() == "1 + 2i", a.to_string());
  ASSERT(b.to_string() == "3 - 1i", b.to_string());
  ASSERT(fmt::format("{}", b) == "3 - 1i");

  return true;
}

bool test_complex_properties() {
  for (size_t k = 0; k < 100; k++) {
    Complex a(randf(-10.0, 10.0), randf(-10.0, 10.0));
    Complex b(randf(-10.0, 10.0), randf(-10.0, 10.0));

    ASSERT(conj(conj(a)) == a, fmt::format("conj(conj({})) = {}", a, conj(conj(a))));
    ASSERT(is_close(abs(a*b), abs(a)*abs(b)), fmt::format("|ab| = {}, |a||b| = {}", abs(a*b), abs(a)*abs(b)));

    std::complex<double> z = a;
    ASSERT(Complex(z) == a);
    Complex e = exp(a + b);
    ASSERT(abs(e - exp(a)*exp(b)) < 1e-10*abs(e), fmt::format("exp(a + b) = {}, exp(a)exp(b) = {}", e, exp(a)*exp(b)));
  }

  return true;
}

bool test_complex_polar() {
  Complex z = Complex::polar(2.0, M_PI/2.0);
  ASSERT(is_close(z.re, 0.0) && is_close(z.im, 2.0), fmt::format("polar(2, pi/2) = {}", z));
  ASSERT(is_close(z.arg(), M_PI/2.0));
  ASSERT(is_close(Complex::i()*Complex::i(), Complex(-1.0)));

  ASSERT_THROWS(DomainError, Complex::polar(0.0, 1.0), "polar with zero radius did not throw.");
  ASSERT_THROWS(DomainError, Complex::polar(-1.0, 1.0), "polar with negative radius did not throw.");
  ASSERT_THROWS(DomainError, Complex::polar(NAN, 1.0), "polar with NaN radius did not throw.");
  ASSERT_THROWS(DomainError, Complex(1.0, 1.0)/Complex(0.0), "Division by zero did not throw.");
  ASSERT_THROWS(DomainError, Complex(1.0, 1.0)/Complex(-0.0, 0.0), "Division by negative zero did not throw.");
  ASSERT_THROWS(DomainError, Complex(1.0, 1.0)/0.0, "Division by zero scalar did not throw.");

  return true;
}

bool test_complex_small_division() {
  Complex tiny(1e-170);
  Complex q = tiny/tiny;
  ASSERT(q == Complex(1.0), fmt::format("1e-170/1e-170 = {}", q));

  Complex w = Complex(1.0, 2.0)/Complex(1e-170, 1e-170);
  ASSERT(w.is_finite(), fmt::format("(1 + 2i)/(1e-170 + 1e-170i) = {}", w));
  ASSERT(is_close_eps(1e-12, w.re/1e170, 1.5) && is_close_eps(1e-12, w.im/1e170, 0.5), fmt::format("(1 + 2i)/(1e-170 + 1e-170i) = {}", w));

  Complex big(1e200, -1e200);
  ASSERT(is_close(big/big, Complex(1.0)), fmt::format("z/z = {} for z = {}", big/big, big));

  for (size_t k = 0; k < 100; k++) {
    Complex a(randf(-10.0, 10.0), randf(-10.0, 10.0));
    Complex b(randf(-10.0, 10.0), randf(-10.0, 10.0));
    Complex expected = Complex(std::complex<double>(a)/std::complex<double>(b));
    ASSERT(abs(a/b - expected) < 1e-12*abs(expected), fmt::format("{}/{} = {}, expected {}", a, b, a/b, expected));
  }

  return true;
}

bool test_vector_normalize() {
  Vector e0(std::vector<Complex>{Complex(1.0, 0.0), Complex(0.0, 0.0)});
  Vector n0 = e0.normalized();
  ASSERT(vectors_close(n0, e0), fmt::format("Normalized basis vector changed: {}", n0.to_string()));

  Vector v(std::vector<Complex>{Complex(3.0, 0.0), Complex(4.0, 0.0)});
  v.normalize();
  ASSERT(is_close(v.get(0), Complex(0.6, 0.0)), v.to_string());
  ASSERT(is_close(v.get(1), Complex(0.8, 0.0)), v.to_string());
  ASSERT(is_close(v.norm(), 1.0));

  Vector zero(3);
  ASSERT_THROWS(DomainError, zero.normalize(), "Normalizing the zero vector did not throw.");

  return true;
}

bool test_vector_checks() {
  Vector a(2);
  Vector b(3);

  ASSERT_THROWS(DimensionMismatch, a + b, "Adding vectors of different size did not throw.");
  ASSERT_THROWS(DimensionMismatch, a.inner(b), "Inner product of vectors of different size did not throw.");
  ASSERT_THROWS(IndexOutOfRange, a.get(2), "Out of range get did not throw.");
  ASSERT_THROWS(IndexOutOfRange, a.set(5, Complex(1.0)), "Out of range set did not throw.");
  ASSERT_THROWS(IndexOutOfRange, Vector::basis(2, 2), "Out of range basis vector did not throw.");

  Vector e1 = operators::basis_vector(3, 1);
  ASSERT(e1.get(1) == Complex(1.0) && e1.get(0) == Complex(0.0) && e1.get(2) == Complex(0.0));

  Vector u = random_vector(4);
  Vector w = random_vector(4);
  ASSERT(is_close(u.inner(w), conj(w.inner(u))), "Inner product is not conjugate symmetric.");
  ASSERT(is_close(inner_product(u, u), Complex(1.0)));

  return true;
}

bool test_matrix_construction() {
  Matrix M(ComplexRows{{1.0, Complex(0.0, 2.0)}, {3.0, 4.0}});
  ASSERT(M.rows() == 2 && M.cols() == 2);
  ASSERT(M.get(0, 1) == Complex(0.0, 2.0));
  ASSERT(M.trace() == Complex(5.0));
  ASSERT(M.transpose().get(1, 0) == Complex(0.0, 2.0));
  ASSERT(M.adjoint().get(1, 0) == Complex(0.0, -2.0));

  ASSERT_THROWS(DimensionMismatch, Matrix(ComplexRows{{1.0, 2.0}, {3.0}}), "Ragged rows did not throw.");
  ASSERT_THROWS(IndexOutOfRange, M.get(2, 0), "Out of range get did not throw.");

  Matrix A(2, 3);
  Matrix B(2, 3);
  ASSERT_THROWS(DimensionMismatch, A*B, "Multiplying 2x3 by 2x3 did not throw.");
  ASSERT_THROWS(DimensionMismatch, A*Vector(2), "Multiplying 2x3 by a 2-vector did not throw.");
  ASSERT_THROWS(DimensionMismatch, A.trace(), "Trace of non-square matrix did not throw.");
  ASSERT_THROWS(DimensionMismatch, A + Matrix(3, 2), "Adding 2x3 and 3x2 did not throw.");
  ASSERT(!A.is_hermitian() && !A.is_unitary());

  return true;
}

bool test_matrix_inverse() {
  for (size_t n = 2; n < 6; n++) {
    Matrix M = random_matrix(n);
    Matrix Minv = M.inverse();
    ASSERT(matrices_close(M*Minv, Matrix::identity(n), 1e-6), fmt::format("M M^-1 != I for n = {}", n));
  }

  Matrix S(ComplexRows{{1.0, 2.0}, {2.0, 4.0}});
  ASSERT_THROWS(NumericalError, S.inverse(), "Inverting a singular 2x2 matrix did not throw.");

  Matrix N(ComplexRows{{1.0, 1.0}, {1.0, 1.0 + 4e-16}});
  ASSERT_THROWS(NumericalError, N.inverse(), "Inverting a numerically singular 2x2 matrix did not throw.");

  Matrix N3(ComplexRows{{1.0, 1.0, 0.0}, {1.0, 1.0 + 4e-16, 0.0}, {0.0, 0.0, 1.0}});
  ASSERT_THROWS(NumericalError, N3.inverse(), "Inverting a numerically singular 3x3 matrix did not throw.");

  Matrix S3(3, 3);
  ASSERT_THROWS(NumericalError, S3.inverse(), "Inverting the zero 3x3 matrix did not throw.");

  return true;
}

bool test_tensor_product() {
  Matrix A = random_matrix(2);
  Matrix B = random_matrix(3);
  Matrix C = random_matrix(2);

  Matrix left = tensor_product(tensor_product(A, B), C);
  Matrix right = tensor_product(A, tensor_product(B, C));
  ASSERT(left.rows() == 12 && left.cols() == 12);
  ASSERT(matrices_close(left, right), "Tensor product is not associative.");

  // (A (x) B)(u (x) v) = Au (x) Bv
  Vector u = random_vector(2);
  Vector v = random_vector(3);
  ASSERT(vectors_close(A.tensor(B)*u.tensor(v), (A*u).tensor(B*v)));

  Vector e = operators::basis_vector(2, 1).tensor(operators::basis_vector(2, 0));
  ASSERT(e.size() == 4 && e.get(2) == Complex(1.0), e.to_string());

  return true;
}

bool test_commutators() {
  Matrix X = operators::sigma_x();
  Matrix Y = operators::sigma_y();
  Matrix Z = operators::sigma_z();

  // [X, Y] = 2iZ
  ASSERT(matrices_close(commutator(X, Y), Z*Complex(0.0, 2.0)), commutator(X, Y).to_string());
  ASSERT(matrices_close(X.anticommutator(Y), Matrix(2, 2)));
  ASSERT(matrices_close(X*X, Matrix::identity(2)));

  for (const auto& P : operators::pauli_matrices()) {
    ASSERT(P.is_hermitian() && P.is_unitary());
  }

  auto S = operators::spin_operators();
  ASSERT(matrices_close(S[0].commutator(S[1]), S[2]*Complex::i()), "[S_x, S_y] != i S_z");

  return true;
}

bool test_gamma_matrices() {
  for (size_t mu = 0; mu < 4; mu++) {
    for (size_t nu = 0; nu < 4; nu++) {
      Matrix G = operators::gamma(mu).anticommutator(operators::gamma(nu));
      Matrix expected = Matrix::identity(4)*Complex(2.0*operators::metric(mu, nu));
      ASSERT(matrices_close(G, expected), fmt::format("{{gamma^{}, gamma^{}}} = {}", mu, nu, G.to_string()));
    }
  }

  ASSERT(operators::gamma(0).is_hermitian());
  ASSERT(!operators::gamma(1).is_hermitian());
  ASSERT_THROWS(IndexOutOfRange, operators::gamma(4), "gamma(4) did not throw.");

  return true;
}

bool test_dirac_spinor() {
  Vector psi = random_vector(4);
  for (size_t mu = 0; mu < 4; mu++) {
    Vector g = operators::apply_gamma(mu, psi);
    ASSERT(vectors_close(g, operators::gamma(mu)*psi));

    // (gamma^mu)^2 = g^{mu mu}
    Vector gg = operators::apply_gamma(mu, g);
    ASSERT(vectors_close(gg, psi*Complex(operators::metric(mu, mu))), fmt::format("gamma^{} squared", mu));
  }

  ASSERT_THROWS(DimensionMismatch, operators::apply_gamma(0, random_vector(2)), "Gamma matrix applied to a 2-spinor did not throw.");

  Vector twisted = operators::twist(psi, 0.7);
  ASSERT(is_close(twisted.norm(), 1.0));
  ASSERT(is_close(psi.inner(twisted), Complex::polar(1.0, 0.7)), fmt::format("<psi|twist(psi)> = {}", psi.inner(twisted)));
  ASSERT(vectors_close(operators::twist(psi, 2.0*M_PI), psi));

  auto basis = operators::orthonormal_basis(5);
  ASSERT(basis.size() == 5);
  for (size_t i = 0; i < 5; i++) {
    for (size_t j = 0; j < 5; j++) {
      ASSERT(is_close(basis[i].inner(basis[j]), Complex(i == j ? 1.0 : 0.0)));
    }
  }

  return true;
}

bool test_fermionic_operators() {
  size_t n = 3;
  Matrix I = Matrix::identity(1 << n);
  Matrix zero(1 << n, 1 << n);

  for (size_t i = 0; i < n; i++) {
    Matrix ci = operators::annihilation(i, n);
    ASSERT(ci.rows() == 8 && ci.cols() == 8);

    for (size_t j = 0; j < n; j++) {
      Matrix cj = operators::annihilation(j, n);
      Matrix cjd = operators::creation(j, n);

      Matrix expected = (i == j) ? I : zero;
      ASSERT(matrices_close(ci.anticommutator(cjd), expected), fmt::format("{{c_{}, c_{}^dagger}} != {}", i, j, (i == j) ? "I" : "0"));
      ASSERT(matrices_close(ci.anticommutator(cj), zero), fmt::format("{{c_{}, c_{}}} != 0", i, j));
    }

    Matrix N = operators::number_operator(i, n);
    ASSERT(N.is_hermitian() && matrices_close(N*N, N), fmt::format("n_{} is not a projector.", i));
  }

  // |000> is the vacuum; c_1^dagger |000> = |010>
  Vector vacuum = Vector::basis(8, 0);
  for (size_t i = 0; i < n; i++) {
    ASSERT(is_close((operators::annihilation(i, n)*vacuum).norm(), 0.0));
  }
  ASSERT(vectors_close(operators::creation(1, n)*vacuum, Vector::basis(8, 2)));

  // c_0^dagger c_1^dagger |000> = -c_1^dagger c_0^dagger |000>
  Vector a = operators::creation(0, n)*(operators::creation(1, n)*vacuum);
  Vector b = operators::creation(1, n)*(operators::creation(0, n)*vacuum);
  ASSERT(vectors_close(a, b*Complex(-1.0)), fmt::format("{} vs {}", a.to_string(), b.to_string()));

  ASSERT_THROWS(IndexOutOfRange, operators::annihilation(3, 3), "Out of range mode did not throw.");
  ASSERT_THROWS(DimensionMismatch, operators::creation(0, 0), "Zero modes did not throw.");

  return true;
}

bool test_bloch_sphere() {
  for (size_t k = 0; k < 20; k++) {
    double theta = randf(0.0, M_PI);
    double phi = randf(0.0, 2.0*M_PI);

    Vector psi = operators::bloch_state(theta, phi);
    auto n = operators::bloch_vector(psi);
    ASSERT(is_close(n[0], std::sin(theta)*std::cos(phi)), fmt::format("n = {}", n));
    ASSERT(is_close(n[1], std::sin(theta)*std::sin(phi)), fmt::format("n = {}", n));
    ASSERT(is_close(n[2], std::cos(theta)), fmt::format("n = {}", n));

    DensityMatrix rho = operators::bloch_density_matrix(0.5*n[0], 0.5*n[1], 0.5*n[2]);
    auto m = operators::bloch_vector(rho);
    ASSERT(is_close(m[0], 0.5*n[0]) && is_close(m[1], 0.5*n[1]) && is_close(m[2], 0.5*n[2]), fmt::format("m = {}", m));
    ASSERT(is_close(rho.purity(), 0.5*(1.0 + 0.25)), fmt::format("purity = {}", rho.purity()));
  }

  // sin(theta/2) < 0 for theta in (2pi, 4pi); the state is still normalized and on the sphere
  for (size_t k = 0; k < 20; k++) {
    double theta = randf(2.0*M_PI + 0.1, 4.0*M_PI - 0.1);
    double phi = randf(0.0, 2.0*M_PI);

    Vector psi = operators::bloch_state(theta, phi);
    ASSERT(is_close(psi.norm(), 1.0), fmt::format("|psi| = {} for theta = {}", psi.norm(), theta));
    auto n = operators::bloch_vector(psi);
    ASSERT(is_close(n[0], std::sin(theta)*std::cos(phi)), fmt::format("n = {} for theta = {}", n, theta));
    ASSERT(is_close(n[1], std::sin(theta)*std::sin(phi)), fmt::format("n = {} for theta = {}", n, theta));
    ASSERT(is_close(n[2], std::cos(theta)), fmt::format("n = {} for theta = {}", n, theta));
  }

  ASSERT_THROWS(DomainError, operators::bloch_density_matrix(1.0, 1.0, 0.0), "Bloch vector of length > 1 did not throw.");

  return true;
}

bool test_spin_hamiltonian() {
  Matrix H = operators::spin_hamiltonian({0.0, 0.0, 2.0}, 1.5);
  ASSERT(matrices_close(H, operators::sigma_z()*Complex(-1.5)), H.to_string());
  ASSERT(H.is_hermitian());

  return true;
}

int main(int argc, char *argv[]) {
  std::map<std::string, TestResult> tests;
  std::set<std::string> test_names;

  bool run_all = (argc == 1);

  if (!run_all) {
    for (int i = 1; i < argc; i++) {
      test_names.insert(argv[i]);
    }
  }

  ADD_TEST(test_complex_arithmetic);
  ADD_TEST(test_complex_properties);
  ADD_TEST(test_complex_polar);
  ADD_TEST(test_complex_small_division);
  ADD_TEST(test_vector_normalize);
  ADD_TEST(test_vector_checks);
  ADD_TEST(test_matrix_construction);
  ADD_TEST(test_matrix_inverse);
  ADD_TEST(test_tensor_product);
  ADD_TEST(test_commutators);
  ADD_TEST(test_gamma_matrices);
  ADD_TEST(test_dirac_spinor);
  ADD_TEST(test_fermionic_operators);
  ADD_TEST(test_bloch_sphere);
  ADD_TEST(test_spin_hamiltonian);

  return report_tests(tests);
}
