// ops.hpp — Charge-basis single-mode operators, the two-mode Kronecker composer, checks

#pragma once

#include <Eigen/Dense>
#include <unsupported/Eigen/KroneckerProduct>

#include <complex>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace fluxq::ops {

using Matrix = Eigen::MatrixXcd;
using Vector = Eigen::VectorXcd;

// --------------------------- Truncated charge basis -------------------------

// Basis size for charges n = -ncut, ..., +ncut
inline Eigen::Index charge_dim(int ncut) {
    if (ncut < 0) throw std::invalid_argument("charge_dim: ncut must be >= 0");
    return static_cast<Eigen::Index>(2 * ncut + 1);
}

// Charge values -ncut..+ncut in basis order
inline Eigen::VectorXd charge_values(int ncut) {
    const Eigen::Index d = charge_dim(ncut);
    Eigen::VectorXd n(d);
    for (Eigen::Index k = 0; k < d; ++k) n(k) = static_cast<double>(k - ncut);
    return n;
}

// Charge number operator: diag(-ncut, ..., +ncut)
inline Matrix number_operator(int ncut) {
    const Eigen::Index d = charge_dim(ncut);
    Matrix M(d, d); M.setZero();
    for (Eigen::Index k = 0; k < d; ++k) {
        M(k, k) = static_cast<double>(k - ncut);
    }
    return M;
}

// e^{iφ}: ones on the first superdiagonal, <n|e^{iφ}|n+1> = 1.
// The transpose is e^{-iφ}.
inline Matrix exp_i_phi_operator(int ncut) {
    const Eigen::Index d = charge_dim(ncut);
    Matrix M(d, d); M.setZero();
    for (Eigen::Index k = 0; k + 1 < d; ++k) {
        M(k, k + 1) = 1.0;
    }
    return M;
}

inline Matrix identity(int ncut) {
    const Eigen::Index d = charge_dim(ncut);
    return Matrix::Identity(d, d);
}

// --------------------------- Kronecker helpers ------------------------------

inline Matrix kron(const Matrix& A, const Matrix& B) {
    const auto expr = Eigen::kroneckerProduct(A, B);
    Matrix K(expr.rows(), expr.cols());
    K = expr;
    return K;
}

// Two-mode operator (mode 1) ⊗ (mode 2). Mode 1 is the slow index of the
// composite basis: state (i1, i2) sits at i1 * d + i2. Every composite
// operator of the model goes through here.
inline Matrix compose_modes(const Matrix& mode1, const Matrix& mode2) {
    if (mode1.rows() != mode1.cols() || mode2.rows() != mode2.cols()) {
        throw std::invalid_argument("compose_modes: single-mode operators must be square");
    }
    if (mode1.rows() != mode2.rows()) {
        throw std::invalid_argument("compose_modes: dimension mismatch (" +
                                    std::to_string(mode1.rows()) + " vs " +
                                    std::to_string(mode2.rows()) + ")");
    }
    return kron(mode1, mode2);
}

// Composite flat index of the charge pair (i1, i2), both in basis order
inline Eigen::Index composite_index(Eigen::Index i1, Eigen::Index i2, Eigen::Index d) {
    if (i1 < 0 || i2 < 0 || i1 >= d || i2 >= d) {
        throw std::out_of_range("composite_index: index out of range");
    }
    return i1 * d + i2;
}

// Reshape a composite state of length d*d into a d x d amplitude matrix
// (row = mode-1 charge index, col = mode-2 charge index).
inline Matrix unflatten_modes(const Vector& psi, Eigen::Index d) {
    if (psi.size() != d * d) throw std::invalid_argument("unflatten_modes: size mismatch");
    Matrix C(d, d);
    for (Eigen::Index i1 = 0; i1 < d; ++i1) {
        for (Eigen::Index i2 = 0; i2 < d; ++i2) {
            C(i1, i2) = psi(i1 * d + i2);
        }
    }
    return C;
}

// --------------------------- Algebraic helpers ------------------------------

inline Matrix comm(const Matrix& A, const Matrix& B) { return A*B - B*A; }

// --------------------------- Validity checks --------------------------------

inline bool is_hermitian(const Matrix& A, double tol = 1e-12) {
    if (A.rows() != A.cols()) return false;
    if (A.size() == 0) return true;
    return (A - A.adjoint()).cwiseAbs().maxCoeff() <= tol;
}

inline double max_abs_entry(const Matrix& A) {
    if (A.size() == 0) return 0.0;
    return A.cwiseAbs().maxCoeff();
}

} // namespace fluxq::ops
