// spectrum.cpp — Dense Hermitian diagonalization and eigensystem canonicalization

#include "fluxq/spectrum.hpp"

#include <Eigen/Eigenvalues>

#include <algorithm>
#include <cmath>
#include <complex>
#include <numeric>
#include <string>
#include <vector>

namespace fluxq::spectrum {

namespace {

using Matrix = Eigen::MatrixXcd;

void check_count(const Matrix& H, int count, const char* who) {
    if (H.rows() != H.cols()) {
        throw std::invalid_argument(std::string(who) + ": Hamiltonian must be square");
    }
    if (count <= 0 || static_cast<Eigen::Index>(count) > H.rows()) {
        throw std::out_of_range(std::string(who) + ": requested " + std::to_string(count) +
                                " eigenvalues, Hilbert space dimension is " +
                                std::to_string(H.rows()));
    }
}

// Both public entry points go through here so eigenvalues() and
// eigensystem() see the same tridiagonalization and QR sweep.
void solve(const Matrix& H, bool vectors, Eigen::SelfAdjointEigenSolver<Matrix>& es, const char* who) {
    es.compute(H, vectors ? Eigen::ComputeEigenvectors : Eigen::EigenvaluesOnly);
    if (es.info() != Eigen::Success) {
        throw std::runtime_error(std::string(who) + ": eigen decomposition failed");
    }
}

} // namespace

void order_eigensystem(Eigen::VectorXd& evals, Eigen::MatrixXcd& evecs) {
    if (evecs.cols() != evals.size()) {
        throw std::invalid_argument("order_eigensystem: evals/evecs size mismatch");
    }
    std::vector<Eigen::Index> idx(static_cast<std::size_t>(evals.size()));
    std::iota(idx.begin(), idx.end(), Eigen::Index{0});
    std::stable_sort(idx.begin(), idx.end(),
                     [&](Eigen::Index a, Eigen::Index b) { return evals(a) < evals(b); });

    Eigen::VectorXd sorted_evals(evals.size());
    Eigen::MatrixXcd sorted_evecs(evecs.rows(), evecs.cols());
    for (std::size_t k = 0; k < idx.size(); ++k) {
        const Eigen::Index src = idx[k];
        const Eigen::Index dst = static_cast<Eigen::Index>(k);
        sorted_evals(dst) = evals(src);
        sorted_evecs.col(dst) = evecs.col(src);
    }
    evals = std::move(sorted_evals);
    evecs = std::move(sorted_evecs);
}

double extract_phase(const Eigen::MatrixXcd& a) {
    if (a.size() == 0) return 0.0;
    Eigen::Index best_r = 0, best_c = 0;
    double best = -1.0;
    for (Eigen::Index r = 0; r < a.rows(); ++r) {
        for (Eigen::Index c = 0; c < a.cols(); ++c) {
            const double m = std::abs(a(r, c));
            if (m > best) {
                best = m;
                best_r = r;
                best_c = c;
            }
        }
    }
    return std::arg(a(best_r, best_c));
}

Eigen::MatrixXcd standardize_phases(const Eigen::MatrixXcd& a) {
    const double phase = extract_phase(a);
    return a * std::polar(1.0, -phase);
}

void standardize_columns(Eigen::MatrixXcd& evecs) {
    for (Eigen::Index j = 0; j < evecs.cols(); ++j) {
        const Eigen::MatrixXcd col = evecs.col(j);
        evecs.col(j) = standardize_phases(col);
    }
}

Eigen::VectorXd eigenvalues(const Eigen::MatrixXcd& H, int count) {
    check_count(H, count, "eigenvalues");
    Eigen::SelfAdjointEigenSolver<Matrix> es;
    solve(H, /*vectors=*/false, es, "eigenvalues");
    Eigen::VectorXd evals = es.eigenvalues().head(count);
    std::sort(evals.data(), evals.data() + evals.size());
    return evals;
}

Eigensystem eigensystem(const Eigen::MatrixXcd& H, int count) {
    check_count(H, count, "eigensystem");
    Eigen::SelfAdjointEigenSolver<Matrix> es;
    solve(H, /*vectors=*/true, es, "eigensystem");
    Eigensystem out;
    out.evals = es.eigenvalues().head(count);
    out.evecs = es.eigenvectors().leftCols(count);
    order_eigensystem(out.evals, out.evecs);
    standardize_columns(out.evecs);
    return out;
}

Eigen::MatrixXcd matrixelement_table(const Eigen::MatrixXcd& op, const Eigensystem& esys) {
    if (op.rows() != op.cols() || op.rows() != esys.evecs.rows()) {
        throw std::invalid_argument("matrixelement_table: operator/eigenvector dimension mismatch");
    }
    return esys.evecs.adjoint() * op * esys.evecs;
}

} // namespace fluxq::spectrum
