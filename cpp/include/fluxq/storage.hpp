// storage.hpp — Wavefunction amplitudes sampled on a 2-D phase grid

#pragma once

#include <Eigen/Dense>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <complex>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include "fluxq/grid.hpp"

namespace fluxq::storage {

// amplitudes(i, j) is the value at (axes[0][i], axes[1][j])
struct WaveFunctionOnGrid {
    grid::GridSpec gridspec;
    Eigen::MatrixXcd amplitudes;
    std::optional<double> energy;

    std::size_t rows() const noexcept { return static_cast<std::size_t>(amplitudes.rows()); }
    std::size_t cols() const noexcept { return static_cast<std::size_t>(amplitudes.cols()); }
};

// ------------------------------ Amplitude modes -----------------------------

enum class AmplitudeMode { Abs, AbsSqr, Real, Imag };

inline AmplitudeMode parse_amplitude_mode(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "abs") return AmplitudeMode::Abs;
    if (s == "abs_sqr") return AmplitudeMode::AbsSqr;
    if (s == "real") return AmplitudeMode::Real;
    if (s == "imag") return AmplitudeMode::Imag;
    throw std::invalid_argument("parse_amplitude_mode: unknown mode '" + s +
                                "' (use abs, abs_sqr, real or imag)");
}

inline const char* to_string(AmplitudeMode m) noexcept {
    switch (m) {
        case AmplitudeMode::Abs: return "abs";
        case AmplitudeMode::AbsSqr: return "abs_sqr";
        case AmplitudeMode::Real: return "real";
        case AmplitudeMode::Imag: return "imag";
    }
    return "abs";
}

inline Eigen::MatrixXd apply_amplitude_mode(const Eigen::MatrixXcd& a, AmplitudeMode m) {
    switch (m) {
        case AmplitudeMode::Abs: return a.cwiseAbs();
        case AmplitudeMode::AbsSqr: return a.cwiseAbs2();
        case AmplitudeMode::Real: return a.real();
        case AmplitudeMode::Imag: return a.imag();
    }
    return a.cwiseAbs();
}

// ------------------------------ Grid integrals ------------------------------

// Trapezoid weights for one axis (endpoints carry half weight)
inline Eigen::VectorXd trapezoid_weights(const grid::Grid1d& g) {
    const Eigen::Index n = static_cast<Eigen::Index>(g.pt_count);
    Eigen::VectorXd w = Eigen::VectorXd::Constant(n, g.grid_spacing());
    if (n >= 2) {
        w(0) *= 0.5;
        w(n - 1) *= 0.5;
    }
    return w;
}

// ∫∫ |ψ|² dφ1 dφ2 with trapezoid weights along both axes
inline double norm_squared(const WaveFunctionOnGrid& wf) {
    if (wf.gridspec.ndim() != 2) throw std::invalid_argument("norm_squared: expected a 2-D grid");
    const Eigen::VectorXd w1 = trapezoid_weights(wf.gridspec.axes[0]);
    const Eigen::VectorXd w2 = trapezoid_weights(wf.gridspec.axes[1]);
    if (w1.size() != wf.amplitudes.rows() || w2.size() != wf.amplitudes.cols()) {
        throw std::invalid_argument("norm_squared: grid/amplitude shape mismatch");
    }
    const Eigen::VectorXd row_sums = wf.amplitudes.cwiseAbs2() * w2;
    return w1.dot(row_sums);
}

} // namespace fluxq::storage
