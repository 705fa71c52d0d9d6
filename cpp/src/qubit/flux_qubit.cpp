// flux_qubit.cpp — Charge-basis Hamiltonian, operators and phase-basis projection

#include "fluxq/flux_qubit.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>

#include "fluxq/ops.hpp"

namespace fluxq::flux_qubit {

using Matrix = Eigen::MatrixXcd;
using cd = std::complex<double>;

namespace {

constexpr double kPi = 3.141592653589793238462643383279502884;

// Reduced to [0, 1) so that flux and flux + n give the same phase factor
inline double reduced_flux(double flux) {
    return flux - std::floor(flux);
}

} // namespace

const std::vector<std::string>& parameter_names() {
    static const std::vector<std::string> names = {
        "EJ1", "EJ2", "EJ3", "ECJ1", "ECJ2", "ECJ3",
        "ECg1", "ECg2", "ng1", "ng2", "flux", "ncut"};
    return names;
}

// --------------------------------- Parameters --------------------------------

void FluxQubit::set_parameter(const std::string& name, double value) {
    if (name == "EJ1") set_EJ1(value);
    else if (name == "EJ2") set_EJ2(value);
    else if (name == "EJ3") set_EJ3(value);
    else if (name == "ECJ1") set_ECJ1(value);
    else if (name == "ECJ2") set_ECJ2(value);
    else if (name == "ECJ3") set_ECJ3(value);
    else if (name == "ECg1") set_ECg1(value);
    else if (name == "ECg2") set_ECg2(value);
    else if (name == "ng1") set_ng1(value);
    else if (name == "ng2") set_ng2(value);
    else if (name == "flux") set_flux(value);
    else if (name == "ncut") set_ncut(static_cast<int>(std::lround(value)));
    else throw std::out_of_range("FluxQubit::set_parameter: unknown parameter '" + name + "'");
}

double FluxQubit::get_parameter(const std::string& name) const {
    if (name == "EJ1") return params_.EJ1;
    if (name == "EJ2") return params_.EJ2;
    if (name == "EJ3") return params_.EJ3;
    if (name == "ECJ1") return params_.ECJ1;
    if (name == "ECJ2") return params_.ECJ2;
    if (name == "ECJ3") return params_.ECJ3;
    if (name == "ECg1") return params_.ECg1;
    if (name == "ECg2") return params_.ECg2;
    if (name == "ng1") return params_.ng1;
    if (name == "ng2") return params_.ng2;
    if (name == "flux") return params_.flux;
    if (name == "ncut") return static_cast<double>(params_.ncut);
    throw std::out_of_range("FluxQubit::get_parameter: unknown parameter '" + name + "'");
}

std::size_t FluxQubit::add_observer(Observer obs) {
    if (!obs) throw std::invalid_argument("FluxQubit::add_observer: empty observer");
    const std::size_t id = next_observer_id_++;
    observers_.emplace_back(id, std::move(obs));
    return id;
}

void FluxQubit::remove_observer(std::size_t id) {
    observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     observers_.end());
}

void FluxQubit::notify(const std::string& name) const {
    for (const auto& entry : observers_) entry.second(name);
}

// --------------------------------- Hamiltonian -------------------------------

int FluxQubit::hilbertdim() const {
    const auto d = ops::charge_dim(params_.ncut);
    return static_cast<int>(d * d);
}

Eigen::Matrix2d FluxQubit::EC_matrix() const {
    // capacitances in units where e = 1
    const double CJ1 = 1.0 / (2.0 * params_.ECJ1);
    const double CJ2 = 1.0 / (2.0 * params_.ECJ2);
    const double CJ3 = 1.0 / (2.0 * params_.ECJ3);
    const double Cg1 = 1.0 / (2.0 * params_.ECg1);
    const double Cg2 = 1.0 / (2.0 * params_.ECg2);

    Eigen::Matrix2d Cmat;
    Cmat << CJ1 + CJ3 + Cg1, -CJ3,
            -CJ3,            CJ2 + CJ3 + Cg2;
    return Cmat.inverse() / 2.0;
}

Matrix FluxQubit::kineticmat() const {
    const Eigen::Matrix2d EC = EC_matrix();
    const Matrix n = ops::number_operator(params_.ncut);
    const Matrix I = ops::identity(params_.ncut);
    const Matrix dn1 = n - params_.ng1 * I;
    const Matrix dn2 = n - params_.ng2 * I;

    Matrix K = 4.0 * EC(0, 0) * ops::compose_modes(dn1 * dn1, I);
    K.noalias() += 4.0 * EC(1, 1) * ops::compose_modes(I, dn2 * dn2);
    K.noalias() += 4.0 * (EC(0, 1) + EC(1, 0)) * ops::compose_modes(dn1, dn2);
    return K;
}

Matrix FluxQubit::potentialmat() const {
    const Matrix E = ops::exp_i_phi_operator(params_.ncut);
    const Matrix Et = E.transpose();
    const Matrix I = ops::identity(params_.ncut);
    const cd phase = std::polar(1.0, 2.0 * kPi * reduced_flux(params_.flux));

    Matrix V = -0.5 * params_.EJ1 * ops::compose_modes(E + Et, I);
    V.noalias() += -0.5 * params_.EJ2 * ops::compose_modes(I, E + Et);
    // EJ3 junction: cos(2πf + φ1 - φ2) couples e^{iφ1} e^{-iφ2} and its conjugate
    V.noalias() += (-0.5 * params_.EJ3 * phase) * ops::compose_modes(E, Et);
    V.noalias() += (-0.5 * params_.EJ3 * std::conj(phase)) * ops::compose_modes(Et, E);
    return V;
}

Matrix FluxQubit::hamiltonian() const {
    return kineticmat() + potentialmat();
}

// --------------------------------- Operators ---------------------------------

Matrix FluxQubit::n_1_operator() const {
    return ops::compose_modes(ops::number_operator(params_.ncut), ops::identity(params_.ncut));
}

Matrix FluxQubit::n_2_operator() const {
    return ops::compose_modes(ops::identity(params_.ncut), ops::number_operator(params_.ncut));
}

Matrix FluxQubit::exp_i_phi_1_operator() const {
    return ops::compose_modes(ops::exp_i_phi_operator(params_.ncut), ops::identity(params_.ncut));
}

Matrix FluxQubit::exp_i_phi_2_operator() const {
    return ops::compose_modes(ops::identity(params_.ncut), ops::exp_i_phi_operator(params_.ncut));
}

Matrix FluxQubit::cos_phi_1_operator() const {
    const Matrix half = 0.5 * exp_i_phi_1_operator();
    return half + half.adjoint();
}

Matrix FluxQubit::cos_phi_2_operator() const {
    const Matrix half = 0.5 * exp_i_phi_2_operator();
    return half + half.adjoint();
}

Matrix FluxQubit::sin_phi_1_operator() const {
    const Matrix half = cd(0.0, -0.5) * exp_i_phi_1_operator();
    return half + half.adjoint();
}

Matrix FluxQubit::sin_phi_2_operator() const {
    const Matrix half = cd(0.0, -0.5) * exp_i_phi_2_operator();
    return half + half.adjoint();
}

// --------------------------------- Spectrum ----------------------------------

Eigen::VectorXd FluxQubit::evals_calc(int count) const {
    return spectrum::eigenvalues(hamiltonian(), count);
}

spectrum::Eigensystem FluxQubit::esys_calc(int count) const {
    return spectrum::eigensystem(hamiltonian(), count);
}

int FluxQubit::default_evals_count() const noexcept {
    if (params_.truncated_dim) return static_cast<int>(*params_.truncated_dim);
    return 6;
}

// ------------------------- Potential / wavefunctions -------------------------

double FluxQubit::potential(double phi1, double phi2) const {
    return -params_.EJ1 * std::cos(phi1) - params_.EJ2 * std::cos(phi2)
           - params_.EJ3 * std::cos(2.0 * kPi * params_.flux + phi1 - phi2);
}

Eigen::MatrixXd FluxQubit::potential_on_grid(const grid::Grid1d& phi_grid) const {
    const Eigen::VectorXd phi = phi_grid.make_linspace();
    Eigen::MatrixXd U(phi.size(), phi.size());
    for (Eigen::Index i = 0; i < phi.size(); ++i) {
        for (Eigen::Index j = 0; j < phi.size(); ++j) {
            U(i, j) = potential(phi(i), phi(j));
        }
    }
    return U;
}

storage::WaveFunctionOnGrid FluxQubit::wavefunction(int which, const grid::Grid1d& phi_grid) const {
    if (which < 0) throw std::out_of_range("FluxQubit::wavefunction: which must be >= 0");
    const int count = std::max(which + 1, std::min(3, hilbertdim()));
    return wavefunction(esys_calc(count), which, phi_grid);
}

storage::WaveFunctionOnGrid FluxQubit::wavefunction(const spectrum::Eigensystem& esys,
                                                    int which,
                                                    const grid::Grid1d& phi_grid) const {
    if (which < 0 || static_cast<Eigen::Index>(which) >= esys.evecs.cols()) {
        throw std::out_of_range("FluxQubit::wavefunction: state " + std::to_string(which) +
                                " not in eigensystem of size " + std::to_string(esys.evecs.cols()));
    }
    const Eigen::Index d = ops::charge_dim(params_.ncut);
    if (esys.evecs.rows() != d * d) {
        throw std::invalid_argument("FluxQubit::wavefunction: eigenvector length does not match ncut");
    }

    // row = mode-1 charge, col = mode-2 charge
    const Matrix amplitudes = ops::unflatten_modes(esys.evecs.col(which), d);

    const Eigen::VectorXd phi = phi_grid.make_linspace();
    const Eigen::VectorXd n = ops::charge_values(params_.ncut);
    const double norm = 1.0 / std::sqrt(2.0 * kPi);
    Matrix a_phi(phi.size(), d);   // <φ|n> = e^{inφ} / sqrt(2π)
    for (Eigen::Index p = 0; p < phi.size(); ++p) {
        for (Eigen::Index k = 0; k < d; ++k) {
            a_phi(p, k) = std::polar(norm, n(k) * phi(p));
        }
    }

    storage::WaveFunctionOnGrid wf;
    wf.gridspec = grid::GridSpec::square(phi_grid);
    wf.amplitudes = spectrum::standardize_phases(a_phi * amplitudes * a_phi.transpose());
    if (static_cast<Eigen::Index>(which) < esys.evals.size()) wf.energy = esys.evals(which);
    return wf;
}

} // namespace fluxq::flux_qubit
