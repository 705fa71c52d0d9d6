// flux_qubit.hpp — Three-junction flux qubit with both islands in the charge basis
//
//   H = (n_i - ng_i) 4 (E_C)_ij (n_j - ng_j)
//       - EJ1 cos φ1 - EJ2 cos φ2 - EJ3 cos(2π f + φ1 - φ2)
//
// Orlando et al., Phys. Rev. B 60, 15398 (1999). Junction energies and
// capacitances may differ (typically EJ1 = EJ2 = EJ, EJ3 = α EJ).

#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "fluxq/grid.hpp"
#include "fluxq/spectrum.hpp"
#include "fluxq/storage.hpp"

namespace fluxq::flux_qubit {

struct Params {
    double EJ1{1.0};
    double EJ2{1.0};
    double EJ3{1.0};
    double ECJ1{1.0};    // junction charging energies
    double ECJ2{1.0};
    double ECJ3{1.0};
    double ECg1{50.0};   // island-to-ground charging energies
    double ECg2{50.0};
    double ng1{0.0};     // offset charges
    double ng2{0.0};
    double flux{0.5};    // in units of the flux quantum
    int ncut{5};         // charges -ncut..ncut on each island
    std::optional<std::size_t> truncated_dim;

    bool operator==(const Params& o) const noexcept {
        return EJ1 == o.EJ1 && EJ2 == o.EJ2 && EJ3 == o.EJ3 &&
               ECJ1 == o.ECJ1 && ECJ2 == o.ECJ2 && ECJ3 == o.ECJ3 &&
               ECg1 == o.ECg1 && ECg2 == o.ECg2 &&
               ng1 == o.ng1 && ng2 == o.ng2 && flux == o.flux &&
               ncut == o.ncut && truncated_dim == o.truncated_dim;
    }
    bool operator!=(const Params& o) const noexcept { return !(*this == o); }
};

// Names accepted by FluxQubit::set_parameter, in declaration order
const std::vector<std::string>& parameter_names();

inline grid::Grid1d default_phi_grid() {
    constexpr double pi = 3.141592653589793238462643383279502884;
    return grid::Grid1d(-pi / 2.0, 3.0 * pi / 2.0, 100);
}

class FluxQubit {
  public:
    using Matrix = Eigen::MatrixXcd;
    using params_type = Params;
    // Called after every parameter assignment with the parameter name
    using Observer = std::function<void(const std::string&)>;

    explicit FluxQubit(const Params& p) : params_(p) {}

    // Copies take the parameters only; observers stay with the original.
    FluxQubit(const FluxQubit& other) : params_(other.params_), revision_(other.revision_) {}
    FluxQubit& operator=(const FluxQubit& other) {
        if (this != &other) {
            params_ = other.params_;
            ++revision_;
            notify("*");
        }
        return *this;
    }

    const Params& params() const noexcept { return params_; }
    std::uint64_t revision() const noexcept { return revision_; }

    // ------------------------------ Parameters ------------------------------

    void set_EJ1(double v)  { assign(params_.EJ1, v, "EJ1"); }
    void set_EJ2(double v)  { assign(params_.EJ2, v, "EJ2"); }
    void set_EJ3(double v)  { assign(params_.EJ3, v, "EJ3"); }
    void set_ECJ1(double v) { assign(params_.ECJ1, v, "ECJ1"); }
    void set_ECJ2(double v) { assign(params_.ECJ2, v, "ECJ2"); }
    void set_ECJ3(double v) { assign(params_.ECJ3, v, "ECJ3"); }
    void set_ECg1(double v) { assign(params_.ECg1, v, "ECg1"); }
    void set_ECg2(double v) { assign(params_.ECg2, v, "ECg2"); }
    void set_ng1(double v)  { assign(params_.ng1, v, "ng1"); }
    void set_ng2(double v)  { assign(params_.ng2, v, "ng2"); }
    void set_flux(double v) { assign(params_.flux, v, "flux"); }
    void set_ncut(int v)    { assign(params_.ncut, v, "ncut"); }
    void set_truncated_dim(std::optional<std::size_t> v) { assign(params_.truncated_dim, v, "truncated_dim"); }

    // Set by name (see parameter_names()); ncut is rounded to the nearest integer.
    // Throws std::out_of_range for an unknown name.
    void set_parameter(const std::string& name, double value);
    double get_parameter(const std::string& name) const;

    std::size_t add_observer(Observer obs);
    void remove_observer(std::size_t id);

    // ------------------------------ Hamiltonian -----------------------------

    int hilbertdim() const;

    // Effective charging-energy matrix E_C = C^{-1} / 2
    Eigen::Matrix2d EC_matrix() const;

    Matrix kineticmat() const;
    Matrix potentialmat() const;
    Matrix hamiltonian() const;

    // ------------------------------ Operators -------------------------------

    Matrix n_1_operator() const;
    Matrix n_2_operator() const;
    Matrix exp_i_phi_1_operator() const;
    Matrix exp_i_phi_2_operator() const;
    Matrix cos_phi_1_operator() const;
    Matrix cos_phi_2_operator() const;
    Matrix sin_phi_1_operator() const;
    Matrix sin_phi_2_operator() const;

    // ------------------------------ Spectrum --------------------------------

    Eigen::VectorXd evals_calc(int count) const;
    spectrum::Eigensystem esys_calc(int count) const;

    // truncated_dim when set, otherwise 6
    int default_evals_count() const noexcept;

    // ------------------------- Potential / wavefunctions ---------------------

    // Potential energy at (phi1, phi2), constants dropped
    double potential(double phi1, double phi2) const;

    // potential on phi_grid x phi_grid (rows = phi1, cols = phi2)
    Eigen::MatrixXd potential_on_grid(const grid::Grid1d& phi_grid) const;

    // Eigenstate `which` (ascending energy) on phi_grid x phi_grid.
    // Computes max(which + 1, 3) eigenstates.
    storage::WaveFunctionOnGrid wavefunction(int which = 0,
                                             const grid::Grid1d& phi_grid = default_phi_grid()) const;

    // Same, for column `which` of a previously computed eigensystem
    storage::WaveFunctionOnGrid wavefunction(const spectrum::Eigensystem& esys,
                                             int which,
                                             const grid::Grid1d& phi_grid = default_phi_grid()) const;

  private:
    template<class T>
    void assign(T& field, const T& value, const char* name) {
        field = value;
        ++revision_;
        notify(name);
    }

    void notify(const std::string& name) const;

    Params params_;
    std::uint64_t revision_{0};
    std::vector<std::pair<std::size_t, Observer>> observers_;
    std::size_t next_observer_id_{0};
};

} // namespace fluxq::flux_qubit
