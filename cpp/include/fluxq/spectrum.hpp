// spectrum.hpp — Dense Hermitian eigensolver, eigensystem canonicalization,
// spectrum cache and parameter sweeps for charge-basis models.

#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace fluxq::spectrum {

struct Eigensystem {
    Eigen::VectorXd evals;      // ascending
    Eigen::MatrixXcd evecs;     // eigenvectors as columns, paired with evals

    std::size_t size() const noexcept { return static_cast<std::size_t>(evals.size()); }
};

// ------------------------- Canonical ordering / phase -----------------------

// Stable ascending sort of evals; evecs columns follow their eigenvalue.
void order_eigensystem(Eigen::VectorXd& evals, Eigen::MatrixXcd& evecs);

// Phase of the largest-magnitude entry (first one in row-major order on ties)
double extract_phase(const Eigen::MatrixXcd& a);

// a * exp(-i * extract_phase(a)): largest entry becomes real and positive
Eigen::MatrixXcd standardize_phases(const Eigen::MatrixXcd& a);

// Column-wise standardize_phases
void standardize_columns(Eigen::MatrixXcd& evecs);

// ------------------------------ Diagonalization -----------------------------

// Lowest `count` eigenvalues of Hermitian H, ascending.
// Throws std::out_of_range unless 1 <= count <= dim, std::runtime_error if the solver fails.
Eigen::VectorXd eigenvalues(const Eigen::MatrixXcd& H, int count);

// Lowest `count` eigenpairs of Hermitian H, ordered and phase-standardized.
Eigensystem eigensystem(const Eigen::MatrixXcd& H, int count);

// <i|op|j> for the eigenvectors in esys
Eigen::MatrixXcd matrixelement_table(const Eigen::MatrixXcd& op, const Eigensystem& esys);

// ------------------------------ Spectrum cache ------------------------------

// Memoizes evals_calc / esys_calc of a model, keyed on a snapshot of its
// parameters and the requested count. Model must provide:
//   params_type params() const;   (equality comparable)
//   Eigen::VectorXd evals_calc(int) const;
//   Eigensystem esys_calc(int) const;
template<class Model>
class SpectrumCache {
  public:
    using params_type = typename Model::params_type;

    const Eigen::VectorXd& eigenvals(const Model& model, int count) {
        if (evals_ && evals_key_ && evals_key_->first == model.params() && evals_key_->second == count) {
            ++hits_;
            return *evals_;
        }
        ++misses_;
        evals_ = model.evals_calc(count);
        evals_key_ = std::make_pair(model.params(), count);
        return *evals_;
    }

    const Eigensystem& eigensys(const Model& model, int count) {
        if (esys_ && esys_key_ && esys_key_->first == model.params() && esys_key_->second == count) {
            ++hits_;
            return *esys_;
        }
        ++misses_;
        esys_ = model.esys_calc(count);
        esys_key_ = std::make_pair(model.params(), count);
        return *esys_;
    }

    void invalidate() noexcept {
        evals_.reset(); evals_key_.reset();
        esys_.reset(); esys_key_.reset();
    }

    std::size_t hits() const noexcept { return hits_; }
    std::size_t misses() const noexcept { return misses_; }

  private:
    std::optional<Eigen::VectorXd> evals_;
    std::optional<std::pair<params_type, int>> evals_key_;
    std::optional<Eigensystem> esys_;
    std::optional<std::pair<params_type, int>> esys_key_;
    std::size_t hits_{0};
    std::size_t misses_{0};
};

// ------------------------------ Parameter sweeps ----------------------------

struct SpectrumData {
    std::string param_name;
    Eigen::VectorXd param_vals;
    Eigen::MatrixXd energy_table;   // (#param_vals x evals_count)
};

// Lowest `count` eigenvalues of `model` with parameter `name` set to each of
// `values`. Points are independent copies of the model, evaluated in parallel
// when built with OpenMP. Model must provide set_parameter(name, value) and
// evals_calc(count); the input model is left untouched.
template<class Model>
SpectrumData sweep_parameter(const Model& model,
                             const std::string& name,
                             const Eigen::VectorXd& values,
                             int count)
{
    SpectrumData data;
    data.param_name = name;
    data.param_vals = values;
    if (values.size() == 0) {
        data.energy_table.resize(0, count > 0 ? count : 0);
        return data;
    }
    {
        // fail early on a bad name/count, outside the parallel region
        Model probe(model);
        probe.set_parameter(name, values(0));
        const Eigen::VectorXd first = probe.evals_calc(count);
        data.energy_table.resize(values.size(), first.size());
        data.energy_table.row(0) = first.transpose();
    }

    std::exception_ptr error;
    const Eigen::Index n = values.size();
#ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (Eigen::Index k = 1; k < n; ++k) {
        try {
            Model local(model);
            local.set_parameter(name, values(k));
            data.energy_table.row(k) = local.evals_calc(count).transpose();
        } catch (...) {
#ifdef _OPENMP
            #pragma omp critical(fluxq_sweep_error)
#endif
            {
                if (!error) error = std::current_exception();
            }
        }
    }
    if (error) std::rethrow_exception(error);
    return data;
}

} // namespace fluxq::spectrum
