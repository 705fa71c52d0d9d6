// config.hpp — YAML run configuration for the flux qubit driver

#pragma once

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <optional>
#include <string>

#include "fluxq/flux_qubit.hpp"
#include "fluxq/grid.hpp"
#include "fluxq/storage.hpp"

namespace fluxq::config {

struct SweepConfig {
    std::string parameter{"flux"};
    double min_val{0.0};
    double max_val{1.0};
    std::size_t points{21};
};

struct OutputConfig {
    std::optional<std::string> evals_csv;
    std::optional<std::string> hamiltonian_csv;
    std::optional<std::string> wavefunction_csv;
    std::optional<std::string> potential_csv;
    std::optional<std::string> sweep_csv;
    storage::AmplitudeMode mode{storage::AmplitudeMode::AbsSqr};
    bool profile{false};
};

struct RunConfig {
    flux_qubit::Params qubit;
    int evals_count{6};
    bool wavefunction{false};
    int which{0};
    grid::Grid1d phi_grid{flux_qubit::default_phi_grid()};
    std::optional<SweepConfig> sweep;
    OutputConfig output;
    int threads{0};   // 0 => OpenMP default
};

// `qubit:` map. Required: EJ1..3, ECJ1..3, ECg1, ECg2, ng1, ng2, flux, ncut.
// Optional: truncated_dim.
flux_qubit::Params load_params(const YAML::Node& node);

// Whole document (qubit, spectrum, wavefunction, sweep, output, numerics)
RunConfig load_run_config(const YAML::Node& root);

RunConfig load_run_config_file(const std::string& path);

} // namespace fluxq::config
