// config.cpp — YAML parsing for flux qubit runs

#include "fluxq/config.hpp"

#include <stdexcept>
#include <string>

namespace fluxq::config {

namespace {

template<class T>
T read_required(const YAML::Node& parent, const std::string& key, const std::string& path) {
    const YAML::Node n = parent[key];
    if (!n) throw std::runtime_error("Missing key: " + path + "." + key);
    try {
        return n.as<T>();
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Invalid value for " + path + "." + key + ": " + ex.what());
    }
}

template<class T>
T read_optional(const YAML::Node& parent, const std::string& key, const std::string& path, T fallback) {
    if (!parent) return fallback;
    const YAML::Node n = parent[key];
    if (!n) return fallback;
    try {
        return n.as<T>();
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Invalid value for " + path + "." + key + ": " + ex.what());
    }
}

std::optional<std::string> read_path(const YAML::Node& out, const std::string& key) {
    if (!out || !out[key]) return std::nullopt;
    return read_required<std::string>(out, key, "output");
}

grid::Grid1d parse_grid(const YAML::Node& n, const std::string& path) {
    const grid::Grid1d fallback = flux_qubit::default_phi_grid();
    if (!n) return fallback;
    if (!n.IsMap()) throw std::runtime_error(path + " must be a map with keys {min, max, points}");
    const double lo = read_optional<double>(n, "min", path, fallback.min_val);
    const double hi = read_optional<double>(n, "max", path, fallback.max_val);
    const auto pts = read_optional<std::size_t>(n, "points", path, fallback.pt_count);
    try {
        return grid::Grid1d(lo, hi, pts);
    } catch (const std::invalid_argument& ex) {
        throw std::runtime_error(path + ": " + ex.what());
    }
}

} // namespace

flux_qubit::Params load_params(const YAML::Node& node) {
    if (!node) throw std::runtime_error("Missing key: qubit");
    if (!node.IsMap()) throw std::runtime_error("qubit must be a map of parameter values");
    const std::string path = "qubit";

    flux_qubit::Params p;
    p.EJ1 = read_required<double>(node, "EJ1", path);
    p.EJ2 = read_required<double>(node, "EJ2", path);
    p.EJ3 = read_required<double>(node, "EJ3", path);
    p.ECJ1 = read_required<double>(node, "ECJ1", path);
    p.ECJ2 = read_required<double>(node, "ECJ2", path);
    p.ECJ3 = read_required<double>(node, "ECJ3", path);
    p.ECg1 = read_required<double>(node, "ECg1", path);
    p.ECg2 = read_required<double>(node, "ECg2", path);
    p.ng1 = read_required<double>(node, "ng1", path);
    p.ng2 = read_required<double>(node, "ng2", path);
    p.flux = read_required<double>(node, "flux", path);

    const long long ncut = read_required<long long>(node, "ncut", path);
    if (ncut < 0) throw std::runtime_error("qubit.ncut must be >= 0");
    p.ncut = static_cast<int>(ncut);

    if (node["truncated_dim"]) {
        const long long td = read_required<long long>(node, "truncated_dim", path);
        if (td <= 0) throw std::runtime_error("qubit.truncated_dim must be >= 1");
        p.truncated_dim = static_cast<std::size_t>(td);
    }
    return p;
}

RunConfig load_run_config(const YAML::Node& root) {
    if (!root || !root.IsMap()) throw std::runtime_error("Configuration root must be a map");

    RunConfig cfg;
    cfg.qubit = load_params(root["qubit"]);

    const YAML::Node sp = root["spectrum"];
    const int default_count = cfg.qubit.truncated_dim ? static_cast<int>(*cfg.qubit.truncated_dim) : 6;
    cfg.evals_count = read_optional<int>(sp, "evals_count", "spectrum", default_count);
    if (cfg.evals_count <= 0) throw std::runtime_error("spectrum.evals_count must be >= 1");

    if (const YAML::Node wf = root["wavefunction"]) {
        cfg.wavefunction = read_optional<bool>(wf, "enabled", "wavefunction", true);
        cfg.which = read_optional<int>(wf, "which", "wavefunction", 0);
        if (cfg.which < 0) throw std::runtime_error("wavefunction.which must be >= 0");
        cfg.phi_grid = parse_grid(wf["grid"], "wavefunction.grid");
    }

    if (const YAML::Node sw = root["sweep"]) {
        SweepConfig s;
        s.parameter = read_required<std::string>(sw, "parameter", "sweep");
        s.min_val = read_required<double>(sw, "min", "sweep");
        s.max_val = read_required<double>(sw, "max", "sweep");
        s.points = read_optional<std::size_t>(sw, "points", "sweep", s.points);
        if (s.points == 0) throw std::runtime_error("sweep.points must be >= 1");
        bool known = false;
        for (const auto& name : flux_qubit::parameter_names()) known = known || (name == s.parameter);
        if (!known) throw std::runtime_error("sweep.parameter: unknown parameter '" + s.parameter + "'");
        cfg.sweep = s;
    }

    const YAML::Node out = root["output"];
    cfg.output.evals_csv = read_path(out, "evals_csv");
    cfg.output.hamiltonian_csv = read_path(out, "hamiltonian_csv");
    cfg.output.wavefunction_csv = read_path(out, "wavefunction_csv");
    cfg.output.potential_csv = read_path(out, "potential_csv");
    cfg.output.sweep_csv = read_path(out, "sweep_csv");
    cfg.output.profile = read_optional<bool>(out, "profile", "output", false);
    if (out && out["mode"]) {
        try {
            cfg.output.mode = storage::parse_amplitude_mode(read_required<std::string>(out, "mode", "output"));
        } catch (const std::invalid_argument& ex) {
            throw std::runtime_error(std::string("output.mode: ") + ex.what());
        }
    }

    cfg.threads = read_optional<int>(root["numerics"], "threads", "numerics", 0);
    return cfg;
}

RunConfig load_run_config_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Failed to open configuration file: " + path);
    } catch (const YAML::ParserException& ex) {
        throw std::runtime_error("Failed to parse " + path + ": " + ex.what());
    }
    return load_run_config(root);
}

} // namespace fluxq::config
