#include <Eigen/Dense>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "fluxq/config.hpp"
#include "fluxq/flux_qubit.hpp"
#include "fluxq/io.hpp"
#include "fluxq/ops.hpp"
#include "fluxq/profile.hpp"
#include "fluxq/spectrum.hpp"
#include "fluxq/storage.hpp"
#include "fluxq/version.hpp"

namespace {

void print_usage(std::ostream& os) {
    os << "Usage: flux_qubit_driver [--config=PATH] [--version]\n"
          "Defaults: config=configs/flux_qubit_driver.yaml\n";
}

void print_params(std::ostream& os, const fluxq::flux_qubit::Params& p) {
    os << "EJ=(" << p.EJ1 << ", " << p.EJ2 << ", " << p.EJ3 << ")"
       << ", ECJ=(" << p.ECJ1 << ", " << p.ECJ2 << ", " << p.ECJ3 << ")"
       << ", ECg=(" << p.ECg1 << ", " << p.ECg2 << ")"
       << ", ng=(" << p.ng1 << ", " << p.ng2 << ")"
       << ", flux=" << p.flux << ", ncut=" << p.ncut << "\n";
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::string config_path = "configs/flux_qubit_driver.yaml";
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "--help" || arg == "-h") {
                print_usage(std::cout);
                return 0;
            }
            if (arg == "--version") {
                std::cout << "fluxq " << fluxq::version() << "\n";
                return 0;
            }
            if (arg.rfind("--config=", 0) == 0) {
                config_path = arg.substr(std::string("--config=").size());
            }
        }

        const fluxq::config::RunConfig cfg = fluxq::config::load_run_config_file(config_path);

#ifdef _OPENMP
        if (cfg.threads > 0) omp_set_num_threads(cfg.threads);
#endif

        fluxq::profile::Session prof(cfg.output.profile, std::cout);
        auto total = prof.section("Total");

        std::cout.setf(std::ios::fixed);
        std::cout << std::setprecision(9);
        std::cout << "flux_qubit_driver config: " << config_path << "\n";
#ifdef _OPENMP
        std::cout << "OpenMP: max_threads=" << omp_get_max_threads() << "\n";
#else
        std::cout << "OpenMP: disabled at build time\n";
#endif

        using fluxq::flux_qubit::FluxQubit;
        FluxQubit qubit(cfg.qubit);
        print_params(std::cout, qubit.params());
        std::cout << "hilbertdim=" << qubit.hilbertdim() << ", evals_count=" << cfg.evals_count << "\n";

        // ------------------------------- Hamiltonian ------------------------------
        Eigen::MatrixXcd H;
        {
            auto sec = prof.section("Build Hamiltonian");
            H = qubit.hamiltonian();
        }
        std::cout << "EC matrix:\n" << qubit.EC_matrix() << "\n";
        std::cout << "||H - H^dag||_max=" << fluxq::ops::max_abs_entry(H - H.adjoint()) << "\n";
        if (cfg.output.hamiltonian_csv) {
            fluxq::io::write_csv_matrix(*cfg.output.hamiltonian_csv, H);
            std::cout << "Wrote H to " << *cfg.output.hamiltonian_csv << "\n";
        }

        // -------------------------------- Spectrum --------------------------------
        fluxq::spectrum::SpectrumCache<FluxQubit> cache;
        Eigen::VectorXd evals;
        {
            auto sec = prof.section("Eigenvalues");
            evals = cache.eigenvals(qubit, cfg.evals_count);
        }
        std::cout << "evals:";
        for (Eigen::Index k = 0; k < evals.size(); ++k) std::cout << " " << evals(k);
        std::cout << "\n";
        if (evals.size() >= 2) std::cout << "E1-E0=" << evals(1) - evals(0) << "\n";
        if (cfg.output.evals_csv) {
            fluxq::io::write_csv_evals(*cfg.output.evals_csv, evals);
            std::cout << "Wrote evals to " << *cfg.output.evals_csv << "\n";
        }

        // ------------------------------- Wavefunction -----------------------------
        if (cfg.wavefunction) {
            fluxq::storage::WaveFunctionOnGrid wf;
            {
                auto sec = prof.section("Wavefunction");
                const int count = std::max(cfg.which + 1, std::min(3, qubit.hilbertdim()));
                const fluxq::spectrum::Eigensystem& esys = cache.eigensys(qubit, count);
                wf = qubit.wavefunction(esys, cfg.which, cfg.phi_grid);
            }
            std::cout << "wavefunction which=" << cfg.which
                      << ", grid=" << wf.rows() << "x" << wf.cols()
                      << ", norm=" << fluxq::storage::norm_squared(wf);
            if (wf.energy) std::cout << ", E=" << *wf.energy;
            std::cout << "\n";
            if (cfg.output.wavefunction_csv) {
                const Eigen::MatrixXd vals = fluxq::storage::apply_amplitude_mode(wf.amplitudes, cfg.output.mode);
                fluxq::io::write_csv_grid(*cfg.output.wavefunction_csv, cfg.phi_grid, vals);
                std::cout << "Wrote wavefunction (" << fluxq::storage::to_string(cfg.output.mode)
                          << ") to " << *cfg.output.wavefunction_csv << "\n";
            }
        }

        if (cfg.output.potential_csv) {
            auto sec = prof.section("Potential grid");
            fluxq::io::write_csv_grid(*cfg.output.potential_csv, cfg.phi_grid, qubit.potential_on_grid(cfg.phi_grid));
            std::cout << "Wrote potential to " << *cfg.output.potential_csv << "\n";
        }

        // ---------------------------------- Sweep ---------------------------------
        if (cfg.sweep) {
            const auto& sw = *cfg.sweep;
            Eigen::VectorXd vals = Eigen::VectorXd::Constant(1, sw.min_val);
            if (sw.points > 1) {
                vals = Eigen::VectorXd::LinSpaced(static_cast<Eigen::Index>(sw.points), sw.min_val, sw.max_val);
            }
            fluxq::spectrum::SpectrumData data;
            {
                auto sec = prof.section("Sweep " + sw.parameter);
                data = fluxq::spectrum::sweep_parameter(qubit, sw.parameter, vals, cfg.evals_count);
            }
            std::cout << "sweep " << sw.parameter << ": " << data.energy_table.rows() << " points\n";
            if (cfg.output.sweep_csv) {
                fluxq::io::write_csv_spectrum(*cfg.output.sweep_csv, data);
                std::cout << "Wrote sweep to " << *cfg.output.sweep_csv << "\n";
            } else {
                fluxq::io::write_csv_spectrum(std::cout, data);
            }
        }

        total.stop();
        prof.print_summary();
        std::cout << "spectrum cache: hits=" << cache.hits() << ", misses=" << cache.misses() << "\n";
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
