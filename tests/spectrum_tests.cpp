#include <algorithm>
#include <cmath>
#include <complex>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "fluxq/flux_qubit.hpp"
#include "fluxq/spectrum.hpp"

using cd = std::complex<double>;
using fluxq::flux_qubit::FluxQubit;
using fluxq::flux_qubit::Params;

static int fails = 0;

static void report(bool ok, const std::string& name, const std::string& detail = "") {
    if (ok) {
        std::cout << "ok   " << name << (detail.empty() ? "" : " (" + detail + ")") << "\n";
    } else {
        std::cerr << "FAIL " << name << (detail.empty() ? "" : ": " + detail) << "\n";
        ++fails;
    }
}

static void check_close(const std::string& name, double got, double expect, double tol) {
    const double e = std::abs(got - expect);
    std::ostringstream d;
    d.precision(3);
    d << std::scientific << "got=" << got << " expect=" << expect << " err=" << e;
    report(e <= tol && std::isfinite(got), name, d.str());
}

template<class Exception, class Fn>
static void check_throws(const std::string& name, Fn&& fn) {
    try {
        fn();
    } catch (const Exception&) {
        report(true, name);
        return;
    } catch (const std::exception& ex) {
        report(false, name, std::string("wrong exception: ") + ex.what());
        return;
    }
    report(false, name, "no exception");
}

// Largest-magnitude entry (up to rounding) is real and positive
static bool phase_standardized(const Eigen::MatrixXcd& a) {
    const double maxabs = a.cwiseAbs().maxCoeff();
    for (Eigen::Index r = 0; r < a.rows(); ++r)
        for (Eigen::Index c = 0; c < a.cols(); ++c) {
            const cd z = a(r, c);
            if (std::abs(z) >= maxabs * (1.0 - 1e-12) && z.real() > 0.0 && std::abs(z.imag()) <= 1e-12 * maxabs)
                return true;
        }
    return false;
}

static Params small_params() {
    Params p;
    p.EJ1 = 3.0; p.EJ2 = 2.5; p.EJ3 = 1.5;
    p.ECJ1 = 1.0; p.ECJ2 = 0.8; p.ECJ3 = 1.2;
    p.ECg1 = 30.0; p.ECg2 = 45.0;
    p.ng1 = 0.1; p.ng2 = -0.2;
    p.flux = 0.45;
    p.ncut = 3;
    return p;
}

static void test_ordering_and_phases() {
    Eigen::VectorXd evals(4);
    evals << 3.0, 1.0, 2.0, 1.0;
    Eigen::MatrixXcd evecs = Eigen::MatrixXcd::Identity(4, 4);
    fluxq::spectrum::order_eigensystem(evals, evecs);
    Eigen::VectorXd expect_evals(4);
    expect_evals << 1.0, 1.0, 2.0, 3.0;
    check_close("order_eigensystem sorts evals", (evals - expect_evals).cwiseAbs().maxCoeff(), 0.0, 0.0);
    // stable: the two 1.0 entries keep their original order (cols 1 then 3)
    const bool paired = evecs(1, 0) == cd(1.0, 0.0) && evecs(3, 1) == cd(1.0, 0.0) &&
                        evecs(2, 2) == cd(1.0, 0.0) && evecs(0, 3) == cd(1.0, 0.0);
    report(paired, "order_eigensystem keeps eigenvector pairing (stable)");

    Eigen::MatrixXcd bad(4, 3);
    bad.setZero();
    check_throws<std::invalid_argument>("order_eigensystem size mismatch", [&] {
        fluxq::spectrum::order_eigensystem(evals, bad);
    });

    Eigen::MatrixXcd v(3, 1);
    v << cd(0.1, 0.0), std::polar(2.0, 1.2), cd(0.0, -0.5);
    check_close("extract_phase picks the largest entry", fluxq::spectrum::extract_phase(v), 1.2, 1e-14);
    const Eigen::MatrixXcd s = fluxq::spectrum::standardize_phases(v);
    check_close("standardize_phases: largest entry real", s(1, 0).imag(), 0.0, 1e-14);
    check_close("standardize_phases: largest entry positive", s(1, 0).real(), 2.0, 1e-14);
    check_close("standardize_phases preserves magnitudes", (s.cwiseAbs() - v.cwiseAbs()).cwiseAbs().maxCoeff(), 0.0, 1e-15);

    // ties resolve to the first entry in row-major order
    Eigen::MatrixXcd t(2, 2);
    t << cd(0.0, 1.0), cd(-1.0, 0.0),
         cd(0.5, 0.0), cd(0.0, 0.0);
    check_close("extract_phase tie -> first in row-major order", fluxq::spectrum::extract_phase(t), std::arg(cd(0.0, 1.0)), 0.0);
    check_close("extract_phase of empty matrix", fluxq::spectrum::extract_phase(Eigen::MatrixXcd(0, 0)), 0.0, 0.0);
}

static void test_dense_solver() {
    Eigen::MatrixXcd D = Eigen::MatrixXcd::Zero(4, 4);
    D.diagonal() << cd(2.0, 0.0), cd(-1.0, 0.0), cd(5.0, 0.0), cd(0.5, 0.0);
    const Eigen::VectorXd ev = fluxq::spectrum::eigenvalues(D, 3);
    Eigen::VectorXd expect(3);
    expect << -1.0, 0.5, 2.0;
    check_close("eigenvalues of a diagonal matrix", (ev - expect).cwiseAbs().maxCoeff(), 0.0, 1e-14);

    // σ_y: eigenvalues ±1 with complex eigenvectors
    Eigen::MatrixXcd sy(2, 2);
    sy << cd(0.0, 0.0), cd(0.0, -1.0),
          cd(0.0, 1.0), cd(0.0, 0.0);
    const fluxq::spectrum::Eigensystem es = fluxq::spectrum::eigensystem(sy, 2);
    check_close("sigma_y E0", es.evals(0), -1.0, 1e-14);
    check_close("sigma_y E1", es.evals(1), 1.0, 1e-14);
    const Eigen::MatrixXcd resid = sy * es.evecs - es.evecs * es.evals.cast<cd>().asDiagonal();
    check_close("sigma_y residual", resid.cwiseAbs().maxCoeff(), 0.0, 1e-14);
    report(es.size() == 2, "Eigensystem::size");

    check_throws<std::out_of_range>("eigenvalues count 0", [&] { (void)fluxq::spectrum::eigenvalues(D, 0); });
    check_throws<std::out_of_range>("eigenvalues count > dim", [&] { (void)fluxq::spectrum::eigenvalues(D, 5); });
    check_throws<std::out_of_range>("eigensystem count > dim", [&] { (void)fluxq::spectrum::eigensystem(sy, 3); });
    check_throws<std::invalid_argument>("eigenvalues rejects non-square H", [] {
        (void)fluxq::spectrum::eigenvalues(Eigen::MatrixXcd::Zero(2, 3), 1);
    });
}

static void test_qubit_eigensystem() {
    const FluxQubit q(small_params());
    const int k = 8;
    const Eigen::VectorXd ev = q.evals_calc(k);
    const fluxq::spectrum::Eigensystem es = q.esys_calc(k);
    check_close("esys evals == evals", (ev - es.evals).cwiseAbs().maxCoeff(), 0.0, 1e-12);

    bool ordered = true;
    for (Eigen::Index j = 1; j < es.evals.size(); ++j) ordered = ordered && es.evals(j) >= es.evals(j - 1);
    report(ordered, "esys evals ascending");

    const Eigen::MatrixXcd gram = es.evecs.adjoint() * es.evecs;
    check_close("eigenvectors orthonormal", (gram - Eigen::MatrixXcd::Identity(k, k)).cwiseAbs().maxCoeff(), 0.0, 1e-10);

    bool phases = true;
    for (Eigen::Index j = 0; j < es.evecs.cols(); ++j) phases = phases && phase_standardized(es.evecs.col(j));
    report(phases, "eigenvector columns phase-standardized");

    // Same Hamiltonian, same canonical eigenvectors
    const fluxq::spectrum::Eigensystem again = FluxQubit(small_params()).esys_calc(k);
    check_close("esys deterministic", (again.evecs - es.evecs).cwiseAbs().maxCoeff(), 0.0, 1e-12);

    const Eigen::MatrixXcd n1 = fluxq::spectrum::matrixelement_table(q.n_1_operator(), es);
    report(n1.rows() == k && n1.cols() == k, "matrixelement_table is count x count");
    check_close("<i|n_1|j> Hermitian", (n1 - n1.adjoint()).cwiseAbs().maxCoeff(), 0.0, 1e-12);
    const Eigen::MatrixXcd h = fluxq::spectrum::matrixelement_table(q.hamiltonian(), es);
    const Eigen::MatrixXcd hdiag = es.evals.cast<cd>().asDiagonal();
    check_close("<i|H|j> = diag(E)", (h - hdiag).cwiseAbs().maxCoeff(), 0.0, 1e-9);
    check_throws<std::invalid_argument>("matrixelement_table dimension mismatch", [&] {
        (void)fluxq::spectrum::matrixelement_table(Eigen::MatrixXcd::Identity(3, 3), es);
    });
}

static void test_spectrum_cache() {
    FluxQubit q(small_params());
    fluxq::spectrum::SpectrumCache<FluxQubit> cache;

    const Eigen::VectorXd first = cache.eigenvals(q, 4);
    const Eigen::VectorXd second = cache.eigenvals(q, 4);
    report(cache.misses() == 1 && cache.hits() == 1, "repeat eigenvals is a cache hit");
    check_close("cached evals match", (first - second).cwiseAbs().maxCoeff(), 0.0, 0.0);
    check_close("cached evals match evals_calc", (first - q.evals_calc(4)).cwiseAbs().maxCoeff(), 0.0, 1e-12);

    (void)cache.eigenvals(q, 5);
    report(cache.misses() == 2, "different count misses");

    q.set_flux(0.47);
    const Eigen::VectorXd moved = cache.eigenvals(q, 5);
    report(cache.misses() == 3, "parameter change misses");
    check_close("recomputed after change", (moved - q.evals_calc(5)).cwiseAbs().maxCoeff(), 0.0, 1e-12);

    // reassigning the same value leaves the snapshot valid
    q.set_flux(0.47);
    (void)cache.eigenvals(q, 5);
    report(cache.hits() == 2, "same parameters after reassignment hit");

    const fluxq::spectrum::Eigensystem& es = cache.eigensys(q, 3);
    (void)cache.eigensys(q, 3);
    report(cache.misses() == 4 && cache.hits() == 3, "eigensys cached separately");
    check_close("cached eigensys evals", (es.evals - q.evals_calc(3)).cwiseAbs().maxCoeff(), 0.0, 1e-12);

    cache.invalidate();
    (void)cache.eigenvals(q, 5);
    (void)cache.eigensys(q, 3);
    report(cache.misses() == 6, "invalidate drops both entries");
}

static void test_parameter_sweep() {
    const FluxQubit q(small_params());
    const std::uint64_t rev = q.revision();
    const Eigen::VectorXd fluxes = Eigen::VectorXd::LinSpaced(7, 0.4, 0.6);
    const fluxq::spectrum::SpectrumData data = fluxq::spectrum::sweep_parameter(q, "flux", fluxes, 3);

    report(data.param_name == "flux", "sweep records parameter name");
    report(data.energy_table.rows() == 7 && data.energy_table.cols() == 3, "sweep table shape 7x3");
    double maxerr = 0.0;
    for (Eigen::Index k = 0; k < fluxes.size(); ++k) {
        Params p = small_params();
        p.flux = fluxes(k);
        const Eigen::VectorXd ev = FluxQubit(p).evals_calc(3);
        maxerr = std::max(maxerr, (data.energy_table.row(k).transpose() - ev).cwiseAbs().maxCoeff());
    }
    check_close("sweep rows match individual evals_calc", maxerr, 0.0, 1e-12);
    report(q.params() == small_params() && q.revision() == rev, "sweep leaves the model untouched");

    // ncut sweep: the Hilbert space changes size between points
    Eigen::VectorXd cuts(3);
    cuts << 1.0, 2.0, 3.0;
    const fluxq::spectrum::SpectrumData by_ncut = fluxq::spectrum::sweep_parameter(q, "ncut", cuts, 4);
    Params p = small_params();
    p.ncut = 2;
    check_close("ncut sweep row", (by_ncut.energy_table.row(1).transpose() - FluxQubit(p).evals_calc(4)).cwiseAbs().maxCoeff(), 0.0, 1e-12);

    const fluxq::spectrum::SpectrumData empty = fluxq::spectrum::sweep_parameter(q, "flux", Eigen::VectorXd(), 3);
    report(empty.energy_table.rows() == 0, "empty sweep gives an empty table");

    check_throws<std::out_of_range>("sweep unknown parameter", [&] {
        (void)fluxq::spectrum::sweep_parameter(q, "EJ4", fluxes, 3);
    });
    check_throws<std::out_of_range>("sweep count > dim", [&] {
        (void)fluxq::spectrum::sweep_parameter(q, "flux", fluxes, 50);
    });
    // the failing point need not be the first one
    check_throws<std::out_of_range>("sweep count exceeds a later point's dim", [&] {
        Eigen::VectorXd shrinking(2);
        shrinking << 3.0, 1.0;
        (void)fluxq::spectrum::sweep_parameter(q, "ncut", shrinking, 20);
    });
}

static void test_observers() {
    FluxQubit q(small_params());
    std::vector<std::string> seen;
    const std::size_t id = q.add_observer([&seen](const std::string& name) { seen.push_back(name); });

    const std::uint64_t r0 = q.revision();
    q.set_flux(0.5);
    q.set_parameter("ng1", 0.25);
    q.set_EJ3(2.0);
    report(seen == std::vector<std::string>({"flux", "ng1", "EJ3"}), "observer sees each assignment by name");
    report(q.revision() == r0 + 3, "revision counts assignments");
    check_close("set_parameter stores value", q.params().ng1, 0.25, 0.0);

    // copies do not inherit observers
    FluxQubit copy(q);
    copy.set_flux(0.1);
    report(seen.size() == 3, "copy does not notify the original's observer");
    check_close("copy keeps its own parameters", q.params().flux, 0.5, 0.0);

    q = copy;
    report(seen.size() == 4 && seen.back() == "*", "assignment notifies '*'");
    check_close("assignment copies parameters", q.params().flux, 0.1, 0.0);

    q.remove_observer(id);
    q.set_flux(0.2);
    report(seen.size() == 4, "removed observer is silent");

    q.set_parameter("ncut", 3.6);
    report(q.params().ncut == 4, "set_parameter rounds ncut");
    for (const std::string& name : fluxq::flux_qubit::parameter_names()) {
        q.set_parameter(name, 2.0);
    }
    bool round_trip = true;
    for (const std::string& name : fluxq::flux_qubit::parameter_names()) {
        round_trip = round_trip && q.get_parameter(name) == 2.0;
    }
    report(round_trip, "get_parameter returns what set_parameter stored");

    check_throws<std::out_of_range>("set_parameter unknown name", [&] { q.set_parameter("EJ4", 1.0); });
    check_throws<std::out_of_range>("get_parameter unknown name", [&] { (void)q.get_parameter("phi"); });
    check_throws<std::invalid_argument>("add_observer rejects empty observer", [&] {
        (void)q.add_observer(FluxQubit::Observer{});
    });

    Params p = small_params();
    report(FluxQubit(p).default_evals_count() == 6, "default evals count 6");
    p.truncated_dim = 10;
    report(FluxQubit(p).default_evals_count() == 10, "default evals count follows truncated_dim");
}

int main() {
    std::cout.setf(std::ios::fixed);
    std::cout.precision(12);
    std::cout << "Spectrum / model bookkeeping tests\n";

    test_ordering_and_phases();
    test_dense_solver();
    test_qubit_eigensystem();
    test_spectrum_cache();
    test_parameter_sweep();
    test_observers();

    if (fails) {
        std::cerr << "\nFAILED: " << fails << " test(s)\n";
        return 1;
    }
    std::cout << "\nAll spectrum tests passed.\n";
    return 0;
}
