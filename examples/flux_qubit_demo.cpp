#include <cmath>
#include <iostream>

#include <Eigen/Dense>

#include "fluxq/flux_qubit.hpp"
#include "fluxq/io.hpp"
#include "fluxq/spectrum.hpp"

int main() {
    using namespace fluxq;

    const double EJ = 35.0;
    const double alpha = 0.6;

    flux_qubit::Params params;
    params.EJ1 = EJ;
    params.EJ2 = EJ;
    params.EJ3 = alpha * EJ;
    params.ECJ1 = 1.0;
    params.ECJ2 = 1.0;
    params.ECJ3 = 1.0 / alpha;
    params.ECg1 = 50.0;
    params.ECg2 = 50.0;
    params.ng1 = 0.0;
    params.ng2 = 0.0;
    params.flux = 0.5;
    params.ncut = 8;

    flux_qubit::FluxQubit qubit(params);
    std::cout.setf(std::ios::fixed); std::cout.precision(6);

    // E_k(flux) across the symmetry point
    const Eigen::VectorXd fluxes = Eigen::VectorXd::LinSpaced(21, 0.46, 0.54);
    const spectrum::SpectrumData data = spectrum::sweep_parameter(qubit, "flux", fluxes, 4);
    io::write_csv_spectrum(std::cout, data, 6);

    // Charge matrix elements between the lowest states at half flux
    const spectrum::Eigensystem esys = qubit.esys_calc(4);
    const Eigen::MatrixXcd n1 = spectrum::matrixelement_table(qubit.n_1_operator(), esys);
    std::cout << '\n' << "# |<i|n_1|j>| (row, col, value)" << '\n';
    for (Eigen::Index r = 0; r < n1.rows(); ++r) {
        for (Eigen::Index c = 0; c < n1.cols(); ++c) {
            std::cout << "n1," << r << ',' << c << ',' << std::abs(n1(r, c)) << '\n';
        }
    }

    return 0;
}
