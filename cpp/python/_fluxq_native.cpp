#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include "fluxq/flux_qubit.hpp"
#include "fluxq/grid.hpp"
#include "fluxq/spectrum.hpp"
#include "fluxq/storage.hpp"
#include "fluxq/version.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_fluxq_native, m) {
    using fluxq::flux_qubit::FluxQubit;
    using fluxq::flux_qubit::Params;

    m.doc() = "fluxq native bindings: charge-basis flux qubit";
    m.def("version", &fluxq::version);

    py::class_<fluxq::grid::Grid1d>(m, "Grid1d")
        .def(py::init<double, double, std::size_t>(), py::arg("min_val"), py::arg("max_val"), py::arg("pt_count"))
        .def_readonly("min_val", &fluxq::grid::Grid1d::min_val)
        .def_readonly("max_val", &fluxq::grid::Grid1d::max_val)
        .def_readonly("pt_count", &fluxq::grid::Grid1d::pt_count)
        .def("grid_spacing", &fluxq::grid::Grid1d::grid_spacing)
        .def("make_linspace", &fluxq::grid::Grid1d::make_linspace);

    py::class_<fluxq::spectrum::Eigensystem>(m, "Eigensystem")
        .def_readonly("evals", &fluxq::spectrum::Eigensystem::evals)
        .def_readonly("evecs", &fluxq::spectrum::Eigensystem::evecs);

    py::class_<fluxq::storage::WaveFunctionOnGrid>(m, "WaveFunctionOnGrid")
        .def_property_readonly("shape", [](const fluxq::storage::WaveFunctionOnGrid& wf) {
            return wf.gridspec.shape();
        })
        .def_readonly("amplitudes", &fluxq::storage::WaveFunctionOnGrid::amplitudes)
        .def_readonly("energy", &fluxq::storage::WaveFunctionOnGrid::energy);

    py::class_<Params>(m, "Params")
        .def(py::init<>())
        .def_readwrite("EJ1", &Params::EJ1)
        .def_readwrite("EJ2", &Params::EJ2)
        .def_readwrite("EJ3", &Params::EJ3)
        .def_readwrite("ECJ1", &Params::ECJ1)
        .def_readwrite("ECJ2", &Params::ECJ2)
        .def_readwrite("ECJ3", &Params::ECJ3)
        .def_readwrite("ECg1", &Params::ECg1)
        .def_readwrite("ECg2", &Params::ECg2)
        .def_readwrite("ng1", &Params::ng1)
        .def_readwrite("ng2", &Params::ng2)
        .def_readwrite("flux", &Params::flux)
        .def_readwrite("ncut", &Params::ncut)
        .def_readwrite("truncated_dim", &Params::truncated_dim);

    py::class_<FluxQubit>(m, "FluxQubit")
        .def(py::init<const Params&>())
        .def_property_readonly("params", &FluxQubit::params)
        .def_property_readonly("revision", &FluxQubit::revision)
        .def("set_parameter", &FluxQubit::set_parameter)
        .def("get_parameter", &FluxQubit::get_parameter)
        .def("add_observer", &FluxQubit::add_observer)
        .def("remove_observer", &FluxQubit::remove_observer)
        .def("hilbertdim", &FluxQubit::hilbertdim)
        .def("EC_matrix", &FluxQubit::EC_matrix)
        .def("kineticmat", &FluxQubit::kineticmat)
        .def("potentialmat", &FluxQubit::potentialmat)
        .def("hamiltonian", &FluxQubit::hamiltonian)
        .def("n_1_operator", &FluxQubit::n_1_operator)
        .def("n_2_operator", &FluxQubit::n_2_operator)
        .def("exp_i_phi_1_operator", &FluxQubit::exp_i_phi_1_operator)
        .def("exp_i_phi_2_operator", &FluxQubit::exp_i_phi_2_operator)
        .def("cos_phi_1_operator", &FluxQubit::cos_phi_1_operator)
        .def("cos_phi_2_operator", &FluxQubit::cos_phi_2_operator)
        .def("sin_phi_1_operator", &FluxQubit::sin_phi_1_operator)
        .def("sin_phi_2_operator", &FluxQubit::sin_phi_2_operator)
        .def("eigenvals", &FluxQubit::evals_calc, py::arg("evals_count") = 6)
        .def("eigensys", &FluxQubit::esys_calc, py::arg("evals_count") = 6)
        .def("potential", &FluxQubit::potential)
        .def("potential_on_grid", &FluxQubit::potential_on_grid)
        .def("wavefunction",
             py::overload_cast<int, const fluxq::grid::Grid1d&>(&FluxQubit::wavefunction, py::const_),
             py::arg("which") = 0, py::arg("phi_grid") = fluxq::flux_qubit::default_phi_grid())
        .def("wavefunction",
             py::overload_cast<const fluxq::spectrum::Eigensystem&, int, const fluxq::grid::Grid1d&>(
                 &FluxQubit::wavefunction, py::const_),
             py::arg("esys"), py::arg("which") = 0,
             py::arg("phi_grid") = fluxq::flux_qubit::default_phi_grid());

    m.def("sweep_parameter",
          [](const FluxQubit& q, const std::string& name, const Eigen::VectorXd& values, int count) {
              const auto data = fluxq::spectrum::sweep_parameter(q, name, values, count);
              return data.energy_table;
          },
          py::arg("qubit"), py::arg("name"), py::arg("values"), py::arg("evals_count") = 6);
}
