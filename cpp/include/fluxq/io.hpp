// io.hpp — CSV writers for operators, spectra and grid data

#pragma once

#include <Eigen/Dense>

#include <complex>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <string>

#include "fluxq/grid.hpp"
#include "fluxq/spectrum.hpp"

namespace fluxq::io {

namespace detail {

inline std::ofstream open_for_write(const std::string& path) {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    return ofs;
}

} // namespace detail

// Sparse-friendly listing of a complex matrix: row,col,re,im
inline void write_csv_matrix(std::ostream& os,
                             const Eigen::MatrixXcd& M,
                             int precision = 17)
{
    os.setf(std::ios::fixed);
    os << std::setprecision(precision);
    os << "row,col,re,im\n";
    for (Eigen::Index r = 0; r < M.rows(); ++r) {
        for (Eigen::Index c = 0; c < M.cols(); ++c) {
            const std::complex<double> v = M(r, c);
            os << r << "," << c << "," << v.real() << "," << v.imag() << "\n";
        }
    }
}

inline void write_csv_matrix(const std::string& path,
                             const Eigen::MatrixXcd& M,
                             int precision = 17)
{
    std::ofstream ofs = detail::open_for_write(path);
    write_csv_matrix(ofs, M, precision);
}

// index,energy
inline void write_csv_evals(std::ostream& os, const Eigen::VectorXd& evals, int precision = 17) {
    os.setf(std::ios::fixed);
    os << std::setprecision(precision);
    os << "index,energy\n";
    for (Eigen::Index k = 0; k < evals.size(); ++k) os << k << "," << evals(k) << "\n";
}

inline void write_csv_evals(const std::string& path, const Eigen::VectorXd& evals, int precision = 17) {
    std::ofstream ofs = detail::open_for_write(path);
    write_csv_evals(ofs, evals, precision);
}

// <param>,E0,E1,...
inline void write_csv_spectrum(std::ostream& os, const spectrum::SpectrumData& data, int precision = 12) {
    os.setf(std::ios::fixed);
    os << std::setprecision(precision);
    os << data.param_name;
    for (Eigen::Index j = 0; j < data.energy_table.cols(); ++j) os << ",E" << j;
    os << "\n";
    for (Eigen::Index i = 0; i < data.energy_table.rows(); ++i) {
        os << data.param_vals(i);
        for (Eigen::Index j = 0; j < data.energy_table.cols(); ++j) os << "," << data.energy_table(i, j);
        os << "\n";
    }
}

inline void write_csv_spectrum(const std::string& path, const spectrum::SpectrumData& data, int precision = 12) {
    std::ofstream ofs = detail::open_for_write(path);
    write_csv_spectrum(ofs, data, precision);
}

// phi1,phi2,value for values(i, j) on g x g
inline void write_csv_grid(std::ostream& os,
                           const grid::Grid1d& g,
                           const Eigen::MatrixXd& values,
                           int precision = 12)
{
    const Eigen::VectorXd phi = g.make_linspace();
    if (values.rows() != phi.size() || values.cols() != phi.size()) {
        throw std::invalid_argument("write_csv_grid: values do not match grid shape");
    }
    os.setf(std::ios::fixed);
    os << std::setprecision(precision);
    os << "phi1,phi2,value\n";
    for (Eigen::Index i = 0; i < values.rows(); ++i) {
        for (Eigen::Index j = 0; j < values.cols(); ++j) {
            os << phi(i) << "," << phi(j) << "," << values(i, j) << "\n";
        }
    }
}

inline void write_csv_grid(const std::string& path,
                           const grid::Grid1d& g,
                           const Eigen::MatrixXd& values,
                           int precision = 12)
{
    std::ofstream ofs = detail::open_for_write(path);
    write_csv_grid(ofs, g, values, precision);
}

} // namespace fluxq::io
