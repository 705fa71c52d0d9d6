// grid.hpp — Uniform 1-D phase grids and their multi-dimensional specification

#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fluxq::grid {

// Closed interval [min_val, max_val] sampled at pt_count equidistant points
struct Grid1d {
    double min_val{0.0};
    double max_val{1.0};
    std::size_t pt_count{2};

    Grid1d() = default;
    Grid1d(double min_value, double max_value, std::size_t points)
        : min_val(min_value), max_val(max_value), pt_count(points) {
        if (pt_count == 0) throw std::invalid_argument("Grid1d: pt_count must be >= 1");
        if (!(max_val >= min_val)) throw std::invalid_argument("Grid1d: max_val must be >= min_val");
    }

    double grid_spacing() const noexcept {
        if (pt_count < 2) return 0.0;
        return (max_val - min_val) / static_cast<double>(pt_count - 1);
    }

    Eigen::VectorXd make_linspace() const {
        // Eigen's LinSpaced returns `high` for a single point
        if (pt_count == 1) return Eigen::VectorXd::Constant(1, min_val);
        return Eigen::VectorXd::LinSpaced(static_cast<Eigen::Index>(pt_count), min_val, max_val);
    }

    bool operator==(const Grid1d& o) const noexcept {
        return min_val == o.min_val && max_val == o.max_val && pt_count == o.pt_count;
    }
    bool operator!=(const Grid1d& o) const noexcept { return !(*this == o); }
};

// One Grid1d per axis
struct GridSpec {
    std::vector<Grid1d> axes;

    GridSpec() = default;
    explicit GridSpec(std::vector<Grid1d> a) : axes(std::move(a)) {}

    static GridSpec square(const Grid1d& g) { return GridSpec({g, g}); }

    std::size_t ndim() const noexcept { return axes.size(); }

    std::vector<std::size_t> shape() const {
        std::vector<std::size_t> s;
        s.reserve(axes.size());
        for (const auto& a : axes) s.push_back(a.pt_count);
        return s;
    }
};

} // namespace fluxq::grid
