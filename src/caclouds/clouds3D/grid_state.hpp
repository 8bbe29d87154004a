#pragma once

#include <Eigen/Core>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// ---- Field Types ---- //
// All fields are flat, row-major over (width, depth, height):
// index = (i * depth + j) * height + k
using CellField   = Eigen::Array<std::uint8_t, Eigen::Dynamic, 1>;
using SampleField = Eigen::Array<std::int16_t, Eigen::Dynamic, 1>;
using CoordField  = Eigen::Array<int, Eigen::Dynamic, 1>;
using MaskField   = Eigen::Array<bool, Eigen::Dynamic, 1>;

// Probabilities are basis points: 0 = 0%, 10000 = 100%
constexpr int kProbabilityScale = 10000;

// ---- Errors ---- //
class InvalidDimension : public std::invalid_argument {
public:
    explicit InvalidDimension(const std::string& what)
        : std::invalid_argument(what) {}
};

// ---- Dimensions ---- //
struct Dimensions {
    int width{0};
    int depth{0};
    int height{0};

    std::size_t volume() const noexcept {
        return static_cast<std::size_t>(width) * depth * height;
    }

    int extent(int axis) const noexcept {
        return axis == 0 ? width : (axis == 1 ? depth : height);
    }

    std::size_t index(int i, int j, int k) const noexcept {
        return (static_cast<std::size_t>(i) * depth + j) * height + k;
    }
};

// ---- Grid State ---- //
// Storage for the automaton: humidity, activation and cloud fields, the three
// probability grids and the precomputed cell coordinates. Shape is fixed at
// construction.
class GridState {
private:
    Dimensions dims;

    CellField hum;
    CellField act;
    CellField cld;

    SampleField p_hum;
    SampleField p_act;
    SampleField p_ext;

    CoordField xs, ys, zs;

public:
    GridState(int width, int depth, int height);

    // ---- Accessors ---- //
    const Dimensions& dimensions() const noexcept { return dims; }
    std::size_t size() const noexcept { return dims.volume(); }

    CellField& humidity() noexcept { return hum; }
    CellField& activation() noexcept { return act; }
    CellField& cloud() noexcept { return cld; }
    const CellField& humidity() const noexcept { return hum; }
    const CellField& activation() const noexcept { return act; }
    const CellField& cloud() const noexcept { return cld; }

    SampleField& humidityProbability() noexcept { return p_hum; }
    SampleField& activationProbability() noexcept { return p_act; }
    SampleField& extinctionProbability() noexcept { return p_ext; }
    const SampleField& humidityProbability() const noexcept { return p_hum; }
    const SampleField& activationProbability() const noexcept { return p_act; }
    const SampleField& extinctionProbability() const noexcept { return p_ext; }

    const CoordField& x() const noexcept { return xs; }
    const CoordField& y() const noexcept { return ys; }
    const CoordField& z() const noexcept { return zs; }
};
