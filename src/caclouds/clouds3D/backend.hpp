#pragma once

#include "grid_state.hpp"

#include <Eigen/Core>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

// ---- Errors ---- //
class UnsupportedBackend : public std::invalid_argument {
public:
    explicit UnsupportedBackend(const std::string& what)
        : std::invalid_argument(what) {}
};

// ---- Array Backend ---- //
// Whole-array operations the seeding and transition rules are written in.
// An implementation decides where the arrays live and how the work is
// spread; results must not depend on that choice.
class ArrayBackend {
public:
    virtual ~ArrayBackend() = default;

    virtual std::string device() const = 0;

    virtual void fill(SampleField& dst, std::int16_t value) const = 0;

    // dst[c] = value wherever mask[c], untouched elsewhere
    virtual void assignWhere(SampleField& dst, const MaskField& mask,
                             std::int16_t value) const = 0;

    // out[c] = sum over axes of (coord - center)^2 / stretch
    virtual void ellipticDistance(const GridState& grid,
                                  const Eigen::Array3d& center,
                                  const Eigen::Array3d& stretch,
                                  Eigen::ArrayXd& out) const = 0;

    // acc(i,j,k) |= src at (i,j,k) moved `offset` cells along `axis`,
    // wrapping around on every axis
    virtual void orShifted(const CellField& src, const Dimensions& dims,
                           int axis, int offset, CellField& acc) const = 0;

    virtual void orInto(CellField& dst, const CellField& src) const = 0;
    virtual void andInto(CellField& dst, const CellField& src) const = 0;
    virtual void andNotInto(CellField& dst, const CellField& src) const = 0;

    // dst |= (draws < threshold)
    virtual void formWhereBelow(CellField& dst, const SampleField& draws,
                                const SampleField& threshold) const = 0;

    // dst &= (draws > threshold)
    virtual void keepWhereAbove(CellField& dst, const SampleField& draws,
                                const SampleField& threshold) const = 0;

    virtual std::size_t countSet(const CellField& field) const = 0;
};

// ---- CPU (Eigen) ---- //
class CpuBackend : public ArrayBackend {
public:
    std::string device() const override { return "cpu"; }

    void fill(SampleField& dst, std::int16_t value) const override;
    void assignWhere(SampleField& dst, const MaskField& mask,
                     std::int16_t value) const override;
    void ellipticDistance(const GridState& grid,
                          const Eigen::Array3d& center,
                          const Eigen::Array3d& stretch,
                          Eigen::ArrayXd& out) const override;
    void orShifted(const CellField& src, const Dimensions& dims,
                   int axis, int offset, CellField& acc) const override;
    void orInto(CellField& dst, const CellField& src) const override;
    void andInto(CellField& dst, const CellField& src) const override;
    void andNotInto(CellField& dst, const CellField& src) const override;
    void formWhereBelow(CellField& dst, const SampleField& draws,
                        const SampleField& threshold) const override;
    void keepWhereAbove(CellField& dst, const SampleField& draws,
                        const SampleField& threshold) const override;
    std::size_t countSet(const CellField& field) const override;
};

// Accepts "cpu" or "cpu:<n>" (any case); anything else throws UnsupportedBackend.
std::unique_ptr<ArrayBackend> makeBackend(const std::string& device);
