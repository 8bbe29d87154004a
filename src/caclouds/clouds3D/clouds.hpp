#pragma once

#include "backend.hpp"
#include "grid_state.hpp"
#include "positions.hpp"
#include "probability_field.hpp"
#include "random_source.hpp"
#include "transition.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// ---- Cloud Automaton ---- //
// Volumetric cloud cellular automaton (Immanuel, Deborrah & Selvaraj,
// Chaos 24, 013125, 2014). Humidity, activation and cloud fields on a
// (width, depth, height) grid with periodic boundaries.
//
// Typical use:
//   CloudAutomaton cloud(100, 100, 100);
//   cloud.initElliptic(50, 50, 50, 5., 5., 1., 100, 1, 500, 10., 10.);
//   cloud.simulate(20);
//   auto xyz = cloud.getCloudPositions();
class CloudAutomaton {
private:
    GridState grid;
    std::unique_ptr<ArrayBackend> backend;
    std::unique_ptr<RandomSource> random;

    ProbabilityField field;
    TransitionEngine engine;
    PositionExtractor extractor;

public:
    CloudAutomaton(int width, int depth, int height,
                   const std::string& device = "cpu");
    CloudAutomaton(int width, int depth, int height,
                   const std::string& device, std::uint32_t seed);
    CloudAutomaton(int width, int depth, int height,
                   const std::string& device,
                   std::unique_ptr<RandomSource> source);

    CloudAutomaton(const CloudAutomaton&) = delete;
    CloudAutomaton& operator=(const CloudAutomaton&) = delete;

    // ---- Seeding ---- //
    void initElliptic(const EllipticZone& zone);
    void initElliptic(double cx, double cy, double cz,
                      double fx, double fy, double fz,
                      long p_hum, long p_act, long p_ext,
                      double radius = 1.0, double overlap = 1.0);

    void setDiagnosticSink(DiagnosticSink sink);

    // ---- Stepping ---- //
    void step();
    void simulate(int n);

    // ---- Read-out ---- //
    std::vector<CellPosition> getCloudPositions() const;
    CloudBounds cloudBounds() const;
    CroppedVolume cropCloud() const;
    std::size_t countCloud() const;

    const Dimensions& dimensions() const noexcept { return grid.dimensions(); }
    const CellField& cloud() const noexcept { return grid.cloud(); }
    const CellField& humidity() const noexcept { return grid.humidity(); }
    const CellField& activation() const noexcept { return grid.activation(); }
    const GridState& state() const noexcept { return grid; }
    std::string device() const { return backend->device(); }
};
