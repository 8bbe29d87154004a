#pragma once

#include "backend.hpp"
#include "grid_state.hpp"
#include "random_source.hpp"

// ---- Neighborhood ---- //
// Offsets sampled for ignition, per axis. The depth axis has no +2.
struct NeighborOffset {
    int axis;
    int offset;
};

constexpr int kNeighborCount = 11;
extern const NeighborOffset kNeighborOffsets[kNeighborCount];

// ---- Transition Engine ---- //
class TransitionEngine {
private:
    GridState& grid;
    const ArrayBackend& backend;
    RandomSource& random;

    // growth scratch
    CellField neighbor;
    CellField next_cld;
    CellField next_act;
    CellField next_hum;

    // formation / extinction draws
    SampleField rnd_hum;
    SampleField rnd_act;
    SampleField rnd_ext;

    void growth();
    void formationExtinction();

public:
    TransitionEngine(GridState& grid, const ArrayBackend& backend,
                     RandomSource& random);

    // One timestep: deterministic growth on the pre-step snapshot, then
    // stochastic formation / extinction on the committed result.
    void step();

    // n sequential steps; n <= 0 does nothing.
    void simulate(int n);
};
