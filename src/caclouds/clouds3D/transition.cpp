#include "transition.hpp"

const NeighborOffset kNeighborOffsets[kNeighborCount] = {
    {0, -2}, {0, -1}, {0, +1}, {0, +2},
    {1, -2}, {1, -1}, {1, +1},
    {2, -2}, {2, -1}, {2, +1}, {2, +2},
};

TransitionEngine::TransitionEngine(GridState& g, const ArrayBackend& b,
                                   RandomSource& r)
    : grid(g),
      backend(b),
      random(r)
{
    const Eigen::Index n = static_cast<Eigen::Index>(grid.size());

    neighbor = CellField::Zero(n);
    next_cld = CellField::Zero(n);
    next_act = CellField::Zero(n);
    next_hum = CellField::Zero(n);

    rnd_hum = SampleField::Zero(n);
    rnd_act = SampleField::Zero(n);
    rnd_ext = SampleField::Zero(n);
}

void TransitionEngine::growth()
{
    const CellField& hum = grid.humidity();
    const CellField& act = grid.activation();
    const CellField& cld = grid.cloud();

    // cld' = cld | act
    next_cld = cld;
    backend.orInto(next_cld, act);

    neighbor.setZero();
    for (const NeighborOffset& o : kNeighborOffsets)
        backend.orShifted(act, grid.dimensions(), o.axis, o.offset, neighbor);

    // act' = ~act & hum & f_act
    next_act = hum;
    backend.andInto(next_act, neighbor);
    backend.andNotInto(next_act, act);

    // hum' = hum & ~act
    next_hum = hum;
    backend.andNotInto(next_hum, act);

    // commit by copy: field buffers never move, so views into them stay live
    grid.cloud() = next_cld;
    grid.activation() = next_act;
    grid.humidity() = next_hum;
}

void TransitionEngine::formationExtinction()
{
    random.fill(rnd_hum);
    random.fill(rnd_act);
    random.fill(rnd_ext);

    backend.formWhereBelow(grid.humidity(), rnd_hum, grid.humidityProbability());
    backend.formWhereBelow(grid.activation(), rnd_act, grid.activationProbability());
    backend.keepWhereAbove(grid.cloud(), rnd_ext, grid.extinctionProbability());
}

void TransitionEngine::step()
{
    growth();
    formationExtinction();
}

void TransitionEngine::simulate(int n)
{
    for (int t = 0; t < n; ++t)
        step();
}
