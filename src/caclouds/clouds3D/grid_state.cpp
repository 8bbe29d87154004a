#include "grid_state.hpp"

#include <sstream>

GridState::GridState(int width, int depth, int height)
    : dims{width, depth, height}
{
    if (width <= 0 || depth <= 0 || height <= 0) {
        std::ostringstream msg;
        msg << "Grid dimensions must be positive, got ("
            << width << ", " << depth << ", " << height << ")";
        throw InvalidDimension(msg.str());
    }

    const Eigen::Index n = static_cast<Eigen::Index>(dims.volume());

    hum = CellField::Zero(n);
    act = CellField::Zero(n);
    cld = CellField::Zero(n);

    p_hum = SampleField::Zero(n);
    p_act = SampleField::Zero(n);
    p_ext = SampleField::Zero(n);

    xs.resize(n);
    ys.resize(n);
    zs.resize(n);
    for (int i = 0; i < width; ++i)
        for (int j = 0; j < depth; ++j)
            for (int k = 0; k < height; ++k)
            {
                const Eigen::Index c = static_cast<Eigen::Index>(dims.index(i, j, k));
                xs(c) = i;
                ys(c) = j;
                zs(c) = k;
            }
}
