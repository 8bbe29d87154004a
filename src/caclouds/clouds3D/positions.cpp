#include "positions.hpp"

#include <algorithm>

PositionExtractor::PositionExtractor(const GridState& g)
    : grid(g)
{
}

std::vector<CellPosition> PositionExtractor::getCloudPositions() const
{
    const CellField& cld = grid.cloud();

    std::vector<CellPosition> out;
    out.reserve(static_cast<std::size_t>(cld.cast<int>().sum()));

    for (Eigen::Index c = 0; c < cld.size(); ++c)
        if (cld(c))
            out.push_back(CellPosition{grid.x()(c), grid.y()(c), grid.z()(c)});

    return out;
}

CloudBounds PositionExtractor::cloudBounds() const
{
    const CellField& cld = grid.cloud();

    CloudBounds b;
    for (Eigen::Index c = 0; c < cld.size(); ++c)
    {
        if (!cld(c)) continue;

        const CellPosition p{grid.x()(c), grid.y()(c), grid.z()(c)};
        if (b.empty) {
            b.min = p;
            b.max = p;
            b.empty = false;
            continue;
        }
        b.min.x = std::min(b.min.x, p.x);
        b.min.y = std::min(b.min.y, p.y);
        b.min.z = std::min(b.min.z, p.z);
        b.max.x = std::max(b.max.x, p.x);
        b.max.y = std::max(b.max.y, p.y);
        b.max.z = std::max(b.max.z, p.z);
    }
    return b;
}

CroppedVolume PositionExtractor::cropCloud() const
{
    CroppedVolume v;
    v.bounds = cloudBounds();
    v.dims = v.bounds.extent();
    v.data = CellField::Zero(static_cast<Eigen::Index>(v.dims.volume()));
    if (v.bounds.empty) return v;

    const Dimensions& full = grid.dimensions();
    const CellField& cld = grid.cloud();

    for (int i = 0; i < v.dims.width; ++i)
        for (int j = 0; j < v.dims.depth; ++j)
            for (int k = 0; k < v.dims.height; ++k)
                v.data(v.dims.index(i, j, k)) = cld(full.index(v.bounds.min.x + i,
                                                               v.bounds.min.y + j,
                                                               v.bounds.min.z + k));
    return v;
}
