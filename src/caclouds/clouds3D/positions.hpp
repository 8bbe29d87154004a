#pragma once

#include "grid_state.hpp"

#include <vector>

struct CellPosition {
    int x{0};
    int y{0};
    int z{0};

    bool operator==(const CellPosition& o) const noexcept {
        return x == o.x && y == o.y && z == o.z;
    }
    bool operator!=(const CellPosition& o) const noexcept { return !(*this == o); }
};

// Inclusive corners of the smallest box holding every cloud cell.
struct CloudBounds {
    bool empty{true};
    CellPosition min;
    CellPosition max;

    Dimensions extent() const noexcept {
        if (empty) return Dimensions{};
        return Dimensions{max.x - min.x + 1, max.y - min.y + 1, max.z - min.z + 1};
    }
};

// Dense copy of the cloud field restricted to its bounds, same row-major order.
struct CroppedVolume {
    CloudBounds bounds;
    Dimensions dims;
    CellField data;
};

// ---- Position Extractor ---- //
// Read-only views of the cloud field. Results come out in the grid's flatten
// order, so identical states give identical output.
class PositionExtractor {
private:
    const GridState& grid;

public:
    explicit PositionExtractor(const GridState& grid);

    std::vector<CellPosition> getCloudPositions() const;

    CloudBounds cloudBounds() const;
    CroppedVolume cropCloud() const;
};
