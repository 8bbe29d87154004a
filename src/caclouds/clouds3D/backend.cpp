#include "backend.hpp"

#include <algorithm>
#include <cctype>

void CpuBackend::fill(SampleField& dst, std::int16_t value) const
{
    dst.setConstant(value);
}

void CpuBackend::assignWhere(SampleField& dst, const MaskField& mask,
                             std::int16_t value) const
{
    dst = mask.select(SampleField::Constant(dst.size(), value), dst);
}

void CpuBackend::ellipticDistance(const GridState& grid,
                                  const Eigen::Array3d& center,
                                  const Eigen::Array3d& stretch,
                                  Eigen::ArrayXd& out) const
{
    out = (grid.x().cast<double>() - center(0)).square() / stretch(0)
        + (grid.y().cast<double>() - center(1)).square() / stretch(1)
        + (grid.z().cast<double>() - center(2)).square() / stretch(2);
}

void CpuBackend::orShifted(const CellField& src, const Dimensions& dims,
                           int axis, int offset, CellField& acc) const
{
    const int n = dims.extent(axis);
    const int s = ((offset % n) + n) % n;

    int d[3] = {0, 0, 0};
    d[axis] = s;

    for (int i = 0; i < dims.width; ++i)
    {
        const int si = (i + d[0]) % dims.width;
        for (int j = 0; j < dims.depth; ++j)
        {
            const int sj = (j + d[1]) % dims.depth;
            for (int k = 0; k < dims.height; ++k)
            {
                const int sk = (k + d[2]) % dims.height;
                if (src(dims.index(si, sj, sk)))
                    acc(dims.index(i, j, k)) = 1;
            }
        }
    }
}

void CpuBackend::orInto(CellField& dst, const CellField& src) const
{
    dst = (dst.cast<bool>() || src.cast<bool>()).cast<std::uint8_t>();
}

void CpuBackend::andInto(CellField& dst, const CellField& src) const
{
    dst = (dst.cast<bool>() && src.cast<bool>()).cast<std::uint8_t>();
}

void CpuBackend::andNotInto(CellField& dst, const CellField& src) const
{
    dst = (dst.cast<bool>() && !src.cast<bool>()).cast<std::uint8_t>();
}

void CpuBackend::formWhereBelow(CellField& dst, const SampleField& draws,
                                const SampleField& threshold) const
{
    dst = (dst.cast<bool>() || (draws < threshold)).cast<std::uint8_t>();
}

void CpuBackend::keepWhereAbove(CellField& dst, const SampleField& draws,
                                const SampleField& threshold) const
{
    dst = (dst.cast<bool>() && (draws > threshold)).cast<std::uint8_t>();
}

std::size_t CpuBackend::countSet(const CellField& field) const
{
    return static_cast<std::size_t>(field.cast<bool>().count());
}

std::unique_ptr<ArrayBackend> makeBackend(const std::string& device)
{
    std::string name = device;
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    const std::string base = name.substr(0, name.find(':'));
    if (base == "cpu")
        return std::unique_ptr<ArrayBackend>(new CpuBackend());

    throw UnsupportedBackend("Unsupported execution backend: '" + device + "'");
}
