#include "random_source.hpp"

MersenneSource::MersenneSource()
{
    std::random_device rd;
    rng.seed(rd());
}

MersenneSource::MersenneSource(std::uint32_t seed)
    : rng(seed)
{
}

void MersenneSource::fill(SampleField& out)
{
    for (Eigen::Index c = 0; c < out.size(); ++c)
        out(c) = static_cast<std::int16_t>(dist(rng));
}
