#pragma once

#include "grid_state.hpp"

#include <cstdint>
#include <random>

// ---- Random Source ---- //
// Fills a field with independent uniform integers in [0, kProbabilityScale].
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual void fill(SampleField& out) = 0;
};

class MersenneSource : public RandomSource {
private:
    std::mt19937 rng;
    std::uniform_int_distribution<int> dist{0, kProbabilityScale};

public:
    MersenneSource();
    explicit MersenneSource(std::uint32_t seed);

    void fill(SampleField& out) override;
};
