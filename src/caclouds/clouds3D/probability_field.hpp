#pragma once

#include "backend.hpp"
#include "grid_state.hpp"

#include <Eigen/Core>

#include <functional>
#include <string>

// ---- Parameters ---- //
// Generalized ellipsoid (x-cx)^2/fx + (y-cy)^2/fy + (z-cz)^2/fz <= radius
// with formation / extinction probabilities in basis points.
struct EllipticZone {
    double cx{0.0};
    double cy{0.0};
    double cz{0.0};
    double fx{1.0};
    double fy{1.0};
    double fz{1.0};
    long p_hum{0};
    long p_act{0};
    long p_ext{0};
    double radius{1.0};
    double overlap{1.0};
};

using DiagnosticSink = std::function<void(const std::string&)>;

// Writes "[clouds3D] <message>" to std::cerr.
void stderrDiagnostic(const std::string& message);

// ---- Probability Field ---- //
class ProbabilityField {
private:
    GridState& grid;
    const ArrayBackend& backend;
    DiagnosticSink sink;

    Eigen::ArrayXd distance;

    double clampCenter(double c, int axis, const char* name) const;
    double clampStretch(double f, const char* name) const;
    std::int16_t clampProbability(long p, const char* name) const;

public:
    ProbabilityField(GridState& grid, const ArrayBackend& backend);

    // An empty sink restores the std::cerr default.
    void setDiagnosticSink(DiagnosticSink s);

    // Out-of-range inputs are clamped and reported, never rejected.
    //   P_hum <- p_hum on the whole grid, whatever the zone
    //   P_act <- p_act where D <= radius + overlap
    //   P_ext <- p_ext where D >  radius - overlap
    // Cells outside a mask keep their previous P_act / P_ext.
    void initElliptic(const EllipticZone& zone);
};
