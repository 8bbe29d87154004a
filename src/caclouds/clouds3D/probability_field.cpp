#include "probability_field.hpp"

#include <iostream>
#include <sstream>
#include <utility>

void stderrDiagnostic(const std::string& message)
{
    std::cerr << "[clouds3D] " << message << "\n";
}

ProbabilityField::ProbabilityField(GridState& g, const ArrayBackend& b)
    : grid(g),
      backend(b),
      sink(stderrDiagnostic)
{
}

void ProbabilityField::setDiagnosticSink(DiagnosticSink s)
{
    sink = s ? std::move(s) : DiagnosticSink(stderrDiagnostic);
}

double ProbabilityField::clampCenter(double c, int axis, const char* name) const
{
    const int upper = grid.dimensions().extent(axis) - 1;
    if (c < 0.0) {
        std::ostringstream msg;
        msg << name << " has to be in range of 0 and " << upper
            << ", hence it was set to 0.";
        sink(msg.str());
        return 0.0;
    }
    if (c > upper) {
        std::ostringstream msg;
        msg << name << " has to be in range of 0 and " << upper
            << ", hence it was set to " << upper << ".";
        sink(msg.str());
        return upper;
    }
    return c;
}

double ProbabilityField::clampStretch(double f, const char* name) const
{
    if (f <= 0.0) {
        sink(std::string(name) + " has to be greater than 0, hence it was set to 1.");
        return 1.0;
    }
    return f;
}

std::int16_t ProbabilityField::clampProbability(long p, const char* name) const
{
    if (p < 0) {
        sink(std::string(name) + " has to be greater or equal to 0, hence it was set to 0.");
        return 0;
    }
    if (p > kProbabilityScale) {
        std::ostringstream msg;
        msg << name << " has to be smaller or equal to " << kProbabilityScale
            << ", hence it was set to " << kProbabilityScale << ".";
        sink(msg.str());
        return kProbabilityScale;
    }
    return static_cast<std::int16_t>(p);
}

void ProbabilityField::initElliptic(const EllipticZone& zone)
{
    double overlap = zone.overlap;
    if (overlap < 0.0) {
        sink("overlap has to be greater or equal to 0, hence it was set to 0.");
        overlap = 0.0;
    }

    const Eigen::Array3d center(clampCenter(zone.cx, 0, "c_x"),
                                clampCenter(zone.cy, 1, "c_y"),
                                clampCenter(zone.cz, 2, "c_z"));
    const Eigen::Array3d stretch(clampStretch(zone.fx, "f_x"),
                                 clampStretch(zone.fy, "f_y"),
                                 clampStretch(zone.fz, "f_z"));

    const std::int16_t p_hum = clampProbability(zone.p_hum, "P_hum");
    const std::int16_t p_act = clampProbability(zone.p_act, "P_act");
    const std::int16_t p_ext = clampProbability(zone.p_ext, "P_ext");

    backend.ellipticDistance(grid, center, stretch, distance);

    const MaskField inner = distance <= zone.radius + overlap;
    const MaskField outer = distance > zone.radius - overlap;

    // humidity is seeded over the whole volume so growth is not confined to the zone
    backend.fill(grid.humidityProbability(), p_hum);
    backend.assignWhere(grid.activationProbability(), inner, p_act);
    backend.assignWhere(grid.extinctionProbability(), outer, p_ext);
}
