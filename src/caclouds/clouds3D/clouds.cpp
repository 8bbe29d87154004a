#include "clouds.hpp"

#include <stdexcept>
#include <utility>

namespace {

std::unique_ptr<RandomSource> requireSource(std::unique_ptr<RandomSource> source)
{
    if (!source)
        throw std::invalid_argument("CloudAutomaton needs a random source");
    return source;
}

} // namespace

CloudAutomaton::CloudAutomaton(int width, int depth, int height,
                               const std::string& device)
    : CloudAutomaton(width, depth, height, device,
                     std::unique_ptr<RandomSource>(new MersenneSource()))
{
}

CloudAutomaton::CloudAutomaton(int width, int depth, int height,
                               const std::string& device, std::uint32_t seed)
    : CloudAutomaton(width, depth, height, device,
                     std::unique_ptr<RandomSource>(new MersenneSource(seed)))
{
}

CloudAutomaton::CloudAutomaton(int width, int depth, int height,
                               const std::string& device,
                               std::unique_ptr<RandomSource> source)
    : grid(width, depth, height),
      backend(makeBackend(device)),
      random(requireSource(std::move(source))),
      field(grid, *backend),
      engine(grid, *backend, *random),
      extractor(grid)
{
}

void CloudAutomaton::initElliptic(const EllipticZone& zone)
{
    field.initElliptic(zone);
}

void CloudAutomaton::initElliptic(double cx, double cy, double cz,
                                  double fx, double fy, double fz,
                                  long p_hum, long p_act, long p_ext,
                                  double radius, double overlap)
{
    EllipticZone zone;
    zone.cx = cx;
    zone.cy = cy;
    zone.cz = cz;
    zone.fx = fx;
    zone.fy = fy;
    zone.fz = fz;
    zone.p_hum = p_hum;
    zone.p_act = p_act;
    zone.p_ext = p_ext;
    zone.radius = radius;
    zone.overlap = overlap;
    field.initElliptic(zone);
}

void CloudAutomaton::setDiagnosticSink(DiagnosticSink sink)
{
    field.setDiagnosticSink(std::move(sink));
}

void CloudAutomaton::step()
{
    engine.step();
}

void CloudAutomaton::simulate(int n)
{
    engine.simulate(n);
}

std::vector<CellPosition> CloudAutomaton::getCloudPositions() const
{
    return extractor.getCloudPositions();
}

CloudBounds CloudAutomaton::cloudBounds() const
{
    return extractor.cloudBounds();
}

CroppedVolume CloudAutomaton::cropCloud() const
{
    return extractor.cropCloud();
}

std::size_t CloudAutomaton::countCloud() const
{
    return backend->countSet(grid.cloud());
}
