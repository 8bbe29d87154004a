#include "clouds.hpp"

#include <cstdint>
#include <stdexcept>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static void printUsage()
{
    std::cerr << "Usage:\n";
    std::cerr << "./clouds3D_model width depth height n_steps cx cy cz fx fy fz "
                 "P_hum P_act P_ext [radius overlap] [output_file] [seed]\n";
    std::cerr << "e.g.\n";
    std::cerr << "./clouds3D_model 100 100 100 20 50 50 50 5 5 1 100 1 500 10 10 cloud_positions.txt\n";
}

static bool savePositions(const std::string& filename,
                          const std::vector<CellPosition>& positions)
{
    std::ofstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Error opening file for writing: " << filename << "\n";
        return false;
    }

    for (const CellPosition& p : positions)
        file << p.x << " " << p.y << " " << p.z << "\n";

    std::cout << "Saved " << positions.size() << " cloud positions to: " << filename << "\n";
    return true;
}

int main(int argc, char *argv[])
{
    std::cout << "=== Cellular Automaton Cloud Simulation ===" << "\n";

    if (argc < 14)
    {
        std::cerr << "Insufficient arguments provided. ";
        printUsage();
        return 1;
    }

    int width = 0, depth = 0, height = 0, steps = 0;
    EllipticZone zone;
    std::string output = "cloud_positions.txt";
    bool seeded = false;
    std::uint32_t seed = 0;

    try
    {
        width  = std::stoi(argv[1]);
        depth  = std::stoi(argv[2]);
        height = std::stoi(argv[3]);
        steps  = std::stoi(argv[4]);

        zone.cx = std::stod(argv[5]);
        zone.cy = std::stod(argv[6]);
        zone.cz = std::stod(argv[7]);
        zone.fx = std::stod(argv[8]);
        zone.fy = std::stod(argv[9]);
        zone.fz = std::stod(argv[10]);
        zone.p_hum = std::stol(argv[11]);
        zone.p_act = std::stol(argv[12]);
        zone.p_ext = std::stol(argv[13]);

        if (argc >= 16)
        {
            zone.radius  = std::stod(argv[14]);
            zone.overlap = std::stod(argv[15]);
        }
        if (argc >= 17)
            output = argv[16];
        if (argc >= 18)
        {
            seed = static_cast<std::uint32_t>(std::stoul(argv[17]));
            seeded = true;
        }
    }
    catch (const std::logic_error& e)
    {
        std::cerr << "Malformed argument (" << e.what() << "). ";
        printUsage();
        return 1;
    }

    std::cout << "\nParameters:" << std::endl;
    std::cout << "  Grid: " << width << " x " << depth << " x " << height << std::endl;
    std::cout << "  Steps: " << steps << std::endl;
    std::cout << "  Center: (" << zone.cx << ", " << zone.cy << ", " << zone.cz << ")" << std::endl;
    std::cout << "  Stretch: (" << zone.fx << ", " << zone.fy << ", " << zone.fz << ")" << std::endl;
    std::cout << "  P_hum / P_act / P_ext: " << zone.p_hum << " / " << zone.p_act
              << " / " << zone.p_ext << std::endl;
    std::cout << "  Radius / overlap: " << zone.radius << " / " << zone.overlap << std::endl;
    std::cout << std::endl;

    try
    {
        std::unique_ptr<CloudAutomaton> sim(seeded
            ? new CloudAutomaton(width, depth, height, "cpu", seed)
            : new CloudAutomaton(width, depth, height, "cpu"));
        CloudAutomaton& cloud = *sim;
        cloud.initElliptic(zone);

        std::cout << "Running simulation for " << steps << " steps..." << "\n";
        cloud.simulate(steps);

        const CloudBounds bounds = cloud.cloudBounds();
        std::cout << "Cloud cells: " << cloud.countCloud() << "\n";
        if (!bounds.empty)
        {
            const Dimensions ext = bounds.extent();
            std::cout << "Bounds: (" << bounds.min.x << ", " << bounds.min.y << ", " << bounds.min.z
                      << ") - (" << bounds.max.x << ", " << bounds.max.y << ", " << bounds.max.z
                      << "), " << ext.width << " x " << ext.depth << " x " << ext.height << "\n";
        }

        if (!savePositions(output, cloud.getCloudPositions()))
            return 1;
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nSimulation complete!" << std::endl;
    return 0;
}
