/*
 Copyright 2025 Tomo Sasaki

 Licensed under the Apache License, Version 2.0 (the "License");
 you may not use this file except in compliance with the License.
 You may obtain a copy of the License at

      https://www.apache.org/licenses/LICENSE-2.0

 Unless required by applicable law or agreed to in writing, software
 distributed under the License is distributed on an "AS IS" BASIS,
 WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 See the License for the specific language governing permissions and
 limitations under the License.
*/

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#include "mstage.hpp"

namespace fs = std::filesystem;

// Minimum-time maneuver of a truck-trailer around a corner, split into an
// approach stage and a corner stage.
//
// Usage: truck_trailer_corner [truck_trailer_para.yaml]
int main(int argc, char *argv[])
{
    mstage::CornerManeuverOptions options;
    if (argc > 1)
    {
        options.parameter_file = argv[1];
    }

    // Toggles
    options.show_figures = true;
    options.use_simulator = false;
    options.save_for_gif = false;

    options.solver.linear_solver = "mumps";
    options.solver.tolerance = 1e-8;

    const std::string plotDirectory = "../results/truck_trailer";
    options.animation_dir = plotDirectory;

    try
    {
        if (!fs::exists(plotDirectory))
        {
            fs::create_directories(plotDirectory);
        }
        const mstage::CornerManeuverResult result = mstage::runCornerManeuver(options);
        std::cout << "Approach ends at t1 = " << result.t1 << " s, corner ends at t2 = "
                  << result.t2 << " s" << std::endl;
        if (options.use_simulator)
        {
            std::cout << "Max articulation deviation: "
                      << mstage::maxArticulationError(result.simulated) << " rad" << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "truck_trailer_corner: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
