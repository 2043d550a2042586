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
#include <iomanip>
#include <iostream>

#include "mstage_core/options.hpp"

namespace mstage
{

casadi::Dict pluginOptions(const SolverOptions &options)
{
    return {{"expand", options.expand},
            {"verbose", options.verbose},
            {"print_time", options.print_time},
            {"error_on_fail", options.error_on_fail}};
}

casadi::Dict ipoptOptions(const SolverOptions &options)
{
    return {{"linear_solver", options.linear_solver},
            {"tol", options.tolerance},
            {"max_iter", options.max_iterations},
            {"print_level", options.print_level}};
}

void printOptions(const SolverOptions &options)
{
    std::cout << "\n========================================\n";
    std::cout << "        NLP Solver Options Overview\n";
    std::cout << "========================================\n";

    std::cout << "  Plugin: " << std::setw(10) << options.plugin << "\n";
    std::cout << "  Linear Solver: " << std::setw(10) << options.linear_solver << "\n";
    std::cout << "  Tolerance: " << std::setw(10) << options.tolerance << "\n";
    std::cout << "  Max Iterations: " << std::setw(10) << options.max_iterations << "\n";
    std::cout << "  Print Level: " << std::setw(10) << options.print_level << "\n";
    std::cout << "  Expand to SX: " << std::setw(10) << (options.expand ? "Yes" : "No") << "\n";
    std::cout << "  Print Time: " << std::setw(10) << (options.print_time ? "Yes" : "No") << "\n";
    std::cout << "  Error On Fail: " << std::setw(10) << (options.error_on_fail ? "Yes" : "No") << "\n";
    std::cout << "  Verbose: " << std::setw(10) << (options.verbose ? "Yes" : "No") << "\n";
    std::cout << "========================================\n\n";
}

void printOptions(const std::string &stage_name, const StageOptions &options)
{
    std::cout << "--- Stage '" << stage_name << "' ---\n";
    std::cout << "  Shooting Intervals: " << std::setw(10) << options.num_intervals << "\n";
    std::cout << "  Integrator Steps: " << std::setw(10) << options.num_substeps << "\n";
    std::cout << "  Integrator: " << std::setw(10) << options.integrator << "\n";
    std::cout << "  Start Time Guess: " << std::setw(10) << options.t0_guess << "\n";
    std::cout << "  Duration Guess: " << std::setw(10) << options.duration_guess << "\n";
}

} // namespace mstage
