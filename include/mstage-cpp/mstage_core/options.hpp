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
#ifndef MSTAGE_OPTIONS_HPP
#define MSTAGE_OPTIONS_HPP

#include <casadi/casadi.hpp>
#include <string>

namespace mstage
{
    /**
     * @brief Options forwarded to the CasADi NLP solver plugin.
     *
     * The plugin-level flags go to casadi::Opti::solver as plugin options, the
     * remaining ones are passed through to IPOPT.
     */
    struct SolverOptions
    {
        std::string plugin = "ipopt";        ///< NLP solver plugin name.
        std::string linear_solver = "mumps"; ///< IPOPT linear solver ("mumps", "ma57", ...).
        double tolerance = 1e-8;             ///< IPOPT convergence tolerance.
        int max_iterations = 3000;           ///< IPOPT iteration limit.
        int print_level = 5;                 ///< IPOPT console verbosity (0-12).
        bool expand = true;                  ///< Expand MX graphs to SX before solving.
        bool print_time = true;              ///< Print solver timing statistics.
        bool error_on_fail = true;           ///< Throw if the solver does not converge.
        bool verbose = false;                ///< CasADi-level verbose output.
    };

    /**
     * @brief Discretization and initial guesses of one stage.
     */
    struct StageOptions
    {
        int num_intervals = 10;        ///< Shooting intervals N.
        int num_substeps = 2;          ///< Integrator steps per interval M.
        double t0_guess = 0.0;         ///< Initial guess of the free start time.
        double duration_guess = 10.0;  ///< Initial guess of the free duration T.
        std::string integrator = "rk"; ///< CasADi fixed-step integrator plugin.
    };

    // CasADi plugin options for Opti::solver
    casadi::Dict pluginOptions(const SolverOptions &options);

    // IPOPT options for Opti::solver
    casadi::Dict ipoptOptions(const SolverOptions &options);

    // Boxed console summary of the solver configuration
    void printOptions(const SolverOptions &options);
    void printOptions(const std::string &stage_name, const StageOptions &options);

} // namespace mstage

#endif // MSTAGE_OPTIONS_HPP
