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
#ifndef MSTAGE_SAMPLER_HPP
#define MSTAGE_SAMPLER_HPP

#include <Eigen/Dense>
#include <casadi/casadi.hpp>
#include <string>
#include <vector>

#include "mstage_core/ocp.hpp"
#include "mstage_core/stage.hpp"
#include "mstage_core/trajectory.hpp"

namespace mstage
{
    /**
     * @brief Re-evaluates signals of one stage at arbitrary times of a solution
     *
     * For a time t the sampler finds the shooting interval k containing t,
     * integrates the node state X_k over t - t_k with the interval control U_k
     * held, and evaluates the signal expressions there. The sampler copies
     * what it needs from the stage and may outlive it.
     */
    class Sampler
    {
    public:
        /**
         * @param stage Stage the signals belong to
         * @param names Signal names, in output order
         * @param signals Scalar expressions of the stage symbols
         */
        Sampler(const Stage &stage,
                const std::vector<std::string> &names,
                const std::vector<casadi::MX> &signals);

        /**
         * @brief Samples the signals at the given times
         * @throws std::out_of_range if a time lies outside [t0, tf] of the stage
         */
        Trajectory operator()(const Gist &gist, const Eigen::VectorXd &times) const;

        const std::string &getStageName() const { return stage_name_; }
        const std::vector<std::string> &getSignalNames() const { return names_; }

    private:
        const StageSolution &findStage(const Gist &gist) const;

        std::string stage_name_;
        int num_intervals_;
        std::vector<std::string> names_;
        casadi::Function integrator_;
        casadi::Function signals_;
    };

} // namespace mstage

#endif // MSTAGE_SAMPLER_HPP
