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
#ifndef MSTAGE_SIMULATOR_HPP
#define MSTAGE_SIMULATOR_HPP

#include <Eigen/Dense>
#include <memory>

#include "dynamics_model/truck_trailer.hpp"
#include "mstage_core/trajectory.hpp"

namespace mstage
{
    /**
     * @brief Open-loop replay of a planned control sequence on the truck-trailer
     *
     * The model is stepped from the initial state with the control of sample k
     * held over [t_k, t_{k+1}]. The result holds the signals
     * theta1, px1, py1, theta0, px0, py0, beta01 and beta01_error, where the
     * error is the planned minus the simulated articulation angle.
     */
    class OpenLoopSimulator
    {
    public:
        explicit OpenLoopSimulator(std::shared_ptr<const TruckTrailer> model,
                                   bool verbose = false);

        /**
         * @param initial_state Model state [θ1, x1, y1, θ0] at time(0)
         * @param plan Trajectory with signals delta0, v0, theta0, theta1
         */
        Trajectory simulate(const Eigen::VectorXd &initial_state,
                            const Trajectory &plan) const;

    private:
        std::shared_ptr<const TruckTrailer> model_;
        bool verbose_;
    };

    // Largest absolute articulation error of a simulated trajectory
    double maxArticulationError(const Trajectory &simulated);

} // namespace mstage

#endif // MSTAGE_SIMULATOR_HPP
