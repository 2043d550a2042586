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
#include <stdexcept>

#include "mstage_core/simulator.hpp"

namespace mstage
{

OpenLoopSimulator::OpenLoopSimulator(std::shared_ptr<const TruckTrailer> model,
                                     bool verbose)
    : model_(std::move(model)), verbose_(verbose)
{
    if (!model_)
    {
        throw std::invalid_argument("OpenLoopSimulator: model must not be null");
    }
}

Trajectory OpenLoopSimulator::simulate(const Eigen::VectorXd &initial_state,
                                       const Trajectory &plan) const
{
    if (initial_state.size() != model_->getStateDim())
    {
        throw std::invalid_argument("OpenLoopSimulator: initial state must have dimension " +
                                    std::to_string(model_->getStateDim()));
    }

    const int num_samples = plan.size();
    const Eigen::VectorXd &time = plan.time();
    const Eigen::VectorXd delta0 = plan.signal("delta0");
    const Eigen::VectorXd v0 = plan.signal("v0");
    const Eigen::VectorXd beta01_plan = plan.signal("theta0") - plan.signal("theta1");

    Eigen::MatrixXd states(TruckTrailer::STATE_DIM, num_samples);
    if (num_samples > 0)
    {
        states.col(0) = initial_state;
    }

    Eigen::VectorXd control(TruckTrailer::CONTROL_DIM);
    for (int k = 0; k + 1 < num_samples; ++k)
    {
        control << delta0(k), v0(k);
        const double dt = time(k + 1) - time(k);
        states.col(k + 1) = model_->integrate(states.col(k), control, dt, time(k));
    }

    Eigen::MatrixXd values(8, num_samples);
    for (int k = 0; k < num_samples; ++k)
    {
        const Eigen::VectorXd x = states.col(k);
        const Eigen::Vector2d p0 = model_->truckPosition(x);
        const double beta01 = model_->articulation(x);
        values.col(k) << x(TruckTrailer::STATE_THETA1), x(TruckTrailer::STATE_X1),
            x(TruckTrailer::STATE_Y1), x(TruckTrailer::STATE_THETA0), p0(0), p0(1),
            beta01, beta01_plan(k) - beta01;
    }

    Trajectory simulated(time,
                         {"theta1", "px1", "py1", "theta0", "px0", "py0", "beta01", "beta01_error"},
                         values);

    if (verbose_)
    {
        std::cout << "\n========================================\n";
        std::cout << "        Open-Loop Simulation Summary\n";
        std::cout << "========================================\n";
        std::cout << "  Samples: " << std::setw(10) << num_samples << "\n";
        std::cout << "  Max |beta01 error|: " << std::setw(10) << maxArticulationError(simulated) << "\n";
        if (num_samples > 0)
        {
            std::cout << "  Final trailer position: (" << states(TruckTrailer::STATE_X1, num_samples - 1)
                      << ", " << states(TruckTrailer::STATE_Y1, num_samples - 1) << ")\n";
        }
        std::cout << "========================================\n\n";
    }
    return simulated;
}

double maxArticulationError(const Trajectory &simulated)
{
    if (simulated.empty())
    {
        return 0.0;
    }
    return simulated.signal("beta01_error").cwiseAbs().maxCoeff();
}

} // namespace mstage
