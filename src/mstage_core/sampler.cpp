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
#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "mstage_core/helper.hpp"
#include "mstage_core/sampler.hpp"

namespace mstage
{

using casadi::DM;

Sampler::Sampler(const Stage &stage,
                 const std::vector<std::string> &names,
                 const std::vector<casadi::MX> &signals)
    : stage_name_(stage.getName()),
      num_intervals_(stage.getNumIntervals()),
      names_(names),
      integrator_(stage.getIntegrator())
{
    if (names_.size() != signals.size())
    {
        throw std::invalid_argument("Sampler: " + std::to_string(names_.size()) + " names for " +
                                    std::to_string(signals.size()) + " signals");
    }
    for (size_t i = 0; i < signals.size(); ++i)
    {
        if (!signals[i].is_scalar())
        {
            throw std::invalid_argument("Sampler: signal '" + names_[i] + "' is not scalar");
        }
    }
    signals_ = stage.signalFunction(stage_name_ + "_signals", signals);
}

const StageSolution &Sampler::findStage(const Gist &gist) const
{
    for (const auto &stage : gist.stages_)
    {
        if (stage.name == stage_name_)
        {
            return stage;
        }
    }
    throw std::invalid_argument("Sampler: solution has no stage '" + stage_name_ + "'");
}

Trajectory Sampler::operator()(const Gist &gist, const Eigen::VectorXd &times) const
{
    const StageSolution &solution = findStage(gist);
    const double t0 = solution.t0;
    const double tf = solution.tf();
    const double h = solution.T / num_intervals_;
    const double eps = 1e-6 * std::max(1.0, std::abs(tf));

    Eigen::MatrixXd values(names_.size(), times.size());
    for (int j = 0; j < times.size(); ++j)
    {
        const double t = times(j);
        if (t < t0 - eps || t > tf + eps)
        {
            throw std::out_of_range("Sampler: time " + std::to_string(t) + " outside stage '" + stage_name_ +
                                    "' [" + std::to_string(t0) + ", " + std::to_string(tf) + "]");
        }

        int k = h > 0.0 ? static_cast<int>(std::floor((t - t0) / h)) : 0;
        k = std::min(std::max(k, 0), num_intervals_ - 1);
        const double tau = t - (t0 + k * h);

        const Eigen::VectorXd u_k = solution.controls.col(k);
        Eigen::VectorXd p(u_k.size() + 1);
        p << u_k, tau;

        const DM x_tau = integrator_(casadi::DMDict{{"x0", helper::toDM(solution.states.col(k))},
                                                    {"p", helper::toDM(p)}})
                             .at("xf");
        const std::vector<DM> out = signals_(std::vector<DM>{x_tau, helper::toDM(u_k)});
        for (size_t i = 0; i < out.size(); ++i)
        {
            values(i, j) = out[i].scalar();
        }
    }
    return Trajectory(times, names_, values);
}

} // namespace mstage
