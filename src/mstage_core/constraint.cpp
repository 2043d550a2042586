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
#include "mstage_core/constraint.hpp"
#include "mstage_core/helper.hpp"

namespace mstage
{

casadi::MX LinearConstraint::evaluateSymbolic(const casadi::MX &state,
                                              const casadi::MX &control) const
{
    return casadi::MX::mtimes(casadi::MX(helper::toDM(A_)), state);
}

CorridorConstraint::CorridorConstraint(std::shared_ptr<const TruckTrailer> model,
                                       TruckTrailer::Body body,
                                       const Eigen::MatrixXd &planes)
    : Constraint("CorridorConstraint"), model_(std::move(model)), body_(body),
      planes_(planes)
{
    if (!model_)
    {
        throw std::invalid_argument("CorridorConstraint: model must not be null");
    }
    if (planes_.rows() != 3)
    {
        throw std::invalid_argument(
            "CorridorConstraint: half-plane matrix must have 3 rows, got " +
            std::to_string(planes_.rows()));
    }
}

Eigen::VectorXd CorridorConstraint::evaluate(const Eigen::VectorXd &state,
                                             const Eigen::VectorXd &control) const
{
    const Eigen::Matrix<double, 2, 4> corners = model_->footprint(state, body_);
    const int num_planes = planes_.cols();

    Eigen::VectorXd g(getDim());
    for (int i = 0; i < 4; ++i)
    {
        Eigen::Vector3d homogeneous(corners(0, i), corners(1, i), 1.0);
        g.segment(i * num_planes, num_planes) = planes_.transpose() * homogeneous;
    }
    return g;
}

casadi::MX CorridorConstraint::evaluateSymbolic(const casadi::MX &state,
                                                const casadi::MX &control) const
{
    const casadi::MX corners = model_->footprint(state, body_);
    const casadi::MX planes_t = casadi::MX(helper::toDM(planes_.transpose()));

    std::vector<casadi::MX> rows;
    for (int i = 0; i < 4; ++i)
    {
        casadi::MX homogeneous = casadi::MX::vertcat({corners(casadi::Slice(), i), casadi::MX(1.0)});
        rows.push_back(casadi::MX::mtimes(planes_t, homogeneous));
    }
    return casadi::MX::vertcat(rows);
}

} // namespace mstage
