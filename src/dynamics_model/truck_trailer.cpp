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

#include "dynamics_model/truck_trailer.hpp"
#include <cmath>
#include <autodiff/forward/dual.hpp> // Include dual types and math functions
#include <autodiff/forward/dual/eigen.hpp> // Include Eigen support for dual types

namespace mstage {

TruckTrailer::TruckTrailer(const VehicleParameters& parameters, double timestep,
                           std::string integration_type)
    : DynamicalSystem(STATE_DIM, CONTROL_DIM, timestep, integration_type),
      parameters_(parameters) {
    if (parameters_.truck.wheelbase <= 0.0 || parameters_.trailer.wheelbase <= 0.0) {
        throw std::invalid_argument("TruckTrailer: wheelbase lengths must be positive");
    }
}

Eigen::VectorXd TruckTrailer::getContinuousDynamics(
    const Eigen::VectorXd& state, const Eigen::VectorXd& control, double time) const {

    const auto rates = kinematics<double>(state(STATE_THETA1), state(STATE_THETA0),
                                          control(CONTROL_DELTA0), control(CONTROL_V0));

    Eigen::VectorXd state_dot(STATE_DIM);
    state_dot << rates[0], rates[1], rates[2], rates[3];
    return state_dot;
}

VectorXdual2nd TruckTrailer::getContinuousDynamicsAutodiff(
    const VectorXdual2nd& state, const VectorXdual2nd& control, double time) const {

    const autodiff::dual2nd theta1 = state(STATE_THETA1);
    const autodiff::dual2nd theta0 = state(STATE_THETA0);
    const autodiff::dual2nd delta0 = control(CONTROL_DELTA0);
    const autodiff::dual2nd v0 = control(CONTROL_V0);

    const auto rates = kinematics<autodiff::dual2nd>(theta1, theta0, delta0, v0);

    VectorXdual2nd state_dot(STATE_DIM);
    for (int i = 0; i < STATE_DIM; ++i) {
        state_dot(i) = rates[i];
    }
    return state_dot;
}

casadi::MX TruckTrailer::getContinuousDynamicsSymbolic(const casadi::MX& state,
                                                       const casadi::MX& control) const {
    if (state.size1() != STATE_DIM || control.size1() != CONTROL_DIM) {
        throw std::invalid_argument("TruckTrailer: symbolic state/control has wrong dimension");
    }
    const auto rates = kinematics<casadi::MX>(state(STATE_THETA1), state(STATE_THETA0),
                                              control(CONTROL_DELTA0), control(CONTROL_V0));
    return casadi::MX::vertcat({rates[0], rates[1], rates[2], rates[3]});
}

Eigen::Vector2d TruckTrailer::truckPosition(const Eigen::VectorXd& state) const {
    const auto p = truckAxle<double>(state(STATE_THETA1), state(STATE_X1),
                                     state(STATE_Y1), state(STATE_THETA0));
    return Eigen::Vector2d(p[0], p[1]);
}

casadi::MX TruckTrailer::truckPosition(const casadi::MX& state) const {
    const auto p = truckAxle<casadi::MX>(state(STATE_THETA1), state(STATE_X1),
                                         state(STATE_Y1), state(STATE_THETA0));
    return casadi::MX::vertcat({p[0], p[1]});
}

Eigen::Vector2d TruckTrailer::hitchPoint(const Eigen::VectorXd& state) const {
    const double theta0 = state(STATE_THETA0);
    const double M0 = parameters_.truck.hitch_offset;
    return truckPosition(state) - M0 * Eigen::Vector2d(std::cos(theta0), std::sin(theta0));
}

double TruckTrailer::articulation(const Eigen::VectorXd& state) const {
    return state(STATE_THETA0) - state(STATE_THETA1);
}

casadi::MX TruckTrailer::articulation(const casadi::MX& state) const {
    return state(STATE_THETA0) - state(STATE_THETA1);
}

Eigen::Matrix<double, 2, 4> TruckTrailer::footprint(const Eigen::VectorXd& state, Body body) const {
    double x, y, theta;
    if (body == Body::Truck) {
        const Eigen::Vector2d p = truckPosition(state);
        x = p(0);
        y = p(1);
        theta = state(STATE_THETA0);
    } else {
        x = state(STATE_X1);
        y = state(STATE_Y1);
        theta = state(STATE_THETA1);
    }

    const auto pts = corners<double>(x, y, theta, geometry(body));
    Eigen::Matrix<double, 2, 4> result;
    for (int i = 0; i < 4; ++i) {
        result(0, i) = pts[i][0];
        result(1, i) = pts[i][1];
    }
    return result;
}

casadi::MX TruckTrailer::footprint(const casadi::MX& state, Body body) const {
    casadi::MX x, y, theta;
    if (body == Body::Truck) {
        const casadi::MX p = truckPosition(state);
        x = p(0);
        y = p(1);
        theta = state(STATE_THETA0);
    } else {
        x = state(STATE_X1);
        y = state(STATE_Y1);
        theta = state(STATE_THETA1);
    }

    const auto pts = corners<casadi::MX>(x, y, theta, geometry(body));
    std::vector<casadi::MX> columns;
    for (const auto& pt : pts) {
        columns.push_back(casadi::MX::vertcat({pt[0], pt[1]}));
    }
    return casadi::MX::horzcat(columns);
}

} // namespace mstage
