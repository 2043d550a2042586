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

#include <Eigen/Dense>
#include <autodiff/forward/dual.hpp>       // Include autodiff
#include <autodiff/forward/dual/eigen.hpp> // Include autodiff Eigen support

#include "mstage_core/dynamical_system.hpp"

using namespace mstage;
using namespace autodiff; // Use autodiff namespace

// Implement integration methods
Eigen::VectorXd DynamicalSystem::euler_step(const Eigen::VectorXd& state, const Eigen::VectorXd& control,
                                            double dt, double time) const {
    return state + dt * getContinuousDynamics(state, control, time);
}

Eigen::VectorXd DynamicalSystem::heun_step(const Eigen::VectorXd& state, const Eigen::VectorXd& control,
                                           double dt, double time) const {
    Eigen::VectorXd k1 = getContinuousDynamics(state, control, time);
    Eigen::VectorXd k2 = getContinuousDynamics(state + dt * k1, control, time + dt);
    return state + 0.5 * dt * (k1 + k2);
}

Eigen::VectorXd DynamicalSystem::rk3_step(const Eigen::VectorXd& state, const Eigen::VectorXd& control,
                                          double dt, double time) const {
    Eigen::VectorXd k1 = getContinuousDynamics(state, control, time);
    Eigen::VectorXd k2 = getContinuousDynamics(state + 0.5 * dt * k1, control, time + 0.5 * dt);
    Eigen::VectorXd k3 = getContinuousDynamics(state - dt * k1 + 2 * dt * k2, control, time + dt);
    return state + (dt / 6) * (k1 + 4 * k2 + k3);
}

Eigen::VectorXd DynamicalSystem::rk4_step(const Eigen::VectorXd& state, const Eigen::VectorXd& control,
                                          double dt, double time) const {
    Eigen::VectorXd k1 = getContinuousDynamics(state, control, time);
    Eigen::VectorXd k2 = getContinuousDynamics(state + 0.5 * dt * k1, control, time + 0.5 * dt);
    Eigen::VectorXd k3 = getContinuousDynamics(state + 0.5 * dt * k2, control, time + 0.5 * dt);
    Eigen::VectorXd k4 = getContinuousDynamics(state + dt * k3, control, time + dt);
    return state + (dt / 6) * (k1 + 2 * k2 + 2 * k3 + k4);
}

Eigen::VectorXd DynamicalSystem::integrate(const Eigen::VectorXd& state, const Eigen::VectorXd& control,
                                           double dt, double time) const {
    if (integration_type_ == "euler") {
        return euler_step(state, control, dt, time);
    } else if (integration_type_ == "heun") {
        return heun_step(state, control, dt, time);
    } else if (integration_type_ == "rk3") {
        return rk3_step(state, control, dt, time);
    } else if (integration_type_ == "rk4") {
        return rk4_step(state, control, dt, time);
    }
    throw std::invalid_argument("Integration type not supported: " + integration_type_);
}

Eigen::VectorXd DynamicalSystem::getDiscreteDynamics(const Eigen::VectorXd& state, const Eigen::VectorXd& control,
                                                     double time) const {
    return integrate(state, control, timestep_, time);
}

Eigen::VectorXd DynamicalSystem::getContinuousDynamics(
    const Eigen::VectorXd& state,
    const Eigen::VectorXd& control,
    double time) const {

    // Get next state using discrete dynamics
    Eigen::VectorXd next_state = getDiscreteDynamics(state, control, time);

    // dx/dt ≈ (x_{k+1} - x_k) / dt
    return (next_state - state) / timestep_;
}

// --- Autodiff Default Implementations for Jacobians ---

Eigen::MatrixXd DynamicalSystem::getStateJacobian(const Eigen::VectorXd& state,
                                                  const Eigen::VectorXd& control,
                                                  double time) const {
    VectorXdual2nd x = state.cast<dual2nd>();
    VectorXdual2nd u = control.cast<dual2nd>();

    // Need to capture 'this' pointer for member function access
    auto dynamics_wrt_x = [&](const VectorXdual2nd& x_ad) -> VectorXdual2nd {
        return this->getContinuousDynamicsAutodiff(x_ad, u, time);
    };

    // Compute Jacobian w.r.t. state
    Eigen::MatrixXd Jx = jacobian(dynamics_wrt_x, wrt(x), at(x));
    return Jx;
}

Eigen::MatrixXd DynamicalSystem::getControlJacobian(const Eigen::VectorXd& state,
                                                    const Eigen::VectorXd& control,
                                                    double time) const {
    VectorXdual2nd x = state.cast<dual2nd>();
    VectorXdual2nd u = control.cast<dual2nd>();

    auto dynamics_wrt_u = [&](const VectorXdual2nd& u_ad) -> VectorXdual2nd {
        return this->getContinuousDynamicsAutodiff(x, u_ad, time);
    };

    Eigen::MatrixXd Ju = jacobian(dynamics_wrt_u, wrt(u), at(u));
    return Ju;
}
