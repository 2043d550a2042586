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

#ifndef MSTAGE_TRUCK_TRAILER_HPP
#define MSTAGE_TRUCK_TRAILER_HPP

#include <array>
#include <cmath>

#include "mstage_core/dynamical_system.hpp"

namespace mstage {

/**
 * @brief Rectangular body of one vehicle unit, measured from its axle
 */
struct BodyGeometry {
    double wheelbase = 0.0;    ///< Length L ahead of the axle
    double hitch_offset = 0.0; ///< Length M behind the axle
    double width = 0.0;        ///< Width W
};

/**
 * @brief Geometry of a truck towing one trailer
 */
struct VehicleParameters {
    BodyGeometry truck;   ///< Towing unit (L0, M0, W0)
    BodyGeometry trailer; ///< First trailer (L1, M1, W1)
};

/**
 * @brief Kinematic truck with one off-axle hitched trailer
 *
 * State vector: [θ1, x1, y1, θ0]
 * - θ1: trailer heading
 * - x1, y1: trailer axle position
 * - θ0: truck heading
 *
 * Control vector: [δ0, v0]
 * - δ0: truck steering angle
 * - v0: truck longitudinal velocity
 *
 * The truck axle sits at x0 = x1 + L1 cos(θ1) + M0 cos(θ0) (same for y), the
 * hitch M0 behind it. The same kinematics serve double, autodiff::dual2nd and
 * casadi::MX evaluation.
 */
class TruckTrailer : public DynamicalSystem {
public:
    enum class Body { Truck, Trailer };

    /**
     * @brief Constructor for the truck-trailer model
     * @param parameters Truck and trailer geometry
     * @param timestep Time step for discretization
     * @param integration_type Integration method ("euler", "heun", "rk3", "rk4")
     */
    TruckTrailer(const VehicleParameters& parameters,
                 double timestep = 0.1,
                 std::string integration_type = "rk4");

    /**
     * @brief Computes the continuous-time dynamics
     * @param state Current state vector [θ1, x1, y1, θ0]
     * @param control Current control input [δ0, v0]
     * @param time Current time
     * @return State derivative vector
     */
    Eigen::VectorXd getContinuousDynamics(const Eigen::VectorXd& state,
                                          const Eigen::VectorXd& control, double time) const override;

    VectorXdual2nd getContinuousDynamicsAutodiff(
        const VectorXdual2nd& state, const VectorXdual2nd& control, double time) const override;

    casadi::MX getContinuousDynamicsSymbolic(const casadi::MX& state,
                                             const casadi::MX& control) const override;

    /// Truck axle position [x0, y0]
    Eigen::Vector2d truckPosition(const Eigen::VectorXd& state) const;
    casadi::MX truckPosition(const casadi::MX& state) const;

    /// Coupling point, M0 behind the truck axle
    Eigen::Vector2d hitchPoint(const Eigen::VectorXd& state) const;

    /// Articulation angle β01 = θ0 - θ1
    double articulation(const Eigen::VectorXd& state) const;
    casadi::MX articulation(const casadi::MX& state) const;

    /**
     * @brief Footprint corners of one body
     * @return 2x4 matrix, columns front-left, front-right, rear-right, rear-left
     */
    Eigen::Matrix<double, 2, 4> footprint(const Eigen::VectorXd& state, Body body) const;
    casadi::MX footprint(const casadi::MX& state, Body body) const;

    const VehicleParameters& getParameters() const { return parameters_; }
    const BodyGeometry& geometry(Body body) const {
        return body == Body::Truck ? parameters_.truck : parameters_.trailer;
    }

    // State indices
    static constexpr int STATE_THETA1 = 0; ///< trailer heading index
    static constexpr int STATE_X1 = 1;     ///< trailer x position index
    static constexpr int STATE_Y1 = 2;     ///< trailer y position index
    static constexpr int STATE_THETA0 = 3; ///< truck heading index
    static constexpr int STATE_DIM = 4;    ///< total state dimension

    // Control indices
    static constexpr int CONTROL_DELTA0 = 0; ///< steering angle index
    static constexpr int CONTROL_V0 = 1;     ///< velocity index
    static constexpr int CONTROL_DIM = 2;    ///< total control dimension

private:
    VehicleParameters parameters_;

    // [dθ1, dx1, dy1, dθ0]
    template <typename T>
    std::array<T, 4> kinematics(const T& theta1, const T& theta0,
                                const T& delta0, const T& v0) const {
        using std::cos;
        using std::sin;
        using std::tan;
        const double L0 = parameters_.truck.wheelbase;
        const double M0 = parameters_.truck.hitch_offset;
        const double L1 = parameters_.trailer.wheelbase;

        const T dtheta0 = v0 / L0 * tan(delta0);
        const T beta01 = theta0 - theta1;
        const T dtheta1 = v0 / L1 * sin(beta01) - M0 / L1 * cos(beta01) * dtheta0;
        const T v1 = v0 * cos(beta01) + M0 * sin(beta01) * dtheta0;
        return {dtheta1, T(v1 * cos(theta1)), T(v1 * sin(theta1)), dtheta0};
    }

    template <typename T>
    std::array<T, 2> truckAxle(const T& theta1, const T& x1, const T& y1, const T& theta0) const {
        using std::cos;
        using std::sin;
        const double M0 = parameters_.truck.hitch_offset;
        const double L1 = parameters_.trailer.wheelbase;
        return {T(x1 + L1 * cos(theta1) + M0 * cos(theta0)),
                T(y1 + L1 * sin(theta1) + M0 * sin(theta0))};
    }

    // Corners of the rectangle [-M, L] x [-W/2, W/2] in the body frame
    template <typename T>
    std::array<std::array<T, 2>, 4> corners(const T& x, const T& y, const T& theta,
                                            const BodyGeometry& g) const {
        using std::cos;
        using std::sin;
        const T c = cos(theta);
        const T s = sin(theta);
        const double half = 0.5 * g.width;
        const std::array<std::array<double, 2>, 4> local = {{{g.wheelbase, half},
                                                             {g.wheelbase, -half},
                                                             {-g.hitch_offset, -half},
                                                             {-g.hitch_offset, half}}};
        std::array<std::array<T, 2>, 4> result;
        for (int i = 0; i < 4; ++i) {
            result[i][0] = x + local[i][0] * c - local[i][1] * s;
            result[i][1] = y + local[i][0] * s + local[i][1] * c;
        }
        return result;
    }
};

} // namespace mstage

#endif // MSTAGE_TRUCK_TRAILER_HPP
