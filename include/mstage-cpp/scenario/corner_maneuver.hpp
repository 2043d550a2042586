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
#ifndef MSTAGE_CORNER_MANEUVER_HPP
#define MSTAGE_CORNER_MANEUVER_HPP

#include <Eigen/Dense>
#include <casadi/casadi.hpp>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "dynamics_model/truck_trailer.hpp"
#include "mstage_core/io.hpp"
#include "mstage_core/ocp.hpp"
#include "mstage_core/options.hpp"
#include "mstage_core/stage.hpp"
#include "mstage_core/trajectory.hpp"

namespace mstage
{
    /**
     * @brief Corner-shaped corridor made of four walls
     *
     * The vertical corridor runs between x_left and x_right, the horizontal
     * one between y_right and y_left. Each wall is a half-plane w = [n; c]
     * with legal side n.p + c <= 0. The whole geometry is rotated by angle.
     */
    struct Corridor
    {
        double x_right = 0.5;
        double y_right = 2.0;
        double x_left = -0.5;
        double y_left = 2.4;
        double angle = 0.0;

        Eigen::Vector3d leftWall() const;   ///< x >= x_left
        Eigen::Vector3d rightWall() const;  ///< x <= x_right
        Eigen::Vector3d topWall() const;    ///< y <= y_left
        Eigen::Vector3d bottomWall() const; ///< y >= y_right

        // [left, right, top], active before the corner
        Eigen::MatrixXd preCorner() const;
        // [top, bottom, left], active after the corner
        Eigen::MatrixXd postCorner() const;

        std::vector<Eigen::Vector3d> walls() const;
    };

    /**
     * @brief Box limits of the maneuver
     */
    struct KinematicLimits
    {
        double max_velocity = 0.2;           ///< |v0|
        double max_acceleration = 1.0;       ///< |dv0/dt|
        double max_steering = M_PI / 6.0;    ///< |delta0|
        double max_steering_rate = M_PI / 10.0; ///< |d delta0/dt|
        double max_articulation = M_PI / 2.0;   ///< |theta0 - theta1|
    };

    /**
     * @brief Fixed pose of the trailer axle and both headings
     */
    struct BoundaryPose
    {
        double x1 = 0.0;
        double y1 = 0.0;
        double theta1 = 0.0;
        double theta0 = 0.0;
    };

    /**
     * @brief Stage handle together with its signal expressions
     */
    struct StageSignals
    {
        Stage *stage = nullptr;
        casadi::MX theta1;
        casadi::MX x1;
        casadi::MX y1;
        casadi::MX theta0;
        casadi::MX x0;
        casadi::MX y0;
        casadi::MX delta0;
        casadi::MX v0;

        // In the order of names()
        std::vector<casadi::MX> all() const;
        static const std::vector<std::string> &names();
    };

    struct CornerManeuverOptions
    {
        bool show_figures = true;   ///< Plot and animate the result.
        bool use_simulator = false; ///< Replay the plan open loop.
        bool save_for_gif = false;  ///< Export animation frames and a GIF.
        bool verbose = true;        ///< Console summaries.

        double control_sample_time = 0.1; ///< Resampling period Ts.

        std::string parameter_file = "truck_trailer_para.yaml";
        std::string result_file = "truck_trailer_x_u.yaml";
        std::string animation_dir = "results/truck_trailer";

        StageOptions approach{10, 2, 0.0, 10.0, "rk"};
        StageOptions corner{5, 2, 10.0, 10.0, "rk"};
        SolverOptions solver;

        Corridor corridor;
        KinematicLimits limits;
        BoundaryPose initial_pose{0.0, 0.0, M_PI / 2.0, M_PI / 2.0};
        // Trailer axle centered in the horizontal corridor, (y_left + y_right) / 2
        BoundaryPose final_pose{1.5, 2.2, 0.0, 0.0};
    };

    struct CornerManeuverResult
    {
        SolveResult solution;
        Trajectory trajectory; ///< Resampled signals of StageSignals::names().
        Trajectory simulated;  ///< Empty unless use_simulator.
        double t1 = 0.0;       ///< End of the approach stage.
        double t2 = 0.0;       ///< End of the corner stage.
    };

    /**
     * @brief Builds one corridor stage of the truck-trailer problem
     *
     * Adds the kinematics with first-order steering and velocity, their box
     * and rate limits, the articulation limit, corridor containment of both
     * footprints and the minimum-time objective.
     */
    StageSignals createStage(MultiStageOCP &ocp,
                             const std::string &name,
                             std::shared_ptr<const TruckTrailer> model,
                             const StageOptions &options,
                             const Eigen::MatrixXd &corridor_planes,
                             const KinematicLimits &limits = KinematicLimits());

    // Time and augmented-state continuity between consecutive stages
    void stitchStages(MultiStageOCP &ocp, const StageSignals &first, const StageSignals &second);

    // Result-file layout: x: {px1, py1, theta1, px0, py0, theta0}, u: {delta, v_l}
    const SignalGroups &resultFileGroups();

    // Solves, resamples and stores the two-stage corner maneuver
    CornerManeuverResult runCornerManeuver(const CornerManeuverOptions &options);

} // namespace mstage

#endif // MSTAGE_CORNER_MANEUVER_HPP
