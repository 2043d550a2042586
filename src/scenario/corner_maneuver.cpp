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
#include <iostream>
#include <stdexcept>

#include "mstage_core/constraint.hpp"
#include "mstage_core/helper.hpp"
#include "mstage_core/sampler.hpp"
#include "mstage_core/simulator.hpp"
#include "scenario/corner_maneuver.hpp"
#include "visualization.hpp"

namespace mstage
{

using casadi::MX;

// --- Corridor ---

Eigen::Vector3d Corridor::leftWall() const
{
    const Eigen::Vector2d n(-std::cos(angle), std::sin(angle));
    const Eigen::Vector2d p(x_left, y_left);
    return Eigen::Vector3d(n(0), n(1), -n.dot(p));
}

Eigen::Vector3d Corridor::rightWall() const
{
    const Eigen::Vector2d n(std::cos(angle), -std::sin(angle));
    const Eigen::Vector2d p(x_right, y_right);
    return Eigen::Vector3d(n(0), n(1), -n.dot(p));
}

Eigen::Vector3d Corridor::topWall() const
{
    const Eigen::Vector2d n(std::sin(angle), std::cos(angle));
    const Eigen::Vector2d p(x_left, y_left);
    return Eigen::Vector3d(n(0), n(1), -n.dot(p));
}

Eigen::Vector3d Corridor::bottomWall() const
{
    const Eigen::Vector2d n(-std::sin(angle), -std::cos(angle));
    const Eigen::Vector2d p(x_right, y_right);
    return Eigen::Vector3d(n(0), n(1), -n.dot(p));
}

Eigen::MatrixXd Corridor::preCorner() const
{
    Eigen::MatrixXd planes(3, 3);
    planes << leftWall(), rightWall(), topWall();
    return planes;
}

Eigen::MatrixXd Corridor::postCorner() const
{
    Eigen::MatrixXd planes(3, 3);
    planes << topWall(), bottomWall(), leftWall();
    return planes;
}

std::vector<Eigen::Vector3d> Corridor::walls() const
{
    return {leftWall(), rightWall(), topWall(), bottomWall()};
}

// --- StageSignals ---

std::vector<MX> StageSignals::all() const
{
    return {theta1, x1, y1, theta0, x0, y0, delta0, v0};
}

const std::vector<std::string> &StageSignals::names()
{
    static const std::vector<std::string> names = {"theta1", "x1", "y1", "theta0",
                                                   "x0", "y0", "delta0", "v0"};
    return names;
}

// --- Problem construction ---

StageSignals createStage(MultiStageOCP &ocp,
                         const std::string &name,
                         std::shared_ptr<const TruckTrailer> model,
                         const StageOptions &options,
                         const Eigen::MatrixXd &corridor_planes,
                         const KinematicLimits &limits)
{
    if (!model)
    {
        throw std::invalid_argument("createStage: model must not be null");
    }
    if (corridor_planes.rows() != 3)
    {
        throw std::invalid_argument("createStage: corridor planes must have 3 rows");
    }

    Stage &stage = ocp.addStage(name, model, options);

    const Eigen::Vector2d control_limit(limits.max_steering, limits.max_velocity);
    stage.addPathConstraint("velocity_steering",
                            std::make_unique<ControlBoxConstraint>(-control_limit, control_limit));

    const Eigen::Vector2d rate_limit(limits.max_steering_rate, limits.max_acceleration);
    stage.addRateConstraint("steering_rate_acceleration",
                            std::make_unique<ControlBoxConstraint>(-rate_limit, rate_limit));

    // beta01 = theta0 - theta1
    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(1, TruckTrailer::STATE_DIM);
    A(0, TruckTrailer::STATE_THETA1) = -1.0;
    A(0, TruckTrailer::STATE_THETA0) = 1.0;
    const Eigen::VectorXd max_articulation = Eigen::VectorXd::Constant(1, limits.max_articulation);
    stage.addPathConstraint("articulation",
                            std::make_unique<LinearConstraint>(A, -max_articulation, max_articulation));

    stage.addPathConstraint("truck_corridor",
                            std::make_unique<CorridorConstraint>(model, TruckTrailer::Body::Truck,
                                                                 corridor_planes));
    stage.addPathConstraint("trailer_corridor",
                            std::make_unique<CorridorConstraint>(model, TruckTrailer::Body::Trailer,
                                                                 corridor_planes));

    // Minimum time
    stage.addObjective(stage.T());

    StageSignals signals;
    signals.stage = &stage;
    const MX &x = stage.state();
    const MX &u = stage.control();
    signals.theta1 = x(TruckTrailer::STATE_THETA1);
    signals.x1 = x(TruckTrailer::STATE_X1);
    signals.y1 = x(TruckTrailer::STATE_Y1);
    signals.theta0 = x(TruckTrailer::STATE_THETA0);
    const MX p0 = model->truckPosition(x);
    signals.x0 = p0(0);
    signals.y0 = p0(1);
    signals.delta0 = u(TruckTrailer::CONTROL_DELTA0);
    signals.v0 = u(TruckTrailer::CONTROL_V0);
    return signals;
}

void stitchStages(MultiStageOCP &ocp, const StageSignals &first, const StageSignals &second)
{
    if (first.stage == nullptr || second.stage == nullptr)
    {
        throw std::invalid_argument("stitchStages: stage handle is null");
    }
    ocp.stitch(*first.stage, *second.stage);
}

const SignalGroups &resultFileGroups()
{
    static const SignalGroups groups = {
        {"x", {{"px1", "x1"}, {"py1", "y1"}, {"theta1", "theta1"},
               {"px0", "x0"}, {"py0", "y0"}, {"theta0", "theta0"}}},
        {"u", {{"delta", "delta0"}, {"v_l", "v0"}}}};
    return groups;
}

namespace
{
void fixPose(MultiStageOCP &ocp, const StageSignals &signals, const BoundaryPose &pose, bool at_start)
{
    const Stage &stage = *signals.stage;
    auto at = [&](const MX &expr) { return at_start ? stage.atT0(expr) : stage.atTf(expr); };
    ocp.subjectTo(at(signals.x1) == pose.x1);
    ocp.subjectTo(at(signals.y1) == pose.y1);
    ocp.subjectTo(at(signals.theta1) == pose.theta1);
    ocp.subjectTo(at(signals.theta0) == pose.theta0);
}
} // namespace

CornerManeuverResult runCornerManeuver(const CornerManeuverOptions &options)
{
    const VehicleParameters parameters = loadVehicleParameters(options.parameter_file);
    auto model = std::make_shared<TruckTrailer>(parameters);

    MultiStageOCP ocp(options.solver);

    // Stage 1: approach the corner in the vertical corridor
    StageSignals approach = createStage(ocp, "approach", model, options.approach,
                                        options.corridor.preCorner(), options.limits);
    ocp.subjectTo(approach.stage->t0() == 0.0);
    fixPose(ocp, approach, options.initial_pose, true);

    // Stage 2: turn into the horizontal corridor
    StageSignals corner = createStage(ocp, "corner", model, options.corner,
                                      options.corridor.postCorner(), options.limits);
    stitchStages(ocp, approach, corner);
    fixPose(ocp, corner, options.final_pose, false);

    SolveFunction solve = ocp.toFunction("solve_truck_trailer");

    // Initial guess: straight up the corridor, then turn at y1 = final y1
    const BoundaryPose &start = options.initial_pose;
    const BoundaryPose &goal = options.final_pose;
    const int N1 = options.approach.num_intervals;
    const int N2 = options.corner.num_intervals;
    auto constant = [](double value) -> Eigen::VectorXd { return Eigen::VectorXd::Constant(1, value); };

    StageGuess approach_guess;
    approach_guess.duration = options.approach.duration_guess;
    approach_guess.states = StageGuess::fromRows({constant(start.theta1),
                                                  constant(start.x1),
                                                  helper::linspace(start.y1, goal.y1, N1 + 1),
                                                  constant(start.theta0),
                                                  constant(0.0),
                                                  constant(0.1)},
                                                 N1 + 1);
    approach_guess.controls = Eigen::MatrixXd::Zero(TruckTrailer::CONTROL_DIM, N1);

    StageGuess corner_guess;
    corner_guess.duration = options.corner.duration_guess;
    corner_guess.states = StageGuess::fromRows({helper::linspace(start.theta1, goal.theta1, N2 + 1),
                                                constant(start.x1),
                                                constant(goal.y1),
                                                helper::linspace(start.theta0, goal.theta0, N2 + 1),
                                                constant(0.0),
                                                constant(0.0)},
                                               N2 + 1);
    corner_guess.controls = Eigen::MatrixXd::Zero(TruckTrailer::CONTROL_DIM, N2);

    CornerManeuverResult result;
    result.solution = solve({approach_guess, corner_guess});
    result.t1 = result.solution.stages[0].tf();
    result.t2 = result.solution.stages[1].tf();
    if (options.verbose)
    {
        printSolutionSummary(result.solution);
    }

    // Resample both stages on the control grid
    const Sampler approach_sampler(*approach.stage, StageSignals::names(), approach.all());
    const Sampler corner_sampler(*corner.stage, StageSignals::names(), corner.all());
    const double Ts = options.control_sample_time;
    result.trajectory = Trajectory::concatenate(
        approach_sampler(result.solution.gist, helper::arange(0.0, result.t1, Ts)),
        corner_sampler(result.solution.gist, helper::arange(result.t1, result.t2, Ts)));

    saveTrajectory(options.result_file, result.trajectory, resultFileGroups());
    if (options.verbose)
    {
        std::cout << "Resampled " << result.trajectory.size() << " points to "
                  << options.result_file << std::endl;
    }

    if (options.use_simulator)
    {
        Eigen::VectorXd initial_state(TruckTrailer::STATE_DIM);
        initial_state << start.theta1, start.x1, start.y1, start.theta0;
        OpenLoopSimulator simulator(model, options.verbose);
        result.simulated = simulator.simulate(initial_state, result.trajectory);
    }

    if (options.show_figures)
    {
        PlotOptions plot_options;
        plot_options.save_frames = options.save_for_gif;
        plot_options.animation.output_dir = options.animation_dir;
        plot_options.animation.temp_dir = options.animation_dir + "/frames";

        ManeuverPlot plot(model, plot_options);
        const std::vector<Eigen::Vector3d> walls = options.corridor.walls();
        plot.plotOverview(result.trajectory, result.solution.stages, walls);
        plot.animate(result.trajectory, result.solution.stages, walls, result.simulated);
        plot.plotControls(result.trajectory);
        if (options.use_simulator)
        {
            plot.plotArticulation(result.trajectory, result.simulated);
        }
        plot.show();
    }

    return result;
}

} // namespace mstage
