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
// Description: Test the two-stage truck-trailer corner maneuver end to end.
#include <cmath>
#include <filesystem>
#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "mstage_core/constraint.hpp"
#include "mstage_core/io.hpp"
#include "scenario/corner_maneuver.hpp"

using namespace mstage;
namespace fs = std::filesystem;

TEST(CornerTest, CorridorWalls) {
    Corridor corridor;
    EXPECT_TRUE(corridor.leftWall().isApprox(Eigen::Vector3d(-1.0, 0.0, -0.5)));
    EXPECT_TRUE(corridor.rightWall().isApprox(Eigen::Vector3d(1.0, 0.0, -0.5)));
    EXPECT_TRUE(corridor.topWall().isApprox(Eigen::Vector3d(0.0, 1.0, -2.4)));
    EXPECT_TRUE(corridor.bottomWall().isApprox(Eigen::Vector3d(0.0, -1.0, 2.0)));

    Eigen::MatrixXd pre = corridor.preCorner();
    ASSERT_EQ(pre.cols(), 3);
    EXPECT_TRUE(pre.col(0).isApprox(corridor.leftWall()));
    EXPECT_TRUE(pre.col(2).isApprox(corridor.topWall()));
    Eigen::MatrixXd post = corridor.postCorner();
    EXPECT_TRUE(post.col(1).isApprox(corridor.bottomWall()));
    EXPECT_TRUE(post.col(2).isApprox(corridor.leftWall()));
    EXPECT_EQ(corridor.walls().size(), 4u);

    // The corner point (x_left, y_left) lies on both the left and the top wall
    // for any rotation
    corridor.angle = 0.3;
    Eigen::Vector3d corner(corridor.x_left, corridor.y_left, 1.0);
    EXPECT_NEAR(corridor.leftWall().dot(corner), 0.0, 1e-12);
    EXPECT_NEAR(corridor.topWall().dot(corner), 0.0, 1e-12);
    EXPECT_NEAR(corridor.leftWall().head<2>().dot(corridor.topWall().head<2>()), 0.0, 1e-12);
}

TEST(CornerTest, ResultFileGroups) {
    const SignalGroups &groups = resultFileGroups();
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].first, "x");
    EXPECT_EQ(groups[0].second.size(), 6u);
    EXPECT_EQ(groups[1].first, "u");
    EXPECT_EQ(groups[1].second[1].first, "v_l");
    EXPECT_EQ(groups[1].second[1].second, "v0");
}

class CornerManeuverTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        VehicleParameters parameters;
        parameters.truck = {0.3375, 0.06, 0.2};
        parameters.trailer = {0.3, 0.06, 0.2};
        parameter_file_ = (fs::temp_directory_path() / "mstage_corner_para.yaml").string();
        result_file_ = (fs::temp_directory_path() / "mstage_corner_x_u.yaml").string();
        saveVehicleParameters(parameter_file_, parameters);

        options_ = CornerManeuverOptions();
        options_.show_figures = false;
        options_.use_simulator = true;
        options_.verbose = false;
        options_.solver.print_level = 0;
        options_.solver.print_time = false;
        options_.parameter_file = parameter_file_;
        options_.result_file = result_file_;

        model_ = std::make_shared<TruckTrailer>(parameters);
        result_ = std::make_unique<CornerManeuverResult>(runCornerManeuver(options_));
    }

    static void TearDownTestSuite() {
        fs::remove(parameter_file_);
        fs::remove(result_file_);
        result_.reset();
    }

    static std::string parameter_file_;
    static std::string result_file_;
    static CornerManeuverOptions options_;
    static std::shared_ptr<const TruckTrailer> model_;
    static std::unique_ptr<CornerManeuverResult> result_;
};

std::string CornerManeuverTest::parameter_file_;
std::string CornerManeuverTest::result_file_;
CornerManeuverOptions CornerManeuverTest::options_;
std::shared_ptr<const TruckTrailer> CornerManeuverTest::model_;
std::unique_ptr<CornerManeuverResult> CornerManeuverTest::result_;

TEST_F(CornerManeuverTest, StagesAreStitched) {
    const auto &stages = result_->solution.stages;
    ASSERT_EQ(stages.size(), 2u);
    EXPECT_EQ(stages[0].name, "approach");
    EXPECT_EQ(stages[1].name, "corner");
    EXPECT_EQ(stages[0].states.cols(), options_.approach.num_intervals + 1);
    EXPECT_EQ(stages[1].states.cols(), options_.corner.num_intervals + 1);

    EXPECT_NEAR(stages[0].t0, 0.0, 1e-6);
    EXPECT_NEAR(stages[0].tf(), stages[1].t0, 1e-6);
    EXPECT_TRUE((stages[0].states.rightCols(1) - stages[1].states.leftCols(1)).cwiseAbs().maxCoeff() < 1e-6);
    EXPECT_DOUBLE_EQ(result_->t1, stages[0].tf());
    EXPECT_DOUBLE_EQ(result_->t2, stages[1].tf());
    EXPECT_GT(result_->t1, 0.0);
    EXPECT_GT(result_->t2, result_->t1);

    // Minimum time: the objective is the total duration
    EXPECT_NEAR(result_->solution.objective, stages[0].T + stages[1].T, 1e-6);
}

TEST_F(CornerManeuverTest, BoundaryPoses) {
    const Eigen::MatrixXd &first = result_->solution.stages[0].states;
    const Eigen::MatrixXd &last = result_->solution.stages[1].states;
    const int end = last.cols() - 1;

    EXPECT_NEAR(first(TruckTrailer::STATE_X1, 0), 0.0, 1e-6);
    EXPECT_NEAR(first(TruckTrailer::STATE_Y1, 0), 0.0, 1e-6);
    EXPECT_NEAR(first(TruckTrailer::STATE_THETA1, 0), M_PI / 2, 1e-6);
    EXPECT_NEAR(first(TruckTrailer::STATE_THETA0, 0), M_PI / 2, 1e-6);

    EXPECT_NEAR(last(TruckTrailer::STATE_X1, end), 1.5, 1e-6);
    EXPECT_NEAR(last(TruckTrailer::STATE_Y1, end), 2.2, 1e-6);
    EXPECT_NEAR(last(TruckTrailer::STATE_THETA1, end), 0.0, 1e-6);
    EXPECT_NEAR(last(TruckTrailer::STATE_THETA0, end), 0.0, 1e-6);
}

TEST_F(CornerManeuverTest, FootprintsStayInCorridor) {
    const std::vector<Eigen::MatrixXd> planes = {options_.corridor.preCorner(),
                                                 options_.corridor.postCorner()};
    const Eigen::VectorXd control = Eigen::VectorXd::Zero(2);

    // At every shooting node
    for (size_t s = 0; s < 2; ++s) {
        const Eigen::MatrixXd &states = result_->solution.stages[s].states;
        for (auto body : {TruckTrailer::Body::Truck, TruckTrailer::Body::Trailer}) {
            CorridorConstraint corridor(model_, body, planes[s]);
            for (int k = 0; k < states.cols(); ++k) {
                Eigen::VectorXd state = states.col(k).head(TruckTrailer::STATE_DIM);
                EXPECT_LT(corridor.computeViolation(state, control), 1e-6)
                    << "stage " << s << " node " << k;
            }
        }
    }

    // Between the nodes, up to a small tolerance
    const Trajectory &trajectory = result_->trajectory;
    for (int k = 0; k < trajectory.size(); ++k) {
        const size_t s = trajectory.time()(k) < result_->t1 ? 0 : 1;
        Eigen::VectorXd state(4);
        state << trajectory.signal("theta1")(k), trajectory.signal("x1")(k),
            trajectory.signal("y1")(k), trajectory.signal("theta0")(k);
        for (auto body : {TruckTrailer::Body::Truck, TruckTrailer::Body::Trailer}) {
            CorridorConstraint corridor(model_, body, planes[s]);
            EXPECT_LT(corridor.computeViolation(state, control), 0.1) << "sample " << k;
        }
    }
}

TEST_F(CornerManeuverTest, ResampledTrajectory) {
    const Trajectory &trajectory = result_->trajectory;
    ASSERT_GT(trajectory.size(), 2);
    ASSERT_EQ(trajectory.names(), StageSignals::names());

    const Eigen::VectorXd &t = trajectory.time();
    const double Ts = options_.control_sample_time;
    EXPECT_DOUBLE_EQ(t(0), 0.0);
    EXPECT_LT(t(t.size() - 1), result_->t2);
    EXPECT_GT(t(t.size() - 1), result_->t2 - Ts - 1e-9);

    // Uniform steps except where the corner stage starts
    int junctions = 0;
    for (int k = 1; k < t.size(); ++k) {
        const double step = t(k) - t(k - 1);
        ASSERT_GT(step, 0.0);
        if (std::abs(step - Ts) > 1e-9) {
            ++junctions;
            EXPECT_NEAR(t(k), result_->t1, 1e-12);
        }
    }
    EXPECT_LE(junctions, 1);

    // Limits hold on the resampled signals
    EXPECT_LE(trajectory.signal("v0").cwiseAbs().maxCoeff(), options_.limits.max_velocity + 1e-6);
    EXPECT_LE(trajectory.signal("delta0").cwiseAbs().maxCoeff(), options_.limits.max_steering + 1e-6);
    Eigen::VectorXd beta01 = trajectory.signal("theta0") - trajectory.signal("theta1");
    EXPECT_LE(beta01.cwiseAbs().maxCoeff(), options_.limits.max_articulation + 1e-6);

    // Truck position follows the geometry
    for (int k = 0; k < trajectory.size(); k += 7) {
        Eigen::VectorXd state(4);
        state << trajectory.signal("theta1")(k), trajectory.signal("x1")(k),
            trajectory.signal("y1")(k), trajectory.signal("theta0")(k);
        Eigen::Vector2d p0 = model_->truckPosition(state);
        EXPECT_NEAR(trajectory.signal("x0")(k), p0(0), 1e-9);
        EXPECT_NEAR(trajectory.signal("y0")(k), p0(1), 1e-9);
    }
}

TEST_F(CornerManeuverTest, ResultFileMatchesTrajectory) {
    Trajectory loaded = loadTrajectory(result_file_);
    ASSERT_EQ(loaded.size(), result_->trajectory.size());
    EXPECT_TRUE(loaded.time().isApprox(result_->trajectory.time()));
    EXPECT_TRUE(loaded.signal("x/py1").isApprox(result_->trajectory.signal("y1")));
    EXPECT_TRUE(loaded.signal("x/theta0").isApprox(result_->trajectory.signal("theta0")));
    EXPECT_TRUE(loaded.signal("u/delta").isApprox(result_->trajectory.signal("delta0")));
}

TEST_F(CornerManeuverTest, SimulatedArticulationStaysClose) {
    const Trajectory &simulated = result_->simulated;
    ASSERT_EQ(simulated.size(), result_->trajectory.size());
    EXPECT_NEAR(simulated.signal("py1")(0), 0.0, 1e-12);
    EXPECT_TRUE(simulated.signal("beta01").allFinite());
    EXPECT_LT(maxArticulationError(simulated), 0.25);
}
