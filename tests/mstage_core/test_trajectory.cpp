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
// Description: Tests for the sampled trajectory container.
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "mstage_core/helper.hpp"
#include "mstage_core/trajectory.hpp"

using namespace mstage;
using ::testing::ElementsAre;

namespace {
Trajectory makeTrajectory(double start, double stop) {
    Eigen::VectorXd time = helper::arange(start, stop, 0.1);
    Eigen::MatrixXd values(2, time.size());
    values.row(0) = time.transpose();
    values.row(1) = 2.0 * time.transpose();
    return Trajectory(time, {"a", "b"}, values);
}
} // namespace

TEST(TrajectoryTest, Construction) {
    Trajectory trajectory = makeTrajectory(0.0, 1.0);
    EXPECT_EQ(trajectory.size(), 10);
    EXPECT_EQ(trajectory.getNumSignals(), 2);
    EXPECT_FALSE(trajectory.empty());
    EXPECT_TRUE(trajectory.hasSignal("b"));
    EXPECT_FALSE(trajectory.hasSignal("c"));
    EXPECT_NEAR(trajectory.signal("b")(3), 0.6, 1e-12);
    EXPECT_THROW(trajectory.signal("c"), std::out_of_range);

    EXPECT_TRUE(Trajectory().empty());

    Eigen::VectorXd time(3);
    time << 0.0, 0.2, 0.1;
    EXPECT_THROW(Trajectory(time, {"a"}, Eigen::MatrixXd::Zero(1, 3)), std::invalid_argument);
    time << 0.0, 0.1, 0.2;
    EXPECT_THROW(Trajectory(time, {"a"}, Eigen::MatrixXd::Zero(2, 3)), std::invalid_argument);
    EXPECT_THROW(Trajectory(time, {"a", "a"}, Eigen::MatrixXd::Zero(2, 3)), std::invalid_argument);
}

TEST(TrajectoryTest, AddAndSelect) {
    Trajectory trajectory = makeTrajectory(0.0, 0.5);
    trajectory.addSignal("c", Eigen::VectorXd::Ones(5));
    EXPECT_THAT(trajectory.names(), ElementsAre("a", "b", "c"));
    EXPECT_THROW(trajectory.addSignal("c", Eigen::VectorXd::Ones(5)), std::invalid_argument);
    EXPECT_THROW(trajectory.addSignal("d", Eigen::VectorXd::Ones(4)), std::invalid_argument);

    Trajectory selected = trajectory.select({"c", "a"});
    EXPECT_THAT(selected.names(), ElementsAre("c", "a"));
    EXPECT_TRUE(selected.signal("a").isApprox(trajectory.signal("a")));
    EXPECT_THROW(trajectory.select({"z"}), std::out_of_range);
}

TEST(TrajectoryTest, Concatenate) {
    Trajectory first = makeTrajectory(0.0, 1.0);
    Trajectory second = makeTrajectory(1.0, 1.5);

    Trajectory joined = Trajectory::concatenate(first, second);
    ASSERT_EQ(joined.size(), 15);
    EXPECT_DOUBLE_EQ(joined.time()(10), 1.0);
    EXPECT_NEAR(joined.signal("b")(14), 2.8, 1e-12);

    // Stage boundary that lands on the rounded grid point
    const double junction = 0.1 * 3;
    Trajectory before = makeTrajectory(0.0, junction);
    Trajectory after = makeTrajectory(junction, 0.5);
    ASSERT_EQ(before.size(), 3);
    Trajectory stitched = Trajectory::concatenate(before, after);
    EXPECT_EQ(stitched.size(), before.size() + after.size());
    EXPECT_DOUBLE_EQ(stitched.time()(3), junction);

    // Empty sides pass the other through
    EXPECT_EQ(Trajectory::concatenate(Trajectory(), second).size(), second.size());
    EXPECT_EQ(Trajectory::concatenate(first, Trajectory()).size(), first.size());

    // Overlap and mismatched signals are rejected
    EXPECT_THROW(Trajectory::concatenate(second, first), std::invalid_argument);
    EXPECT_THROW(Trajectory::concatenate(first, second.select({"b", "a"})), std::invalid_argument);
}
